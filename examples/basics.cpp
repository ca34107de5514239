#include "spark_context.hpp"
#include <fmt/ranges.h>

int main() {
    SparkConfig config;
    config.set(config_keys::appName, "basics").set(config_keys::master, "local[4]");
    auto sc = createContext(config);

    vector<int> values = {1, 2, 3, 4, 5, 6, 7};
    auto rdd = sc->parallelize(values, 3);
    auto rdd2 = rdd.newRddFromCommand<StageKind::Map>([](int x) {
        return x + 1;
    });
    auto rdd3 = rdd2.newRddFromCommand<StageKind::Filter>([](const int& x) {
        return x % 2 == 0;
    });
    // 2, 4, 6, 8
    for (auto v : rdd3.collect()) {
        std::cout << v << ' ';
    }
    std::cout << '\n';

    // per partition sums, only for partitions 2 and 0
    auto sums = sc->runJobWithCommand<StageKind::MapPartitions>(rdd, vector<int64_t>{2, 0}, false,
            [](unique_ptr<Iterator<int>> it, int offset) {
                int acc = offset;
                while (it->hasNext()) {
                    acc += it->next().value();
                }
                return vector<int>{acc};
            }, 100);
    std::cout << sums[0][0] << ' ' << sums[1][0] << '\n';

    auto squares = sc->broadcast(vector<int>{0, 1, 4, 9, 16, 25, 36, 49});
    sc->setCallSite("basics: lookup");
    auto looked = sc->runJobWithCommand<StageKind::Map>(rdd, boost::none, false,
            [](int x, const vector<int>& table) {
                return table.at(static_cast<size_t>(x));
            }, squares.value());
    for (auto& part : looked) {
        std::cout << fmt::format("{}", fmt::join(part, ",")) << '\n';
    }
    sc->stop();
    return 0;
}
