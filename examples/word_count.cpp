#include <chrono>
#include "spark_context.hpp"
#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

using namespace std::chrono;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: word_count <file or directory> [partitions]\n";
        return 1;
    }
    SparkConfig config;
    config.set(config_keys::appName, "word_count").set(config_keys::master, "local[*]");
    auto sc = createContext(config);
    optional<size_t> partitions;
    if (argc > 2) {
        partitions = static_cast<size_t>(std::stoul(argv[2]));
    }

    auto t_begin = steady_clock::now();
    auto lines = sc->textFile(argv[1], partitions);
    auto words = lines.newRddFromCommand<StageKind::FlatMap>([](const string& s) {
        vector<string> v;
        boost::algorithm::split(v, s, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
        v.erase(std::remove(v.begin(), v.end(), ""), v.end());
        return v;
    });
    // count inside each partition, merge on the driver
    auto counted = sc->runJobWithCommand<StageKind::MapPartitions>(words, boost::none, false,
            [](unique_ptr<Iterator<string>> it) {
                map<string, int> counts;
                while (it->hasNext()) {
                    counts[it->next().value()] += 1;
                }
                return vector<pair<string, int>>(counts.begin(), counts.end());
            });
    map<string, int> result;
    for (auto& part : counted) {
        for (auto& [k, v] : part) {
            result[k] += v;
        }
    }
    auto t_end = steady_clock::now();
    for (auto& [k, v] : result) {
        std::cout << k << ": " << v << '\n';
    }
    std::cout << "Elapsed time in milliseconds: "
              << duration_cast<milliseconds>(t_end - t_begin).count() << " ms\n";
    sc->stop();
    return 0;
}
