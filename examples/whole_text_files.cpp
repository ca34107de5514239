#include "spark_context.hpp"

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: whole_text_files <directory>\n";
        return 1;
    }
    SparkConfig config;
    config.set(config_keys::appName, "whole_text_files")
          .set(config_keys::master, "local[2]")
          .set(config_keys::stageStrategy, "direct");
    auto sc = createContext(config);

    auto files = sc->wholeTextFiles(argv[1]);
    auto sizes = sc->runJob(files, [](const pair<string, string>& file) {
        auto lines = std::count(file.second.begin(), file.second.end(), '\n');
        return make_pair(file.first, static_cast<int64_t>(lines));
    });
    for (size_t i = 0; i < sizes.size(); ++i) {
        for (auto& [path, lines] : sizes[i]) {
            std::cout << fmt::format("[{}] {}: {} lines\n", i, path, lines);
        }
    }
    sc->stop();
    return 0;
}
