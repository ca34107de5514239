#ifndef SPARKBRIDGE_TEMP_FILE_HPP
#define SPARKBRIDGE_TEMP_FILE_HPP

#include <filesystem>
#include <system_error>
#include "utils/logging.hpp"

/// Owns a path inside a scratch directory and removes it on scope exit,
/// whether the scope is left normally or by an exception.
struct TempFile {
    std::filesystem::path path;

    explicit TempFile(std::filesystem::path p) : path{std::move(p)} {}
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            SPARKBRIDGE_LOG_WARN("could not remove staging file {}: {}", path.string(), ec.message());
        }
    }
};

#endif //SPARKBRIDGE_TEMP_FILE_HPP
