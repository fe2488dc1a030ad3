#include "sluice/internal/FileSystem.hpp"

#include "spdlog/spdlog.h"

#include <fstream>
#include <iterator>
#include <system_error>

namespace sluice {

bool writeIfChanged(const fs::path& path, const std::string& contents) {
    if (fs::exists(path)) {
        std::ifstream existing(path, std::ifstream::binary);
        std::string current((std::istreambuf_iterator<char>(existing)), std::istreambuf_iterator<char>());
        if (existing && current == contents) {
            SPDLOG_DEBUG("{} unchanged", path.string());
            return true;
        }
    }

    if (path.has_parent_path()) {
        std::error_code error;
        fs::create_directories(path.parent_path(), error);
        if (error) {
            SPDLOG_ERROR("Failed to create directory {}: {}", path.parent_path().string(), error.message());
            return false;
        }
    }

    std::ofstream outFile(path, std::ofstream::binary | std::ofstream::trunc);
    if (!outFile) {
        SPDLOG_ERROR("Failed to open output file {}", path.string());
        return false;
    }
    outFile << contents;
    if (!outFile) {
        SPDLOG_ERROR("Failed to write output file {}", path.string());
        return false;
    }
    return true;
}

} // namespace sluice
