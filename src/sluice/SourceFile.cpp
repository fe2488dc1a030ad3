#include "sluice/SourceFile.hpp"

#include "sluice/internal/FileSystem.hpp"

#include "spdlog/spdlog.h"

#include <fstream>
#include <sstream>

namespace sluice {

SourceFile::SourceFile(std::string path): m_path(std::move(path)) {}

bool SourceFile::read() {
    fs::path filePath(m_path);
    if (!fs::exists(filePath)) {
        SPDLOG_ERROR("File: '{}' not found", m_path);
        return false;
    }

    std::ifstream inFile(filePath, std::ifstream::binary);
    if (!inFile) {
        SPDLOG_ERROR("File: '{}' open error", m_path);
        return false;
    }
    std::ostringstream contents;
    contents << inFile.rdbuf();
    if (!inFile && !inFile.eof()) {
        SPDLOG_ERROR("File: '{}' read error", m_path);
        return false;
    }
    m_code = contents.str();
    return true;
}

} // namespace sluice
