#ifndef SRC_SLUICE_INTERNAL_FILE_SYSTEM_HPP_
#define SRC_SLUICE_INTERNAL_FILE_SYSTEM_HPP_

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace sluice {

// Writes |contents| to |path| only if the file is missing or differs, so regenerating identical bindings doesn't
// force the build to recompile everything that includes them. Creates parent directories as needed.
bool writeIfChanged(const fs::path& path, const std::string& contents);

} // namespace sluice

#endif // SRC_SLUICE_INTERNAL_FILE_SYSTEM_HPP_
