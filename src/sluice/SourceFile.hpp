#ifndef SRC_SLUICE_SOURCE_FILE_HPP_
#define SRC_SLUICE_SOURCE_FILE_HPP_

#include <string>
#include <string_view>

namespace sluice {

// An IDL input file, read whole into memory. Tokens produced by the Lexer point into this buffer, so the SourceFile
// must outlive them.
class SourceFile {
public:
    SourceFile() = delete;
    explicit SourceFile(std::string path);
    ~SourceFile() = default;

    bool read();

    const std::string& path() const { return m_path; }
    std::string_view codeView() const { return m_code; }

private:
    std::string m_path;
    std::string m_code;
};

} // namespace sluice

#endif // SRC_SLUICE_SOURCE_FILE_HPP_
