#ifndef SRC_SLUICE_ERROR_REPORTER_HPP_
#define SRC_SLUICE_ERROR_REPORTER_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sluice {

// Collects errors from the Lexer, Parser, and BindingGenerator. Shared between the stages so a caller can inspect
// every reported problem after a failed run.
class ErrorReporter {
public:
    enum Kind {
        kSyntax = 0,
        kUnexpectedClose = 1,   // "};" with no interface open.
        kUnexpectedToken = 2,   // Anything other than an interface at top level.
        kDuplicateName = 3,
        kUnresolvedTypeReference = 4,
        kSymbolCollision = 5    // Two methods would export the same trampoline symbol.
    };

    struct Error {
        Kind kind;
        // 1-based, or 0 if the error is not tied to a line of input.
        int32_t lineNumber;
        std::string interfaceName;
        std::string memberName;
        std::string message;
        // Only for kUnresolvedTypeReference, the interface name that failed to resolve.
        std::string referencedName;
    };

    ErrorReporter();
    explicit ErrorReporter(bool suppress);
    ~ErrorReporter();

    void addError(Kind kind, int32_t lineNumber, const std::string& message);
    void addError(Kind kind, int32_t lineNumber, const std::string& interfaceName, const std::string& memberName,
                  const std::string& message, const std::string& referencedName = std::string());

    // Prefixed onto logged errors, useful when one reporter is shared across several input files.
    void setFileName(const std::string& fileName) { m_fileName = fileName; }

    const std::vector<Error>& errors() const { return m_errors; }
    size_t errorCount() const { return m_errors.size(); }
    bool hasErrors() const { return !m_errors.empty(); }

    static const char* kindName(Kind kind);

private:
    bool m_suppress;
    std::string m_fileName;
    std::vector<Error> m_errors;
};

} // namespace sluice

#endif // SRC_SLUICE_ERROR_REPORTER_HPP_
