#ifndef SRC_SLUICE_LEXER_HPP_
#define SRC_SLUICE_LEXER_HPP_

#include "sluice/Token.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace sluice {

class ErrorReporter;

class Lexer {
public:
    Lexer() = delete;
    Lexer(std::string_view code, std::shared_ptr<ErrorReporter> errorReporter);
    // Used for testing, errors go to an internally owned and suppressed ErrorReporter.
    explicit Lexer(std::string_view code);
    ~Lexer() = default;

    // Returns false and reports a kSyntax error on the first character that can't start a token, an unterminated
    // string, or an unterminated block comment.
    bool lex();

    const std::vector<Token>& tokens() const { return m_tokens; }
    std::shared_ptr<ErrorReporter> errorReporter() { return m_errorReporter; }

    // Access for testing
    std::string_view code() const { return m_code; }

private:
    // Each of these starts at m_position, and on success leaves m_position just past the consumed text.
    bool lexIdentifier();
    bool lexNumber();
    bool lexString();
    bool skipComment();

    bool atEnd() const { return m_position >= m_code.size(); }
    char peek(size_t ahead = 0) const;

    std::string_view m_code;
    size_t m_position;
    int32_t m_lineNumber;
    std::vector<Token> m_tokens;
    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace sluice

#endif // SRC_SLUICE_LEXER_HPP_
