#ifndef SRC_SLUICE_PARSER_HPP_
#define SRC_SLUICE_PARSER_HPP_

#include "sluice/Schema.hpp"
#include "sluice/Token.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace sluice {

class ErrorReporter;
class Lexer;

// Recursive-descent parser for the IDL grammar:
//
//   schema      := interface*
//   interface   := "interface" IDENT ["{"] member* "};"
//   member      := attribute | method
//   attribute   := ["readonly"] ["attribute"] type IDENT ";"
//   method      := [qualifier] type IDENT "(" [arg ("," arg)*] ")" ";"
//   arg         := ["optional"] type IDENT ["=" default]
//   type        := ["unsigned"] IDENT ["?"] | "Promise" "<" type ">" ["?"]
//
// WebIDL extended attribute lists "[...]" are accepted and ignored ahead of interfaces, members, and arguments.
// Parsing stops at the first error, which is added to the ErrorReporter along with its line number.
class Parser {
public:
    // Builds a Schema from an external lexer that has already successfully lexed the source code.
    Parser(Lexer* lexer, std::shared_ptr<ErrorReporter> errorReporter);
    Parser(std::string_view code, std::shared_ptr<ErrorReporter> errorReporter);

    // Used for testing, lexes the code itself with an owned Lexer and a suppressed ErrorReporter.
    explicit Parser(std::string_view code);
    ~Parser();

    // Parses into the internal schema(), which is left empty on failure.
    bool parse();

    // Appends parsed interfaces onto |schema|, checking names against the interfaces already there. On failure
    // |schema| is returned to the state it was in before the call.
    bool parse(Schema& schema);

    const Schema& schema() const { return m_schema; }
    std::shared_ptr<ErrorReporter> errorReporter() { return m_errorReporter; }

private:
    bool innerParse(Schema& schema);
    bool parseInterface(Schema& schema);
    bool parseMember(Interface& interfaceDef);
    bool parseMethod(Interface& interfaceDef);
    bool parseAttribute(Interface& interfaceDef);
    bool parseArgument(Method& method);
    bool parseDefaultValue();
    bool parseType(std::string& typeText);
    bool skipExtendedAttributes();

    // True if the member starting at the current token contains '(' before its terminating ';'.
    bool memberIsMethod() const;
    bool checkMemberName(const Interface& interfaceDef, const std::string& name, int32_t lineNumber);
    bool expect(Token::Name name, const char* description);

    Token token(size_t ahead = 0) const;
    void next() { ++m_tokenIndex; }
    bool atEnd() const;

    // Always returns false, for the convenience of the callers.
    bool syntaxError(int32_t lineNumber, const std::string& message);
    static std::string describe(const Token& token);

    std::unique_ptr<Lexer> m_ownLexer;
    Lexer* m_lexer;
    size_t m_tokenIndex;
    std::string m_interfaceName;

    std::shared_ptr<ErrorReporter> m_errorReporter;
    Schema m_schema;
};

} // namespace sluice

#endif // SRC_SLUICE_PARSER_HPP_
