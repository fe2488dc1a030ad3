#include "sluice/Parser.hpp"

#include "sluice/ErrorReporter.hpp"
#include "sluice/Lexer.hpp"
#include "sluice/TypeMapper.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <array>

namespace {

// Special operation qualifiers that may precede a method's return type. Only "static" (lexed as a keyword) changes
// the resulting Method.
constexpr std::array<std::string_view, 5> kQualifiers = { "getter", "setter", "deleter", "stringifier",
                                                          "legacycaller" };

bool isQualifier(std::string_view word) {
    for (auto qualifier : kQualifiers) {
        if (qualifier == word) {
            return true;
        }
    }
    return false;
}

} // namespace

namespace sluice {

Parser::Parser(Lexer* lexer, std::shared_ptr<ErrorReporter> errorReporter):
    m_lexer(lexer), m_tokenIndex(0), m_errorReporter(errorReporter) {}

Parser::Parser(std::string_view code, std::shared_ptr<ErrorReporter> errorReporter):
    m_ownLexer(std::make_unique<Lexer>(code, errorReporter)),
    m_lexer(m_ownLexer.get()),
    m_tokenIndex(0),
    m_errorReporter(errorReporter) {}

Parser::Parser(std::string_view code):
    m_tokenIndex(0), m_errorReporter(std::make_shared<ErrorReporter>(true)) {
    m_ownLexer = std::make_unique<Lexer>(code, m_errorReporter);
    m_lexer = m_ownLexer.get();
}

Parser::~Parser() {}

bool Parser::parse() {
    m_schema.interfaces.clear();
    return parse(m_schema);
}

bool Parser::parse(Schema& schema) {
    if (m_ownLexer && !m_ownLexer->lex()) {
        return false;
    }

    m_tokenIndex = 0;
    m_interfaceName.clear();
    auto originalSize = schema.interfaces.size();
    if (!innerParse(schema)) {
        // No partial schemas, a half-parsed interface must not produce a half-wired binding.
        schema.interfaces.resize(originalSize);
        return false;
    }

    SPDLOG_DEBUG("Parsed {} interfaces", schema.interfaces.size() - originalSize);
    return true;
}

bool Parser::innerParse(Schema& schema) {
    while (!atEnd()) {
        if (token().name == Token::Name::kOpenSquare) {
            if (!skipExtendedAttributes()) {
                return false;
            }
            if (token().name != Token::Name::kOpenSquare && token().name != Token::Name::kInterface) {
                m_errorReporter->addError(ErrorReporter::kUnexpectedToken, token().lineNumber,
                                          fmt::format("extended attributes must precede an interface, found {}",
                                                      describe(token())));
                return false;
            }
            continue;
        }

        if (token().name == Token::Name::kInterface) {
            if (!parseInterface(schema)) {
                return false;
            }
            continue;
        }

        if (token().name == Token::Name::kCloseCurly && token(1).name == Token::Name::kSemicolon) {
            m_errorReporter->addError(ErrorReporter::kUnexpectedClose, token().lineNumber,
                                      "'};' without an open interface");
            return false;
        }

        m_errorReporter->addError(ErrorReporter::kUnexpectedToken, token().lineNumber,
                                  fmt::format("unexpected {} outside of an interface definition", describe(token())));
        return false;
    }

    return true;
}

bool Parser::parseInterface(Schema& schema) {
    Interface interfaceDef;
    interfaceDef.lineNumber = token().lineNumber;
    // 'interface'
    next();

    if (token().name != Token::Name::kIdentifier) {
        return syntaxError(interfaceDef.lineNumber,
                           fmt::format("interface definition missing name, found {}", describe(token())));
    }
    interfaceDef.name = std::string(token().range);
    m_interfaceName = interfaceDef.name;
    next();

    if (TypeMapper::isKeyword(interfaceDef.name)) {
        return syntaxError(interfaceDef.lineNumber,
                           fmt::format("interface name '{}' is a built-in type name", interfaceDef.name));
    }

    if (token().name == Token::Name::kColon) {
        return syntaxError(token().lineNumber,
                           fmt::format("interface '{}' uses inheritance, which is not supported", interfaceDef.name));
    }

    if (schema.findInterface(interfaceDef.name)) {
        m_errorReporter->addError(ErrorReporter::kDuplicateName, interfaceDef.lineNumber, interfaceDef.name,
                                  std::string(), fmt::format("duplicate interface name '{}'", interfaceDef.name));
        return false;
    }

    if (token().name == Token::Name::kOpenCurly) {
        next();
    }

    while (true) {
        if (atEnd()) {
            return syntaxError(interfaceDef.lineNumber,
                               fmt::format("unterminated interface '{}', expected '}};'", interfaceDef.name));
        }

        if (token().name == Token::Name::kCloseCurly) {
            next();
            if (token().name != Token::Name::kSemicolon) {
                return syntaxError(token().lineNumber, fmt::format("expected ';' after '}}' closing interface '{}'",
                                                                   interfaceDef.name));
            }
            next();
            break;
        }

        if (!parseMember(interfaceDef)) {
            return false;
        }
    }

    SPDLOG_DEBUG("Parsed interface {} with {} methods and {} attributes", interfaceDef.name,
                 interfaceDef.methods.size(), interfaceDef.attributes.size());
    schema.interfaces.emplace_back(std::move(interfaceDef));
    m_interfaceName.clear();
    return true;
}

bool Parser::parseMember(Interface& interfaceDef) {
    while (token().name == Token::Name::kOpenSquare) {
        if (!skipExtendedAttributes()) {
            return false;
        }
        if (token().name == Token::Name::kCloseCurly || atEnd()) {
            return syntaxError(token().lineNumber, fmt::format("extended attributes must precede a member, found {}",
                                                               describe(token())));
        }
    }
    if (token().name == Token::Name::kInterface) {
        return syntaxError(token().lineNumber,
                           fmt::format("expected '}};' to close interface '{}' before next interface",
                                       interfaceDef.name));
    }
    if (memberIsMethod()) {
        return parseMethod(interfaceDef);
    }
    return parseAttribute(interfaceDef);
}

bool Parser::parseMethod(Interface& interfaceDef) {
    Method method;
    method.lineNumber = token().lineNumber;

    if (token().name == Token::Name::kStatic) {
        method.isStatic = true;
        next();
    } else if (token().name == Token::Name::kIdentifier && isQualifier(token().range) &&
               token(1).name != Token::Name::kOpenParen) {
        next();
    }

    std::string typeText;
    if (!parseType(typeText)) {
        return false;
    }
    method.returnType = TypeMapper::mapToken(typeText);

    if (token().name != Token::Name::kIdentifier) {
        return syntaxError(token().lineNumber, fmt::format("expected method name, found {}", describe(token())));
    }
    method.name = std::string(token().range);
    next();

    if (!expect(Token::Name::kOpenParen, "'(' after method name")) {
        return false;
    }

    if (token().name != Token::Name::kCloseParen) {
        while (true) {
            if (!parseArgument(method)) {
                return false;
            }
            if (token().name == Token::Name::kComma) {
                next();
                continue;
            }
            break;
        }
    }

    if (!expect(Token::Name::kCloseParen, "')' closing argument list")) {
        return false;
    }
    if (!expect(Token::Name::kSemicolon, "';' after method declaration")) {
        return false;
    }

    if (!checkMemberName(interfaceDef, method.name, method.lineNumber)) {
        return false;
    }
    interfaceDef.methods.emplace_back(std::move(method));
    return true;
}

bool Parser::parseAttribute(Interface& interfaceDef) {
    Attribute attribute;
    attribute.lineNumber = token().lineNumber;

    if (token().name == Token::Name::kStatic) {
        return syntaxError(token().lineNumber, "static attributes are not supported");
    }
    if (token().name == Token::Name::kReadonly) {
        attribute.readonly = true;
        next();
    }
    if (token().name == Token::Name::kAttribute) {
        next();
    }

    std::string typeText;
    if (!parseType(typeText)) {
        return false;
    }
    attribute.type = TypeMapper::mapToken(typeText);
    if (attribute.type.kind == Type::Kind::kVoid) {
        return syntaxError(attribute.lineNumber, "attribute type cannot be void");
    }

    if (token().name != Token::Name::kIdentifier) {
        return syntaxError(token().lineNumber, fmt::format("expected attribute name, found {}", describe(token())));
    }
    attribute.name = std::string(token().range);
    next();

    if (!expect(Token::Name::kSemicolon, "';' after attribute declaration")) {
        return false;
    }

    if (!checkMemberName(interfaceDef, attribute.name, attribute.lineNumber)) {
        return false;
    }
    interfaceDef.attributes.emplace_back(std::move(attribute));
    return true;
}

bool Parser::parseArgument(Method& method) {
    if (token().name == Token::Name::kOpenSquare && !skipExtendedAttributes()) {
        return false;
    }

    Argument argument;
    argument.lineNumber = token().lineNumber;
    if (token().name == Token::Name::kOptional) {
        argument.optional = true;
        next();
    }

    std::string typeText;
    if (!parseType(typeText)) {
        return false;
    }
    argument.type = TypeMapper::mapToken(typeText);

    if (token().name != Token::Name::kIdentifier) {
        return syntaxError(token().lineNumber, fmt::format("expected argument name in method '{}', found {}",
                                                           method.name, describe(token())));
    }
    argument.name = std::string(token().range);
    next();

    if (argument.type.kind == Type::Kind::kVoid) {
        return syntaxError(argument.lineNumber, fmt::format("argument '{}' of method '{}' cannot be void",
                                                            argument.name, method.name));
    }

    for (const auto& existing : method.arguments) {
        if (existing.name == argument.name) {
            m_errorReporter->addError(ErrorReporter::kDuplicateName, argument.lineNumber, m_interfaceName,
                                      method.name, fmt::format("duplicate argument name '{}' in method '{}'",
                                                               argument.name, method.name));
            return false;
        }
    }

    if (token().name == Token::Name::kAssign) {
        next();
        if (!parseDefaultValue()) {
            return false;
        }
    }

    method.arguments.emplace_back(std::move(argument));
    return true;
}

bool Parser::parseDefaultValue() {
    switch (token().name) {
    case Token::Name::kNumber:
    case Token::Name::kString:
    case Token::Name::kIdentifier:
        next();
        return true;

    case Token::Name::kOpenCurly:
        next();
        return expect(Token::Name::kCloseCurly, "'}' in empty dictionary default value");

    case Token::Name::kOpenSquare:
        next();
        return expect(Token::Name::kCloseSquare, "']' in empty sequence default value");

    default:
        return syntaxError(token().lineNumber, fmt::format("expected default value, found {}", describe(token())));
    }
}

bool Parser::parseType(std::string& typeText) {
    int32_t lineNumber = token().lineNumber;

    if (token().name == Token::Name::kUnsigned) {
        next();
        if (token().name != Token::Name::kIdentifier || (token().range != "short" && token().range != "long")) {
            return syntaxError(lineNumber, fmt::format("expected 'short' or 'long' after 'unsigned', found {}",
                                                       describe(token())));
        }
        typeText = fmt::format("unsigned {}", token().range);
        next();
    } else if (token().name == Token::Name::kIdentifier) {
        typeText = std::string(token().range);
        next();

        if (typeText == "Promise") {
            if (!expect(Token::Name::kLessThan, "'<' after Promise")) {
                return false;
            }
            std::string innerText;
            if (!parseType(innerText)) {
                return false;
            }
            if (!expect(Token::Name::kGreaterThan, "'>' closing Promise type")) {
                return false;
            }
            typeText = fmt::format("Promise<{}>", innerText);
        } else if (token().name == Token::Name::kLessThan) {
            return syntaxError(lineNumber, fmt::format("generic type '{}<...>' is not supported", typeText));
        }
    } else {
        return syntaxError(lineNumber, fmt::format("expected type, found {}", describe(token())));
    }

    if (token().name == Token::Name::kQuestion) {
        typeText += '?';
        next();
    }
    return true;
}

bool Parser::skipExtendedAttributes() {
    int32_t lineNumber = token().lineNumber;
    // '['
    next();
    int32_t depth = 1;
    while (depth > 0) {
        if (atEnd()) {
            return syntaxError(lineNumber, "unterminated extended attribute list");
        }
        if (token().name == Token::Name::kOpenSquare) {
            ++depth;
        } else if (token().name == Token::Name::kCloseSquare) {
            --depth;
        }
        next();
    }
    return true;
}

bool Parser::memberIsMethod() const {
    for (size_t i = 0; m_tokenIndex + i < m_lexer->tokens().size(); ++i) {
        auto name = token(i).name;
        if (name == Token::Name::kOpenParen) {
            return true;
        }
        if (name == Token::Name::kSemicolon || name == Token::Name::kCloseCurly) {
            return false;
        }
    }
    return false;
}

bool Parser::checkMemberName(const Interface& interfaceDef, const std::string& name, int32_t lineNumber) {
    if (interfaceDef.findMethod(name) || interfaceDef.findAttribute(name)) {
        m_errorReporter->addError(ErrorReporter::kDuplicateName, lineNumber, interfaceDef.name, name,
                                  fmt::format("duplicate member name '{}' in interface '{}'", name,
                                              interfaceDef.name));
        return false;
    }
    return true;
}

bool Parser::expect(Token::Name name, const char* description) {
    if (token().name != name) {
        return syntaxError(token().lineNumber, fmt::format("expected {}, found {}", description, describe(token())));
    }
    next();
    return true;
}

Token Parser::token(size_t ahead) const {
    const auto& tokens = m_lexer->tokens();
    if (m_tokenIndex + ahead < tokens.size()) {
        return tokens[m_tokenIndex + ahead];
    }
    return Token::makeEmpty(tokens.empty() ? 1 : tokens.back().lineNumber);
}

bool Parser::atEnd() const { return m_tokenIndex >= m_lexer->tokens().size(); }

bool Parser::syntaxError(int32_t lineNumber, const std::string& message) {
    m_errorReporter->addError(ErrorReporter::kSyntax, lineNumber, m_interfaceName, std::string(), message);
    return false;
}

// static
std::string Parser::describe(const Token& token) {
    if (token.name == Token::Name::kEmpty) {
        return "end of input";
    }
    return fmt::format("'{}'", token.range);
}

} // namespace sluice
