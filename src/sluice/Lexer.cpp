#include "sluice/Lexer.hpp"

#include "sluice/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <array>
#include <cctype>

namespace {

struct Keyword {
    std::string_view text;
    sluice::Token::Name name;
};

// Only the structural words of the grammar. Type keywords stay identifiers so the TypeMapper remains the single place
// that knows the type vocabulary.
constexpr std::array<Keyword, 6> kKeywords = {{
    { "interface", sluice::Token::Name::kInterface },
    { "readonly", sluice::Token::Name::kReadonly },
    { "attribute", sluice::Token::Name::kAttribute },
    { "optional", sluice::Token::Name::kOptional },
    { "static", sluice::Token::Name::kStatic },
    { "unsigned", sluice::Token::Name::kUnsigned }
}};

bool isIdentifierStart(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
bool isIdentifierChar(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }
bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

} // namespace

namespace sluice {

Lexer::Lexer(std::string_view code, std::shared_ptr<ErrorReporter> errorReporter):
    m_code(code), m_position(0), m_lineNumber(1), m_errorReporter(errorReporter) {}

Lexer::Lexer(std::string_view code):
    m_code(code), m_position(0), m_lineNumber(1), m_errorReporter(std::make_shared<ErrorReporter>(true)) {}

char Lexer::peek(size_t ahead) const {
    if (m_position + ahead >= m_code.size()) {
        return '\0';
    }
    return m_code[m_position + ahead];
}

bool Lexer::lex() {
    m_tokens.clear();
    m_position = 0;
    m_lineNumber = 1;

    while (!atEnd()) {
        char c = peek();
        Token::Name single = Token::Name::kEmpty;

        switch (c) {
        case '\n':
            ++m_lineNumber;
            ++m_position;
            continue;

        case ' ':
        case '\t':
        case '\r':
        case '\f':
        case '\v':
            ++m_position;
            continue;

        case '/':
            if (!skipComment()) {
                return false;
            }
            continue;

        case '"':
            if (!lexString()) {
                return false;
            }
            continue;

        case '{': single = Token::Name::kOpenCurly; break;
        case '}': single = Token::Name::kCloseCurly; break;
        case '(': single = Token::Name::kOpenParen; break;
        case ')': single = Token::Name::kCloseParen; break;
        case '[': single = Token::Name::kOpenSquare; break;
        case ']': single = Token::Name::kCloseSquare; break;
        case '<': single = Token::Name::kLessThan; break;
        case '>': single = Token::Name::kGreaterThan; break;
        case ',': single = Token::Name::kComma; break;
        case ';': single = Token::Name::kSemicolon; break;
        case '=': single = Token::Name::kAssign; break;
        case '?': single = Token::Name::kQuestion; break;
        case ':': single = Token::Name::kColon; break;

        default:
            if (isIdentifierStart(c)) {
                if (!lexIdentifier()) {
                    return false;
                }
                continue;
            }
            if (isDigit(c) || (c == '-' && (isDigit(peek(1)) || peek(1) == '.'))) {
                if (!lexNumber()) {
                    return false;
                }
                continue;
            }
            m_errorReporter->addError(ErrorReporter::kSyntax, m_lineNumber,
                                      fmt::format("unexpected character '{}'", c));
            return false;
        }

        m_tokens.emplace_back(Token::make(single, m_code.substr(m_position, 1), m_lineNumber));
        ++m_position;
    }

    SPDLOG_DEBUG("Lexed {} tokens over {} lines", m_tokens.size(), m_lineNumber);
    return true;
}

bool Lexer::lexIdentifier() {
    size_t start = m_position;
    while (!atEnd() && isIdentifierChar(peek())) {
        ++m_position;
    }
    auto range = m_code.substr(start, m_position - start);

    Token::Name name = Token::Name::kIdentifier;
    for (const auto& keyword : kKeywords) {
        if (keyword.text == range) {
            name = keyword.name;
            break;
        }
    }
    m_tokens.emplace_back(Token::make(name, range, m_lineNumber));
    return true;
}

bool Lexer::lexNumber() {
    size_t start = m_position;
    if (peek() == '-') {
        ++m_position;
    }

    if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X')) {
        m_position += 2;
        size_t digitsStart = m_position;
        while (!atEnd() && std::isxdigit(static_cast<unsigned char>(peek()))) {
            ++m_position;
        }
        if (m_position == digitsStart) {
            m_errorReporter->addError(ErrorReporter::kSyntax, m_lineNumber, "hexadecimal literal missing digits");
            return false;
        }
    } else {
        while (!atEnd() && (isDigit(peek()) || peek() == '.')) {
            ++m_position;
        }
        if (peek() == 'e' || peek() == 'E') {
            ++m_position;
            if (peek() == '+' || peek() == '-') {
                ++m_position;
            }
            if (!isDigit(peek())) {
                m_errorReporter->addError(ErrorReporter::kSyntax, m_lineNumber, "malformed exponent in number literal");
                return false;
            }
            while (!atEnd() && isDigit(peek())) {
                ++m_position;
            }
        }
    }

    // Catches things like "12abc", which would otherwise silently lex as a number followed by an identifier.
    if (!atEnd() && isIdentifierChar(peek())) {
        m_errorReporter->addError(ErrorReporter::kSyntax, m_lineNumber,
                                  fmt::format("malformed number literal '{}'",
                                              m_code.substr(start, m_position - start + 1)));
        return false;
    }

    m_tokens.emplace_back(Token::make(Token::Name::kNumber, m_code.substr(start, m_position - start), m_lineNumber));
    return true;
}

bool Lexer::lexString() {
    size_t start = m_position;
    int32_t startLine = m_lineNumber;
    ++m_position;
    while (!atEnd() && peek() != '"') {
        if (peek() == '\n') {
            ++m_lineNumber;
        }
        ++m_position;
    }
    if (atEnd()) {
        m_errorReporter->addError(ErrorReporter::kSyntax, startLine, "unterminated string literal");
        return false;
    }
    // Consume closing quote.
    ++m_position;
    m_tokens.emplace_back(Token::make(Token::Name::kString, m_code.substr(start, m_position - start), startLine));
    return true;
}

bool Lexer::skipComment() {
    if (peek(1) == '/') {
        while (!atEnd() && peek() != '\n') {
            ++m_position;
        }
        return true;
    }

    if (peek(1) == '*') {
        int32_t startLine = m_lineNumber;
        m_position += 2;
        while (!atEnd()) {
            if (peek() == '*' && peek(1) == '/') {
                m_position += 2;
                return true;
            }
            if (peek() == '\n') {
                ++m_lineNumber;
            }
            ++m_position;
        }
        m_errorReporter->addError(ErrorReporter::kSyntax, startLine, "unterminated block comment");
        return false;
    }

    m_errorReporter->addError(ErrorReporter::kSyntax, m_lineNumber, "unexpected character '/'");
    return false;
}

} // namespace sluice
