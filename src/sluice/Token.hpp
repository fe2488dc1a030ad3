#ifndef SRC_SLUICE_TOKEN_HPP_
#define SRC_SLUICE_TOKEN_HPP_

#include <cstdint>
#include <string_view>

namespace sluice {

// Lexer lexes IDL source to produce Tokens, Parser consumes Tokens to produce a Schema.
struct Token {
    Token() = delete;
    ~Token() = default;

    enum Name {
        kEmpty = 0, // represents no token, returned when reading past the end of input
        kIdentifier = 1,
        kNumber = 2,
        kString = 3,

        // Keywords. Type names like "long" or "DOMString" are lexed as identifiers and resolved by the TypeMapper.
        kInterface = 4,
        kReadonly = 5,
        kAttribute = 6,
        kOptional = 7,
        kStatic = 8,
        kUnsigned = 9,

        kOpenCurly = 10,
        kCloseCurly = 11,
        kOpenParen = 12,
        kCloseParen = 13,
        kOpenSquare = 14,
        kCloseSquare = 15,
        kLessThan = 16,
        kGreaterThan = 17,
        kComma = 18,
        kSemicolon = 19,
        kAssign = 20,
        kQuestion = 21,
        kColon = 22
    };

    Name name;
    std::string_view range;
    // 1-based line number of the first character of the token.
    int32_t lineNumber;

    static inline Token make(Name n, std::string_view r, int32_t line) { return Token(n, r, line); }
    static inline Token makeEmpty(int32_t line) { return Token(kEmpty, std::string_view(), line); }

private:
    Token(Name n, std::string_view r, int32_t line): name(n), range(r), lineNumber(line) {}
};

} // namespace sluice

#endif // SRC_SLUICE_TOKEN_HPP_
