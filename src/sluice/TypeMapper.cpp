#include "sluice/TypeMapper.hpp"

#include <array>
#include <cctype>

namespace {

struct KeywordType {
    std::string_view text;
    sluice::Type::Kind kind;
};

constexpr std::array<KeywordType, 12> kKeywordTypes = {{
    { "void", sluice::Type::Kind::kVoid },
    { "boolean", sluice::Type::Kind::kBoolean },
    { "byte", sluice::Type::Kind::kByte },
    { "octet", sluice::Type::Kind::kOctet },
    { "short", sluice::Type::Kind::kShort },
    { "unsigned short", sluice::Type::Kind::kUnsignedShort },
    { "long", sluice::Type::Kind::kLong },
    { "unsigned long", sluice::Type::Kind::kUnsignedLong },
    { "float", sluice::Type::Kind::kFloat },
    { "double", sluice::Type::Kind::kDouble },
    { "DOMString", sluice::Type::Kind::kString },
    { "object", sluice::Type::Kind::kObject }
}};

constexpr std::string_view kPromisePrefix = "Promise<";

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

namespace sluice {

// static
Type TypeMapper::mapToken(std::string_view text) {
    text = trim(text);

    bool nullable = false;
    if (!text.empty() && text.back() == '?') {
        nullable = true;
        text = trim(text.substr(0, text.size() - 1));
    }

    Type type;
    bool found = false;
    if (text.size() > kPromisePrefix.size() && text.substr(0, kPromisePrefix.size()) == kPromisePrefix &&
        text.back() == '>') {
        type = Type::makePromise(mapToken(text.substr(kPromisePrefix.size(),
                                                      text.size() - kPromisePrefix.size() - 1)));
        found = true;
    } else {
        for (const auto& keyword : kKeywordTypes) {
            if (keyword.text == text) {
                type = Type::make(keyword.kind);
                found = true;
                break;
            }
        }
    }

    if (!found) {
        type = Type::makeInterfaceRef(std::string(text));
    }
    type.nullable = nullable;
    return type;
}

// static
bool TypeMapper::isKeyword(std::string_view text) {
    if (text == "Promise") {
        return true;
    }
    for (const auto& keyword : kKeywordTypes) {
        if (keyword.text == text) {
            return true;
        }
    }
    return false;
}

} // namespace sluice
