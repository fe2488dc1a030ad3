#include "sluice/Type.hpp"

namespace sluice {

bool Type::isPassedInline() const {
    switch (kind) {
    case kBoolean:
    case kByte:
    case kOctet:
    case kShort:
    case kUnsignedShort:
    case kLong:
    case kUnsignedLong:
    case kFloat:
    case kDouble:
        return true;
    default:
        return false;
    }
}

std::string Type::toString() const {
    std::string text;
    switch (kind) {
    case kVoid: text = "void"; break;
    case kBoolean: text = "boolean"; break;
    case kByte: text = "byte"; break;
    case kOctet: text = "octet"; break;
    case kShort: text = "short"; break;
    case kUnsignedShort: text = "unsigned short"; break;
    case kLong: text = "long"; break;
    case kUnsignedLong: text = "unsigned long"; break;
    case kFloat: text = "float"; break;
    case kDouble: text = "double"; break;
    case kString: text = "DOMString"; break;
    case kObject: text = "object"; break;
    case kPromise: text = "Promise<" + (inner ? inner->toString() : std::string("void")) + ">"; break;
    case kInterfaceRef: text = name; break;
    }
    if (nullable) {
        text += '?';
    }
    return text;
}

bool Type::operator==(const Type& other) const {
    if (kind != other.kind || nullable != other.nullable) {
        return false;
    }
    if (kind == kInterfaceRef) {
        return name == other.name;
    }
    if (kind == kPromise) {
        if (!inner || !other.inner) {
            return inner == other.inner;
        }
        return *inner == *other.inner;
    }
    return true;
}

} // namespace sluice
