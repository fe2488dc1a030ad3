#include "sluice/Schema.hpp"

namespace sluice {

const Method* Interface::findMethod(std::string_view methodName) const {
    for (const auto& method : methods) {
        if (method.name == methodName) {
            return &method;
        }
    }
    return nullptr;
}

const Attribute* Interface::findAttribute(std::string_view attributeName) const {
    for (const auto& attribute : attributes) {
        if (attribute.name == attributeName) {
            return &attribute;
        }
    }
    return nullptr;
}

const Interface* Schema::findInterface(std::string_view interfaceName) const {
    for (const auto& interfaceDef : interfaces) {
        if (interfaceDef.name == interfaceName) {
            return &interfaceDef;
        }
    }
    return nullptr;
}

} // namespace sluice
