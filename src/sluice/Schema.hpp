#ifndef SRC_SLUICE_SCHEMA_HPP_
#define SRC_SLUICE_SCHEMA_HPP_

#include "sluice/Type.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sluice {

struct Argument {
    std::string name;
    Type type;
    bool optional = false;
    int32_t lineNumber = 0;
};

struct Method {
    std::string name;
    Type returnType;
    std::vector<Argument> arguments;
    bool isStatic = false;
    int32_t lineNumber = 0;
};

struct Attribute {
    std::string name;
    Type type;
    bool readonly = false;
    int32_t lineNumber = 0;
};

struct Interface {
    std::string name;
    std::vector<Method> methods;
    std::vector<Attribute> attributes;
    int32_t lineNumber = 0;

    // Return nullptr if no member of that name exists.
    const Method* findMethod(std::string_view methodName) const;
    const Attribute* findAttribute(std::string_view attributeName) const;
};

// The parsed form of one or more IDL inputs. Interfaces are kept in source order.
struct Schema {
    std::vector<Interface> interfaces;

    const Interface* findInterface(std::string_view interfaceName) const;
};

} // namespace sluice

#endif // SRC_SLUICE_SCHEMA_HPP_
