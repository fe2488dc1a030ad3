#ifndef SRC_SLUICE_TYPE_MAPPER_HPP_
#define SRC_SLUICE_TYPE_MAPPER_HPP_

#include "sluice/Type.hpp"

#include <string_view>

namespace sluice {

// Translates textual IDL type tokens into Types. Never fails: any identifier not in the keyword table is taken to be
// a reference to an interface, to be resolved later by the BindingGenerator.
class TypeMapper {
public:
    static Type mapToken(std::string_view text);

    // True if |text| is one of the built-in type keywords, including "Promise".
    static bool isKeyword(std::string_view text);
};

} // namespace sluice

#endif // SRC_SLUICE_TYPE_MAPPER_HPP_
