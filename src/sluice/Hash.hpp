#ifndef SRC_SLUICE_HASH_HPP_
#define SRC_SLUICE_HASH_HPP_

#include <cstdint>
#include <string>
#include <string_view>

namespace sluice {

using Hash = std::uint32_t;

Hash hash(std::string_view symbol, Hash seed = 0);

// Exported trampoline symbol for a method, which is also the string hashed to produce its dispatch key.
std::string exportSymbol(std::string_view interfaceName, std::string_view methodName);

// Key used both by the generated trampolines and by the DispatchRegistry to find the implementation of a method.
Hash dispatchKey(std::string_view interfaceName, std::string_view methodName);

} // namespace sluice

#endif // SRC_SLUICE_HASH_HPP_
