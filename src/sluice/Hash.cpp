#include "sluice/Hash.hpp"

#include "xxhash.h"

namespace sluice {

Hash hash(std::string_view symbol, Hash seed) {
    return XXH32(symbol.data(), symbol.size(), seed);
}

std::string exportSymbol(std::string_view interfaceName, std::string_view methodName) {
    std::string symbol(interfaceName);
    symbol += '_';
    symbol += methodName;
    return symbol;
}

Hash dispatchKey(std::string_view interfaceName, std::string_view methodName) {
    return hash(exportSymbol(interfaceName, methodName));
}

} // namespace sluice
