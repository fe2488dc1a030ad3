#ifndef SRC_SLUICE_DISPATCH_REGISTRY_HPP_
#define SRC_SLUICE_DISPATCH_REGISTRY_HPP_

#include "sluice/Arena.hpp"
#include "sluice/Hash.hpp"
#include "sluice/Status.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sluice {

class Session;

// Opaque value identifying a resource owned by the other side of the boundary. Wide enough for a pointer or an index
// from either side.
using RawHandle = std::uint64_t;

// The registered implementation of one IDL method. |args| is the argument record the trampoline built, |result| is
// set by the implementation to the region holding its encoded result, or left empty for void methods.
using Implementation =
    std::function<Status(Session* session, RawHandle receiver, ArenaRegion args, ArenaRegion& result)>;

// Maps (interface, method) pairs to implementations. The host populates it once at session setup, after which the
// first dispatch seals it and any further registration is refused. Trampolines look up implementations by the
// precomputed dispatchKey() hash of their export symbol.
class DispatchRegistry {
public:
    DispatchRegistry(): m_sealed(false) {}
    ~DispatchRegistry() = default;

    // Returns false on a duplicate registration, a hash collision with a different pair, an empty implementation, or
    // if the registry has already been sealed.
    bool registerImplementation(std::string_view interfaceName, std::string_view methodName,
                                Implementation implementation);

    void seal() { m_sealed = true; }
    bool isSealed() const { return m_sealed; }

    Status dispatch(Session* session, Hash key, RawHandle receiver, ArenaRegion args, ArenaRegion& result);

    // Returns nullptr if nothing is registered for this pair.
    const Implementation* lookup(std::string_view interfaceName, std::string_view methodName) const;
    size_t size() const { return m_entries.size(); }

private:
    struct Entry {
        std::string interfaceName;
        std::string methodName;
        Implementation implementation;
    };

    std::unordered_map<Hash, Entry> m_entries;
    bool m_sealed;
};

} // namespace sluice

#endif // SRC_SLUICE_DISPATCH_REGISTRY_HPP_
