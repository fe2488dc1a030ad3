#ifndef SRC_SLUICE_SESSION_HPP_
#define SRC_SLUICE_SESSION_HPP_

#include "sluice/Arena.hpp"
#include "sluice/DispatchRegistry.hpp"
#include "sluice/Hash.hpp"
#include "sluice/Status.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace sluice {

// Owns all of the state for one host/sandbox boundary session: the Arena used to move variable-length data and the
// DispatchRegistry consulted by generated trampolines. Created by whichever side sets up the boundary and passed
// explicitly to every operation that needs it.
class Session {
public:
    // Matches the 1 MiB bridge buffer the sandbox side expects by default.
    static constexpr uint32_t kDefaultArenaCapacity = 1024 * 1024;

    Session() = delete;
    explicit Session(uint32_t arenaCapacity);
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    ~Session();

    // Maps the arena. A false return means the backing memory was unavailable and the session is unusable.
    bool init();

    // The only arena operations available to the rendering layer.
    Status writeBuffer(const void* bytes, uint32_t length, ArenaRegion& region);
    Status readBuffer(ArenaRegion region, std::vector<uint8_t>& bytes) const;
    void resetArena();

    // Called by generated trampolines.
    Status dispatch(Hash key, RawHandle receiver, ArenaRegion args, ArenaRegion& result);

    Arena& arena() { return *m_arena; }
    const Arena& arena() const { return *m_arena; }
    DispatchRegistry& registry() { return *m_registry; }

private:
    std::unique_ptr<Arena> m_arena;
    std::unique_ptr<DispatchRegistry> m_registry;
};

} // namespace sluice

#endif // SRC_SLUICE_SESSION_HPP_
