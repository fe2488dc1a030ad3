#include "sluice/Session.hpp"

#include "spdlog/spdlog.h"

namespace sluice {

Session::Session(uint32_t arenaCapacity):
    m_arena(std::make_unique<Arena>(arenaCapacity)), m_registry(std::make_unique<DispatchRegistry>()) {}

Session::~Session() {}

bool Session::init() {
    if (!m_arena->map()) {
        SPDLOG_CRITICAL("Out of memory creating boundary session with {} byte arena", m_arena->capacity());
        return false;
    }
    SPDLOG_DEBUG("Boundary session ready with {} byte arena", m_arena->capacity());
    return true;
}

Status Session::writeBuffer(const void* bytes, uint32_t length, ArenaRegion& region) {
    uint32_t offset = 0;
    Status status = m_arena->write(bytes, length, offset);
    if (status != kOk) {
        return status;
    }
    region = ArenaRegion{offset, length};
    return kOk;
}

Status Session::readBuffer(ArenaRegion region, std::vector<uint8_t>& bytes) const {
    return m_arena->read(region.offset, region.length, bytes);
}

void Session::resetArena() { m_arena->reset(); }

Status Session::dispatch(Hash key, RawHandle receiver, ArenaRegion args, ArenaRegion& result) {
    return m_registry->dispatch(this, key, receiver, args, result);
}

} // namespace sluice
