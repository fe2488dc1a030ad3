#include "sluice/Boundary.hpp"

#include "sluice/Session.hpp"

#include "spdlog/spdlog.h"

#include <memory>

extern "C" {

sluice::Session* sluice_session_create(uint32_t arenaCapacity) {
    auto session = std::make_unique<sluice::Session>(arenaCapacity);
    if (!session->init()) {
        return nullptr;
    }
    return session.release();
}

void sluice_session_destroy(sluice::Session* session) { delete session; }

int32_t sluice_write_buffer(sluice::Session* session, const uint8_t* bytes, uint32_t length,
                            sluice::ArenaRegion* region) {
    if (!session || !region || (length && !bytes)) {
        SPDLOG_ERROR("sluice_write_buffer called with null argument");
        return sluice::kInvalidArguments;
    }
    return session->writeBuffer(bytes, length, *region);
}

int32_t sluice_read_buffer(sluice::Session* session, sluice::ArenaRegion region, uint8_t* bytes) {
    if (!session || (region.length && !bytes)) {
        SPDLOG_ERROR("sluice_read_buffer called with null argument");
        return sluice::kInvalidArguments;
    }
    return session->arena().read(region.offset, region.length, bytes);
}

void sluice_reset_arena(sluice::Session* session) {
    if (session) {
        session->resetArena();
    }
}

uint32_t sluice_arena_used(const sluice::Session* session) { return session ? session->arena().used() : 0; }

} // extern "C"
