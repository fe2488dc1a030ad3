#ifndef SRC_SLUICE_BOUNDARY_HPP_
#define SRC_SLUICE_BOUNDARY_HPP_

#include "sluice/Arena.hpp"

#include <cstdint>

namespace sluice {
class Session;
} // namespace sluice

// C entry points for the side of the boundary that can't speak C++. Every function takes the session explicitly,
// there is no process-wide session. Status codes are sluice::Status values.
extern "C" {

// Returns nullptr if the arena backing memory could not be mapped.
sluice::Session* sluice_session_create(uint32_t arenaCapacity);
void sluice_session_destroy(sluice::Session* session);

int32_t sluice_write_buffer(sluice::Session* session, const uint8_t* bytes, uint32_t length,
                            sluice::ArenaRegion* region);
// |bytes| must have room for region.length bytes.
int32_t sluice_read_buffer(sluice::Session* session, sluice::ArenaRegion region, uint8_t* bytes);
void sluice_reset_arena(sluice::Session* session);
uint32_t sluice_arena_used(const sluice::Session* session);

} // extern "C"

#endif // SRC_SLUICE_BOUNDARY_HPP_
