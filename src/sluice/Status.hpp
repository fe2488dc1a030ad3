#ifndef SRC_SLUICE_STATUS_HPP_
#define SRC_SLUICE_STATUS_HPP_

#include <cstdint>

namespace sluice {

// Result codes for runtime operations. These cross the boundary as int32_t return values from trampolines, so the
// numeric values are part of the ABI and must not be reordered.
enum Status : std::int32_t {
    kOk = 0,
    kArenaExhausted = 1, // Not enough room left in the arena for the requested allocation.
    kOutOfBounds = 2,    // A read or record access reached past the end of the arena.
    kNotRegistered = 3,  // No implementation registered for the (interface, method) pair.
    kArenaUnmapped = 4,  // The arena was used before a successful Arena::map().
    kInvalidArguments = 5,
    kImplementationFailed = 6
};

const char* statusName(Status status);

} // namespace sluice

#endif // SRC_SLUICE_STATUS_HPP_
