#ifndef SRC_SLUICE_ARENA_HPP_
#define SRC_SLUICE_ARENA_HPP_

#include "sluice/Status.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace sluice {

// Allocation handle into an Arena. Only valid until the next Arena::reset().
struct ArenaRegion {
    uint32_t offset;
    uint32_t length;
};

// A fixed-capacity bump allocator over one contiguous block of mapped memory, used to move variable-length data like
// strings and byte buffers across the boundary. Both sides only ever see offsets into the arena, never addresses.
// Allocations are never freed individually, the owner calls reset() between turns of boundary interaction to reclaim
// the whole region at once.
//
// Not thread safe. The boundary protocol only ever allows one side to run at a time.
class Arena {
public:
    Arena() = delete;
    explicit Arena(uint32_t capacity);
    Arena(const Arena&) = delete;
    Arena& operator=(const Arena&) = delete;
    ~Arena();

    // Maps the backing region. Returns false if the memory could not be obtained, which is fatal to the owner.
    bool map();
    bool isMapped() const { return m_capacity == 0 || m_startAddress != nullptr; }

    // On success sets |offset| to the start of |size| fresh bytes. Returns kArenaExhausted if fewer than |size| bytes
    // remain, leaving the arena unchanged, or kArenaUnmapped if map() has not succeeded.
    Status allocate(uint32_t size, uint32_t& offset);

    // Allocates |length| bytes and copies |bytes| into them.
    Status write(const void* bytes, uint32_t length, uint32_t& offset);
    Status write(std::string_view bytes, uint32_t& offset);

    // Copies |length| bytes starting at |offset| into |bytes|. Returns kOutOfBounds if the range extends past the end
    // of the arena, kArenaUnmapped before map(). Reads are checked against capacity, not against the bump cursor.
    Status read(uint32_t offset, uint32_t length, std::vector<uint8_t>& bytes) const;
    Status read(uint32_t offset, uint32_t length, void* bytes) const;

    // Invalidates every outstanding offset. The next allocation starts at 0.
    void reset();

    uint32_t capacity() const { return m_capacity; }
    uint32_t used() const { return m_used; }
    uint32_t available() const { return m_capacity - m_used; }

private:
    bool unmap();
    bool inBounds(uint32_t offset, uint32_t length) const;

    uint8_t* m_startAddress;
    uint32_t m_capacity;
    // Bump cursor, the offset of the next allocation.
    uint32_t m_used;
};

} // namespace sluice

#endif // SRC_SLUICE_ARENA_HPP_
