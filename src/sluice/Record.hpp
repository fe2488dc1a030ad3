#ifndef SRC_SLUICE_RECORD_HPP_
#define SRC_SLUICE_RECORD_HPP_

#include "sluice/Arena.hpp"
#include "sluice/Status.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sluice {

// Argument and result records are a flat sequence of 8-byte little-endian slots stored in the Arena. Integers of any
// width are widened to int64_t, floats to double, and an ArenaRegion packs offset into the low 4 bytes and length into
// the high 4 bytes. Trampolines build a record from their parameters, implementations read it back by index.
constexpr uint32_t kRecordSlotSize = 8;

class RecordWriter {
public:
    RecordWriter() = default;
    ~RecordWriter() = default;

    void addInteger(int64_t value);
    void addFloat(double value);
    void addRegion(ArenaRegion region);

    // Copies the record into |arena|, setting |region| to where it landed. An empty record allocates nothing.
    Status finish(Arena& arena, ArenaRegion& region) const;

    size_t slotCount() const { return m_bytes.size() / kRecordSlotSize; }

private:
    void addBits(uint64_t bits);

    std::vector<uint8_t> m_bytes;
};

class RecordReader {
public:
    RecordReader() = delete;
    RecordReader(const Arena& arena, ArenaRegion region);
    ~RecordReader() = default;

    // Must be called before any of the getters.
    Status load();

    size_t slotCount() const { return m_bytes.size() / kRecordSlotSize; }

    // Getters return false if |index| is past the end of the record.
    bool integer(size_t index, int64_t& value) const;
    bool floatingPoint(size_t index, double& value) const;
    bool region(size_t index, ArenaRegion& value) const;
    // Follows the region stored at |index| and copies the bytes it refers to out of the arena.
    bool string(size_t index, std::string& value) const;

private:
    bool bits(size_t index, uint64_t& value) const;

    const Arena& m_arena;
    ArenaRegion m_region;
    std::vector<uint8_t> m_bytes;
};

} // namespace sluice

#endif // SRC_SLUICE_RECORD_HPP_
