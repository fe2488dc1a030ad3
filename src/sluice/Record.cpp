#include "sluice/Record.hpp"

#include "spdlog/spdlog.h"

#include <cstring>

namespace sluice {

void RecordWriter::addInteger(int64_t value) { addBits(static_cast<uint64_t>(value)); }

void RecordWriter::addFloat(double value) {
    uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(value));
    std::memcpy(&bits, &value, sizeof(bits));
    addBits(bits);
}

void RecordWriter::addRegion(ArenaRegion region) {
    addBits(static_cast<uint64_t>(region.offset) | (static_cast<uint64_t>(region.length) << 32));
}

Status RecordWriter::finish(Arena& arena, ArenaRegion& region) const {
    if (m_bytes.empty()) {
        region = ArenaRegion{arena.used(), 0};
        return kOk;
    }
    uint32_t offset = 0;
    Status status = arena.write(m_bytes.data(), static_cast<uint32_t>(m_bytes.size()), offset);
    if (status != kOk) {
        return status;
    }
    region = ArenaRegion{offset, static_cast<uint32_t>(m_bytes.size())};
    return kOk;
}

void RecordWriter::addBits(uint64_t bits) {
    for (uint32_t i = 0; i < kRecordSlotSize; ++i) {
        m_bytes.emplace_back(static_cast<uint8_t>((bits >> (i * 8)) & 0xff));
    }
}

RecordReader::RecordReader(const Arena& arena, ArenaRegion region): m_arena(arena), m_region(region) {}

Status RecordReader::load() {
    if (m_region.length % kRecordSlotSize != 0) {
        SPDLOG_ERROR("Record length {} is not a multiple of the {} byte slot size", m_region.length, kRecordSlotSize);
        return kInvalidArguments;
    }
    return m_arena.read(m_region.offset, m_region.length, m_bytes);
}

bool RecordReader::integer(size_t index, int64_t& value) const {
    uint64_t raw = 0;
    if (!bits(index, raw)) {
        return false;
    }
    value = static_cast<int64_t>(raw);
    return true;
}

bool RecordReader::floatingPoint(size_t index, double& value) const {
    uint64_t raw = 0;
    if (!bits(index, raw)) {
        return false;
    }
    std::memcpy(&value, &raw, sizeof(value));
    return true;
}

bool RecordReader::region(size_t index, ArenaRegion& value) const {
    uint64_t raw = 0;
    if (!bits(index, raw)) {
        return false;
    }
    value.offset = static_cast<uint32_t>(raw & 0xffffffff);
    value.length = static_cast<uint32_t>(raw >> 32);
    return true;
}

bool RecordReader::string(size_t index, std::string& value) const {
    ArenaRegion stringRegion{0, 0};
    if (!region(index, stringRegion)) {
        return false;
    }
    std::vector<uint8_t> bytes;
    if (m_arena.read(stringRegion.offset, stringRegion.length, bytes) != kOk) {
        return false;
    }
    value.assign(bytes.begin(), bytes.end());
    return true;
}

bool RecordReader::bits(size_t index, uint64_t& value) const {
    if (index >= slotCount()) {
        SPDLOG_ERROR("Record slot {} requested from record of {} slots", index, slotCount());
        return false;
    }
    value = 0;
    for (uint32_t i = 0; i < kRecordSlotSize; ++i) {
        value |= static_cast<uint64_t>(m_bytes[index * kRecordSlotSize + i]) << (i * 8);
    }
    return true;
}

} // namespace sluice
