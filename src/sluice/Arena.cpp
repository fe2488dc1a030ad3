#include "sluice/Arena.hpp"

#include "spdlog/spdlog.h"

#include <cstring>
#include <errno.h>
#include <string.h>

#if WIN32
#    define WIN32_LEAN_AND_MEAN
#    include "windows.h"
#else
#    include <sys/mman.h>
#endif // WIN32

namespace sluice {

Arena::Arena(uint32_t capacity): m_startAddress(nullptr), m_capacity(capacity), m_used(0) {}

Arena::~Arena() { unmap(); }

bool Arena::map() {
    if (m_startAddress) {
        SPDLOG_WARN("Duplicate calls to Arena::map()");
        return true;
    }

    // Nothing to map, and mmap rejects zero-length requests.
    if (m_capacity == 0) {
        return true;
    }

#if WIN32
    void* address = VirtualAlloc(nullptr, m_capacity, MEM_COMMIT | MEM_RESERVE, PAGE_READWRITE);
    bool success = (address != nullptr);
#else
    void* address = mmap(nullptr, m_capacity, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    bool success = (address != MAP_FAILED);
#endif

    if (!success) {
        int mapError = errno;
        SPDLOG_CRITICAL("Arena map failed for {} bytes, errno: {}, string: {}", m_capacity, mapError,
                        strerror(mapError));
        return false;
    }

    m_startAddress = static_cast<uint8_t*>(address);
    m_used = 0;
    return true;
}

bool Arena::unmap() {
    if (m_startAddress == nullptr) {
        return true;
    }

#if WIN32
    bool success = VirtualFree(m_startAddress, 0, MEM_RELEASE);
#else
    bool success = munmap(m_startAddress, m_capacity) == 0;
#endif

    if (!success) {
        SPDLOG_ERROR("Arena munmap failed");
        return false;
    }

    m_startAddress = nullptr;
    return true;
}

Status Arena::allocate(uint32_t size, uint32_t& offset) {
    if (!isMapped()) {
        SPDLOG_ERROR("Arena::allocate() called on unmapped arena");
        return kArenaUnmapped;
    }
    if (available() < size) {
        SPDLOG_WARN("Arena exhausted, requested {} bytes with {} of {} available", size, available(), m_capacity);
        return kArenaExhausted;
    }
    offset = m_used;
    m_used += size;
    return kOk;
}

Status Arena::write(const void* bytes, uint32_t length, uint32_t& offset) {
    uint32_t start = 0;
    Status status = allocate(length, start);
    if (status != kOk) {
        return status;
    }
    // allocate() guarantees [start, start + length) fits.
    if (length) {
        std::memcpy(m_startAddress + start, bytes, length);
    }
    offset = start;
    return kOk;
}

Status Arena::write(std::string_view bytes, uint32_t& offset) {
    if (bytes.size() > m_capacity) {
        SPDLOG_WARN("Arena exhausted, write of {} bytes exceeds capacity of {}", bytes.size(), m_capacity);
        return kArenaExhausted;
    }
    return write(bytes.data(), static_cast<uint32_t>(bytes.size()), offset);
}

Status Arena::read(uint32_t offset, uint32_t length, std::vector<uint8_t>& bytes) const {
    if (!isMapped()) {
        SPDLOG_ERROR("Arena::read() called on unmapped arena");
        return kArenaUnmapped;
    }
    if (!inBounds(offset, length)) {
        SPDLOG_WARN("Arena read of {} bytes at offset {} out of bounds for capacity {}", length, offset, m_capacity);
        return kOutOfBounds;
    }
    bytes.assign(m_startAddress + offset, m_startAddress + offset + length);
    return kOk;
}

Status Arena::read(uint32_t offset, uint32_t length, void* bytes) const {
    if (!isMapped()) {
        SPDLOG_ERROR("Arena::read() called on unmapped arena");
        return kArenaUnmapped;
    }
    if (!inBounds(offset, length)) {
        SPDLOG_WARN("Arena read of {} bytes at offset {} out of bounds for capacity {}", length, offset, m_capacity);
        return kOutOfBounds;
    }
    if (length) {
        std::memcpy(bytes, m_startAddress + offset, length);
    }
    return kOk;
}

void Arena::reset() { m_used = 0; }

bool Arena::inBounds(uint32_t offset, uint32_t length) const {
    if (!isMapped()) {
        return false;
    }
    // Widen before adding so a huge offset can't wrap around back into range.
    return static_cast<uint64_t>(offset) + static_cast<uint64_t>(length) <= static_cast<uint64_t>(m_capacity);
}

} // namespace sluice
