#include "sluice/Arena.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace sluice {

TEST_CASE("Arena allocate") {
    SUBCASE("bump cursor") {
        Arena arena(64);
        REQUIRE(arena.map());
        uint32_t offset = 99;
        REQUIRE(arena.allocate(10, offset) == kOk);
        CHECK(offset == 0);
        CHECK(arena.used() == 10);
        REQUIRE(arena.allocate(7, offset) == kOk);
        CHECK(offset == 10);
        CHECK(arena.used() == 17);
        CHECK(arena.available() == 47);
    }

    SUBCASE("exact remaining capacity succeeds, one more byte fails") {
        Arena arena(32);
        REQUIRE(arena.map());
        uint32_t offset = 0;
        REQUIRE(arena.allocate(12, offset) == kOk);
        CHECK(arena.allocate(21, offset) == kArenaExhausted);
        CHECK(arena.used() == 12);
        REQUIRE(arena.allocate(20, offset) == kOk);
        CHECK(offset == 12);
        CHECK(arena.available() == 0);
        CHECK(arena.allocate(1, offset) == kArenaExhausted);
    }

    SUBCASE("zero size") {
        Arena arena(8);
        REQUIRE(arena.map());
        uint32_t offset = 0;
        REQUIRE(arena.allocate(8, offset) == kOk);
        uint32_t zeroOffset = 0;
        REQUIRE(arena.allocate(0, zeroOffset) == kOk);
        CHECK(zeroOffset == 8);
        CHECK(arena.used() == 8);
    }

    SUBCASE("huge request does not wrap") {
        Arena arena(16);
        REQUIRE(arena.map());
        uint32_t offset = 0;
        REQUIRE(arena.allocate(4, offset) == kOk);
        CHECK(arena.allocate(std::numeric_limits<uint32_t>::max(), offset) == kArenaExhausted);
        CHECK(arena.used() == 4);
    }

    SUBCASE("zero capacity") {
        Arena arena(0);
        REQUIRE(arena.map());
        uint32_t offset = 0;
        CHECK(arena.allocate(0, offset) == kOk);
        CHECK(arena.allocate(1, offset) == kArenaExhausted);
    }
}

TEST_CASE("Arena write and read") {
    SUBCASE("read returns what was written") {
        Arena arena(128);
        REQUIRE(arena.map());
        std::string message("Hello WebGPU!");
        uint32_t offset = 0;
        REQUIRE(arena.write(message, offset) == kOk);
        std::vector<uint8_t> bytes;
        REQUIRE(arena.read(offset, static_cast<uint32_t>(message.size()), bytes) == kOk);
        CHECK(std::string(bytes.begin(), bytes.end()) == message);
    }

    SUBCASE("successive writes are disjoint") {
        Arena arena(64);
        REQUIRE(arena.map());
        std::vector<uint8_t> first(10, 0xaa);
        std::vector<uint8_t> second(10, 0x55);
        uint32_t firstOffset = 0;
        uint32_t secondOffset = 0;
        REQUIRE(arena.write(first.data(), 10, firstOffset) == kOk);
        REQUIRE(arena.write(second.data(), 10, secondOffset) == kOk);
        CHECK(firstOffset + 10 <= secondOffset);

        std::vector<uint8_t> bytes;
        REQUIRE(arena.read(firstOffset, 10, bytes) == kOk);
        CHECK(bytes == first);
        REQUIRE(arena.read(secondOffset, 10, bytes) == kOk);
        CHECK(bytes == second);
    }

    SUBCASE("exhausted write leaves arena unchanged") {
        Arena arena(16);
        REQUIRE(arena.map());
        std::vector<uint8_t> payload(10, 1);
        uint32_t offset = 0;
        REQUIRE(arena.write(payload.data(), 10, offset) == kOk);
        CHECK(offset == 0);
        uint32_t unchanged = 1234;
        CHECK(arena.write(payload.data(), 10, unchanged) == kArenaExhausted);
        CHECK(unchanged == 1234);
        CHECK(arena.used() == 10);
    }

    SUBCASE("write larger than capacity") {
        Arena arena(4);
        REQUIRE(arena.map());
        uint32_t offset = 0;
        CHECK(arena.write(std::string("too long"), offset) == kArenaExhausted);
        CHECK(arena.used() == 0);
    }

    SUBCASE("read out of bounds") {
        Arena arena(16);
        REQUIRE(arena.map());
        std::vector<uint8_t> bytes;
        CHECK(arena.read(0, 16, bytes) == kOk);
        CHECK(arena.read(8, 9, bytes) == kOutOfBounds);
        CHECK(arena.read(17, 0, bytes) == kOutOfBounds);
        CHECK(arena.read(16, 0, bytes) == kOk);
        CHECK(bytes.empty());
    }

    SUBCASE("read offset near integer limit does not wrap") {
        Arena arena(16);
        REQUIRE(arena.map());
        std::vector<uint8_t> bytes;
        CHECK(arena.read(std::numeric_limits<uint32_t>::max(), 2, bytes) == kOutOfBounds);
        uint8_t raw[4];
        CHECK(arena.read(std::numeric_limits<uint32_t>::max() - 1, 4, raw) == kOutOfBounds);
    }
}

TEST_CASE("Arena unmapped") {
    SUBCASE("allocate and write before map") {
        Arena arena(16);
        CHECK_FALSE(arena.isMapped());
        uint32_t offset = 77;
        CHECK(arena.allocate(4, offset) == kArenaUnmapped);
        CHECK(arena.write(std::string("abc"), offset) == kArenaUnmapped);
        CHECK(offset == 77);
        CHECK(arena.used() == 0);
    }

    SUBCASE("zero-length read before map") {
        Arena arena(16);
        std::vector<uint8_t> bytes;
        CHECK(arena.read(4, 0, bytes) == kArenaUnmapped);
        CHECK(arena.read(0, 0, bytes) == kArenaUnmapped);
        uint8_t raw[1];
        CHECK(arena.read(8, 0, raw) == kArenaUnmapped);
    }

    SUBCASE("zero capacity needs no mapping") {
        Arena arena(0);
        CHECK(arena.isMapped());
        std::vector<uint8_t> bytes;
        CHECK(arena.read(0, 0, bytes) == kOk);
        CHECK(arena.read(1, 0, bytes) == kOutOfBounds);
    }
}

TEST_CASE("Arena reset") {
    SUBCASE("capacity 16 scenario") {
        Arena arena(16);
        REQUIRE(arena.map());
        std::vector<uint8_t> payload(10, 7);
        uint32_t offset = 99;
        REQUIRE(arena.write(payload.data(), 10, offset) == kOk);
        CHECK(offset == 0);
        CHECK(arena.write(payload.data(), 10, offset) == kArenaExhausted);
        arena.reset();
        CHECK(arena.used() == 0);
        REQUIRE(arena.write(payload.data(), 10, offset) == kOk);
        CHECK(offset == 0);
    }

    SUBCASE("reset after full use") {
        Arena arena(8);
        REQUIRE(arena.map());
        uint32_t offset = 0;
        REQUIRE(arena.allocate(8, offset) == kOk);
        arena.reset();
        REQUIRE(arena.allocate(8, offset) == kOk);
        CHECK(offset == 0);
    }
}

} // namespace sluice
