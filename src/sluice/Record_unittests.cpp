#include "sluice/Record.hpp"

#include "sluice/Arena.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace sluice {

TEST_CASE("RecordWriter") {
    SUBCASE("empty record allocates nothing") {
        Arena arena(64);
        REQUIRE(arena.map());
        uint32_t offset = 0;
        REQUIRE(arena.allocate(5, offset) == kOk);
        RecordWriter writer;
        CHECK(writer.slotCount() == 0);
        ArenaRegion region{99, 99};
        REQUIRE(writer.finish(arena, region) == kOk);
        CHECK(region.offset == 5);
        CHECK(region.length == 0);
        CHECK(arena.used() == 5);
    }

    SUBCASE("slots are little-endian 8 byte values") {
        Arena arena(64);
        REQUIRE(arena.map());
        RecordWriter writer;
        writer.addInteger(0x0102030405060708);
        writer.addRegion(ArenaRegion{0x11223344, 0x55667788});
        CHECK(writer.slotCount() == 2);
        ArenaRegion region{0, 0};
        REQUIRE(writer.finish(arena, region) == kOk);
        CHECK(region.length == 16);

        std::vector<uint8_t> bytes;
        REQUIRE(arena.read(region.offset, region.length, bytes) == kOk);
        std::vector<uint8_t> expected = { 0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01,
                                          0x44, 0x33, 0x22, 0x11, 0x88, 0x77, 0x66, 0x55 };
        CHECK(bytes == expected);
    }

    SUBCASE("record larger than arena") {
        Arena arena(16);
        REQUIRE(arena.map());
        RecordWriter writer;
        writer.addInteger(1);
        writer.addInteger(2);
        writer.addInteger(3);
        ArenaRegion region{7, 7};
        CHECK(writer.finish(arena, region) == kArenaExhausted);
        CHECK(region.offset == 7);
        CHECK(region.length == 7);
        CHECK(arena.used() == 0);
    }
}

TEST_CASE("RecordReader") {
    SUBCASE("mixed slots") {
        Arena arena(256);
        REQUIRE(arena.map());
        std::string label("queue");
        uint32_t labelOffset = 0;
        REQUIRE(arena.write(label, labelOffset) == kOk);

        RecordWriter writer;
        writer.addInteger(-42);
        writer.addFloat(0.25);
        writer.addRegion(ArenaRegion{labelOffset, static_cast<uint32_t>(label.size())});
        writer.addInteger(std::numeric_limits<uint32_t>::max());
        ArenaRegion region{0, 0};
        REQUIRE(writer.finish(arena, region) == kOk);

        RecordReader reader(arena, region);
        REQUIRE(reader.load() == kOk);
        REQUIRE(reader.slotCount() == 4);

        int64_t integer = 0;
        REQUIRE(reader.integer(0, integer));
        CHECK(integer == -42);
        double floatingPoint = 0.0;
        REQUIRE(reader.floatingPoint(1, floatingPoint));
        CHECK(floatingPoint == 0.25);
        ArenaRegion stringRegion{0, 0};
        REQUIRE(reader.region(2, stringRegion));
        CHECK(stringRegion.offset == labelOffset);
        CHECK(stringRegion.length == label.size());
        std::string text;
        REQUIRE(reader.string(2, text));
        CHECK(text == label);
        REQUIRE(reader.integer(3, integer));
        CHECK(integer == std::numeric_limits<uint32_t>::max());
    }

    SUBCASE("index past the end") {
        Arena arena(64);
        REQUIRE(arena.map());
        RecordWriter writer;
        writer.addInteger(1);
        ArenaRegion region{0, 0};
        REQUIRE(writer.finish(arena, region) == kOk);
        RecordReader reader(arena, region);
        REQUIRE(reader.load() == kOk);
        int64_t value = 0;
        CHECK_FALSE(reader.integer(1, value));
        double floatValue = 0.0;
        CHECK_FALSE(reader.floatingPoint(5, floatValue));
    }

    SUBCASE("empty record") {
        Arena arena(8);
        REQUIRE(arena.map());
        RecordReader reader(arena, ArenaRegion{0, 0});
        REQUIRE(reader.load() == kOk);
        CHECK(reader.slotCount() == 0);
        int64_t value = 0;
        CHECK_FALSE(reader.integer(0, value));
    }

    SUBCASE("partial slot length") {
        Arena arena(64);
        REQUIRE(arena.map());
        RecordReader reader(arena, ArenaRegion{0, 12});
        CHECK(reader.load() == kInvalidArguments);
    }

    SUBCASE("region outside arena") {
        Arena arena(16);
        REQUIRE(arena.map());
        RecordReader reader(arena, ArenaRegion{8, 16});
        CHECK(reader.load() == kOutOfBounds);
    }

    SUBCASE("string region outside arena") {
        Arena arena(32);
        REQUIRE(arena.map());
        RecordWriter writer;
        writer.addRegion(ArenaRegion{30, 10});
        ArenaRegion region{0, 0};
        REQUIRE(writer.finish(arena, region) == kOk);
        RecordReader reader(arena, region);
        REQUIRE(reader.load() == kOk);
        std::string text;
        CHECK_FALSE(reader.string(0, text));
    }
}

} // namespace sluice
