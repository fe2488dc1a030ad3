#include "sluice/Session.hpp"

#include "sluice/Boundary.hpp"
#include "sluice/Record.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <string>
#include <vector>

namespace sluice {

TEST_CASE("Session") {
    SUBCASE("default capacity") {
        Session session(Session::kDefaultArenaCapacity);
        REQUIRE(session.init());
        CHECK(session.arena().capacity() == 1024 * 1024);
        CHECK(session.arena().used() == 0);
        CHECK(session.registry().size() == 0);
    }

    SUBCASE("buffer write and read") {
        Session session(64);
        REQUIRE(session.init());
        std::string label("pipeline layout");
        ArenaRegion region{0, 0};
        REQUIRE(session.writeBuffer(label.data(), static_cast<uint32_t>(label.size()), region) == kOk);
        CHECK(region.length == label.size());

        std::vector<uint8_t> bytes;
        REQUIRE(session.readBuffer(region, bytes) == kOk);
        CHECK(std::string(bytes.begin(), bytes.end()) == label);

        CHECK(session.readBuffer(ArenaRegion{60, 8}, bytes) == kOutOfBounds);
    }

    SUBCASE("reset reclaims the arena") {
        Session session(16);
        REQUIRE(session.init());
        std::vector<uint8_t> payload(10, 3);
        ArenaRegion region{0, 0};
        REQUIRE(session.writeBuffer(payload.data(), 10, region) == kOk);
        CHECK(session.writeBuffer(payload.data(), 10, region) == kArenaExhausted);
        session.resetArena();
        REQUIRE(session.writeBuffer(payload.data(), 10, region) == kOk);
        CHECK(region.offset == 0);
    }

    SUBCASE("dispatch passes the session through") {
        Session session(256);
        REQUIRE(session.init());
        Session* seenSession = nullptr;
        REQUIRE(session.registry().registerImplementation("GPUBuffer", "size",
            [&seenSession](Session* calledSession, RawHandle receiver, ArenaRegion, ArenaRegion& result) {
                seenSession = calledSession;
                RecordWriter writer;
                writer.addInteger(static_cast<int64_t>(receiver) * 2);
                return writer.finish(calledSession->arena(), result);
            }));

        ArenaRegion result{0, 0};
        REQUIRE(session.dispatch(dispatchKey("GPUBuffer", "size"), 21, ArenaRegion{0, 0}, result) == kOk);
        CHECK(seenSession == &session);

        RecordReader reader(session.arena(), result);
        REQUIRE(reader.load() == kOk);
        int64_t value = 0;
        REQUIRE(reader.integer(0, value));
        CHECK(value == 42);
        CHECK(session.registry().isSealed());
    }

    SUBCASE("sessions are independent") {
        Session first(32);
        Session second(32);
        REQUIRE(first.init());
        REQUIRE(second.init());
        REQUIRE(first.registry().registerImplementation("GPUQueue", "submit",
            [](Session*, RawHandle, ArenaRegion, ArenaRegion&) { return kOk; }));
        ArenaRegion result{0, 0};
        CHECK(first.dispatch(dispatchKey("GPUQueue", "submit"), 0, ArenaRegion{0, 0}, result) == kOk);
        CHECK(second.dispatch(dispatchKey("GPUQueue", "submit"), 0, ArenaRegion{0, 0}, result) == kNotRegistered);

        uint8_t byte = 9;
        ArenaRegion region{0, 0};
        REQUIRE(first.writeBuffer(&byte, 1, region) == kOk);
        CHECK(first.arena().used() == 1);
        CHECK(second.arena().used() == 0);
    }
}

TEST_CASE("Boundary C entry points") {
    SUBCASE("create, write, read, destroy") {
        Session* session = sluice_session_create(32);
        REQUIRE(session != nullptr);

        const uint8_t payload[] = { 1, 2, 3, 4, 5 };
        ArenaRegion region{0, 0};
        REQUIRE(sluice_write_buffer(session, payload, 5, &region) == kOk);
        CHECK(region.offset == 0);
        CHECK(region.length == 5);
        CHECK(sluice_arena_used(session) == 5);

        uint8_t copy[5] = { 0, 0, 0, 0, 0 };
        REQUIRE(sluice_read_buffer(session, region, copy) == kOk);
        for (int i = 0; i < 5; ++i) {
            CHECK(copy[i] == payload[i]);
        }

        sluice_reset_arena(session);
        CHECK(sluice_arena_used(session) == 0);
        sluice_session_destroy(session);
    }

    SUBCASE("exhaustion and bounds") {
        Session* session = sluice_session_create(8);
        REQUIRE(session != nullptr);
        const uint8_t payload[12] = {};
        ArenaRegion region{0, 0};
        CHECK(sluice_write_buffer(session, payload, 12, &region) == kArenaExhausted);
        uint8_t copy[4];
        CHECK(sluice_read_buffer(session, ArenaRegion{6, 4}, copy) == kOutOfBounds);
        sluice_session_destroy(session);
    }

    SUBCASE("null arguments") {
        ArenaRegion region{0, 0};
        const uint8_t payload[1] = { 0 };
        CHECK(sluice_write_buffer(nullptr, payload, 1, &region) == kInvalidArguments);
        uint8_t copy[1];
        CHECK(sluice_read_buffer(nullptr, ArenaRegion{0, 1}, copy) == kInvalidArguments);
        CHECK(sluice_arena_used(nullptr) == 0);
        sluice_reset_arena(nullptr);
        sluice_session_destroy(nullptr);

        Session* session = sluice_session_create(8);
        REQUIRE(session != nullptr);
        CHECK(sluice_write_buffer(session, nullptr, 1, &region) == kInvalidArguments);
        CHECK(sluice_write_buffer(session, payload, 1, nullptr) == kInvalidArguments);
        CHECK(sluice_read_buffer(session, ArenaRegion{0, 1}, nullptr) == kInvalidArguments);
        sluice_session_destroy(session);
    }
}

} // namespace sluice
