// Drives the bindings sluice-bindgen generated from idl/WebGPU.idl through a live Session.
#include "WebGPUBindings.hpp"

#include "sluice/Record.hpp"
#include "sluice/Status.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <string>
#include <vector>

namespace {

sluice::ArenaRegion writeString(sluice::Session& session, const std::string& text) {
    sluice::ArenaRegion region{0, 0};
    REQUIRE(session.writeBuffer(text.data(), static_cast<uint32_t>(text.size()), region) == sluice::kOk);
    return region;
}

} // namespace

namespace sluice {

TEST_CASE("Generated Bindings Dispatch") {
    Session session(4096);
    REQUIRE(session.init());

    SUBCASE("inline arguments reach the implementation") {
        RawHandle seenDevice = 0;
        int64_t seenSize = 0;
        int64_t seenUsage = 0;
        int64_t seenMapped = 0;
        REQUIRE(webgpu::registerGPUDevice_createBuffer(session.registry(),
            [&](Session* calledSession, RawHandle receiver, ArenaRegion args, ArenaRegion& result) {
                seenDevice = receiver;
                RecordReader reader(calledSession->arena(), args);
                Status status = reader.load();
                if (status != kOk) {
                    return status;
                }
                if (reader.slotCount() != 3 || !reader.integer(0, seenSize) || !reader.integer(1, seenUsage) ||
                    !reader.integer(2, seenMapped)) {
                    return kInvalidArguments;
                }
                RecordWriter writer;
                writer.addInteger(0xb0ffe5);
                return writer.finish(calledSession->arena(), result);
            }));

        ArenaRegion result{0, 0};
        REQUIRE(GPUDevice_createBuffer(&session, 77, 65536, 0x0044, true, &result) == kOk);
        CHECK(seenDevice == 77);
        CHECK(seenSize == 65536);
        CHECK(seenUsage == 0x0044);
        CHECK(seenMapped == 1);

        RecordReader reader(session.arena(), result);
        REQUIRE(reader.load() == kOk);
        int64_t bufferHandle = 0;
        REQUIRE(reader.integer(0, bufferHandle));
        CHECK(bufferHandle == 0xb0ffe5);
        webgpu::GPUBuffer buffer(static_cast<RawHandle>(bufferHandle));
        CHECK(buffer.raw() == 0xb0ffe5);
    }

    SUBCASE("every inline width keeps its value") {
        std::vector<int64_t> integers;
        double first = 0.0;
        double second = 0.0;
        REQUIRE(webgpu::registerGPUBuffer_writeFloats(session.registry(),
            [&](Session* calledSession, RawHandle, ArenaRegion args, ArenaRegion&) {
                RecordReader reader(calledSession->arena(), args);
                if (reader.load() != kOk || reader.slotCount() != 7) {
                    return kInvalidArguments;
                }
                if (!reader.floatingPoint(1, first) || !reader.floatingPoint(2, second)) {
                    return kInvalidArguments;
                }
                for (size_t i : { 0, 3, 4, 5, 6 }) {
                    int64_t value = 0;
                    if (!reader.integer(i, value)) {
                        return kInvalidArguments;
                    }
                    integers.emplace_back(value);
                }
                return kOk;
            }));

        ArenaRegion result{9, 9};
        REQUIRE(GPUBuffer_writeFloats(&session, 1, 4000000000u, 0.5f, -2.25, -128, 255, -32768, -2147483647,
                                      &result) == kOk);
        // Void methods leave the result region empty.
        CHECK(result.offset == 0);
        CHECK(result.length == 0);
        REQUIRE(integers.size() == 5);
        CHECK(integers[0] == 4000000000ll);
        CHECK(first == 0.5);
        CHECK(second == -2.25);
        CHECK(integers[1] == -128);
        CHECK(integers[2] == 255);
        CHECK(integers[3] == -32768);
        CHECK(integers[4] == -2147483647);
    }

    SUBCASE("region arguments carry strings and handles") {
        std::string seenFilter;
        REQUIRE(webgpu::registerGPUDevice_pushErrorScope(session.registry(),
            [&seenFilter](Session* calledSession, RawHandle, ArenaRegion args, ArenaRegion&) {
                RecordReader reader(calledSession->arena(), args);
                if (reader.load() != kOk || !reader.string(0, seenFilter)) {
                    return kInvalidArguments;
                }
                return kOk;
            }));

        ArenaRegion filter = writeString(session, "out-of-memory");
        ArenaRegion result{0, 0};
        REQUIRE(GPUDevice_pushErrorScope(&session, 3, filter, &result) == kOk);
        CHECK(seenFilter == "out-of-memory");
    }

    SUBCASE("mixed region and inline arguments keep declaration order") {
        ArenaRegion seenBuffer{0, 0};
        int64_t seenOffset = 0;
        std::string seenData;
        REQUIRE(webgpu::registerGPUQueue_writeBuffer(session.registry(),
            [&](Session* calledSession, RawHandle, ArenaRegion args, ArenaRegion&) {
                RecordReader reader(calledSession->arena(), args);
                if (reader.load() != kOk || !reader.region(0, seenBuffer) || !reader.integer(1, seenOffset) ||
                    !reader.string(2, seenData)) {
                    return kInvalidArguments;
                }
                return kOk;
            }));

        ArenaRegion buffer = writeString(session, "handle:9");
        ArenaRegion data = writeString(session, "vertex data");
        ArenaRegion result{0, 0};
        REQUIRE(GPUQueue_writeBuffer(&session, 5, buffer, 256, data, &result) == kOk);
        CHECK(seenBuffer.offset == buffer.offset);
        CHECK(seenBuffer.length == buffer.length);
        CHECK(seenOffset == 256);
        CHECK(seenData == "vertex data");
    }

    SUBCASE("static method ignores receiver") {
        REQUIRE(webgpu::registerGPUCanvas_fromId(session.registry(),
            [](Session* calledSession, RawHandle, ArenaRegion args, ArenaRegion& result) {
                RecordReader reader(calledSession->arena(), args);
                std::string id;
                if (reader.load() != kOk || !reader.string(0, id)) {
                    return kInvalidArguments;
                }
                RecordWriter writer;
                writer.addInteger(id == "main" ? 1 : 0);
                return writer.finish(calledSession->arena(), result);
            }));

        ArenaRegion id = writeString(session, "main");
        ArenaRegion result{0, 0};
        REQUIRE(GPUCanvas_fromId(&session, 0, id, &result) == kOk);
        RecordReader reader(session.arena(), result);
        REQUIRE(reader.load() == kOk);
        int64_t canvas = 0;
        REQUIRE(reader.integer(0, canvas));
        CHECK(canvas == 1);
    }

    SUBCASE("absent optional argument arrives as an empty region") {
        ArenaRegion seenOptions{1, 1};
        REQUIRE(webgpu::registerGPU_requestAdapter(session.registry(),
            [&seenOptions](Session* calledSession, RawHandle, ArenaRegion args, ArenaRegion&) {
                RecordReader reader(calledSession->arena(), args);
                if (reader.load() != kOk || !reader.region(0, seenOptions)) {
                    return kInvalidArguments;
                }
                return kOk;
            }));

        ArenaRegion result{0, 0};
        REQUIRE(GPU_requestAdapter(&session, 1, ArenaRegion{0, 0}, &result) == kOk);
        CHECK(seenOptions.length == 0);
    }

    SUBCASE("no arguments builds an empty record") {
        uint32_t seenLength = 1;
        REQUIRE(webgpu::registerGPUQueue_submit(session.registry(),
            [&seenLength](Session*, RawHandle, ArenaRegion args, ArenaRegion&) {
                seenLength = args.length;
                return kOk;
            }));
        ArenaRegion result{0, 0};
        REQUIRE(GPUQueue_submit(&session, 2, &result) == kOk);
        CHECK(seenLength == 0);
    }

    SUBCASE("missing registration") {
        ArenaRegion result{0, 0};
        CHECK(GPUDevice_destroy(&session, 1, &result) == kNotRegistered);
        CHECK(result.length == 0);
    }

    SUBCASE("implementation failure is returned") {
        REQUIRE(webgpu::registerGPUBuffer_unmap(session.registry(),
            [](Session*, RawHandle, ArenaRegion, ArenaRegion&) { return kImplementationFailed; }));
        ArenaRegion result{0, 0};
        CHECK(GPUBuffer_unmap(&session, 1, &result) == kImplementationFailed);
    }

    SUBCASE("registration closes after the first call") {
        REQUIRE(webgpu::registerGPUQueue_submit(session.registry(),
            [](Session*, RawHandle, ArenaRegion, ArenaRegion&) { return kOk; }));
        ArenaRegion result{0, 0};
        REQUIRE(GPUQueue_submit(&session, 2, &result) == kOk);
        CHECK_FALSE(webgpu::registerGPUDevice_destroy(session.registry(),
            [](Session*, RawHandle, ArenaRegion, ArenaRegion&) { return kOk; }));
        CHECK(GPUDevice_destroy(&session, 1, &result) == kNotRegistered);
    }

    SUBCASE("null session or result") {
        ArenaRegion result{0, 0};
        CHECK(GPUQueue_submit(nullptr, 2, &result) == kInvalidArguments);
        CHECK(GPUQueue_submit(&session, 2, nullptr) == kInvalidArguments);
    }
}

TEST_CASE("Generated Bindings Arena Exhaustion") {
    // Room for the buffer handle string but not for a three slot argument record after it.
    Session session(32);
    REQUIRE(session.init());
    bool called = false;
    REQUIRE(webgpu::registerGPUQueue_writeBuffer(session.registry(),
        [&called](Session*, RawHandle, ArenaRegion, ArenaRegion&) {
            called = true;
            return kOk;
        }));

    ArenaRegion buffer = writeString(session, "0123456789");
    ArenaRegion result{0, 0};
    CHECK(GPUQueue_writeBuffer(&session, 1, buffer, 0, buffer, &result) == kArenaExhausted);
    CHECK_FALSE(called);

    session.resetArena();
    buffer = writeString(session, "0123");
    CHECK(GPUQueue_writeBuffer(&session, 1, buffer, 0, buffer, &result) == kOk);
    CHECK(called);
}

TEST_CASE("Generated Bindings Keys") {
    CHECK(webgpu::kGPUAdapter_requestDeviceKey == dispatchKey("GPUAdapter", "requestDevice"));
    CHECK(webgpu::kGPUDevice_createBufferKey == hash("GPUDevice_createBuffer"));
    CHECK(webgpu::kGPUAdapter_requestDeviceKey != webgpu::kGPU_requestAdapterKey);
}

} // namespace sluice
