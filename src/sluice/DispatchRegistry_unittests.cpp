#include "sluice/DispatchRegistry.hpp"

#include "sluice/Hash.hpp"

#include "doctest/doctest.h"

namespace sluice {

namespace {

Implementation returnStatus(Status status) {
    return [status](Session*, RawHandle, ArenaRegion, ArenaRegion&) { return status; };
}

} // namespace

TEST_CASE("DispatchRegistry registration") {
    SUBCASE("register and look up") {
        DispatchRegistry registry;
        CHECK(registry.size() == 0);
        REQUIRE(registry.registerImplementation("GPUDevice", "destroy", returnStatus(kOk)));
        CHECK(registry.size() == 1);
        CHECK(registry.lookup("GPUDevice", "destroy") != nullptr);
        CHECK(registry.lookup("GPUDevice", "createBuffer") == nullptr);
        CHECK(registry.lookup("GPUBuffer", "destroy") == nullptr);
    }

    SUBCASE("duplicate pair refused") {
        DispatchRegistry registry;
        REQUIRE(registry.registerImplementation("GPUQueue", "submit", returnStatus(kOk)));
        CHECK_FALSE(registry.registerImplementation("GPUQueue", "submit", returnStatus(kImplementationFailed)));
        CHECK(registry.size() == 1);

        // The first registration is the one that stays.
        ArenaRegion result{0, 0};
        CHECK(registry.dispatch(nullptr, dispatchKey("GPUQueue", "submit"), 0, ArenaRegion{0, 0}, result) == kOk);
    }

    SUBCASE("empty implementation refused") {
        DispatchRegistry registry;
        CHECK_FALSE(registry.registerImplementation("GPUQueue", "submit", Implementation()));
        CHECK(registry.size() == 0);
    }

    SUBCASE("pairs with the same export symbol collide") {
        DispatchRegistry registry;
        REQUIRE(registry.registerImplementation("A_b", "c", returnStatus(kOk)));
        CHECK_FALSE(registry.registerImplementation("A", "b_c", returnStatus(kOk)));
        CHECK(registry.lookup("A", "b_c") == nullptr);
        CHECK(registry.lookup("A_b", "c") != nullptr);
    }

    SUBCASE("explicit seal") {
        DispatchRegistry registry;
        CHECK_FALSE(registry.isSealed());
        registry.seal();
        CHECK(registry.isSealed());
        CHECK_FALSE(registry.registerImplementation("GPUQueue", "submit", returnStatus(kOk)));
    }

    SUBCASE("first dispatch seals") {
        DispatchRegistry registry;
        REQUIRE(registry.registerImplementation("GPUQueue", "submit", returnStatus(kOk)));
        ArenaRegion result{0, 0};
        CHECK(registry.dispatch(nullptr, dispatchKey("GPUQueue", "submit"), 0, ArenaRegion{0, 0}, result) == kOk);
        CHECK(registry.isSealed());
        CHECK_FALSE(registry.registerImplementation("GPUDevice", "destroy", returnStatus(kOk)));
    }

    SUBCASE("failed dispatch also seals") {
        DispatchRegistry registry;
        ArenaRegion result{0, 0};
        CHECK(registry.dispatch(nullptr, dispatchKey("GPUQueue", "submit"), 0, ArenaRegion{0, 0}, result)
              == kNotRegistered);
        CHECK(registry.isSealed());
    }
}

TEST_CASE("DispatchRegistry dispatch") {
    SUBCASE("not registered") {
        DispatchRegistry registry;
        REQUIRE(registry.registerImplementation("GPUQueue", "submit", returnStatus(kOk)));
        ArenaRegion result{3, 4};
        CHECK(registry.dispatch(nullptr, dispatchKey("GPUDevice", "destroy"), 0, ArenaRegion{0, 0}, result)
              == kNotRegistered);
        CHECK(result.offset == 0);
        CHECK(result.length == 0);
    }

    SUBCASE("arguments reach the implementation") {
        DispatchRegistry registry;
        RawHandle seenReceiver = 0;
        ArenaRegion seenArgs{0, 0};
        REQUIRE(registry.registerImplementation("GPUBuffer", "unmap",
            [&seenReceiver, &seenArgs](Session*, RawHandle receiver, ArenaRegion args, ArenaRegion& result) {
                seenReceiver = receiver;
                seenArgs = args;
                result = ArenaRegion{40, 8};
                return kOk;
            }));

        ArenaRegion result{0, 0};
        CHECK(registry.dispatch(nullptr, dispatchKey("GPUBuffer", "unmap"), 0xfeedface00000001ull,
                                ArenaRegion{16, 24}, result) == kOk);
        CHECK(seenReceiver == 0xfeedface00000001ull);
        CHECK(seenArgs.offset == 16);
        CHECK(seenArgs.length == 24);
        CHECK(result.offset == 40);
        CHECK(result.length == 8);
    }

    SUBCASE("implementation status is passed through") {
        DispatchRegistry registry;
        REQUIRE(registry.registerImplementation("GPUDevice", "destroy", returnStatus(kImplementationFailed)));
        ArenaRegion result{0, 0};
        CHECK(registry.dispatch(nullptr, dispatchKey("GPUDevice", "destroy"), 0, ArenaRegion{0, 0}, result)
              == kImplementationFailed);
    }

    SUBCASE("captured state persists across calls") {
        DispatchRegistry registry;
        int calls = 0;
        REQUIRE(registry.registerImplementation("GPUQueue", "submit",
            [&calls](Session*, RawHandle, ArenaRegion, ArenaRegion&) {
                ++calls;
                return kOk;
            }));
        ArenaRegion result{0, 0};
        for (int i = 0; i < 3; ++i) {
            CHECK(registry.dispatch(nullptr, dispatchKey("GPUQueue", "submit"), 0, ArenaRegion{0, 0}, result)
                  == kOk);
        }
        CHECK(calls == 3);
    }
}

} // namespace sluice
