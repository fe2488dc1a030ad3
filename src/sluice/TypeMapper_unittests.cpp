#include "sluice/TypeMapper.hpp"

#include "doctest/doctest.h"

namespace sluice {

TEST_CASE("TypeMapper keywords") {
    CHECK(TypeMapper::mapToken("void").kind == Type::Kind::kVoid);
    CHECK(TypeMapper::mapToken("boolean").kind == Type::Kind::kBoolean);
    CHECK(TypeMapper::mapToken("byte").kind == Type::Kind::kByte);
    CHECK(TypeMapper::mapToken("octet").kind == Type::Kind::kOctet);
    CHECK(TypeMapper::mapToken("short").kind == Type::Kind::kShort);
    CHECK(TypeMapper::mapToken("unsigned short").kind == Type::Kind::kUnsignedShort);
    CHECK(TypeMapper::mapToken("long").kind == Type::Kind::kLong);
    CHECK(TypeMapper::mapToken("unsigned long").kind == Type::Kind::kUnsignedLong);
    CHECK(TypeMapper::mapToken("float").kind == Type::Kind::kFloat);
    CHECK(TypeMapper::mapToken("double").kind == Type::Kind::kDouble);
    CHECK(TypeMapper::mapToken("DOMString").kind == Type::Kind::kString);
    CHECK(TypeMapper::mapToken("object").kind == Type::Kind::kObject);

    CHECK(TypeMapper::isKeyword("Promise"));
    CHECK(TypeMapper::isKeyword("unsigned long"));
    CHECK_FALSE(TypeMapper::isKeyword("GPUDevice"));
}

TEST_CASE("TypeMapper interface references") {
    SUBCASE("unknown identifier") {
        auto type = TypeMapper::mapToken("GPUBuffer");
        CHECK(type.kind == Type::Kind::kInterfaceRef);
        CHECK(type.name == "GPUBuffer");
        CHECK_FALSE(type.nullable);
    }
    SUBCASE("keywords are case sensitive") {
        auto type = TypeMapper::mapToken("domstring");
        CHECK(type.kind == Type::Kind::kInterfaceRef);
        CHECK(type.name == "domstring");
    }
    SUBCASE("surrounding whitespace") {
        auto type = TypeMapper::mapToken("  long\t");
        CHECK(type.kind == Type::Kind::kLong);
    }
}

TEST_CASE("TypeMapper promises and nullables") {
    SUBCASE("promise of interface") {
        auto type = TypeMapper::mapToken("Promise<GPUDevice>");
        REQUIRE(type.kind == Type::Kind::kPromise);
        REQUIRE(type.inner);
        CHECK(type.inner->kind == Type::Kind::kInterfaceRef);
        CHECK(type.inner->name == "GPUDevice");
        CHECK(type == Type::makePromise(Type::makeInterfaceRef("GPUDevice")));
    }
    SUBCASE("nested promise") {
        auto type = TypeMapper::mapToken("Promise<Promise<unsigned long>>");
        REQUIRE(type.kind == Type::Kind::kPromise);
        REQUIRE(type.inner);
        REQUIRE(type.inner->kind == Type::Kind::kPromise);
        REQUIRE(type.inner->inner);
        CHECK(type.inner->inner->kind == Type::Kind::kUnsignedLong);
        CHECK(type.toString() == "Promise<Promise<unsigned long>>");
    }
    SUBCASE("nullable inner type") {
        auto type = TypeMapper::mapToken("Promise<GPUAdapter?>");
        REQUIRE(type.kind == Type::Kind::kPromise);
        CHECK_FALSE(type.nullable);
        REQUIRE(type.inner);
        CHECK(type.inner->nullable);
        CHECK(type.toString() == "Promise<GPUAdapter?>");
    }
    SUBCASE("nullable keyword keeps its kind") {
        auto type = TypeMapper::mapToken("DOMString?");
        CHECK(type.kind == Type::Kind::kString);
        CHECK(type.nullable);
        CHECK(type != Type::make(Type::Kind::kString));
    }
}

TEST_CASE("Type passing") {
    CHECK(Type::make(Type::Kind::kBoolean).isPassedInline());
    CHECK(Type::make(Type::Kind::kDouble).isPassedInline());
    CHECK(Type::make(Type::Kind::kString).isPassedByRegion());
    CHECK(Type::make(Type::Kind::kObject).isPassedByRegion());
    CHECK(Type::makeInterfaceRef("GPUQueue").isPassedByRegion());
    CHECK(Type::makePromise(Type::make(Type::Kind::kLong)).isPassedByRegion());
    CHECK_FALSE(Type::make(Type::Kind::kVoid).isPassedInline());
    CHECK_FALSE(Type::make(Type::Kind::kVoid).isPassedByRegion());
}

} // namespace sluice
