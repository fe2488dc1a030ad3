#include "sluice/BindingGenerator.hpp"

#include "sluice/ErrorReporter.hpp"
#include "sluice/Hash.hpp"
#include "sluice/Parser.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string_view>

namespace sluice {

namespace {

// Parses |code|, which must be valid, into |schema|.
void parseSchema(std::string_view code, Schema& schema) {
    Parser parser(code);
    REQUIRE(parser.parse());
    schema = parser.schema();
}

} // namespace

TEST_CASE("BindingGenerator Surface") {
    SUBCASE("empty schema") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        BindingGenerator generator(reporter);
        BindingSurface surface;
        REQUIRE(generator.generate(Schema(), surface));
        CHECK(surface.handles.size() == 0);
        CHECK(surface.trampolines.size() == 0);
    }

    SUBCASE("one handle per interface, one trampoline per method") {
        Schema schema;
        parseSchema(R"(
interface GPUAdapter {
    Promise<GPUDevice> requestDevice(optional GPUDeviceDescriptor descriptor);
    readonly attribute DOMString name;
};
interface GPUDeviceDescriptor {
    attribute DOMString label;
};
interface GPUDevice {
    readonly attribute GPUQueue queue;
    void destroy();
    GPUBuffer createBuffer(unsigned long size, unsigned short usage);
};
interface GPUQueue {};
interface GPUBuffer {};
)", schema);

        auto reporter = std::make_shared<ErrorReporter>(true);
        BindingGenerator generator(reporter);
        BindingSurface surface;
        REQUIRE(generator.generate(schema, surface));
        CHECK_FALSE(reporter->hasErrors());

        REQUIRE(surface.handles.size() == 5);
        CHECK(surface.handles[0].interfaceName == "GPUAdapter");
        CHECK(surface.handles[1].interfaceName == "GPUDeviceDescriptor");
        CHECK(surface.handles[2].interfaceName == "GPUDevice");
        CHECK(surface.handles[3].interfaceName == "GPUQueue");
        CHECK(surface.handles[4].interfaceName == "GPUBuffer");

        REQUIRE(surface.trampolines.size() == 3);
        const auto& requestDevice = surface.trampolines[0];
        CHECK(requestDevice.interfaceName == "GPUAdapter");
        CHECK(requestDevice.methodName == "requestDevice");
        CHECK(requestDevice.symbol == "GPUAdapter_requestDevice");
        CHECK(requestDevice.dispatchKey == dispatchKey("GPUAdapter", "requestDevice"));
        CHECK(requestDevice.returnType == Type::makePromise(Type::makeInterfaceRef("GPUDevice")));
        CHECK_FALSE(requestDevice.isStatic);
        REQUIRE(requestDevice.parameters.size() == 1);
        CHECK(requestDevice.parameters[0].name == "descriptor");
        CHECK(requestDevice.parameters[0].optional);
        CHECK(requestDevice.parameters[0].passing == Parameter::kRegion);

        CHECK(surface.trampolines[1].symbol == "GPUDevice_destroy");
        CHECK(surface.trampolines[1].parameters.size() == 0);

        const auto& createBuffer = surface.trampolines[2];
        CHECK(createBuffer.symbol == "GPUDevice_createBuffer");
        REQUIRE(createBuffer.parameters.size() == 2);
        CHECK(createBuffer.parameters[0].passing == Parameter::kInline);
        CHECK(createBuffer.parameters[0].type == Type::make(Type::Kind::kUnsignedLong));
        CHECK(createBuffer.parameters[1].passing == Parameter::kInline);
    }

    SUBCASE("parameter passing") {
        Schema schema;
        parseSchema("interface GPUQueue { void write(boolean a, byte b, octet c, short d, unsigned short e, long f, "
                    "unsigned long g, float h, double i, DOMString j, object k, GPUQueue l, Promise<long> m); };",
                    schema);
        auto reporter = std::make_shared<ErrorReporter>(true);
        BindingGenerator generator(reporter);
        BindingSurface surface;
        REQUIRE(generator.generate(schema, surface));
        REQUIRE(surface.trampolines.size() == 1);
        const auto& parameters = surface.trampolines[0].parameters;
        REQUIRE(parameters.size() == 13);
        for (size_t i = 0; i < 9; ++i) {
            CHECK(parameters[i].passing == Parameter::kInline);
        }
        for (size_t i = 9; i < 13; ++i) {
            CHECK(parameters[i].passing == Parameter::kRegion);
        }
    }

    SUBCASE("static method") {
        Schema schema;
        parseSchema("interface GPUCanvas { static GPUCanvas fromId(DOMString id); };", schema);
        auto reporter = std::make_shared<ErrorReporter>(true);
        BindingGenerator generator(reporter);
        BindingSurface surface;
        REQUIRE(generator.generate(schema, surface));
        REQUIRE(surface.trampolines.size() == 1);
        CHECK(surface.trampolines[0].isStatic);
    }
}

TEST_CASE("BindingGenerator Errors") {
    SUBCASE("unresolved return type") {
        Schema schema;
        parseSchema("interface GPUAdapter {\n    Promise<GPUDevice> requestDevice();\n};", schema);
        auto reporter = std::make_shared<ErrorReporter>(true);
        BindingGenerator generator(reporter);
        BindingSurface surface;
        CHECK_FALSE(generator.generate(schema, surface));
        CHECK(surface.handles.size() == 0);
        CHECK(surface.trampolines.size() == 0);
        REQUIRE(reporter->errorCount() == 1);
        const auto& error = reporter->errors()[0];
        CHECK(error.kind == ErrorReporter::kUnresolvedTypeReference);
        CHECK(error.interfaceName == "GPUAdapter");
        CHECK(error.memberName == "requestDevice");
        CHECK(error.referencedName == "GPUDevice");
        CHECK(error.lineNumber == 2);
    }

    SUBCASE("unresolved argument type") {
        Schema schema;
        parseSchema("interface GPUQueue { void writeBuffer(GPUBuffer buffer); };", schema);
        auto reporter = std::make_shared<ErrorReporter>(true);
        BindingGenerator generator(reporter);
        BindingSurface surface;
        CHECK_FALSE(generator.generate(schema, surface));
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kUnresolvedTypeReference);
        CHECK(reporter->errors()[0].referencedName == "GPUBuffer");
    }

    SUBCASE("unresolved attribute type") {
        Schema schema;
        parseSchema("interface GPUDevice { readonly attribute GPUQueue queue; };", schema);
        auto reporter = std::make_shared<ErrorReporter>(true);
        BindingGenerator generator(reporter);
        BindingSurface surface;
        CHECK_FALSE(generator.generate(schema, surface));
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].memberName == "queue");
        CHECK(reporter->errors()[0].referencedName == "GPUQueue");
    }

    SUBCASE("forward references resolve") {
        Schema schema;
        parseSchema("interface A { B next(); }; interface B { A previous(); };", schema);
        auto reporter = std::make_shared<ErrorReporter>(true);
        BindingGenerator generator(reporter);
        BindingSurface surface;
        CHECK(generator.generate(schema, surface));
        CHECK(surface.trampolines.size() == 2);
    }

    SUBCASE("export symbol collision") {
        Schema schema;
        parseSchema("interface A_b { void c(); };\ninterface A { void b_c(); };", schema);
        auto reporter = std::make_shared<ErrorReporter>(true);
        BindingGenerator generator(reporter);
        BindingSurface surface;
        CHECK_FALSE(generator.generate(schema, surface));
        CHECK(surface.trampolines.size() == 0);
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kSymbolCollision);
        CHECK(reporter->errors()[0].interfaceName == "A");
        CHECK(reporter->errors()[0].memberName == "b_c");
        CHECK(reporter->errors()[0].lineNumber == 2);
    }

    SUBCASE("failure clears a previously filled surface") {
        Schema good;
        parseSchema("interface A { void f(); };", good);
        Schema bad;
        parseSchema("interface A { Missing f(); };", bad);
        auto reporter = std::make_shared<ErrorReporter>(true);
        BindingGenerator generator(reporter);
        BindingSurface surface;
        REQUIRE(generator.generate(good, surface));
        REQUIRE(surface.trampolines.size() == 1);
        CHECK_FALSE(generator.generate(bad, surface));
        CHECK(surface.handles.size() == 0);
        CHECK(surface.trampolines.size() == 0);
    }
}

} // namespace sluice
