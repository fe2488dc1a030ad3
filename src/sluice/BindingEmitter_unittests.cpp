#include "sluice/BindingEmitter.hpp"

#include "sluice/ErrorReporter.hpp"
#include "sluice/Parser.hpp"

#include "doctest/doctest.h"
#include "fmt/format.h"

#include <memory>
#include <sstream>
#include <string>
#include <string_view>

namespace sluice {

namespace {

void generateSurface(std::string_view code, BindingSurface& surface) {
    Parser parser(code);
    REQUIRE(parser.parse());
    BindingGenerator generator(std::make_shared<ErrorReporter>(true));
    REQUIRE(generator.generate(parser.schema(), surface));
}

bool contains(const std::string& text, std::string_view fragment) { return text.find(fragment) != std::string::npos; }

} // namespace

TEST_CASE("BindingEmitter Header") {
    BindingSurface surface;
    generateSurface("interface GPUAdapter { Promise<GPUDevice> requestDevice(optional GPUDeviceDescriptor descriptor);"
                    " readonly attribute DOMString name; };\n"
                    "interface GPUDevice { void destroy(); };\n"
                    "interface GPUDeviceDescriptor {};\n"
                    "interface GPUCanvas { static GPUCanvas fromId(DOMString id); };", surface);

    BindingEmitter emitter("webgpu", "WebGPUBindings.hpp");
    std::ostringstream out;
    emitter.emitHeader(surface, out);
    auto header = out.str();

    SUBCASE("include guard and namespace") {
        CHECK(header.rfind("#ifndef SLUICE_BINDINGS_", 0) == 0);
        CHECK(contains(header, "namespace webgpu {"));
        CHECK(contains(header, "} // namespace webgpu"));
        CHECK(contains(header, "#include \"sluice/Session.hpp\""));
    }

    SUBCASE("handle classes") {
        CHECK(contains(header, "class GPUAdapter {"));
        CHECK(contains(header, "class GPUDevice {"));
        CHECK(contains(header, "class GPUDeviceDescriptor {"));
        CHECK(contains(header, "explicit GPUCanvas(sluice::RawHandle raw): m_raw(raw) {}"));
    }

    SUBCASE("dispatch keys and registration helpers") {
        CHECK(contains(header, fmt::format("constexpr sluice::Hash kGPUAdapter_requestDeviceKey = 0x{:08x};",
                                           dispatchKey("GPUAdapter", "requestDevice"))));
        CHECK(contains(header, "inline bool registerGPUDevice_destroy(sluice::DispatchRegistry& registry"));
        CHECK(contains(header, "registry.registerImplementation(\"GPUDevice\", \"destroy\""));
        CHECK(contains(header, "// Promise<GPUDevice> GPUAdapter.requestDevice(optional GPUDeviceDescriptor "
                               "descriptor)"));
    }

    SUBCASE("trampoline declarations") {
        CHECK(contains(header, "extern \"C\" {"));
        CHECK(contains(header, "int32_t GPUAdapter_requestDevice(sluice::Session* session, sluice::RawHandle "
                               "receiver, sluice::ArenaRegion descriptor, sluice::ArenaRegion* result);"));
        CHECK(contains(header, "int32_t GPUDevice_destroy(sluice::Session* session, sluice::RawHandle receiver, "
                               "sluice::ArenaRegion* result);"));
        CHECK(contains(header, "// Static, |receiver| is ignored.\nint32_t GPUCanvas_fromId("));
    }

    SUBCASE("attributes get no trampolines") {
        CHECK_FALSE(contains(header, "GPUAdapter_name"));
    }
}

TEST_CASE("BindingEmitter Source") {
    BindingSurface surface;
    generateSurface("interface GPUBuffer { void write(unsigned long offset, float scale, double bias, boolean flag, "
                    "DOMString label, GPUBuffer source); };", surface);

    BindingEmitter emitter("webgpu", "WebGPUBindings.hpp");
    std::ostringstream out;
    emitter.emitSource(surface, out);
    auto source = out.str();

    CHECK(contains(source, "#include \"WebGPUBindings.hpp\""));
    CHECK(contains(source, "#include \"sluice/Record.hpp\""));
    CHECK(contains(source, "int32_t GPUBuffer_write(sluice::Session* session, sluice::RawHandle receiver, "
                           "uint32_t offset, float scale, double bias, bool flag, sluice::ArenaRegion label, "
                           "sluice::ArenaRegion source, sluice::ArenaRegion* result) {"));
    CHECK(contains(source, "return sluice::kInvalidArguments;"));
    CHECK(contains(source, "writer.addInteger(static_cast<int64_t>(offset));"));
    CHECK(contains(source, "writer.addFloat(static_cast<double>(scale));"));
    CHECK(contains(source, "writer.addFloat(static_cast<double>(bias));"));
    CHECK(contains(source, "writer.addInteger(static_cast<int64_t>(flag));"));
    CHECK(contains(source, "writer.addRegion(label);"));
    CHECK(contains(source, "writer.addRegion(source);"));
    CHECK(contains(source, "return session->dispatch(webgpu::kGPUBuffer_writeKey, receiver, args, *result);"));

    // Parameters appear in the record in declaration order.
    auto offsetPosition = source.find("addInteger(static_cast<int64_t>(offset))");
    auto labelPosition = source.find("addRegion(label)");
    auto sourcePosition = source.find("addRegion(source)");
    CHECK(offsetPosition < labelPosition);
    CHECK(labelPosition < sourcePosition);
}

TEST_CASE("BindingEmitter Names and Types") {
    SUBCASE("reserved parameter names") {
        CHECK(BindingEmitter::parameterName("descriptor") == "descriptor");
        CHECK(BindingEmitter::parameterName("default") == "default_");
        CHECK(BindingEmitter::parameterName("delete") == "delete_");
        CHECK(BindingEmitter::parameterName("session") == "session_");
        CHECK(BindingEmitter::parameterName("result") == "result_");
        CHECK(BindingEmitter::parameterName("receiver") == "receiver_");
    }

    SUBCASE("parameter types") {
        auto inlineParameter = [](Type::Kind kind) {
            return Parameter{"x", Type::make(kind), false, Parameter::kInline};
        };
        CHECK(BindingEmitter::parameterType(inlineParameter(Type::Kind::kBoolean)) == "bool");
        CHECK(BindingEmitter::parameterType(inlineParameter(Type::Kind::kByte)) == "int8_t");
        CHECK(BindingEmitter::parameterType(inlineParameter(Type::Kind::kOctet)) == "uint8_t");
        CHECK(BindingEmitter::parameterType(inlineParameter(Type::Kind::kShort)) == "int16_t");
        CHECK(BindingEmitter::parameterType(inlineParameter(Type::Kind::kUnsignedShort)) == "uint16_t");
        CHECK(BindingEmitter::parameterType(inlineParameter(Type::Kind::kLong)) == "int32_t");
        CHECK(BindingEmitter::parameterType(inlineParameter(Type::Kind::kUnsignedLong)) == "uint32_t");
        CHECK(BindingEmitter::parameterType(inlineParameter(Type::Kind::kFloat)) == "float");
        CHECK(BindingEmitter::parameterType(inlineParameter(Type::Kind::kDouble)) == "double");
        CHECK(BindingEmitter::parameterType(Parameter{"x", Type::make(Type::Kind::kString), false,
                                                      Parameter::kRegion}) == "sluice::ArenaRegion");
    }

    SUBCASE("reserved name in emitted trampoline") {
        BindingSurface surface;
        generateSurface("interface GPUQueue { void submit(long default, DOMString result); };", surface);
        BindingEmitter emitter("webgpu", "WebGPUBindings.hpp");
        std::ostringstream out;
        emitter.emitSource(surface, out);
        auto source = out.str();
        CHECK(contains(source, "int32_t default_, sluice::ArenaRegion result_, sluice::ArenaRegion* result)"));
        CHECK(contains(source, "writer.addRegion(result_);"));
    }

    SUBCASE("fixed-width type names") {
        CHECK(BindingEmitter::parameterName("int64_t") == "int64_t_");
        CHECK(BindingEmitter::parameterName("uint8_t") == "uint8_t_");
        CHECK(BindingEmitter::parameterName("int32") == "int32");

        BindingSurface surface;
        generateSurface("interface GPUQueue { void g(long int64_t, double uint32_t); };", surface);
        BindingEmitter emitter("webgpu", "WebGPUBindings.hpp");
        std::ostringstream out;
        emitter.emitSource(surface, out);
        auto source = out.str();
        CHECK(contains(source, "int32_t int64_t_, double uint32_t_, sluice::ArenaRegion* result)"));
        CHECK(contains(source, "writer.addInteger(static_cast<int64_t>(int64_t_));"));
        CHECK(contains(source, "writer.addFloat(static_cast<double>(uint32_t_));"));
    }

    SUBCASE("renamed parameters stay distinct") {
        BindingSurface surface;
        generateSurface("interface GPUQueue { void f(DOMString result, DOMString result_);"
                        " void h(long session_, long session); };", surface);
        REQUIRE(surface.trampolines.size() == 2);
        auto fNames = BindingEmitter::parameterNames(surface.trampolines[0]);
        REQUIRE(fNames.size() == 2);
        CHECK(fNames[0] == "result_");
        CHECK(fNames[1] == "result__");
        auto hNames = BindingEmitter::parameterNames(surface.trampolines[1]);
        REQUIRE(hNames.size() == 2);
        CHECK(hNames[0] == "session_");
        CHECK(hNames[1] == "session__");

        BindingEmitter emitter("webgpu", "WebGPUBindings.hpp");
        std::ostringstream out;
        emitter.emitSource(surface, out);
        auto source = out.str();
        CHECK(contains(source,
                       "sluice::ArenaRegion result_, sluice::ArenaRegion result__, sluice::ArenaRegion* result)"));
        CHECK(contains(source, "writer.addRegion(result_);"));
        CHECK(contains(source, "writer.addRegion(result__);"));
        CHECK(contains(source, "int32_t session_, int32_t session__, sluice::ArenaRegion* result)"));
    }
}

} // namespace sluice
