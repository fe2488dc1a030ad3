#include "sluice/Parser.hpp"

#include "sluice/ErrorReporter.hpp"
#include "sluice/Lexer.hpp"

#include "doctest/doctest.h"

#include <memory>

namespace sluice {

TEST_CASE("Parser Base Cases") {
    SUBCASE("empty input") {
        Parser parser("");
        REQUIRE(parser.parse());
        CHECK(parser.schema().interfaces.size() == 0);
    }
    SUBCASE("comments only") {
        Parser parser("// nothing here\n/* or here */");
        REQUIRE(parser.parse());
        CHECK(parser.schema().interfaces.size() == 0);
    }
    SUBCASE("empty interface") {
        Parser parser("interface GPUQueue {};");
        REQUIRE(parser.parse());
        REQUIRE(parser.schema().interfaces.size() == 1);
        const auto& interfaceDef = parser.schema().interfaces[0];
        CHECK(interfaceDef.name == "GPUQueue");
        CHECK(interfaceDef.methods.size() == 0);
        CHECK(interfaceDef.attributes.size() == 0);
        CHECK(interfaceDef.lineNumber == 1);
    }
    SUBCASE("opening brace is optional") {
        Parser parser("interface GPUQueue\n    void submit();\n};");
        REQUIRE(parser.parse());
        REQUIRE(parser.schema().interfaces.size() == 1);
        CHECK(parser.schema().interfaces[0].methods.size() == 1);
    }
}

TEST_CASE("Parser Interfaces") {
    SUBCASE("single line interface") {
        Parser parser("interface GPUAdapter { Promise<GPUDevice> requestDevice(optional GPUDeviceDescriptor descriptor); "
                      "readonly attribute DOMString name; };");
        REQUIRE(parser.parse());
        REQUIRE(parser.schema().interfaces.size() == 1);
        const auto& adapter = parser.schema().interfaces[0];
        CHECK(adapter.name == "GPUAdapter");

        REQUIRE(adapter.methods.size() == 1);
        const auto& method = adapter.methods[0];
        CHECK(method.name == "requestDevice");
        CHECK(method.returnType == Type::makePromise(Type::makeInterfaceRef("GPUDevice")));
        CHECK_FALSE(method.isStatic);
        REQUIRE(method.arguments.size() == 1);
        CHECK(method.arguments[0].name == "descriptor");
        CHECK(method.arguments[0].optional);
        CHECK(method.arguments[0].type == Type::makeInterfaceRef("GPUDeviceDescriptor"));

        REQUIRE(adapter.attributes.size() == 1);
        CHECK(adapter.attributes[0].name == "name");
        CHECK(adapter.attributes[0].type == Type::make(Type::Kind::kString));
        CHECK(adapter.attributes[0].readonly);
    }

    SUBCASE("interfaces kept in source order") {
        Parser parser("interface C {};\ninterface A {};\ninterface B {};");
        REQUIRE(parser.parse());
        REQUIRE(parser.schema().interfaces.size() == 3);
        CHECK(parser.schema().interfaces[0].name == "C");
        CHECK(parser.schema().interfaces[1].name == "A");
        CHECK(parser.schema().interfaces[2].name == "B");
        CHECK(parser.schema().interfaces[2].lineNumber == 3);
        CHECK(parser.schema().findInterface("A") == &parser.schema().interfaces[1]);
        CHECK(parser.schema().findInterface("D") == nullptr);
    }

    SUBCASE("members in source order with line numbers") {
        Parser parser(R"(interface GPUDevice {
    readonly attribute GPUQueue queue;

    GPUBuffer createBuffer(unsigned long size, unsigned short usage, optional boolean mappedAtCreation = false);
    void destroy();
    attribute DOMString label;
};)");
        REQUIRE(parser.parse());
        REQUIRE(parser.schema().interfaces.size() == 1);
        const auto& device = parser.schema().interfaces[0];
        REQUIRE(device.methods.size() == 2);
        CHECK(device.methods[0].name == "createBuffer");
        CHECK(device.methods[0].lineNumber == 4);
        CHECK(device.methods[1].name == "destroy");
        CHECK(device.methods[1].returnType == Type::make(Type::Kind::kVoid));
        CHECK(device.methods[1].arguments.size() == 0);

        const auto& arguments = device.methods[0].arguments;
        REQUIRE(arguments.size() == 3);
        CHECK(arguments[0].type == Type::make(Type::Kind::kUnsignedLong));
        CHECK_FALSE(arguments[0].optional);
        CHECK(arguments[1].type == Type::make(Type::Kind::kUnsignedShort));
        CHECK(arguments[2].name == "mappedAtCreation");
        CHECK(arguments[2].optional);
        CHECK(arguments[2].type == Type::make(Type::Kind::kBoolean));

        REQUIRE(device.attributes.size() == 2);
        CHECK(device.attributes[0].name == "queue");
        CHECK(device.attributes[0].readonly);
        CHECK(device.attributes[0].lineNumber == 2);
        CHECK(device.attributes[1].name == "label");
        CHECK_FALSE(device.attributes[1].readonly);
    }

    SUBCASE("static method") {
        Parser parser("interface GPUCanvas { static GPUCanvas fromId(DOMString id); };");
        REQUIRE(parser.parse());
        REQUIRE(parser.schema().interfaces.size() == 1);
        REQUIRE(parser.schema().interfaces[0].methods.size() == 1);
        CHECK(parser.schema().interfaces[0].methods[0].isStatic);
        CHECK(parser.schema().interfaces[0].methods[0].returnType == Type::makeInterfaceRef("GPUCanvas"));
    }

    SUBCASE("special operation qualifier") {
        Parser parser("interface GPUSupportedFeatures { getter DOMString item(unsigned long index); };");
        REQUIRE(parser.parse());
        REQUIRE(parser.schema().interfaces.size() == 1);
        REQUIRE(parser.schema().interfaces[0].methods.size() == 1);
        CHECK(parser.schema().interfaces[0].methods[0].name == "item");
        CHECK_FALSE(parser.schema().interfaces[0].methods[0].isStatic);
    }

    SUBCASE("attribute keyword is optional") {
        Parser parser("interface GPUAdapter { readonly DOMString name; boolean ready; };");
        REQUIRE(parser.parse());
        REQUIRE(parser.schema().interfaces.size() == 1);
        REQUIRE(parser.schema().interfaces[0].attributes.size() == 2);
        CHECK(parser.schema().interfaces[0].attributes[0].readonly);
        CHECK(parser.schema().interfaces[0].attributes[1].type == Type::make(Type::Kind::kBoolean));
    }

    SUBCASE("nullable types") {
        Parser parser("interface GPU { Promise<GPUAdapter?> requestAdapter(); readonly attribute DOMString? label; };"
                      "interface GPUAdapter {};");
        REQUIRE(parser.parse());
        const auto& gpu = parser.schema().interfaces[0];
        REQUIRE(gpu.methods.size() == 1);
        REQUIRE(gpu.methods[0].returnType.inner);
        CHECK(gpu.methods[0].returnType.inner->nullable);
        REQUIRE(gpu.attributes.size() == 1);
        CHECK(gpu.attributes[0].type.nullable);
    }

    SUBCASE("default values") {
        Parser parser("interface GPU { void f(optional long a = -1, optional DOMString b = \"x\", "
                      "optional GPU c = {}, optional object d = [], optional boolean e = true); };");
        REQUIRE(parser.parse());
        REQUIRE(parser.schema().interfaces.size() == 1);
        REQUIRE(parser.schema().interfaces[0].methods.size() == 1);
        CHECK(parser.schema().interfaces[0].methods[0].arguments.size() == 5);
    }

    SUBCASE("extended attributes are ignored") {
        Parser parser("[Exposed=(Window, Worker), SecureContext]\ninterface GPUBuffer {\n"
                      "    [SameObject] readonly attribute unsigned long size;\n"
                      "    void writeSize([EnforceRange] unsigned long size);\n};");
        REQUIRE(parser.parse());
        REQUIRE(parser.schema().interfaces.size() == 1);
        const auto& buffer = parser.schema().interfaces[0];
        CHECK(buffer.name == "GPUBuffer");
        CHECK(buffer.lineNumber == 2);
        CHECK(buffer.attributes.size() == 1);
        REQUIRE(buffer.methods.size() == 1);
        CHECK(buffer.methods[0].arguments.size() == 1);
    }
}

TEST_CASE("Parser Errors") {
    SUBCASE("stray line outside interface") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        Parser parser("GPUAdapter requestAdapter\ninterface GPU {};", reporter);
        CHECK_FALSE(parser.parse());
        CHECK(parser.schema().interfaces.size() == 0);
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kUnexpectedToken);
        CHECK(reporter->errors()[0].lineNumber == 1);
    }

    SUBCASE("stray line after interface") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        Parser parser("interface GPU {};\n\nsomething else;", reporter);
        CHECK_FALSE(parser.parse());
        CHECK(parser.schema().interfaces.size() == 0);
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kUnexpectedToken);
        CHECK(reporter->errors()[0].lineNumber == 3);
    }

    SUBCASE("close without open interface") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        Parser parser("interface GPU {};\n};", reporter);
        CHECK_FALSE(parser.parse());
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kUnexpectedClose);
        CHECK(reporter->errors()[0].lineNumber == 2);
    }

    SUBCASE("duplicate interface") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        Parser parser("interface GPU {};\ninterface GPU {};", reporter);
        CHECK_FALSE(parser.parse());
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kDuplicateName);
        CHECK(reporter->errors()[0].interfaceName == "GPU");
        CHECK(reporter->errors()[0].lineNumber == 2);
    }

    SUBCASE("duplicate method") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        Parser parser("interface GPUQueue {\n    void submit();\n    void submit(long count);\n};", reporter);
        CHECK_FALSE(parser.parse());
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kDuplicateName);
        CHECK(reporter->errors()[0].interfaceName == "GPUQueue");
        CHECK(reporter->errors()[0].memberName == "submit");
        CHECK(reporter->errors()[0].lineNumber == 3);
    }

    SUBCASE("method and attribute share a name") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        Parser parser("interface GPUBuffer { readonly attribute long size; long size(); };", reporter);
        CHECK_FALSE(parser.parse());
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kDuplicateName);
    }

    SUBCASE("duplicate argument") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        Parser parser("interface GPUCanvas { void resize(long width, long width); };", reporter);
        CHECK_FALSE(parser.parse());
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kDuplicateName);
        CHECK(reporter->errors()[0].memberName == "resize");
    }

    SUBCASE("unterminated interface") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        Parser parser("interface GPUQueue {\n    void submit();\n", reporter);
        CHECK_FALSE(parser.parse());
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kSyntax);
        CHECK(reporter->errors()[0].interfaceName == "GPUQueue");
    }

    SUBCASE("missing semicolon after close") {
        Parser parser("interface GPUQueue { void submit(); }");
        CHECK_FALSE(parser.parse());
        REQUIRE(parser.errorReporter()->errorCount() == 1);
        CHECK(parser.errorReporter()->errors()[0].kind == ErrorReporter::kSyntax);
    }

    SUBCASE("missing semicolon after method") {
        Parser parser("interface GPUQueue {\n    void submit()\n    void onSubmittedWorkDone();\n};");
        CHECK_FALSE(parser.parse());
        REQUIRE(parser.errorReporter()->errorCount() == 1);
        CHECK(parser.errorReporter()->errors()[0].kind == ErrorReporter::kSyntax);
        CHECK(parser.errorReporter()->errors()[0].lineNumber == 3);
    }

    SUBCASE("malformed argument list reports its line") {
        Parser parser("interface GPUQueue {\n\n    void writeBuffer(GPUBuffer buffer,);\n};");
        CHECK_FALSE(parser.parse());
        REQUIRE(parser.errorReporter()->errorCount() == 1);
        CHECK(parser.errorReporter()->errors()[0].kind == ErrorReporter::kSyntax);
        CHECK(parser.errorReporter()->errors()[0].lineNumber == 3);
    }

    SUBCASE("interface missing name") {
        Parser parser("interface {};");
        CHECK_FALSE(parser.parse());
        CHECK(parser.errorReporter()->errors()[0].kind == ErrorReporter::kSyntax);
    }

    SUBCASE("inheritance") {
        Parser parser("interface GPUBase {};\ninterface GPUBuffer : GPUBase {};");
        CHECK_FALSE(parser.parse());
        CHECK(parser.errorReporter()->errors()[0].kind == ErrorReporter::kSyntax);
        CHECK(parser.errorReporter()->errors()[0].lineNumber == 2);
    }

    SUBCASE("nested interface") {
        Parser parser("interface A {\n    interface B {};\n};");
        CHECK_FALSE(parser.parse());
        CHECK(parser.errorReporter()->errors()[0].kind == ErrorReporter::kSyntax);
    }

    SUBCASE("void attribute") {
        Parser parser("interface A { attribute void nothing; };");
        CHECK_FALSE(parser.parse());
        CHECK(parser.errorReporter()->errors()[0].kind == ErrorReporter::kSyntax);
    }

    SUBCASE("void argument") {
        Parser parser("interface A { void f(void nothing); };");
        CHECK_FALSE(parser.parse());
        CHECK(parser.errorReporter()->errors()[0].kind == ErrorReporter::kSyntax);
    }

    SUBCASE("unsupported generic") {
        Parser parser("interface A { sequence<long> values(); };");
        CHECK_FALSE(parser.parse());
        CHECK(parser.errorReporter()->errors()[0].kind == ErrorReporter::kSyntax);
    }

    SUBCASE("static attribute") {
        Parser parser("interface A { static attribute long count; };");
        CHECK_FALSE(parser.parse());
        CHECK(parser.errorReporter()->errors()[0].kind == ErrorReporter::kSyntax);
    }

    SUBCASE("unsigned without width") {
        Parser parser("interface A { unsigned double value(); };");
        CHECK_FALSE(parser.parse());
        CHECK(parser.errorReporter()->errors()[0].kind == ErrorReporter::kSyntax);
    }

    SUBCASE("lexer error stops parse") {
        Parser parser("interface A { void f(); }; @");
        CHECK_FALSE(parser.parse());
        CHECK(parser.schema().interfaces.size() == 0);
        REQUIRE(parser.errorReporter()->errorCount() == 1);
        CHECK(parser.errorReporter()->errors()[0].kind == ErrorReporter::kSyntax);
    }

    SUBCASE("extended attributes with nothing after them") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        Parser parser("[Exposed=Window]\n", reporter);
        CHECK_FALSE(parser.parse());
        CHECK(parser.schema().interfaces.size() == 0);
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kUnexpectedToken);
        CHECK(reporter->errors()[0].lineNumber == 1);
    }

    SUBCASE("extended attributes after the last interface") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        Parser parser("interface A {\n};\n[SecureContext]\n", reporter);
        CHECK_FALSE(parser.parse());
        CHECK(parser.schema().interfaces.size() == 0);
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kUnexpectedToken);
        CHECK(reporter->errors()[0].lineNumber == 3);
    }

    SUBCASE("extended attributes before a stray token") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        Parser parser("[Exposed=Window] dictionary GPUColor {};", reporter);
        CHECK_FALSE(parser.parse());
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kUnexpectedToken);
    }

    SUBCASE("extended attributes before interface close") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        Parser parser("interface A {\n  [Foo]\n};\n", reporter);
        CHECK_FALSE(parser.parse());
        CHECK(parser.schema().interfaces.size() == 0);
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kSyntax);
        CHECK(reporter->errors()[0].interfaceName == "A");
        CHECK(reporter->errors()[0].lineNumber == 3);
    }

    SUBCASE("stacked extended attributes are fine") {
        Parser parser("[Exposed=Window] [SecureContext]\ninterface A {\n  [Foo] [Bar] void f();\n};");
        REQUIRE(parser.parse());
        REQUIRE(parser.schema().interfaces.size() == 1);
        CHECK(parser.schema().interfaces[0].methods.size() == 1);
    }

    SUBCASE("interface named after a built-in type") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        Parser parser("interface DOMString {};", reporter);
        CHECK_FALSE(parser.parse());
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kSyntax);
        CHECK(reporter->errors()[0].interfaceName == "DOMString");
    }

    SUBCASE("unterminated extended attributes") {
        Parser parser("[Exposed=Window interface A {};");
        CHECK_FALSE(parser.parse());
        CHECK(parser.errorReporter()->errors()[0].kind == ErrorReporter::kSyntax);
    }
}

TEST_CASE("Parser Appending Schemas") {
    SUBCASE("several inputs share one schema") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        Schema schema;

        Lexer firstLexer("interface GPUDevice { GPUQueue queue(); };", reporter);
        REQUIRE(firstLexer.lex());
        Parser first(&firstLexer, reporter);
        REQUIRE(first.parse(schema));

        Lexer secondLexer("interface GPUQueue { void submit(); };", reporter);
        REQUIRE(secondLexer.lex());
        Parser second(&secondLexer, reporter);
        REQUIRE(second.parse(schema));

        REQUIRE(schema.interfaces.size() == 2);
        CHECK(schema.interfaces[0].name == "GPUDevice");
        CHECK(schema.interfaces[1].name == "GPUQueue");
        CHECK_FALSE(reporter->hasErrors());
    }

    SUBCASE("duplicate across inputs") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        Schema schema;
        Parser first("interface GPUQueue {};", reporter);
        REQUIRE(first.parse(schema));
        Parser second("interface GPUBuffer {};\ninterface GPUQueue {};", reporter);
        CHECK_FALSE(second.parse(schema));
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kDuplicateName);
        // The failed input leaves nothing behind.
        REQUIRE(schema.interfaces.size() == 1);
        CHECK(schema.interfaces[0].name == "GPUQueue");
    }
}

} // namespace sluice
