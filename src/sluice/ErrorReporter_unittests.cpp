#include "sluice/ErrorReporter.hpp"

#include "sluice/Status.hpp"

#include "doctest/doctest.h"

#include <cstring>

namespace sluice {

TEST_CASE("ErrorReporter") {
    SUBCASE("starts empty") {
        ErrorReporter reporter(true);
        CHECK_FALSE(reporter.hasErrors());
        CHECK(reporter.errorCount() == 0);
    }

    SUBCASE("records every error in order") {
        ErrorReporter reporter(true);
        reporter.setFileName("gpu.idl");
        reporter.addError(ErrorReporter::kSyntax, 3, "expected ';'");
        reporter.addError(ErrorReporter::kUnresolvedTypeReference, 7, "GPUAdapter", "requestDevice",
                          "unknown interface", "GPUDevice");
        REQUIRE(reporter.errorCount() == 2);
        CHECK(reporter.hasErrors());

        const auto& syntax = reporter.errors()[0];
        CHECK(syntax.kind == ErrorReporter::kSyntax);
        CHECK(syntax.lineNumber == 3);
        CHECK(syntax.interfaceName.empty());
        CHECK(syntax.memberName.empty());
        CHECK(syntax.message == "expected ';'");

        const auto& unresolved = reporter.errors()[1];
        CHECK(unresolved.kind == ErrorReporter::kUnresolvedTypeReference);
        CHECK(unresolved.lineNumber == 7);
        CHECK(unresolved.interfaceName == "GPUAdapter");
        CHECK(unresolved.memberName == "requestDevice");
        CHECK(unresolved.referencedName == "GPUDevice");
    }

    SUBCASE("logging errors still records them") {
        ErrorReporter reporter;
        reporter.addError(ErrorReporter::kDuplicateName, 0, "duplicate interface name 'GPU'");
        CHECK(reporter.errorCount() == 1);
    }

    SUBCASE("kind names") {
        CHECK(std::strcmp(ErrorReporter::kindName(ErrorReporter::kSyntax), "SyntaxError") == 0);
        CHECK(std::strcmp(ErrorReporter::kindName(ErrorReporter::kUnexpectedClose), "UnexpectedCloseError") == 0);
        CHECK(std::strcmp(ErrorReporter::kindName(ErrorReporter::kUnexpectedToken), "UnexpectedTokenError") == 0);
        CHECK(std::strcmp(ErrorReporter::kindName(ErrorReporter::kDuplicateName), "DuplicateNameError") == 0);
        CHECK(std::strcmp(ErrorReporter::kindName(ErrorReporter::kUnresolvedTypeReference),
                          "UnresolvedTypeReferenceError") == 0);
        CHECK(std::strcmp(ErrorReporter::kindName(ErrorReporter::kSymbolCollision), "SymbolCollisionError") == 0);
    }
}

TEST_CASE("Status names") {
    CHECK(std::strcmp(statusName(kOk), "Ok") == 0);
    CHECK(std::strcmp(statusName(kArenaExhausted), "ArenaExhausted") == 0);
    CHECK(std::strcmp(statusName(kOutOfBounds), "OutOfBounds") == 0);
    CHECK(std::strcmp(statusName(kNotRegistered), "NotRegistered") == 0);
    CHECK(std::strcmp(statusName(kArenaUnmapped), "ArenaUnmapped") == 0);
    CHECK(std::strcmp(statusName(kInvalidArguments), "InvalidArguments") == 0);
    CHECK(std::strcmp(statusName(kImplementationFailed), "ImplementationFailed") == 0);
}

} // namespace sluice
