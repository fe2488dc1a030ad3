#include "sluice/SourceFile.hpp"

#include "sluice/internal/FileSystem.hpp"

#include "doctest/doctest.h"

#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace sluice {

namespace {

std::string slurp(const fs::path& path) {
    std::ifstream inFile(path, std::ifstream::binary);
    return std::string((std::istreambuf_iterator<char>(inFile)), std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("SourceFile and writeIfChanged") {
    auto root = fs::temp_directory_path() / "sluice_unittests";
    std::error_code error;
    fs::remove_all(root, error);

    SUBCASE("missing file") {
        SourceFile sourceFile((root / "missing.idl").string());
        CHECK_FALSE(sourceFile.read());
    }

    SUBCASE("write creates directories and read returns contents") {
        auto path = root / "nested" / "gpu.idl";
        std::string code("interface GPU {\n};\n");
        REQUIRE(writeIfChanged(path, code));
        CHECK(slurp(path) == code);

        SourceFile sourceFile(path.string());
        REQUIRE(sourceFile.read());
        CHECK(sourceFile.path() == path.string());
        CHECK(sourceFile.codeView() == code);
    }

    SUBCASE("identical contents leave the file alone") {
        auto path = root / "bindings.hpp";
        REQUIRE(writeIfChanged(path, "first"));
        auto firstWrite = fs::last_write_time(path);
        REQUIRE(writeIfChanged(path, "first"));
        CHECK(fs::last_write_time(path) == firstWrite);

        REQUIRE(writeIfChanged(path, "second, longer"));
        CHECK(slurp(path) == "second, longer");
        REQUIRE(writeIfChanged(path, "third"));
        CHECK(slurp(path) == "third");
    }

    fs::remove_all(root, error);
}

} // namespace sluice
