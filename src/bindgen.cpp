// sluice-bindgen, parses IDL interface definitions and generates C++ boundary bindings for them
#include "sluice/BindingEmitter.hpp"
#include "sluice/BindingGenerator.hpp"
#include "sluice/ErrorReporter.hpp"
#include "sluice/Lexer.hpp"
#include "sluice/Parser.hpp"
#include "sluice/Schema.hpp"
#include "sluice/SourceFile.hpp"
#include "sluice/internal/FileSystem.hpp"

#include "gflags/gflags.h"
#include "spdlog/spdlog.h"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::vector<std::string> splitPaths(const std::string& paths) {
    std::vector<std::string> result;
    size_t pathBegin = 0;
    while (pathBegin <= paths.size()) {
        size_t pathEnd = paths.find_first_of(';', pathBegin);
        auto path = paths.substr(pathBegin, pathEnd == std::string::npos ? std::string::npos : pathEnd - pathBegin);
        if (!path.empty()) {
            result.emplace_back(path);
        }
        if (pathEnd == std::string::npos) {
            break;
        }
        pathBegin = pathEnd + 1;
    }
    return result;
}

} // namespace

DEFINE_string(idlFiles, "", "Semicolon-delineated list of input IDL files to process.");
DEFINE_string(outputHeader, "", "Path of the generated bindings header.");
DEFINE_string(outputSource, "", "Path of the generated bindings source file.");
DEFINE_string(bindingNamespace, "bindings", "C++ namespace for the generated handle types and dispatch keys.");
DEFINE_bool(verbose, false, "Set log output level to debug (verbose).");

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("sluice-bindgen --idlFiles=a.idl;b.idl --outputHeader=X.hpp --outputSource=X.cpp");
    gflags::ParseCommandLineFlags(&argc, &argv, false);

    if (FLAGS_verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    auto idlFiles = splitPaths(FLAGS_idlFiles);
    if (idlFiles.empty()) {
        SPDLOG_ERROR("No input IDL files, provide at least one with --idlFiles");
        return -1;
    }
    if (FLAGS_outputHeader.empty() || FLAGS_outputSource.empty()) {
        SPDLOG_ERROR("Both --outputHeader and --outputSource are required");
        return -1;
    }

    auto errorReporter = std::make_shared<sluice::ErrorReporter>();

    // All inputs parse into one Schema, so interfaces may reference interfaces defined in other files.
    sluice::Schema schema;
    for (const auto& path : idlFiles) {
        sluice::SourceFile sourceFile(path);
        if (!sourceFile.read()) {
            SPDLOG_ERROR("Failed to read input IDL file: {}", path);
            return -1;
        }

        errorReporter->setFileName(path);
        sluice::Lexer lexer(sourceFile.codeView(), errorReporter);
        if (!lexer.lex()) {
            return -1;
        }
        sluice::Parser parser(&lexer, errorReporter);
        if (!parser.parse(schema)) {
            return -1;
        }
    }
    errorReporter->setFileName(std::string());

    sluice::BindingGenerator generator(errorReporter);
    sluice::BindingSurface surface;
    if (!generator.generate(schema, surface)) {
        return -1;
    }

    sluice::BindingEmitter emitter(FLAGS_bindingNamespace, fs::path(FLAGS_outputHeader).filename().string());
    std::ostringstream header;
    emitter.emitHeader(surface, header);
    std::ostringstream source;
    emitter.emitSource(surface, source);

    if (!sluice::writeIfChanged(fs::path(FLAGS_outputHeader), header.str())) {
        return -1;
    }
    if (!sluice::writeIfChanged(fs::path(FLAGS_outputSource), source.str())) {
        return -1;
    }

    SPDLOG_INFO("Generated {} handle types and {} trampolines from {} IDL files", surface.handles.size(),
                surface.trampolines.size(), idlFiles.size());
    return 0;
}
