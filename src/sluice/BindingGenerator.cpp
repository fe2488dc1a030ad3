#include "sluice/BindingGenerator.hpp"

#include "sluice/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <unordered_map>

namespace sluice {

BindingGenerator::BindingGenerator(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(errorReporter) {}

bool BindingGenerator::generate(const Schema& schema, BindingSurface& surface) {
    surface.handles.clear();
    surface.trampolines.clear();

    BindingSurface result;
    // Maps symbols and keys back to the trampoline that claimed them, for collision reporting.
    std::unordered_map<std::string, size_t> symbols;
    std::unordered_map<Hash, size_t> keys;

    for (const auto& interfaceDef : schema.interfaces) {
        for (const auto& attribute : interfaceDef.attributes) {
            if (!resolveType(schema, attribute.type, interfaceDef, attribute.name, attribute.lineNumber)) {
                return false;
            }
        }

        result.handles.emplace_back(HandleType{interfaceDef.name});

        for (const auto& method : interfaceDef.methods) {
            if (!resolveType(schema, method.returnType, interfaceDef, method.name, method.lineNumber)) {
                return false;
            }

            Trampoline trampoline;
            trampoline.interfaceName = interfaceDef.name;
            trampoline.methodName = method.name;
            trampoline.symbol = exportSymbol(interfaceDef.name, method.name);
            trampoline.dispatchKey = hash(trampoline.symbol);
            trampoline.returnType = method.returnType;
            trampoline.isStatic = method.isStatic;

            for (const auto& argument : method.arguments) {
                if (!resolveType(schema, argument.type, interfaceDef, method.name, argument.lineNumber)) {
                    return false;
                }
                auto passing = argument.type.isPassedInline() ? Parameter::kInline : Parameter::kRegion;
                trampoline.parameters.emplace_back(Parameter{argument.name, argument.type, argument.optional, passing});
            }

            auto symbolIter = symbols.find(trampoline.symbol);
            if (symbolIter != symbols.end()) {
                const auto& other = result.trampolines[symbolIter->second];
                m_errorReporter->addError(ErrorReporter::kSymbolCollision, method.lineNumber, interfaceDef.name,
                                          method.name,
                                          fmt::format("trampoline symbol '{}' for {}.{} collides with {}.{}",
                                                      trampoline.symbol, interfaceDef.name, method.name,
                                                      other.interfaceName, other.methodName));
                return false;
            }
            auto keyIter = keys.find(trampoline.dispatchKey);
            if (keyIter != keys.end()) {
                const auto& other = result.trampolines[keyIter->second];
                m_errorReporter->addError(ErrorReporter::kSymbolCollision, method.lineNumber, interfaceDef.name,
                                          method.name,
                                          fmt::format("dispatch key 0x{:08x} for {}.{} collides with {}.{}",
                                                      trampoline.dispatchKey, interfaceDef.name, method.name,
                                                      other.interfaceName, other.methodName));
                return false;
            }
            symbols.emplace(std::make_pair(trampoline.symbol, result.trampolines.size()));
            keys.emplace(std::make_pair(trampoline.dispatchKey, result.trampolines.size()));

            result.trampolines.emplace_back(std::move(trampoline));
        }
    }

    SPDLOG_DEBUG("Generated {} handle types and {} trampolines", result.handles.size(), result.trampolines.size());
    surface = std::move(result);
    return true;
}

bool BindingGenerator::resolveType(const Schema& schema, const Type& type, const Interface& owner,
                                   const std::string& memberName, int32_t lineNumber) {
    if (type.kind == Type::Kind::kPromise) {
        return !type.inner || resolveType(schema, *type.inner, owner, memberName, lineNumber);
    }
    if (type.kind != Type::Kind::kInterfaceRef) {
        return true;
    }
    if (schema.findInterface(type.name)) {
        return true;
    }
    m_errorReporter->addError(ErrorReporter::kUnresolvedTypeReference, lineNumber, owner.name, memberName,
                              fmt::format("{}.{} references unknown interface '{}'", owner.name, memberName,
                                          type.name),
                              type.name);
    return false;
}

} // namespace sluice
