#include "sluice/BindingEmitter.hpp"

#include "sluice/Hash.hpp"

#include "fmt/format.h"

#include <unordered_set>

namespace {

// IDL argument names that are C++ keywords, fixed-width type names used by the generated code, or the names of the
// parameters and locals every trampoline declares. Any match is emitted with a trailing underscore.
const std::unordered_set<std::string> kReservedNames {
    "alignas", "alignof", "and", "asm", "auto", "bool", "break", "case", "catch", "char", "class", "const",
    "constexpr", "const_cast", "continue", "decltype", "default", "delete", "do", "double", "dynamic_cast", "else",
    "enum", "explicit", "export", "extern", "false", "float", "for", "friend", "goto", "if", "inline", "int", "long",
    "mutable", "namespace", "new", "noexcept", "not", "nullptr", "operator", "or", "private", "protected", "public",
    "register", "reinterpret_cast", "return", "short", "signed", "sizeof", "static", "static_assert", "static_cast",
    "struct", "switch", "template", "this", "throw", "true", "try", "typedef", "typeid", "typename", "union",
    "unsigned", "using", "virtual", "void", "volatile", "while", "xor",
    // Types named in trampoline signatures and bodies.
    "int8_t", "int16_t", "int32_t", "int64_t", "uint8_t", "uint16_t", "uint32_t", "uint64_t", "size_t",
    // Trampoline parameters and locals.
    "session", "receiver", "result", "writer", "args", "status"
};

} // namespace

namespace sluice {

BindingEmitter::BindingEmitter(std::string bindingNamespace, std::string headerName):
    m_bindingNamespace(std::move(bindingNamespace)), m_headerName(std::move(headerName)) {}

void BindingEmitter::emitHeader(const BindingSurface& surface, std::ostream& out) const {
    auto includeGuard = fmt::format("SLUICE_BINDINGS_{:08X}", hash(m_headerName));
    out << "#ifndef " << includeGuard << "\n";
    out << "#define " << includeGuard << "\n\n";

    out << "// NOTE: sluice-bindgen automatically generated this file from IDL input.\n";
    out << "// Edits will likely be clobbered.\n\n";

    out << "#include \"sluice/Arena.hpp\"\n";
    out << "#include \"sluice/DispatchRegistry.hpp\"\n";
    out << "#include \"sluice/Hash.hpp\"\n";
    out << "#include \"sluice/Session.hpp\"\n\n";
    out << "#include <cstdint>\n";
    out << "#include <utility>\n\n";

    out << "namespace " << m_bindingNamespace << " {\n\n";

    for (const auto& handle : surface.handles) {
        out << "// ========== " << handle.interfaceName << "\n";
        out << "// Non-owning view of a " << handle.interfaceName << " living on the other side of the boundary.\n";
        out << fmt::format("class {} {{\n", handle.interfaceName);
        out << "public:\n";
        out << fmt::format("    {}() = delete;\n", handle.interfaceName);
        out << fmt::format("    explicit {}(sluice::RawHandle raw): m_raw(raw) {{}}\n", handle.interfaceName);
        out << "\n";
        out << "    sluice::RawHandle raw() const { return m_raw; }\n";
        out << "\n";
        out << "private:\n";
        out << "    sluice::RawHandle m_raw;\n";
        out << "};\n\n";

        for (const auto& trampoline : surface.trampolines) {
            if (trampoline.interfaceName != handle.interfaceName) {
                continue;
            }
            out << "// " << idlSignature(trampoline) << "\n";
            out << fmt::format("constexpr sluice::Hash {} = 0x{:08x};\n", keyConstant(trampoline),
                               trampoline.dispatchKey);
            out << fmt::format("inline bool register{}(sluice::DispatchRegistry& registry, "
                               "sluice::Implementation implementation) {{\n", trampoline.symbol);
            out << fmt::format("    return registry.registerImplementation(\"{}\", \"{}\", "
                               "std::move(implementation));\n", trampoline.interfaceName, trampoline.methodName);
            out << "}\n\n";
        }
    }

    out << "} // namespace " << m_bindingNamespace << "\n\n";

    out << "extern \"C\" {\n\n";
    for (const auto& trampoline : surface.trampolines) {
        out << "// " << idlSignature(trampoline) << "\n";
        if (trampoline.isStatic) {
            out << "// Static, |receiver| is ignored.\n";
        }
        out << signature(trampoline) << ";\n\n";
    }
    out << "} // extern \"C\"\n\n";

    out << "#endif // " << includeGuard << "\n";
}

void BindingEmitter::emitSource(const BindingSurface& surface, std::ostream& out) const {
    out << "// NOTE: sluice-bindgen automatically generated this file from IDL input.\n";
    out << "// Edits will likely be clobbered.\n\n";

    out << "#include \"" << m_headerName << "\"\n\n";
    out << "#include \"sluice/Record.hpp\"\n";
    out << "#include \"sluice/Status.hpp\"\n\n";

    out << "extern \"C\" {\n\n";
    for (const auto& trampoline : surface.trampolines) {
        out << signature(trampoline) << " {\n";
        out << "    if (!session || !result) {\n";
        out << "        return sluice::kInvalidArguments;\n";
        out << "    }\n";
        out << "    sluice::RecordWriter writer;\n";
        auto names = parameterNames(trampoline);
        for (size_t i = 0; i < trampoline.parameters.size(); ++i) {
            const auto& parameter = trampoline.parameters[i];
            const auto& name = names[i];
            if (parameter.passing == Parameter::kRegion) {
                out << fmt::format("    writer.addRegion({});\n", name);
            } else if (parameter.type.kind == Type::Kind::kFloat || parameter.type.kind == Type::Kind::kDouble) {
                out << fmt::format("    writer.addFloat(static_cast<double>({}));\n", name);
            } else {
                out << fmt::format("    writer.addInteger(static_cast<int64_t>({}));\n", name);
            }
        }
        out << "    sluice::ArenaRegion args{0, 0};\n";
        out << "    sluice::Status status = writer.finish(session->arena(), args);\n";
        out << "    if (status != sluice::kOk) {\n";
        out << "        return status;\n";
        out << "    }\n";
        out << fmt::format("    return session->dispatch({}::{}, receiver, args, *result);\n", m_bindingNamespace,
                           keyConstant(trampoline));
        out << "}\n\n";
    }
    out << "} // extern \"C\"\n";
}

// static
std::string BindingEmitter::parameterType(const Parameter& parameter) {
    if (parameter.passing == Parameter::kRegion) {
        return "sluice::ArenaRegion";
    }
    switch (parameter.type.kind) {
    case Type::Kind::kBoolean:
        return "bool";
    case Type::Kind::kByte:
        return "int8_t";
    case Type::Kind::kOctet:
        return "uint8_t";
    case Type::Kind::kShort:
        return "int16_t";
    case Type::Kind::kUnsignedShort:
        return "uint16_t";
    case Type::Kind::kLong:
        return "int32_t";
    case Type::Kind::kUnsignedLong:
        return "uint32_t";
    case Type::Kind::kFloat:
        return "float";
    case Type::Kind::kDouble:
        return "double";
    default:
        return "sluice::ArenaRegion";
    }
}

// static
std::string BindingEmitter::parameterName(const std::string& name) {
    if (kReservedNames.count(name)) {
        return name + "_";
    }
    return name;
}

// static
std::vector<std::string> BindingEmitter::parameterNames(const Trampoline& trampoline) {
    std::vector<std::string> names;
    names.reserve(trampoline.parameters.size());
    std::unordered_set<std::string> used;
    for (const auto& parameter : trampoline.parameters) {
        // Renaming "result" to "result_" must not collide with an argument already spelled "result_".
        auto name = parameterName(parameter.name);
        while (used.count(name) || kReservedNames.count(name)) {
            name += "_";
        }
        used.insert(name);
        names.emplace_back(std::move(name));
    }
    return names;
}

// static
std::string BindingEmitter::keyConstant(const Trampoline& trampoline) {
    return fmt::format("k{}Key", trampoline.symbol);
}

std::string BindingEmitter::signature(const Trampoline& trampoline) const {
    std::string text = fmt::format("int32_t {}(sluice::Session* session, sluice::RawHandle receiver",
                                   trampoline.symbol);
    auto names = parameterNames(trampoline);
    for (size_t i = 0; i < trampoline.parameters.size(); ++i) {
        text += fmt::format(", {} {}", parameterType(trampoline.parameters[i]), names[i]);
    }
    text += ", sluice::ArenaRegion* result)";
    return text;
}

// static
std::string BindingEmitter::idlSignature(const Trampoline& trampoline) {
    std::string text = fmt::format("{}{} {}.{}(", trampoline.isStatic ? "static " : "",
                                   trampoline.returnType.toString(), trampoline.interfaceName, trampoline.methodName);
    for (size_t i = 0; i < trampoline.parameters.size(); ++i) {
        const auto& parameter = trampoline.parameters[i];
        if (i > 0) {
            text += ", ";
        }
        text += fmt::format("{}{} {}", parameter.optional ? "optional " : "", parameter.type.toString(),
                            parameter.name);
    }
    text += ")";
    return text;
}

} // namespace sluice
