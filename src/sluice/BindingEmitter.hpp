#ifndef SRC_SLUICE_BINDING_EMITTER_HPP_
#define SRC_SLUICE_BINDING_EMITTER_HPP_

#include "sluice/BindingGenerator.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace sluice {

// Renders a BindingSurface as a C++ header and source pair. The header declares the handle classes, the dispatch keys
// and registration helpers, and the extern "C" trampolines. The source defines the trampolines, each of which packs
// its parameters into an argument record in the session Arena and forwards to Session::dispatch().
class BindingEmitter {
public:
    BindingEmitter() = delete;
    // |headerName| is the path the generated source uses to include the generated header.
    BindingEmitter(std::string bindingNamespace, std::string headerName);
    ~BindingEmitter() = default;

    void emitHeader(const BindingSurface& surface, std::ostream& out) const;
    void emitSource(const BindingSurface& surface, std::ostream& out) const;

    // C++ spelling of the parameter type in a trampoline signature.
    static std::string parameterType(const Parameter& parameter);
    // Parameter names that would be invalid or shadow trampoline locals get a trailing underscore.
    static std::string parameterName(const std::string& name);
    // Final names for every parameter of |trampoline|, in order. Unique within the trampoline and never reserved.
    static std::vector<std::string> parameterNames(const Trampoline& trampoline);
    static std::string keyConstant(const Trampoline& trampoline);

private:
    std::string signature(const Trampoline& trampoline) const;
    static std::string idlSignature(const Trampoline& trampoline);

    std::string m_bindingNamespace;
    std::string m_headerName;
};

} // namespace sluice

#endif // SRC_SLUICE_BINDING_EMITTER_HPP_
