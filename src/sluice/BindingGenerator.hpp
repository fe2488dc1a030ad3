#ifndef SRC_SLUICE_BINDING_GENERATOR_HPP_
#define SRC_SLUICE_BINDING_GENERATOR_HPP_

#include "sluice/Hash.hpp"
#include "sluice/Schema.hpp"
#include "sluice/Type.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sluice {

class ErrorReporter;

// One opaque handle type per interface. Handles are non-owning views of a RawHandle, the boundary runtime owns the
// underlying resource.
struct HandleType {
    std::string interfaceName;
};

struct Parameter {
    enum Passing {
        kInline = 0, // Fixed-width number or boolean, passed directly.
        kRegion = 1  // Variable-length or reference value, passed as an ArenaRegion.
    };

    std::string name;
    Type type;
    bool optional;
    Passing passing;
};

// One exported trampoline per method.
struct Trampoline {
    std::string interfaceName;
    std::string methodName;
    // Export symbol, "{Interface}_{Method}".
    std::string symbol;
    Hash dispatchKey;
    Type returnType;
    bool isStatic;
    std::vector<Parameter> parameters;
};

struct BindingSurface {
    std::vector<HandleType> handles;
    std::vector<Trampoline> trampolines;
};

// Validates a Schema for binding and lays out the binding surface. Every interface reference must resolve to an
// interface in the Schema, and every trampoline symbol and dispatch key must be unique.
class BindingGenerator {
public:
    BindingGenerator() = delete;
    explicit BindingGenerator(std::shared_ptr<ErrorReporter> errorReporter);
    ~BindingGenerator() = default;

    // On failure reports the problem and leaves |surface| empty.
    bool generate(const Schema& schema, BindingSurface& surface);

private:
    // Checks |type|, and any Type nested in it, against the interfaces in |schema|.
    bool resolveType(const Schema& schema, const Type& type, const Interface& owner, const std::string& memberName,
                     int32_t lineNumber);

    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace sluice

#endif // SRC_SLUICE_BINDING_GENERATOR_HPP_
