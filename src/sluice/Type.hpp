#ifndef SRC_SLUICE_TYPE_HPP_
#define SRC_SLUICE_TYPE_HPP_

#include <cstdint>
#include <memory>
#include <string>

namespace sluice {

// Closed set of IDL types. kPromise always carries exactly one inner Type, kInterfaceRef carries only a name that the
// BindingGenerator resolves against the Schema.
struct Type {
    enum Kind : std::int32_t {
        kVoid = 0,
        kBoolean = 1,
        kByte = 2,
        kOctet = 3,
        kShort = 4,
        kUnsignedShort = 5,
        kLong = 6,
        kUnsignedLong = 7,
        kFloat = 8,
        kDouble = 9,
        kString = 10,
        kObject = 11,
        kPromise = 12,
        kInterfaceRef = 13
    };

    Type(): kind(kVoid), nullable(false) {}
    ~Type() = default;

    static inline Type make(Kind k) { return Type(k, std::string(), nullptr); }
    static inline Type makePromise(Type inner) {
        return Type(kPromise, std::string(), std::make_shared<const Type>(std::move(inner)));
    }
    static inline Type makeInterfaceRef(std::string name) { return Type(kInterfaceRef, std::move(name), nullptr); }

    // Numbers and booleans travel inline in a trampoline call.
    bool isPassedInline() const;
    // Everything that is not inline must travel as an ArenaRegion.
    bool isPassedByRegion() const { return kind != kVoid && !isPassedInline(); }

    // Canonical IDL spelling, e.g. "unsigned long", "Promise<GPUDevice?>".
    std::string toString() const;

    bool operator==(const Type& other) const;
    bool operator!=(const Type& other) const { return !(*this == other); }

    Kind kind;
    // Set by a trailing '?' in the IDL. Does not affect the kind or how the value is passed.
    bool nullable;
    // Only for kInterfaceRef.
    std::string name;
    // Only for kPromise.
    std::shared_ptr<const Type> inner;

private:
    Type(Kind k, std::string n, std::shared_ptr<const Type> i): kind(k), nullable(false), name(std::move(n)),
        inner(std::move(i)) {}
};

} // namespace sluice

#endif // SRC_SLUICE_TYPE_HPP_
