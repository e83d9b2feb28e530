//
// Type Descriptors
//
// Narrow view of the host type system used by the synthesis engine. Code
// generation only needs a type's kind, its declared members with their
// ordinal positions, and its base-type chain; everything else about the
// compilation stays behind this interface.
//

#pragma once

#include <sqlmarshal/model.hh>
#include <memory>
#include <string>
#include <vector>

namespace sqlmarshal {

// ============================================================================
// TypeDescriptor
// ============================================================================

/// Read-only description of one named type.
class TypeDescriptor {
public:
    virtual ~TypeDescriptor() = default;

    /// Simple name ("Item")
    [[nodiscard]] virtual const std::string& name() const = 0;

    /// Namespace-qualified name ("Foo.Item")
    [[nodiscard]] virtual std::string qualified_name() const = 0;

    [[nodiscard]] virtual model::type_kind kind() const = 0;

    [[nodiscard]] virtual bool is_value_type() const = 0;

    /// Declared fields in declaration order
    [[nodiscard]] virtual const std::vector<model::member_def>& fields() const = 0;

    /// Declared properties; the vector index is the property ordinal
    [[nodiscard]] virtual const std::vector<model::member_def>& properties() const = 0;

    /// Direct base type, if any
    [[nodiscard]] virtual const model::type_ref* base_type() const = 0;
};

// ============================================================================
// TypeUniverse
// ============================================================================

/**
 * Resolves type references against the compilation's declared types and a
 * fixed catalog of well-known framework types (DbConnection and its common
 * provider subclasses, DbContext).
 *
 * Declared types shadow well-known types of the same name. Resolution is a
 * pure function of the compilation, so the same reference always yields the
 * same descriptor.
 */
class TypeUniverse {
public:
    explicit TypeUniverse(const model::compilation& compilation);
    ~TypeUniverse();

    TypeUniverse(const TypeUniverse&) = delete;
    TypeUniverse& operator=(const TypeUniverse&) = delete;

    /// Resolve a reference written inside namespace `context_namespace`.
    /// Returns nullptr for types the universe knows nothing about.
    [[nodiscard]] const TypeDescriptor* resolve(const model::type_ref& ref,
                                                const std::string& context_namespace = {}) const;

    /// Resolve a declared type definition
    [[nodiscard]] const TypeDescriptor* describe(const model::type_def& def) const;

    /// Base-type chain of `type` by simple name, nearest base first.
    /// Stops at unresolvable bases and guards against cycles.
    [[nodiscard]] std::vector<std::string> base_chain(const TypeDescriptor& type) const;

    /// True if `type` is named `base_name` or derives from it
    [[nodiscard]] bool is_or_derives_from(const TypeDescriptor& type,
                                          const std::string& base_name) const;

    /// True if the reference names a type declared in the compilation
    /// (as opposed to a well-known or unknown type)
    [[nodiscard]] bool is_declared(const model::type_ref& ref,
                                   const std::string& context_namespace = {}) const;

    [[nodiscard]] const model::compilation& compilation() const { return compilation_; }

private:
    class DeclaredType;

    const DeclaredType* find(const std::string& name,
                             const std::string& context_namespace,
                             bool declared_only) const;

    const model::compilation& compilation_;
    std::vector<model::type_def> well_known_defs_;
    std::vector<std::unique_ptr<DeclaredType>> declared_;
    std::vector<std::unique_ptr<DeclaredType>> well_known_;
};

}  // namespace sqlmarshal
