//
// Type Classifier
//
// Maps declared types onto the categories the synthesis engine dispatches on:
// scalars with a database type tag, single-row entity types, and collections
// of entities. Classification is a pure function of the type reference and
// the type universe; nothing is cached.
//

#pragma once

#include <sqlmarshal/errors.hh>
#include <sqlmarshal/model.hh>
#include <sqlmarshal/type_descriptor.hh>
#include <optional>
#include <string>

namespace sqlmarshal {

// ============================================================================
// Scalar Kinds
// ============================================================================

/// Closed set of primitive kinds. `unsupported` covers primitives that have
/// no database type tag; requesting a mapping for them is a hard error.
enum class scalar_kind {
    text,
    boolean,
    uint8,
    int8,
    int16,
    uint16,
    int32,
    uint32,
    int64,
    uint64,
    single,
    double_,
    decimal,
    timestamp,
    unsupported
};

/// Look up a primitive type by name ("int", "Int32", "System.Int32", ...).
/// Returns nullopt for names that are not primitives at all.
std::optional<scalar_kind> lookup_primitive(const std::string& name);

/// Human-readable name of a scalar kind ("int32", "timestamp", ...)
const char* to_string(scalar_kind kind);

// ============================================================================
// Classification
// ============================================================================

enum class classification_kind {
    scalar,
    entity_type,
    entity_collection,
    void_
};

struct type_classification {
    classification_kind kind = classification_kind::void_;

    /// Scalar: the type with any nullable wrapper removed.
    /// Entity type: the type itself. Collection: the item type.
    model::type_ref underlying_type;

    /// Type was wrapped in Nullable<T> or annotated with `?`
    bool is_nullable = false;

    /// Set for scalars
    std::optional<scalar_kind> scalar;

    [[nodiscard]] bool is_scalar() const { return kind == classification_kind::scalar; }
    [[nodiscard]] bool is_list() const { return kind == classification_kind::entity_collection; }
};

bool operator==(const type_classification& a, const type_classification& b);

// ============================================================================
// TypeClassifier
// ============================================================================

class TypeClassifier {
public:
    explicit TypeClassifier(const TypeUniverse& universe);

    /// Classify a declared type.
    /// @throws unsupported_type_error for primitives without a database mapping
    ///         and for collections of scalars
    [[nodiscard]] type_classification classify(const model::type_ref& type,
                                               const std::string& context_namespace = {}) const;

    /// Scalar kind of a type, looking through nullable wrappers.
    /// @throws unsupported_type_error if the type is not a supported scalar
    [[nodiscard]] scalar_kind scalar_mapping(const model::type_ref& type) const;

    /// Inner type of a single-argument generic, otherwise the type itself
    [[nodiscard]] static model::type_ref underlying_type(const model::type_ref& type);

    /// `Nullable<T>` or `T?`
    [[nodiscard]] static bool is_nullable_wrapper(const model::type_ref& type);

    /// Remove `Nullable<>` and the `?` annotation
    [[nodiscard]] static model::type_ref unwrap_nullable(const model::type_ref& type);

    [[nodiscard]] bool is_value_type(const model::type_ref& type,
                                     const std::string& context_namespace = {}) const;

    /// True if a variable of this type can hold null under the given
    /// nullability mode. Value types only when wrapped; reference types
    /// always when annotations are off, only when annotated otherwise.
    [[nodiscard]] bool can_hold_null(const model::type_ref& type,
                                     bool nullable_annotations,
                                     const std::string& context_namespace = {}) const;

private:
    const TypeUniverse& universe_;
};

}  // namespace sqlmarshal
