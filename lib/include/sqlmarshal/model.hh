//
// Declaration Model for SqlMarshal
//
// Language-neutral description of the C# compilation the generator works on:
// declared types with their fields, properties and methods, plus the
// attributes applied to methods and parameters. Produced by the model loader
// and consumed by analysis and code generation.
//

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sqlmarshal::model {

// ============================================================================
// Type References
// ============================================================================

/// A type as written in a declaration, e.g. `IList<Foo.Item>` or `int?`.
struct type_ref {
    /// Type name as written, possibly namespace-qualified ("Foo.Item", "int")
    std::string name;

    /// Generic arguments in order (empty for non-generic types)
    std::vector<type_ref> type_args;

    /// Trailing `?` annotation
    bool nullable_annotation = false;

    /// Last segment of the name ("Foo.Item" -> "Item")
    [[nodiscard]] std::string simple_name() const;

    /// Namespace part of the name ("Foo.Item" -> "Foo", "Item" -> "")
    [[nodiscard]] std::string qualifier() const;

    /// Reconstruct the written form ("IList<Foo.Item>", "int?")
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool is_void() const { return name == "void" && type_args.empty(); }
};

bool operator==(const type_ref& a, const type_ref& b);
bool operator!=(const type_ref& a, const type_ref& b);

// ============================================================================
// Attributes
// ============================================================================

/// An attribute application, e.g. `[SqlMarshal("sp_name", PropertyName = "X")]`
struct attribute_usage {
    std::string name;
    std::vector<std::string> arguments;                  ///< Positional arguments
    std::map<std::string, std::string> named_arguments;  ///< Named arguments
};

// ============================================================================
// Members
// ============================================================================

enum class parameter_direction {
    in,    ///< Plain parameter
    out,   ///< `out` parameter
    ref    ///< `ref` parameter
};

enum class accessibility {
    public_,
    internal,
    protected_,
    private_,
    protected_internal,
    private_protected
};

/// Field or property of a declared type
struct member_def {
    std::string name;
    type_ref type;
};

struct parameter_def {
    std::string name;
    type_ref type;
    parameter_direction direction = parameter_direction::in;
    std::vector<attribute_usage> attributes;
};

struct method_def {
    std::string name;
    accessibility access = accessibility::private_;
    type_ref return_type;
    std::vector<parameter_def> parameters;
    std::vector<attribute_usage> attributes;
};

// ============================================================================
// Declared Types
// ============================================================================

enum class type_kind {
    class_,
    struct_,
    record,
    interface,
    enum_,
    attribute
};

struct type_def {
    std::string name;
    std::string namespace_name;                ///< Empty for the global namespace
    type_kind kind = type_kind::class_;
    std::optional<type_ref> base;
    std::optional<std::string> containing_type; ///< Set for nested types

    std::vector<member_def> fields;
    std::vector<member_def> properties;         ///< Declaration order is the ordinal
    std::vector<method_def> methods;

    /// "Foo.Bar.C" or "C" for the global namespace
    [[nodiscard]] std::string qualified_name() const;

    [[nodiscard]] bool is_top_level() const { return !containing_type.has_value(); }

    [[nodiscard]] bool is_value_type() const {
        return kind == type_kind::struct_ || kind == type_kind::enum_;
    }
};

// ============================================================================
// Compilation
// ============================================================================

/// Nullable context of the input compilation
enum class nullable_context {
    disable,
    enable,
    warnings,
    annotations
};

struct compilation {
    std::string source_path;   ///< Model file the compilation was loaded from
    nullable_context nullable = nullable_context::disable;
    std::vector<type_def> types;

    /// Nullable reference annotations are honored unless the context is disabled
    [[nodiscard]] bool has_nullable_annotations() const {
        return nullable != nullable_context::disable;
    }
};

// ============================================================================
// Keyword Helpers
// ============================================================================

/// C# spelling of an accessibility ("public", "protected internal", ...)
std::string to_keyword(accessibility access);

/// Parse "public", "internal", ... into accessibility
std::optional<accessibility> parse_accessibility(const std::string& text);

/// Parse "in", "out", "ref" into parameter_direction
std::optional<parameter_direction> parse_direction(const std::string& text);

/// Parse "class", "struct", ... into type_kind
std::optional<type_kind> parse_type_kind(const std::string& text);

/// Parse "enable", "disable", ... into nullable_context
std::optional<nullable_context> parse_nullable_context(const std::string& text);

}  // namespace sqlmarshal::model
