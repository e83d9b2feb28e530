#include <sqlmarshal/type_classifier.hh>

namespace sqlmarshal {

// ============================================================================
// Primitive Table
// ============================================================================

namespace {

struct primitive_entry {
    const char* name;
    scalar_kind kind;
    bool value_type;
};

// Keyword, framework and fully qualified spellings
constexpr primitive_entry k_primitives[] = {
    {"string", scalar_kind::text, false},
    {"String", scalar_kind::text, false},
    {"System.String", scalar_kind::text, false},
    {"bool", scalar_kind::boolean, true},
    {"Boolean", scalar_kind::boolean, true},
    {"System.Boolean", scalar_kind::boolean, true},
    {"byte", scalar_kind::uint8, true},
    {"Byte", scalar_kind::uint8, true},
    {"System.Byte", scalar_kind::uint8, true},
    {"sbyte", scalar_kind::int8, true},
    {"SByte", scalar_kind::int8, true},
    {"System.SByte", scalar_kind::int8, true},
    {"short", scalar_kind::int16, true},
    {"Int16", scalar_kind::int16, true},
    {"System.Int16", scalar_kind::int16, true},
    {"ushort", scalar_kind::uint16, true},
    {"UInt16", scalar_kind::uint16, true},
    {"System.UInt16", scalar_kind::uint16, true},
    {"int", scalar_kind::int32, true},
    {"Int32", scalar_kind::int32, true},
    {"System.Int32", scalar_kind::int32, true},
    {"uint", scalar_kind::uint32, true},
    {"UInt32", scalar_kind::uint32, true},
    {"System.UInt32", scalar_kind::uint32, true},
    {"long", scalar_kind::int64, true},
    {"Int64", scalar_kind::int64, true},
    {"System.Int64", scalar_kind::int64, true},
    {"ulong", scalar_kind::uint64, true},
    {"UInt64", scalar_kind::uint64, true},
    {"System.UInt64", scalar_kind::uint64, true},
    {"float", scalar_kind::single, true},
    {"Single", scalar_kind::single, true},
    {"System.Single", scalar_kind::single, true},
    {"double", scalar_kind::double_, true},
    {"Double", scalar_kind::double_, true},
    {"System.Double", scalar_kind::double_, true},
    {"decimal", scalar_kind::decimal, true},
    {"Decimal", scalar_kind::decimal, true},
    {"System.Decimal", scalar_kind::decimal, true},
    {"DateTime", scalar_kind::timestamp, true},
    {"System.DateTime", scalar_kind::timestamp, true},

    // Primitives without a database type tag
    {"char", scalar_kind::unsupported, true},
    {"Char", scalar_kind::unsupported, true},
    {"System.Char", scalar_kind::unsupported, true},
    {"object", scalar_kind::unsupported, false},
    {"Object", scalar_kind::unsupported, false},
    {"System.Object", scalar_kind::unsupported, false},
    {"nint", scalar_kind::unsupported, true},
    {"nuint", scalar_kind::unsupported, true},
    {"Guid", scalar_kind::unsupported, true},
    {"System.Guid", scalar_kind::unsupported, true},
    {"TimeSpan", scalar_kind::unsupported, true},
    {"System.TimeSpan", scalar_kind::unsupported, true},
    {"DateTimeOffset", scalar_kind::unsupported, true},
    {"System.DateTimeOffset", scalar_kind::unsupported, true},
};

const primitive_entry* find_primitive(const model::type_ref& type) {
    if (!type.type_args.empty()) {
        return nullptr;
    }
    for (const auto& entry : k_primitives) {
        if (type.name == entry.name) {
            return &entry;
        }
    }
    return nullptr;
}

bool is_nullable_generic(const model::type_ref& type) {
    return type.type_args.size() == 1 &&
           (type.name == "Nullable" || type.name == "System.Nullable");
}

}  // namespace

std::optional<scalar_kind> lookup_primitive(const std::string& name) {
    model::type_ref ref;
    ref.name = name;
    if (const auto* entry = find_primitive(ref)) {
        return entry->kind;
    }
    return std::nullopt;
}

const char* to_string(scalar_kind kind) {
    switch (kind) {
        case scalar_kind::text:        return "text";
        case scalar_kind::boolean:     return "boolean";
        case scalar_kind::uint8:       return "uint8";
        case scalar_kind::int8:        return "int8";
        case scalar_kind::int16:       return "int16";
        case scalar_kind::uint16:      return "uint16";
        case scalar_kind::int32:       return "int32";
        case scalar_kind::uint32:      return "uint32";
        case scalar_kind::int64:       return "int64";
        case scalar_kind::uint64:      return "uint64";
        case scalar_kind::single:      return "single";
        case scalar_kind::double_:     return "double";
        case scalar_kind::decimal:     return "decimal";
        case scalar_kind::timestamp:   return "timestamp";
        case scalar_kind::unsupported: return "unsupported";
    }
    return "unsupported";
}

bool operator==(const type_classification& a, const type_classification& b) {
    return a.kind == b.kind &&
           a.underlying_type == b.underlying_type &&
           a.is_nullable == b.is_nullable &&
           a.scalar == b.scalar;
}

// ============================================================================
// TypeClassifier
// ============================================================================

TypeClassifier::TypeClassifier(const TypeUniverse& universe)
    : universe_(universe)
{
}

bool TypeClassifier::is_nullable_wrapper(const model::type_ref& type) {
    return type.nullable_annotation || is_nullable_generic(type);
}

model::type_ref TypeClassifier::unwrap_nullable(const model::type_ref& type) {
    if (is_nullable_generic(type)) {
        return unwrap_nullable(type.type_args.front());
    }
    model::type_ref result = type;
    result.nullable_annotation = false;
    return result;
}

model::type_ref TypeClassifier::underlying_type(const model::type_ref& type) {
    if (type.type_args.size() != 1) {
        return type;
    }
    return type.type_args.front();
}

type_classification TypeClassifier::classify(const model::type_ref& type,
                                             const std::string& context_namespace) const {
    if (is_nullable_wrapper(type)) {
        type_classification inner = classify(unwrap_nullable(type), context_namespace);
        inner.is_nullable = true;
        return inner;
    }

    type_classification result;

    if (type.is_void()) {
        result.kind = classification_kind::void_;
        result.underlying_type = type;
        return result;
    }

    if (const auto* primitive = find_primitive(type)) {
        if (primitive->kind == scalar_kind::unsupported) {
            throw unsupported_type_error(type.to_string(), "primitive without a database type");
        }
        result.kind = classification_kind::scalar;
        result.underlying_type = type;
        result.scalar = primitive->kind;
        return result;
    }

    if (type.type_args.size() == 1) {
        const model::type_ref item = underlying_type(type);
        if (find_primitive(unwrap_nullable(item))) {
            throw unsupported_type_error(type.to_string(), "collections of scalar values");
        }
        result.kind = classification_kind::entity_collection;
        result.underlying_type = unwrap_nullable(item);
        return result;
    }

    result.kind = classification_kind::entity_type;
    result.underlying_type = type;
    return result;
}

scalar_kind TypeClassifier::scalar_mapping(const model::type_ref& type) const {
    const model::type_ref plain = unwrap_nullable(type);
    const auto* primitive = find_primitive(plain);
    if (!primitive || primitive->kind == scalar_kind::unsupported) {
        throw unsupported_type_error(type.to_string(), "output parameter");
    }
    return primitive->kind;
}

bool TypeClassifier::is_value_type(const model::type_ref& type,
                                   const std::string& context_namespace) const {
    if (is_nullable_generic(type)) {
        return true;
    }
    if (const auto* primitive = find_primitive(unwrap_nullable(type))) {
        return primitive->value_type;
    }
    if (const auto* descriptor = universe_.resolve(type, context_namespace)) {
        return descriptor->is_value_type();
    }
    return false;
}

bool TypeClassifier::can_hold_null(const model::type_ref& type,
                                   bool nullable_annotations,
                                   const std::string& context_namespace) const {
    if (is_nullable_wrapper(type)) {
        return true;
    }
    if (is_value_type(type, context_namespace)) {
        return false;
    }
    return !nullable_annotations;
}

}  // namespace sqlmarshal
