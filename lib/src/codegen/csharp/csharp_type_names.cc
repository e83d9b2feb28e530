#include <sqlmarshal/codegen/csharp/csharp_type_names.hh>
#include <sqlmarshal/errors.hh>
#include <map>

namespace sqlmarshal::codegen {

std::string keyword_name(const std::string& name) {
    static const std::map<std::string, std::string> keywords = {
        {"String", "string"},   {"System.String", "string"},
        {"Boolean", "bool"},    {"System.Boolean", "bool"},
        {"Byte", "byte"},       {"System.Byte", "byte"},
        {"SByte", "sbyte"},     {"System.SByte", "sbyte"},
        {"Int16", "short"},     {"System.Int16", "short"},
        {"UInt16", "ushort"},   {"System.UInt16", "ushort"},
        {"Int32", "int"},       {"System.Int32", "int"},
        {"UInt32", "uint"},     {"System.UInt32", "uint"},
        {"Int64", "long"},      {"System.Int64", "long"},
        {"UInt64", "ulong"},    {"System.UInt64", "ulong"},
        {"Single", "float"},    {"System.Single", "float"},
        {"Double", "double"},   {"System.Double", "double"},
        {"Decimal", "decimal"}, {"System.Decimal", "decimal"},
        {"Char", "char"},       {"System.Char", "char"},
        {"Object", "object"},   {"System.Object", "object"},
    };

    auto it = keywords.find(name);
    return it != keywords.end() ? it->second : name;
}

std::string db_type_name(scalar_kind kind) {
    const char* member = nullptr;
    switch (kind) {
        case scalar_kind::text:      member = "String"; break;
        case scalar_kind::boolean:   member = "Boolean"; break;
        case scalar_kind::uint8:     member = "Byte"; break;
        case scalar_kind::int8:      member = "SByte"; break;
        case scalar_kind::int16:     member = "Int16"; break;
        case scalar_kind::uint16:    member = "UInt16"; break;
        case scalar_kind::int32:     member = "Int32"; break;
        case scalar_kind::uint32:    member = "UInt32"; break;
        case scalar_kind::int64:     member = "Int64"; break;
        case scalar_kind::uint64:    member = "UInt64"; break;
        case scalar_kind::single:    member = "Single"; break;
        case scalar_kind::double_:   member = "Double"; break;
        case scalar_kind::decimal:   member = "Decimal"; break;
        case scalar_kind::timestamp: member = "DateTime2"; break;
        case scalar_kind::unsupported:
            throw unsupported_type_error(to_string(kind), "database type tag");
    }
    return std::string("System.Data.DbType.") + member;
}

// ============================================================================
// TypeNameFormatter
// ============================================================================

TypeNameFormatter::TypeNameFormatter(const TypeUniverse& universe, std::string context_namespace)
    : universe_(universe),
      context_namespace_(std::move(context_namespace))
{
}

std::string TypeNameFormatter::display(const model::type_ref& type) const {
    if (type.type_args.size() == 1 &&
        (type.name == "Nullable" || type.name == "System.Nullable")) {
        return display(type.type_args.front()) + "?";
    }

    std::string result = type.type_args.empty() ? keyword_name(type.name) : type.name;
    if (result == type.name) {
        const TypeDescriptor* descriptor = universe_.is_declared(type, context_namespace_)
            ? universe_.resolve(type, context_namespace_)
            : nullptr;
        result = descriptor ? descriptor->qualified_name() : type.name;
    }

    if (!type.type_args.empty()) {
        result += '<';
        for (size_t i = 0; i < type.type_args.size(); ++i) {
            if (i > 0) {
                result += ", ";
            }
            result += display(type.type_args[i]);
        }
        result += '>';
    }

    if (type.nullable_annotation) {
        result += '?';
    }
    return result;
}

std::string TypeNameFormatter::short_name(const model::type_ref& type) const {
    const std::string keyword = keyword_name(type.name);
    if (keyword != type.name) {
        return keyword;
    }
    return type.simple_name();
}

}  // namespace sqlmarshal::codegen
