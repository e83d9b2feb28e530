#include <sqlmarshal/model.hh>

namespace sqlmarshal::model {

// ============================================================================
// type_ref
// ============================================================================

std::string type_ref::simple_name() const {
    auto pos = name.rfind('.');
    return pos == std::string::npos ? name : name.substr(pos + 1);
}

std::string type_ref::qualifier() const {
    auto pos = name.rfind('.');
    return pos == std::string::npos ? std::string() : name.substr(0, pos);
}

std::string type_ref::to_string() const {
    std::string result = name;
    if (!type_args.empty()) {
        result += '<';
        for (size_t i = 0; i < type_args.size(); ++i) {
            if (i > 0) result += ", ";
            result += type_args[i].to_string();
        }
        result += '>';
    }
    if (nullable_annotation) {
        result += '?';
    }
    return result;
}

bool operator==(const type_ref& a, const type_ref& b) {
    return a.name == b.name &&
           a.nullable_annotation == b.nullable_annotation &&
           a.type_args == b.type_args;
}

bool operator!=(const type_ref& a, const type_ref& b) {
    return !(a == b);
}

// ============================================================================
// type_def
// ============================================================================

std::string type_def::qualified_name() const {
    if (namespace_name.empty()) {
        return name;
    }
    return namespace_name + "." + name;
}

// ============================================================================
// Keyword Helpers
// ============================================================================

std::string to_keyword(accessibility access) {
    switch (access) {
        case accessibility::public_:            return "public";
        case accessibility::internal:           return "internal";
        case accessibility::protected_:         return "protected";
        case accessibility::private_:           return "private";
        case accessibility::protected_internal: return "protected internal";
        case accessibility::private_protected:  return "private protected";
    }
    return "private";
}

std::optional<accessibility> parse_accessibility(const std::string& text) {
    if (text == "public") return accessibility::public_;
    if (text == "internal") return accessibility::internal;
    if (text == "protected") return accessibility::protected_;
    if (text == "private") return accessibility::private_;
    if (text == "protected internal") return accessibility::protected_internal;
    if (text == "private protected") return accessibility::private_protected;
    return std::nullopt;
}

std::optional<parameter_direction> parse_direction(const std::string& text) {
    if (text == "in") return parameter_direction::in;
    if (text == "out") return parameter_direction::out;
    if (text == "ref") return parameter_direction::ref;
    return std::nullopt;
}

std::optional<type_kind> parse_type_kind(const std::string& text) {
    if (text == "class") return type_kind::class_;
    if (text == "struct") return type_kind::struct_;
    if (text == "record") return type_kind::record;
    if (text == "interface") return type_kind::interface;
    if (text == "enum") return type_kind::enum_;
    if (text == "attribute") return type_kind::attribute;
    return std::nullopt;
}

std::optional<nullable_context> parse_nullable_context(const std::string& text) {
    if (text == "disable") return nullable_context::disable;
    if (text == "enable") return nullable_context::enable;
    if (text == "warnings") return nullable_context::warnings;
    if (text == "annotations") return nullable_context::annotations;
    return std::nullopt;
}

}  // namespace sqlmarshal::model
