#include <sqlmarshal/model_loader.hh>
#include <fstream>

namespace sqlmarshal::model {

ModelLoader::ModelLoader() = default;

ModelLoader::~ModelLoader() = default;

compilation ModelLoader::build_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    fkyaml::node root;
    try {
        root = fkyaml::node::deserialize(file);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to parse YAML: " + std::string(e.what()));
    }

    compilation result = build_from_yaml(root);
    result.source_path = path;
    return result;
}

compilation ModelLoader::build_from_yaml(const fkyaml::node& root) {
    if (!root.is_mapping()) {
        throw model_error("", "model root must be a mapping");
    }

    compilation result;

    std::string nullable = optional_string(root, "nullable", "model");
    if (!nullable.empty()) {
        auto ctx = parse_nullable_context(nullable);
        if (!ctx) {
            throw model_error("nullable",
                              "unknown nullable context '" + nullable +
                              "' (expected: enable, disable, warnings, annotations)");
        }
        result.nullable = *ctx;
    }

    if (root.contains("types")) {
        const auto& types = root["types"];
        if (!types.is_sequence()) {
            throw model_error("types", "'types' must be a sequence");
        }
        for (size_t i = 0; i < types.size(); ++i) {
            result.types.push_back(build_type(types[i]));
        }
    }

    return result;
}

// ============================================================================
// Types
// ============================================================================

type_def ModelLoader::build_type(const fkyaml::node& node) {
    if (!node.is_mapping()) {
        throw model_error("types", "type entry must be a mapping");
    }

    type_def type;
    type.name = require_string(node, "name", "type");
    type.namespace_name = optional_string(node, "namespace", type.name);

    const std::string owner = type.qualified_name();

    std::string kind = optional_string(node, "kind", owner);
    if (!kind.empty()) {
        auto parsed = parse_type_kind(kind);
        if (!parsed) {
            throw model_error(owner, "unknown type kind '" + kind + "'");
        }
        type.kind = *parsed;
    }

    std::string base = optional_string(node, "base", owner);
    if (!base.empty()) {
        type.base = parse_type(base, owner);
    }

    std::string containing = optional_string(node, "containing_type", owner);
    if (!containing.empty()) {
        type.containing_type = containing;
    }

    auto each = [&](const char* key, auto&& fn) {
        if (!node.contains(key)) {
            return;
        }
        const auto& seq = node[key];
        if (!seq.is_sequence()) {
            throw model_error(owner, std::string("'") + key + "' must be a sequence");
        }
        for (size_t i = 0; i < seq.size(); ++i) {
            fn(seq[i]);
        }
    };

    each("fields", [&](const fkyaml::node& n) {
        type.fields.push_back(build_member(n, owner));
    });
    each("properties", [&](const fkyaml::node& n) {
        type.properties.push_back(build_member(n, owner));
    });
    each("methods", [&](const fkyaml::node& n) {
        type.methods.push_back(build_method(n, owner));
    });

    return type;
}

member_def ModelLoader::build_member(const fkyaml::node& node, const std::string& owner) {
    if (!node.is_mapping()) {
        throw model_error(owner, "member entry must be a mapping");
    }

    member_def member;
    member.name = require_string(node, "name", owner);
    member.type = parse_type(require_string(node, "type", owner + "." + member.name),
                             owner + "." + member.name);
    return member;
}

// ============================================================================
// Methods
// ============================================================================

method_def ModelLoader::build_method(const fkyaml::node& node, const std::string& owner) {
    if (!node.is_mapping()) {
        throw model_error(owner, "method entry must be a mapping");
    }

    method_def method;
    method.name = require_string(node, "name", owner);

    const std::string method_owner = owner + "." + method.name;

    std::string access = optional_string(node, "accessibility", method_owner);
    if (!access.empty()) {
        auto parsed = parse_accessibility(access);
        if (!parsed) {
            throw model_error(method_owner, "unknown accessibility '" + access + "'");
        }
        method.access = *parsed;
    }

    std::string returns = optional_string(node, "returns", method_owner);
    method.return_type = parse_type(returns.empty() ? "void" : returns, method_owner);

    if (node.contains("parameters")) {
        const auto& params = node["parameters"];
        if (!params.is_sequence()) {
            throw model_error(method_owner, "'parameters' must be a sequence");
        }
        for (size_t i = 0; i < params.size(); ++i) {
            method.parameters.push_back(build_parameter(params[i], method_owner));
        }
    }

    if (node.contains("attributes")) {
        method.attributes = build_attributes(node["attributes"], method_owner);
    }

    return method;
}

parameter_def ModelLoader::build_parameter(const fkyaml::node& node, const std::string& owner) {
    if (!node.is_mapping()) {
        throw model_error(owner, "parameter entry must be a mapping");
    }

    parameter_def param;
    param.name = require_string(node, "name", owner);

    const std::string param_owner = owner + "(" + param.name + ")";
    param.type = parse_type(require_string(node, "type", param_owner), param_owner);

    std::string direction = optional_string(node, "direction", param_owner);
    if (!direction.empty()) {
        auto parsed = parse_direction(direction);
        if (!parsed) {
            throw model_error(param_owner,
                              "unknown direction '" + direction + "' (expected: in, out, ref)");
        }
        param.direction = *parsed;
    }

    if (node.contains("attributes")) {
        param.attributes = build_attributes(node["attributes"], param_owner);
    }

    return param;
}

// ============================================================================
// Attributes
// ============================================================================

std::vector<attribute_usage> ModelLoader::build_attributes(const fkyaml::node& node,
                                                           const std::string& owner) {
    if (!node.is_sequence()) {
        throw model_error(owner, "'attributes' must be a sequence");
    }

    std::vector<attribute_usage> result;
    for (size_t i = 0; i < node.size(); ++i) {
        result.push_back(build_attribute(node[i], owner));
    }
    return result;
}

attribute_usage ModelLoader::build_attribute(const fkyaml::node& node, const std::string& owner) {
    attribute_usage attr;

    // Shorthand: "- RawSql"
    if (node.is_string()) {
        attr.name = node.get_value<std::string>();
        return attr;
    }

    if (!node.is_mapping()) {
        throw model_error(owner, "attribute entry must be a name or a mapping");
    }

    attr.name = require_string(node, "name", owner);

    if (node.contains("arguments")) {
        const auto& args = node["arguments"];
        if (!args.is_sequence()) {
            throw model_error(owner, "attribute '" + attr.name + "' arguments must be a sequence");
        }
        for (size_t i = 0; i < args.size(); ++i) {
            attr.arguments.push_back(scalar_text(args[i], owner));
        }
    }

    if (node.contains("named")) {
        const auto& named = node["named"];
        if (!named.is_mapping()) {
            throw model_error(owner, "attribute '" + attr.name + "' named arguments must be a mapping");
        }
        for (auto it = named.begin(); it != named.end(); ++it) {
            std::string key = it.key().get_value<std::string>();
            attr.named_arguments[key] = scalar_text(*it, owner);
        }
    }

    return attr;
}

// ============================================================================
// Helpers
// ============================================================================

std::string ModelLoader::require_string(const fkyaml::node& node,
                                        const std::string& key,
                                        const std::string& owner) {
    if (!node.contains(key)) {
        throw model_error(owner, "missing required '" + key + "'");
    }
    std::string value = scalar_text(node[key], owner);
    if (value.empty()) {
        throw model_error(owner, "'" + key + "' must not be empty");
    }
    return value;
}

std::string ModelLoader::optional_string(const fkyaml::node& node,
                                         const std::string& key,
                                         const std::string& owner) {
    if (!node.contains(key) || node[key].is_null()) {
        return {};
    }
    return scalar_text(node[key], owner);
}

std::string ModelLoader::scalar_text(const fkyaml::node& node, const std::string& owner) {
    if (node.is_string()) {
        return node.get_value<std::string>();
    }
    if (node.is_integer()) {
        return std::to_string(node.get_value<int64_t>());
    }
    if (node.is_boolean()) {
        return node.get_value<bool>() ? "true" : "false";
    }
    throw model_error(owner, "expected a scalar value");
}

type_ref ModelLoader::parse_type(const std::string& text, const std::string& owner) {
    try {
        return parse_type_name(text);
    } catch (const model_error& e) {
        throw model_error(owner, e.what());
    }
}

}  // namespace sqlmarshal::model
