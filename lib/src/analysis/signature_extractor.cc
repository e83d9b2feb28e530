#include <sqlmarshal/analysis.hh>

namespace sqlmarshal::analysis {

bool attribute_matches(const std::string& usage_name, const std::string& type_name) {
    std::string name = usage_name;

    auto dot = name.rfind('.');
    if (dot != std::string::npos) {
        name = name.substr(dot + 1);
    }
    if (name == type_name) {
        return true;
    }

    static const std::string suffix = "Attribute";
    return type_name.size() > suffix.size() &&
           type_name.compare(type_name.size() - suffix.size(), suffix.size(), suffix) == 0 &&
           name == type_name.substr(0, type_name.size() - suffix.size());
}

// ============================================================================
// SignatureExtractor
// ============================================================================

SignatureExtractor::SignatureExtractor(const marker_names& markers,
                                       std::vector<diagnostic>& diagnostics)
    : markers_(markers)
    , diagnostics_(diagnostics)
{
}

const model::attribute_usage* SignatureExtractor::find_marker(const model::method_def& method) const {
    for (const auto& attr : method.attributes) {
        if (attribute_matches(attr.name, markers_.generation_marker)) {
            return &attr;
        }
    }
    return nullptr;
}

bool SignatureExtractor::is_marked(const model::method_def& method) const {
    return find_marker(method) != nullptr;
}

bool SignatureExtractor::is_raw_command(const model::parameter_def& param) const {
    for (const auto& attr : param.attributes) {
        if (attribute_matches(attr.name, markers_.raw_command_marker)) {
            return true;
        }
    }
    return false;
}

void SignatureExtractor::report(diagnostic_level level, const char* code,
                                const std::string& message, const std::string& symbol) {
    diagnostics_.push_back({level, code, message, symbol});
}

std::optional<binding::procedure_binding> SignatureExtractor::extract(
    const model::type_def& owner,
    const model::method_def& method)
{
    const model::attribute_usage* marker = find_marker(method);
    if (!marker) {
        return std::nullopt;
    }

    const std::string symbol = owner.qualified_name() + "." + method.name;

    binding::procedure_binding result;
    result.name = method.name;
    result.visibility = method.access;
    result.return_type = method.return_type;

    const model::parameter_def* raw_parameter = nullptr;
    bool valid = true;

    for (const auto& param : method.parameters) {
        binding::parameter_spec spec;
        spec.internal_name = param.name;
        spec.declared_type = param.type;

        switch (param.direction) {
            case model::parameter_direction::in:  spec.dir = binding::direction::in; break;
            case model::parameter_direction::out: spec.dir = binding::direction::out; break;
            case model::parameter_direction::ref: spec.dir = binding::direction::in_out; break;
        }

        if (is_raw_command(param)) {
            spec.is_raw_command_text = true;

            if (raw_parameter) {
                report(diagnostic_level::error, diag_codes::E_MULTIPLE_RAW_SQL,
                       "Parameters '" + raw_parameter->name + "' and '" + param.name +
                       "' both supply the command text", symbol);
                valid = false;
            }
            raw_parameter = &param;

            const auto simple = param.type.simple_name();
            if (!param.type.type_args.empty() || (simple != "string" && simple != "String")) {
                report(diagnostic_level::error, diag_codes::E_RAW_SQL_NOT_STRING,
                       "Command text parameter '" + param.name + "' must be a string, found '" +
                       param.type.to_string() + "'", symbol);
                valid = false;
            }

            if (param.direction != model::parameter_direction::in) {
                report(diagnostic_level::error, diag_codes::E_RAW_SQL_DIRECTION,
                       "Command text parameter '" + param.name + "' cannot be out or ref", symbol);
                valid = false;
            }
        }

        result.parameters.push_back(std::move(spec));
    }

    if (raw_parameter) {
        result.source = binding::raw_text{raw_parameter->name};
    } else if (!marker->arguments.empty() && !marker->arguments.front().empty()) {
        result.source = binding::named_procedure{marker->arguments.front()};
    } else {
        report(diagnostic_level::error, diag_codes::E_NO_COMMAND_TEXT,
               "No procedure name given and no parameter supplies the command text", symbol);
        valid = false;
    }

    for (const auto& [key, value] : marker->named_arguments) {
        if (markers_.recognized_overrides.count(key) == 0) {
            report(diagnostic_level::warning, diag_codes::W_UNKNOWN_NAMED_ARGUMENT,
                   "Unknown named argument '" + key + "' is ignored", symbol);
            continue;
        }
        result.overrides[key] = value;
    }

    if (!valid) {
        return std::nullopt;
    }
    return result;
}

}  // namespace sqlmarshal::analysis
