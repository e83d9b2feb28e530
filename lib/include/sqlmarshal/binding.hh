//
// Procedure Bindings
//
// Normalized description of one annotated declaration, produced by the
// signature extractor and consumed by every code generation stage.
//

#pragma once

#include <sqlmarshal/model.hh>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace sqlmarshal::binding {

enum class direction {
    in,      ///< Value passed to the command
    out,     ///< Value produced by the command
    in_out   ///< Value passed and read back
};

struct parameter_spec {
    std::string internal_name;      ///< Identifier as declared
    model::type_ref declared_type;
    direction dir = direction::in;

    /// Parameter supplies the literal command text instead of a bound value
    bool is_raw_command_text = false;

    [[nodiscard]] bool reads_value() const { return dir != direction::out; }
    [[nodiscard]] bool writes_back() const { return dir != direction::in; }
};

/// Command text comes from a parameter at call time
struct raw_text {
    std::string parameter_name;
};

/// Command text invokes a stored procedure
struct named_procedure {
    std::string name;
};

using command_source = std::variant<raw_text, named_procedure>;

struct procedure_binding {
    std::string name;
    model::accessibility visibility = model::accessibility::private_;
    model::type_ref return_type;
    std::vector<parameter_spec> parameters;   ///< Declaration order
    command_source source;

    /// Named marker arguments (e.g. "PropertyName")
    std::map<std::string, std::string> overrides;

    /// Parameters bound to the command, in declaration order
    [[nodiscard]] std::vector<const parameter_spec*> bound_parameters() const {
        std::vector<const parameter_spec*> result;
        for (const auto& param : parameters) {
            if (!param.is_raw_command_text) {
                result.push_back(&param);
            }
        }
        return result;
    }

    [[nodiscard]] bool uses_raw_text() const {
        return std::holds_alternative<raw_text>(source);
    }
};

}  // namespace sqlmarshal::binding
