//
// Parameter Binder
//
// Emits the DbParameter construction for every bound parameter of a
// procedure, in declaration order, and the read-back of out/ref values after
// execution. The raw command text parameter is never bound.
//
// Generated shape per parameter:
//
//   var clientIdParameter = command.CreateParameter();
//   clientIdParameter.ParameterName = "@client_id";
//   clientIdParameter.DbType = System.Data.DbType.Int32;                  (out/ref)
//   clientIdParameter.Direction = System.Data.ParameterDirection.Output;  (out/ref)
//   clientIdParameter.Value = clientId;                                   (in/ref)
//

#pragma once

#include <sqlmarshal/binding.hh>
#include <sqlmarshal/codegen/code_writer.hh>
#include <sqlmarshal/codegen/csharp/csharp_type_names.hh>
#include <sqlmarshal/type_classifier.hh>
#include <string>

namespace sqlmarshal::codegen {

/// Local variable holding the parameter object ("clientIdParameter")
std::string parameter_variable(const binding::parameter_spec& param);

class ParameterBinder {
public:
    ParameterBinder(const TypeClassifier& classifier,
                    const TypeNameFormatter& names,
                    bool nullable_annotations,
                    std::string context_namespace);

    /// All bound parameters followed by the `parameters` array.
    /// Emits nothing when the procedure binds no parameter.
    /// @throws unsupported_type_error for out/ref parameters without a scalar mapping
    void emit_bindings(CodeWriter& writer, const binding::procedure_binding& procedure) const;

    /// Statements for one parameter
    void emit_parameter(CodeWriter& writer, const binding::parameter_spec& param) const;

    /// Assign the values of out/ref parameters back to the caller's variables
    void emit_read_backs(CodeWriter& writer, const binding::procedure_binding& procedure) const;

    /// Expression converting a database value into `type`. The database null
    /// sentinel maps to null when the type can hold null; otherwise the value
    /// is cast directly.
    [[nodiscard]] std::string convert_from_database(const model::type_ref& type,
                                                    const std::string& value_expr) const;

    /// True if the binder guards values of this type against null
    [[nodiscard]] bool requires_null_check(const model::type_ref& type) const;

private:
    const TypeClassifier& classifier_;
    const TypeNameFormatter& names_;
    bool nullable_annotations_;
    std::string context_namespace_;
};

}  // namespace sqlmarshal::codegen
