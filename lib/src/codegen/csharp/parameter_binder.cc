#include <sqlmarshal/codegen/csharp/parameter_binder.hh>
#include <sqlmarshal/name_mapper.hh>

namespace sqlmarshal::codegen {

std::string parameter_variable(const binding::parameter_spec& param) {
    return param.internal_name + "Parameter";
}

ParameterBinder::ParameterBinder(const TypeClassifier& classifier,
                                 const TypeNameFormatter& names,
                                 bool nullable_annotations,
                                 std::string context_namespace)
    : classifier_(classifier),
      names_(names),
      nullable_annotations_(nullable_annotations),
      context_namespace_(std::move(context_namespace))
{
}

bool ParameterBinder::requires_null_check(const model::type_ref& type) const {
    return classifier_.can_hold_null(type, nullable_annotations_, context_namespace_);
}

void ParameterBinder::emit_bindings(CodeWriter& writer,
                                    const binding::procedure_binding& procedure) const {
    const auto bound = procedure.bound_parameters();
    if (bound.empty()) {
        return;
    }

    for (const auto* param : bound) {
        emit_parameter(writer, *param);
        writer.write_blank_line();
    }

    {
        auto array = writer.write_initializer("var parameters = new DbParameter[]");
        for (const auto* param : bound) {
            writer << parameter_variable(*param) << "," << endl;
        }
    }
    writer.write_blank_line();
}

void ParameterBinder::emit_parameter(CodeWriter& writer,
                                     const binding::parameter_spec& param) const {
    const std::string var = parameter_variable(param);

    writer << "var " << var << " = command.CreateParameter();" << endl;
    writer << var << ".ParameterName = \"" << external_parameter_name(param.internal_name)
           << "\";" << endl;

    if (param.writes_back()) {
        const scalar_kind kind = classifier_.scalar_mapping(param.declared_type);
        writer << var << ".DbType = " << db_type_name(kind) << ";" << endl;

        const char* direction = param.dir == binding::direction::out
            ? "System.Data.ParameterDirection.Output"
            : "System.Data.ParameterDirection.InputOutput";
        writer << var << ".Direction = " << direction << ";" << endl;
    }

    if (param.reads_value()) {
        const std::string& name = param.internal_name;
        if (requires_null_check(param.declared_type)) {
            writer << var << ".Value = " << name << " == null ? (object)DBNull.Value : "
                   << name << ";" << endl;
        } else {
            writer << var << ".Value = " << name << ";" << endl;
        }
    }
}

void ParameterBinder::emit_read_backs(CodeWriter& writer,
                                      const binding::procedure_binding& procedure) const {
    for (const auto* param : procedure.bound_parameters()) {
        if (!param->writes_back()) {
            continue;
        }
        writer << param->internal_name << " = "
               << convert_from_database(param->declared_type, parameter_variable(*param) + ".Value")
               << ";" << endl;
    }
}

std::string ParameterBinder::convert_from_database(const model::type_ref& type,
                                                   const std::string& value_expr) const {
    const std::string declared = names_.display(type);
    if (!requires_null_check(type)) {
        return "(" + declared + ")" + value_expr;
    }

    const std::string underlying = names_.display(TypeClassifier::unwrap_nullable(type));
    return value_expr + " == DBNull.Value ? (" + declared + ")null : (" + underlying + ")" + value_expr;
}

}  // namespace sqlmarshal::codegen
