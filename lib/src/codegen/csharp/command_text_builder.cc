#include <sqlmarshal/codegen/csharp/command_text_builder.hh>
#include <sqlmarshal/name_mapper.hh>

namespace sqlmarshal::codegen {

namespace {
    constexpr const char* QUERY_VARIABLE = "sqlQuery";
}

CommandTextBuilder::CommandTextBuilder(const binding::procedure_binding& procedure)
    : procedure_(procedure)
{
}

std::string CommandTextBuilder::procedure_invocation(const std::string& procedure_name,
                                                     const binding::procedure_binding& procedure) {
    std::string text = procedure_name;

    bool first = true;
    for (const auto* param : procedure.bound_parameters()) {
        text += first ? " " : ", ";
        first = false;

        text += external_parameter_name(param->internal_name);
        if (param->writes_back()) {
            text += " OUTPUT";
        }
    }
    return text;
}

std::string CommandTextBuilder::verbatim_literal(const std::string& text) {
    std::string result = "@\"";
    for (char c : text) {
        if (c == '"') {
            result += '"';
        }
        result += c;
    }
    result += '"';
    return result;
}

std::string CommandTextBuilder::text_expression() const {
    if (const auto* raw = std::get_if<binding::raw_text>(&procedure_.source)) {
        return raw->parameter_name;
    }
    return QUERY_VARIABLE;
}

void CommandTextBuilder::emit_text_declaration(CodeWriter& writer) const {
    const auto* named = std::get_if<binding::named_procedure>(&procedure_.source);
    if (!named) {
        return;
    }
    writer << "var " << QUERY_VARIABLE << " = "
           << verbatim_literal(procedure_invocation(named->name, procedure_)) << ";" << endl;
}

void CommandTextBuilder::emit_command_text(CodeWriter& writer) const {
    emit_text_declaration(writer);
    writer << "command.CommandText = " << text_expression() << ";" << endl;
}

}  // namespace sqlmarshal::codegen
