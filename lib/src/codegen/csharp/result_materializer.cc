#include <sqlmarshal/codegen/csharp/result_materializer.hh>
#include <sqlmarshal/codegen/csharp/command_text_builder.hh>

namespace sqlmarshal::codegen {

const char* to_string(result_strategy strategy) {
    switch (strategy) {
        case result_strategy::scalar:    return "scalar";
        case result_strategy::non_query: return "non-query";
        case result_strategy::manual:    return "manual";
        case result_strategy::orm:       return "orm";
    }
    return "manual";
}

result_strategy select_result_strategy(const type_classification& classification,
                                       const connection_strategy& connection) {
    switch (classification.kind) {
        case classification_kind::scalar:
            return result_strategy::scalar;
        case classification_kind::void_:
            return result_strategy::non_query;
        case classification_kind::entity_type:
        case classification_kind::entity_collection:
            break;
    }
    return uses_context_field(connection) ? result_strategy::orm : result_strategy::manual;
}

// ============================================================================
// ResultMaterializer
// ============================================================================

ResultMaterializer::ResultMaterializer(const TypeUniverse& universe,
                                       const TypeNameFormatter& names,
                                       const ParameterBinder& binder,
                                       const connection_strategy& connection,
                                       std::string context_namespace)
    : universe_(universe),
      names_(names),
      binder_(binder),
      connection_(connection),
      context_namespace_(std::move(context_namespace))
{
}

void ResultMaterializer::emit(CodeWriter& writer,
                              const binding::procedure_binding& procedure,
                              const type_classification& classification) const {
    switch (select_result_strategy(classification, connection_)) {
        case result_strategy::scalar:
            emit_execute_scalar(writer, procedure, false);
            break;
        case result_strategy::non_query:
            emit_execute_scalar(writer, procedure, true);
            break;
        case result_strategy::manual:
            emit_manual(writer, procedure, classification);
            break;
        case result_strategy::orm:
            emit_orm(writer, procedure, classification);
            break;
    }
}

void ResultMaterializer::emit_add_range(CodeWriter& writer,
                                        const binding::procedure_binding& procedure) const {
    if (!procedure.bound_parameters().empty()) {
        writer << "command.Parameters.AddRange(parameters);" << endl;
    }
}

void ResultMaterializer::emit_execute_scalar(CodeWriter& writer,
                                             const binding::procedure_binding& procedure,
                                             bool non_query) const {
    CommandTextBuilder(procedure).emit_command_text(writer);
    emit_add_range(writer, procedure);
    writer << open_statement(connection_) << endl;

    auto body = writer.write_try();
    if (non_query) {
        writer << "command.ExecuteNonQuery();" << endl;
    } else {
        writer << "var result = command.ExecuteScalar();" << endl;
    }
    binder_.emit_read_backs(writer, procedure);
    if (!non_query) {
        writer << "return " << binder_.convert_from_database(procedure.return_type, "result")
               << ";" << endl;
    }

    auto cleanup = body.write_finally();
    writer << close_statement(connection_) << endl;
}

void ResultMaterializer::emit_manual(CodeWriter& writer,
                                     const binding::procedure_binding& procedure,
                                     const type_classification& classification) const {
    CommandTextBuilder(procedure).emit_command_text(writer);
    emit_add_range(writer, procedure);
    writer << "using var reader = command.ExecuteReader();" << endl;

    const model::type_ref& item_type = classification.underlying_type;
    const std::string item_name = names_.short_name(item_type);

    if (classification.is_list()) {
        writer << "var result = new List<" << item_name << ">();" << endl;
        auto loop = writer.write_while("reader.Read()");
        emit_row_mapping(writer, item_type);
        writer << "result.Add(item);" << endl;
    } else {
        const TypeDescriptor* descriptor = universe_.resolve(item_type, context_namespace_);
        if (descriptor && descriptor->is_value_type() && !classification.is_nullable) {
            writer << "var result = default(" << item_name << ");" << endl;
        } else {
            writer << item_name << "? result = null;" << endl;
        }
        auto first_row = writer.write_if("reader.Read()");
        emit_row_mapping(writer, item_type);
        writer << "result = item;" << endl;
    }

    writer.write_blank_line();
    writer << "reader.Close();" << endl;
    binder_.emit_read_backs(writer, procedure);
    writer << "return result;" << endl;
}

void ResultMaterializer::emit_row_mapping(CodeWriter& writer,
                                          const model::type_ref& item_type) const {
    writer << "var item = new " << names_.short_name(item_type) << "();" << endl;

    if (!universe_.is_declared(item_type, context_namespace_)) {
        throw unsupported_type_error(item_type.to_string(), "entity type has no declaration");
    }
    const TypeDescriptor* descriptor = universe_.resolve(item_type, context_namespace_);

    // Column index is the property's declaration position
    const auto& properties = descriptor->properties();
    for (size_t i = 0; i < properties.size(); ++i) {
        const std::string value = "value_" + std::to_string(i);
        writer << "var " << value << " = reader.GetValue(" << i << ");" << endl;
        writer << "item." << properties[i].name << " = "
               << binder_.convert_from_database(properties[i].type, value) << ";" << endl;
    }
}

void ResultMaterializer::emit_orm(CodeWriter& writer,
                                  const binding::procedure_binding& procedure,
                                  const type_classification& classification) const {
    CommandTextBuilder text(procedure);
    text.emit_text_declaration(writer);

    std::string arguments = text.text_expression();
    if (!procedure.bound_parameters().empty()) {
        arguments += ", parameters";
    }

    const char* terminal = classification.is_list() ? "ToList()" : "AsEnumerable().FirstOrDefault()";

    writer << "var result = this." << *context_name(connection_) << "."
           << entity_set_name(classification.underlying_type, procedure)
           << ".FromSqlRaw(" << arguments << ")." << terminal << ";" << endl;

    binder_.emit_read_backs(writer, procedure);
    writer << "return result;" << endl;
}

std::string ResultMaterializer::entity_set_name(const model::type_ref& item_type,
                                                const binding::procedure_binding& procedure) const {
    auto override_it = procedure.overrides.find(ENTITY_SET_OVERRIDE);
    if (override_it != procedure.overrides.end() && !override_it->second.empty()) {
        return override_it->second;
    }

    const std::string item_name = item_type.simple_name();

    if (const auto* ctx = std::get_if<context_field>(&connection_)) {
        if (const TypeDescriptor* context = universe_.resolve(ctx->context_type, context_namespace_)) {
            for (const auto& property : context->properties()) {
                const model::type_ref set_type = TypeClassifier::unwrap_nullable(property.type);
                if (set_type.simple_name() == "DbSet" &&
                    set_type.type_args.size() == 1 &&
                    set_type.type_args.front().simple_name() == item_name) {
                    return property.name;
                }
            }
        }
    }

    return item_name + "s";
}

}  // namespace sqlmarshal::codegen
