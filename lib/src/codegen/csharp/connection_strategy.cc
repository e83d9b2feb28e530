#include <sqlmarshal/codegen/csharp/connection_strategy.hh>

namespace sqlmarshal::codegen {

namespace {

bool field_is(const model::member_def& field,
              const std::string& ns,
              const TypeUniverse& universe,
              const char* base_name) {
    const TypeDescriptor* descriptor = universe.resolve(field.type, ns);
    if (!descriptor) {
        return field.type.simple_name() == base_name;
    }
    return universe.is_or_derives_from(*descriptor, base_name);
}

}  // namespace

connection_strategy resolve_connection_strategy(const analysis::class_unit& unit,
                                                const TypeUniverse& universe,
                                                const std::string& default_context) {
    const std::string& ns = unit.type->namespace_name;
    const auto fields = unit.fields();

    for (const auto* field : fields) {
        if (field_is(*field, ns, universe, framework_types::CONNECTION)) {
            return connection_field{field->name};
        }
    }

    for (const auto* field : fields) {
        if (field_is(*field, ns, universe, framework_types::CONTEXT)) {
            return context_field{field->name, field->type};
        }
    }

    return assumed_default{default_context};
}

std::string connection_access(const connection_strategy& strategy) {
    if (const auto* connection = std::get_if<connection_field>(&strategy)) {
        return "this." + connection->name;
    }
    return "this." + *context_name(strategy) + ".Database.GetDbConnection()";
}

std::string open_statement(const connection_strategy& strategy) {
    if (const auto* connection = std::get_if<connection_field>(&strategy)) {
        return "this." + connection->name + ".Open();";
    }
    return "this." + *context_name(strategy) + ".Database.OpenConnection();";
}

std::string close_statement(const connection_strategy& strategy) {
    if (const auto* connection = std::get_if<connection_field>(&strategy)) {
        return "this." + connection->name + ".Close();";
    }
    return "this." + *context_name(strategy) + ".Database.CloseConnection();";
}

std::optional<std::string> context_name(const connection_strategy& strategy) {
    if (const auto* ctx = std::get_if<context_field>(&strategy)) {
        return ctx->name;
    }
    if (const auto* assumed = std::get_if<assumed_default>(&strategy)) {
        return assumed->name;
    }
    return std::nullopt;
}

}  // namespace sqlmarshal::codegen
