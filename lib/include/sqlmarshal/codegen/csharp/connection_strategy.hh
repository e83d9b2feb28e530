//
// Connection Strategy
//
// How a generated method obtains its database connection. Resolved once per
// enclosing type from the fields of all its declared parts.
//
//   ConnectionField  field whose type is, or derives from, DbConnection
//   ContextField     field whose type is, or derives from, DbContext
//   AssumedDefault   neither exists; a context field named by convention
//
// A connection field wins over a context field regardless of field order.
//

#pragma once

#include <sqlmarshal/analysis.hh>
#include <sqlmarshal/model.hh>
#include <sqlmarshal/type_descriptor.hh>
#include <optional>
#include <string>
#include <variant>

namespace sqlmarshal::codegen {

struct connection_field {
    std::string name;
};

struct context_field {
    std::string name;
    model::type_ref context_type;
};

struct assumed_default {
    std::string name;
};

using connection_strategy = std::variant<connection_field, context_field, assumed_default>;

/// Base type names the resolver looks for
namespace framework_types {
    constexpr const char* CONNECTION = "DbConnection";
    constexpr const char* CONTEXT = "DbContext";
}

/// Resolve the strategy for an enclosing type.
/// @param default_context Field name assumed when no field qualifies
connection_strategy resolve_connection_strategy(const analysis::class_unit& unit,
                                                const TypeUniverse& universe,
                                                const std::string& default_context = "dbContext");

/// Expression yielding the connection ("this.connection",
/// "this.ctx.Database.GetDbConnection()")
std::string connection_access(const connection_strategy& strategy);

/// Statement opening the connection explicitly
std::string open_statement(const connection_strategy& strategy);

/// Statement closing the connection explicitly
std::string close_statement(const connection_strategy& strategy);

/// Name of the ORM context field, real or assumed; nullopt for a connection field
std::optional<std::string> context_name(const connection_strategy& strategy);

[[nodiscard]] inline bool uses_connection_field(const connection_strategy& strategy) {
    return std::holds_alternative<connection_field>(strategy);
}

[[nodiscard]] inline bool uses_context_field(const connection_strategy& strategy) {
    return std::holds_alternative<context_field>(strategy);
}

}  // namespace sqlmarshal::codegen
