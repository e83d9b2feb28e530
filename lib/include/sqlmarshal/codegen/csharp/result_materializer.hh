//
// Result Materializer
//
// Chooses how a procedure executes and turns its result into the declared
// return type. One strategy per declaration:
//
//   scalar     ExecuteScalar inside an explicit open / try / finally close
//   non_query  ExecuteNonQuery in the same shape, for void returns
//   manual     data reader, one fresh object per row, properties by position
//   orm        FromSqlRaw against an entity set of the ORM context
//
// Read-backs of out and ref parameters follow execution in every strategy.
//

#pragma once

#include <sqlmarshal/binding.hh>
#include <sqlmarshal/codegen/code_writer.hh>
#include <sqlmarshal/codegen/csharp/connection_strategy.hh>
#include <sqlmarshal/codegen/csharp/csharp_type_names.hh>
#include <sqlmarshal/codegen/csharp/parameter_binder.hh>
#include <sqlmarshal/type_classifier.hh>
#include <sqlmarshal/type_descriptor.hh>
#include <string>

namespace sqlmarshal::codegen {

enum class result_strategy {
    scalar,
    non_query,
    manual,
    orm
};

const char* to_string(result_strategy strategy);

/// Scalars execute as scalars and void as non-query. Entity results use the
/// ORM only when the type holds a context field and no connection field.
result_strategy select_result_strategy(const type_classification& classification,
                                       const connection_strategy& connection);

/// Named marker argument overriding the entity set accessor
inline constexpr const char* ENTITY_SET_OVERRIDE = "PropertyName";

class ResultMaterializer {
public:
    ResultMaterializer(const TypeUniverse& universe,
                       const TypeNameFormatter& names,
                       const ParameterBinder& binder,
                       const connection_strategy& connection,
                       std::string context_namespace);

    /// Command text, execution, materialization, read-backs and return
    void emit(CodeWriter& writer,
              const binding::procedure_binding& procedure,
              const type_classification& classification) const;

    /// Entity set accessor for `item_type`: the override, else the context's
    /// DbSet<Item> property, else the item name with an "s" appended
    [[nodiscard]] std::string entity_set_name(const model::type_ref& item_type,
                                              const binding::procedure_binding& procedure) const;

private:
    void emit_execute_scalar(CodeWriter& writer,
                             const binding::procedure_binding& procedure,
                             bool non_query) const;

    void emit_manual(CodeWriter& writer,
                     const binding::procedure_binding& procedure,
                     const type_classification& classification) const;

    void emit_orm(CodeWriter& writer,
                  const binding::procedure_binding& procedure,
                  const type_classification& classification) const;

    /// `var item = new Item();` and one positional assignment per property
    void emit_row_mapping(CodeWriter& writer, const model::type_ref& item_type) const;

    void emit_add_range(CodeWriter& writer, const binding::procedure_binding& procedure) const;

    const TypeUniverse& universe_;
    const TypeNameFormatter& names_;
    const ParameterBinder& binder_;
    const connection_strategy& connection_;
    std::string context_namespace_;
};

}  // namespace sqlmarshal::codegen
