#pragma once

#include <sqlmarshal/model.hh>
#include <sqlmarshal/type_classifier.hh>
#include <sqlmarshal/type_descriptor.hh>
#include <string>

namespace sqlmarshal::codegen {

/// C# keyword for a framework type name ("Int32", "System.String" -> "int",
/// "string"). Names without a keyword are returned unchanged.
std::string keyword_name(const std::string& name);

/// Fully qualified DbType member for a scalar kind ("System.Data.DbType.Int32")
/// @throws unsupported_type_error for scalar_kind::unsupported
std::string db_type_name(scalar_kind kind);

/**
 * Renders type references the way they appear in generated signatures and
 * casts: declared model types namespace-qualified, framework primitives as
 * keywords, `Nullable<T>` as `T?`, everything else as written.
 */
class TypeNameFormatter {
public:
    TypeNameFormatter(const TypeUniverse& universe, std::string context_namespace);

    [[nodiscard]] std::string display(const model::type_ref& type) const;

    /// Unqualified name used in constructor calls ("new Item()")
    [[nodiscard]] std::string short_name(const model::type_ref& type) const;

private:
    const TypeUniverse& universe_;
    std::string context_namespace_;
};

}  // namespace sqlmarshal::codegen
