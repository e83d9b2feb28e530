#pragma once

#include <sqlmarshal/analysis.hh>
#include <sqlmarshal/base_renderer.hh>
#include <sqlmarshal/codegen/csharp/csharp_code_writer.hh>
#include <sqlmarshal/codegen/csharp/connection_strategy.hh>
#include <sqlmarshal/codegen/csharp/csharp_type_names.hh>
#include <sqlmarshal/type_classifier.hh>
#include <string>
#include <vector>

namespace sqlmarshal::codegen {

// ============================================================================
// C# Code Renderer
// ============================================================================

/**
 * Renders analyzed class units as C# partial classes.
 *
 * One file per enclosing type, named after its qualified name
 * ("Foo.Bar.Repository" -> "Foo_Bar_Repository_sp.cs"). Each marked
 * declaration becomes the implementation of its partial method.
 *
 * Example usage:
 *   CSharpRenderer renderer;
 *   renderer.set_option("default-context", std::string("db"));
 *   auto files = renderer.generate_files(analyzed, "out");
 */
class CSharpRenderer : public BaseRenderer {
public:
    CSharpRenderer();

    /// Banner placed at the top of every generated file
    static const std::vector<std::string>& banner();

    /// C# source of the marker attribute types
    [[nodiscard]] static std::string attribute_source();

    /// File name of a unit ("Foo_C_sp.cs")
    [[nodiscard]] static std::string unit_file_name(const model::type_def& type);

    // ========================================================================
    // BaseRenderer Interface Implementation
    // ========================================================================

    LanguageMetadata get_metadata() const override;
    std::string get_language_name() const override;
    std::string get_file_extension() const override;

    /// "cs"
    std::string get_option_prefix() const override;
    std::vector<OptionDescription> get_options() const override;
    void set_option(const std::string& name, const OptionValue& value) override;

    /// Registers SqlMarshalAttribute and RawSqlAttribute in the compilation
    /// (unless already declared) and returns SqlMarshalAttribute.cs
    std::vector<OutputFile> post_initialize(model::compilation& compilation,
                                            const std::filesystem::path& output_dir) override;

    /// @throws unsupported_type_error naming the offending declaration
    std::vector<OutputFile> generate_files(
        const analysis::analyzed_compilation& analyzed,
        const std::filesystem::path& output_dir) override;

    // ========================================================================
    // Unit Rendering
    // ========================================================================

    /// Complete source of one class unit
    [[nodiscard]] std::string render_unit(const analysis::class_unit& unit,
                                          const TypeUniverse& universe,
                                          bool nullable_annotations) const;

    [[nodiscard]] bool emits_attributes() const { return emit_attributes_; }
    [[nodiscard]] const std::string& default_context() const { return default_context_; }

private:
    /// Namespaces imported by a unit with the given connection strategy
    static std::vector<std::string> unit_usings(const connection_strategy& connection);

    /// "public partial IList<Foo.Item> M(string sql)"
    static std::string method_signature(const binding::procedure_binding& procedure,
                                        const TypeNameFormatter& names);

    void render_method(CSharpCodeWriter& writer,
                       const binding::procedure_binding& procedure,
                       const TypeUniverse& universe,
                       const connection_strategy& connection,
                       const std::string& ns,
                       bool nullable_annotations) const;

    /// Classify the return type and map every out/ref parameter before any
    /// output is written
    static type_classification validate(const binding::procedure_binding& procedure,
                                        const TypeClassifier& classifier,
                                        const TypeUniverse& universe,
                                        const connection_strategy& connection,
                                        const std::string& owner,
                                        const std::string& ns);

    bool emit_attributes_ = true;
    std::string default_context_ = "dbContext";
};

}  // namespace sqlmarshal::codegen
