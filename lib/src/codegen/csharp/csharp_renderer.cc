#include <sqlmarshal/codegen/csharp/csharp_renderer.hh>
#include <sqlmarshal/codegen/csharp/parameter_binder.hh>
#include <sqlmarshal/codegen/csharp/result_materializer.hh>
#include <algorithm>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace sqlmarshal::codegen {

namespace {

constexpr const char* GENERATION_MARKER = "SqlMarshalAttribute";
constexpr const char* RAW_COMMAND_MARKER = "RawSqlAttribute";
constexpr const char* ATTRIBUTE_FILE = "SqlMarshalAttribute.cs";

bool is_declared(const model::compilation& compilation, const std::string& name) {
    return std::any_of(compilation.types.begin(), compilation.types.end(),
        [&](const model::type_def& t) { return t.name == name && t.namespace_name.empty(); });
}

model::type_def attribute_type(const std::string& name) {
    model::type_def def;
    def.name = name;
    def.kind = model::type_kind::attribute;
    def.base = model::type_ref{"System.Attribute", {}, false};
    return def;
}

void write_generation_marker(CSharpCodeWriter& writer) {
    writer << "[System.AttributeUsage(System.AttributeTargets.Method, AllowMultiple=true)]" << endl;
    auto cls = writer.write_class("internal sealed", GENERATION_MARKER, "System.Attribute");
    {
        auto ctor = writer.write_scope("public SqlMarshalAttribute()");
    }
    writer.write_blank_line();
    {
        auto ctor = writer.write_scope("public SqlMarshalAttribute(string name)");
        writer << "this.ProcedureName = name;" << endl;
    }
    writer.write_blank_line();
    writer << "public string ProcedureName { get; }" << endl;
    writer.write_blank_line();
    writer << "public string PropertyName { get; set; }" << endl;
}

void write_raw_command_marker(CSharpCodeWriter& writer) {
    writer << "[System.AttributeUsage(System.AttributeTargets.Parameter, AllowMultiple=false)]" << endl;
    auto cls = writer.write_class("internal sealed", RAW_COMMAND_MARKER, "System.Attribute");
}

std::string render_attributes(bool generation_marker, bool raw_command_marker) {
    std::ostringstream out;
    CSharpCodeWriter writer(out);

    writer.write_comment_block(CSharpRenderer::banner());
    writer.write_directive("nullable disable");

    if (generation_marker) {
        writer.write_blank_line();
        write_generation_marker(writer);
    }
    if (raw_command_marker) {
        writer.write_blank_line();
        write_raw_command_marker(writer);
    }

    return out.str();
}

}  // namespace

CSharpRenderer::CSharpRenderer() = default;

const std::vector<std::string>& CSharpRenderer::banner() {
    static const std::vector<std::string> lines = {
        "<auto-generated>",
        "Code generated by SqlMarshal Code Generator.",
        "Changes may cause incorrect behavior and will be lost if the code is",
        "regenerated.",
        "</auto-generated>"
    };
    return lines;
}

std::string CSharpRenderer::attribute_source() {
    return render_attributes(true, true);
}

std::string CSharpRenderer::unit_file_name(const model::type_def& type) {
    std::string name = type.qualified_name();
    std::replace(name.begin(), name.end(), '.', '_');
    return name + "_sp.cs";
}

// ============================================================================
// BaseRenderer Interface
// ============================================================================

LanguageMetadata CSharpRenderer::get_metadata() const {
    return {"C#", "C# 9", ".cs"};
}

std::string CSharpRenderer::get_language_name() const {
    return "C#";
}

std::string CSharpRenderer::get_file_extension() const {
    return ".cs";
}

std::string CSharpRenderer::get_option_prefix() const {
    return "cs";
}

std::vector<OptionDescription> CSharpRenderer::get_options() const {
    return {
        {
            "emit-attributes",
            OptionType::Bool,
            "Declare the marker attributes and emit SqlMarshalAttribute.cs",
            "true"
        },
        {
            "default-context",
            OptionType::String,
            "Context field assumed when a type has neither a connection nor a context field",
            "dbContext"
        }
    };
}

void CSharpRenderer::set_option(const std::string& name, const OptionValue& value) {
    if (name == "emit-attributes") {
        emit_attributes_ = std::get<bool>(value);
    } else if (name == "default-context") {
        const auto& field = std::get<std::string>(value);
        if (field.empty()) {
            throw std::invalid_argument("default-context must not be empty");
        }
        default_context_ = field;
    } else {
        throw std::invalid_argument("Unknown cs option: " + name);
    }
}

std::vector<OutputFile> CSharpRenderer::post_initialize(model::compilation& compilation,
                                                        const std::filesystem::path& output_dir) {
    if (!emit_attributes_) {
        return {};
    }

    // A marker the user declared is left alone
    const bool add_generation = !is_declared(compilation, GENERATION_MARKER);
    const bool add_raw_command = !is_declared(compilation, RAW_COMMAND_MARKER);
    if (!add_generation && !add_raw_command) {
        return {};
    }

    if (add_generation) {
        model::type_def marker = attribute_type(GENERATION_MARKER);
        marker.properties.push_back({"ProcedureName", model::type_ref{"string", {}, false}});
        marker.properties.push_back({"PropertyName", model::type_ref{"string", {}, false}});
        compilation.types.push_back(std::move(marker));
    }
    if (add_raw_command) {
        compilation.types.push_back(attribute_type(RAW_COMMAND_MARKER));
    }

    return {{output_dir / ATTRIBUTE_FILE, render_attributes(add_generation, add_raw_command)}};
}

std::vector<OutputFile> CSharpRenderer::generate_files(
    const analysis::analyzed_compilation& analyzed,
    const std::filesystem::path& output_dir)
{
    if (!analyzed.compilation) {
        throw std::invalid_argument("analyzed compilation has no source compilation");
    }

    TypeUniverse universe(*analyzed.compilation);
    const bool annotations = analyzed.compilation->has_nullable_annotations();

    std::vector<OutputFile> files;
    files.reserve(analyzed.units.size());
    for (const auto& unit : analyzed.units) {
        files.push_back({output_dir / unit_file_name(*unit.type),
                         render_unit(unit, universe, annotations)});
    }
    return files;
}

// ============================================================================
// Unit Rendering
// ============================================================================

std::string CSharpRenderer::render_unit(const analysis::class_unit& unit,
                                        const TypeUniverse& universe,
                                        bool nullable_annotations) const {
    const model::type_def& type = *unit.type;
    const std::string& ns = type.namespace_name;

    const connection_strategy connection =
        resolve_connection_strategy(unit, universe, default_context_);

    TypeClassifier classifier(universe);
    for (const auto& procedure : unit.procedures) {
        validate(procedure, classifier, universe, connection, type.qualified_name(), ns);
    }

    std::ostringstream out;
    CSharpCodeWriter writer(out);

    writer.write_comment_block(banner());
    writer.write_directive("nullable enable");
    writer.write_directive("pragma warning disable 1591");
    writer.write_blank_line();

    std::optional<ScopeBlock> namespace_block;
    if (!ns.empty()) {
        namespace_block.emplace(writer.write_namespace(ns));
    }

    writer.write_usings(unit_usings(connection));
    writer.write_blank_line();

    {
        auto class_block = writer.write_class("partial", type.name);
        for (size_t i = 0; i < unit.procedures.size(); ++i) {
            if (i > 0) {
                writer.write_blank_line();
            }
            render_method(writer, unit.procedures[i], universe, connection, ns,
                          nullable_annotations);
        }
    }

    namespace_block.reset();
    return out.str();
}

std::vector<std::string> CSharpRenderer::unit_usings(const connection_strategy& connection) {
    std::vector<std::string> usings = {
        "System",
        "System.Collections.Generic",
        "System.Data.Common",
        "System.Linq"
    };

    // GetDbConnection, OpenConnection and FromSqlRaw are ORM extension methods
    if (context_name(connection)) {
        usings.push_back("Microsoft.EntityFrameworkCore");
    }
    return usings;
}

std::string CSharpRenderer::method_signature(const binding::procedure_binding& procedure,
                                             const TypeNameFormatter& names) {
    std::string signature;
    if (procedure.visibility != model::accessibility::private_) {
        signature = model::to_keyword(procedure.visibility) + " ";
    }
    signature += "partial " + names.display(procedure.return_type) + " " + procedure.name + "(";

    for (size_t i = 0; i < procedure.parameters.size(); ++i) {
        const auto& param = procedure.parameters[i];
        if (i > 0) {
            signature += ", ";
        }
        switch (param.dir) {
            case binding::direction::out:    signature += "out "; break;
            case binding::direction::in_out: signature += "ref "; break;
            case binding::direction::in:     break;
        }
        signature += names.display(param.declared_type) + " " + param.internal_name;
    }

    return signature + ")";
}

type_classification CSharpRenderer::validate(const binding::procedure_binding& procedure,
                                             const TypeClassifier& classifier,
                                             const TypeUniverse& universe,
                                             const connection_strategy& connection,
                                             const std::string& owner,
                                             const std::string& ns) {
    try {
        type_classification classification = classifier.classify(procedure.return_type, ns);

        // Rows map onto the declared properties of the entity type
        if (select_result_strategy(classification, connection) == result_strategy::manual &&
            !universe.is_declared(classification.underlying_type, ns)) {
            throw unsupported_type_error(classification.underlying_type.to_string(),
                                         "entity type has no declaration");
        }

        for (const auto* param : procedure.bound_parameters()) {
            if (param->writes_back()) {
                (void)classifier.scalar_mapping(param->declared_type);
            }
        }
        return classification;
    } catch (const unsupported_type_error& e) {
        throw unsupported_type_error(e.type_name(),
                                     e.context() + " in " + owner + "." + procedure.name);
    }
}

void CSharpRenderer::render_method(CSharpCodeWriter& writer,
                                   const binding::procedure_binding& procedure,
                                   const TypeUniverse& universe,
                                   const connection_strategy& connection,
                                   const std::string& ns,
                                   bool nullable_annotations) const {
    TypeClassifier classifier(universe);
    TypeNameFormatter names(universe, ns);
    ParameterBinder binder(classifier, names, nullable_annotations, ns);
    ResultMaterializer materializer(universe, names, binder, connection, ns);

    const type_classification classification = classifier.classify(procedure.return_type, ns);

    auto body = writer.write_method(method_signature(procedure, names));
    writer << "var connection = " << connection_access(connection) << ";" << endl;
    writer << "using var command = connection.CreateCommand();" << endl;
    writer.write_blank_line();

    binder.emit_bindings(writer, procedure);
    materializer.emit(writer, procedure, classification);
}

}  // namespace sqlmarshal::codegen
