//
// Declaration analysis entry point
//

#include <sqlmarshal/analysis.hh>
#include <algorithm>
#include <map>

namespace sqlmarshal::analysis {

namespace {

bool has_type_named(const model::compilation& compilation, const std::string& name) {
    return std::any_of(compilation.types.begin(), compilation.types.end(),
        [&](const model::type_def& t) { return t.name == name; });
}

void apply_warning_policy(std::vector<diagnostic>& diagnostics, const analysis_options& opts) {
    if (opts.suppress_warnings) {
        diagnostics.erase(
            std::remove_if(diagnostics.begin(), diagnostics.end(),
                [](const diagnostic& d) { return d.level == diagnostic_level::warning; }),
            diagnostics.end());
        return;
    }

    if (opts.warnings_as_errors) {
        for (auto& d : diagnostics) {
            if (d.level == diagnostic_level::warning) {
                d.level = diagnostic_level::error;
            }
        }
    }
}

}  // namespace

analysis_result analyze(const model::compilation& compilation, const analysis_options& opts) {
    analysis_result result;

    // Both marker types must be resolvable before any declaration is looked at
    bool fatal = false;
    if (!has_type_named(compilation, opts.markers.generation_marker)) {
        result.diagnostics.push_back({
            diagnostic_level::error, diag_codes::E_NO_MARKER_SYMBOL,
            "No generation marker symbol '" + opts.markers.generation_marker + "' resolvable",
            {}});
        fatal = true;
    }
    if (!has_type_named(compilation, opts.markers.raw_command_marker)) {
        result.diagnostics.push_back({
            diagnostic_level::error, diag_codes::E_NO_RAW_SQL_SYMBOL,
            "No raw command marker symbol '" + opts.markers.raw_command_marker + "' resolvable",
            {}});
        fatal = true;
    }
    if (fatal) {
        return result;
    }

    analyzed_compilation analyzed;
    analyzed.compilation = &compilation;

    SignatureExtractor extractor(opts.markers, result.diagnostics);

    // Partial declarations of the same type share one unit, placed where the
    // type first appears
    std::map<std::string, size_t> unit_index;

    for (const auto& type : compilation.types) {
        std::vector<binding::procedure_binding> procedures;

        for (const auto& method : type.methods) {
            if (!extractor.is_marked(method)) {
                continue;
            }

            if (!type.is_top_level()) {
                analyzed.skipped_nested.push_back(type.qualified_name() + "." + method.name);
                continue;
            }

            if (auto binding = extractor.extract(type, method)) {
                procedures.push_back(std::move(*binding));
            }
        }

        const std::string key = type.qualified_name();
        auto it = unit_index.find(key);
        if (it == unit_index.end()) {
            // Kept even without procedures: its fields may serve a later part
            unit_index[key] = analyzed.units.size();
            analyzed.units.push_back(class_unit{&type, {&type}, std::move(procedures)});
            continue;
        }

        class_unit& unit = analyzed.units[it->second];
        unit.parts.push_back(&type);
        for (auto& procedure : procedures) {
            unit.procedures.push_back(std::move(procedure));
        }
    }

    // Types without annotated declarations produce no output
    analyzed.units.erase(
        std::remove_if(analyzed.units.begin(), analyzed.units.end(),
            [](const class_unit& u) { return u.procedures.empty(); }),
        analyzed.units.end());

    apply_warning_policy(result.diagnostics, opts);

    result.analyzed = std::move(analyzed);
    return result;
}

}  // namespace sqlmarshal::analysis
