//
// Declaration Analysis for SqlMarshal
//
// Finds methods carrying the generation marker, resolves the marker symbols,
// extracts one procedure binding per declaration and groups the bindings by
// enclosing type. The result feeds the code renderers.
//
// USAGE EXAMPLE:
//   auto compilation = ModelLoader().build_from_file("repository.yaml");
//   auto result = analysis::analyze(compilation);
//
//   if (result.has_errors()) {
//       result.print_diagnostics(std::cerr);
//       return 1;
//   }
//
//   for (const auto& unit : result.analyzed->units) { ... }
//

#pragma once

#include <sqlmarshal/binding.hh>
#include <sqlmarshal/model.hh>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace sqlmarshal::analysis {

// ============================================================================
// Diagnostics
// ============================================================================

enum class diagnostic_level {
    error,
    warning,
    note
};

/// Diagnostic codes.
///
/// - SM0001-SM0009: fatal, abort the whole run
/// - SM0010-SM0099: declaration errors, the declaration is skipped
/// - SM0100-SM0199: warnings
namespace diag_codes {
    constexpr const char* E_NO_MARKER_SYMBOL = "SM0001";      ///< Generation marker type not resolvable
    constexpr const char* E_NO_RAW_SQL_SYMBOL = "SM0002";     ///< Raw-command marker type not resolvable

    constexpr const char* E_MULTIPLE_RAW_SQL = "SM0010";      ///< More than one raw-command parameter
    constexpr const char* E_RAW_SQL_NOT_STRING = "SM0011";    ///< Raw-command parameter is not a string
    constexpr const char* E_NO_COMMAND_TEXT = "SM0012";       ///< Neither procedure name nor raw-command parameter
    constexpr const char* E_RAW_SQL_DIRECTION = "SM0013";     ///< Raw-command parameter is out/ref

    constexpr const char* W_UNKNOWN_NAMED_ARGUMENT = "SM0100"; ///< Marker named argument is not recognized
}

struct diagnostic {
    diagnostic_level level;
    std::string code;
    std::string message;
    std::string symbol;   ///< Qualified symbol the diagnostic refers to (may be empty)

    /// Format as "symbol: error: message [code]"
    [[nodiscard]] std::string format() const;
};

// ============================================================================
// Marker Symbols
// ============================================================================

/// Names of the marker attribute types
struct marker_names {
    std::string generation_marker = "SqlMarshalAttribute";
    std::string raw_command_marker = "RawSqlAttribute";

    /// Named arguments recognized on the generation marker
    std::set<std::string> recognized_overrides = {"PropertyName"};
};

/// True if an attribute usage written as `usage_name` refers to the attribute
/// type `type_name` ("SqlMarshal" and "Foo.SqlMarshalAttribute" both match
/// "SqlMarshalAttribute").
bool attribute_matches(const std::string& usage_name, const std::string& type_name);

// ============================================================================
// Signature Extractor
// ============================================================================

/**
 * Produces procedure bindings from annotated method declarations.
 *
 * Reports declaration-level problems into the diagnostics vector and
 * returns nullopt for declarations that cannot be bound.
 */
class SignatureExtractor {
public:
    SignatureExtractor(const marker_names& markers, std::vector<diagnostic>& diagnostics);

    /// True if the method carries the generation marker
    [[nodiscard]] bool is_marked(const model::method_def& method) const;

    std::optional<binding::procedure_binding> extract(const model::type_def& owner,
                                                      const model::method_def& method);

private:
    const model::attribute_usage* find_marker(const model::method_def& method) const;
    bool is_raw_command(const model::parameter_def& param) const;

    void report(diagnostic_level level, const char* code,
                const std::string& message, const std::string& symbol);

    const marker_names& markers_;
    std::vector<diagnostic>& diagnostics_;
};

// ============================================================================
// Analysis Result
// ============================================================================

/// All bindings declared in one enclosing type.
/// A partial type declared in several parts forms a single unit.
struct class_unit {
    const model::type_def* type = nullptr;            ///< First declared part
    std::vector<const model::type_def*> parts;        ///< All parts in declaration order
    std::vector<binding::procedure_binding> procedures;

    /// Fields of all parts in declaration order
    [[nodiscard]] std::vector<const model::member_def*> fields() const {
        std::vector<const model::member_def*> result;
        for (const auto* part : parts) {
            for (const auto& field : part->fields) {
                result.push_back(&field);
            }
        }
        return result;
    }
};

struct analyzed_compilation {
    const model::compilation* compilation = nullptr;

    /// Units in first-appearance order of their enclosing type
    std::vector<class_unit> units;

    /// Qualified names of declarations skipped because their enclosing type
    /// is nested
    std::vector<std::string> skipped_nested;
};

struct analysis_options {
    marker_names markers;

    /// Treat all warnings as errors
    bool warnings_as_errors = false;

    /// Suppress warnings entirely
    bool suppress_warnings = false;
};

struct analysis_result {
    /// Present unless a fatal diagnostic aborted the run
    std::optional<analyzed_compilation> analyzed;

    std::vector<diagnostic> diagnostics;

    [[nodiscard]] bool has_errors() const;
    [[nodiscard]] bool has_warnings() const;
    [[nodiscard]] size_t error_count() const;
    [[nodiscard]] size_t warning_count() const;

    void print_diagnostics(std::ostream& os) const;
};

/// Analyze a compilation.
///
/// Fatal diagnostics (unresolvable marker types) leave `analyzed` empty.
/// Declaration errors skip only the offending declaration.
analysis_result analyze(const model::compilation& compilation,
                        const analysis_options& opts = {});

}  // namespace sqlmarshal::analysis
