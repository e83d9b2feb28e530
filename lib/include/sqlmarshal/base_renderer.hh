#pragma once

#include <sqlmarshal/analysis.hh>
#include <sqlmarshal/codegen/option_description.hh>
#include <sqlmarshal/model.hh>
#include <filesystem>
#include <string>
#include <vector>

namespace sqlmarshal::codegen {

// ============================================================================
// Language Metadata
// ============================================================================

struct LanguageMetadata {
    std::string name;             ///< Language name ("C#")
    std::string version;          ///< Language version the output targets ("C# 9")
    std::string file_extension;   ///< ".cs"
};

// ============================================================================
// Abstract Base Renderer
// ============================================================================

/// Abstract base class for target-language renderers
///
/// A renderer takes part in two pipeline stages:
/// - post-initialization, before analysis: may add the marker attribute types
///   to the compilation and contribute their source files
/// - generation, after analysis: turns every class unit into output files
///
/// **Example Usage:**
/// \code
///   auto* renderer = RendererRegistry::instance().get_renderer("csharp");
///   auto files = renderer->post_initialize(compilation, out_dir);
///   auto result = analysis::analyze(compilation);
///   auto generated = renderer->generate_files(*result.analyzed, out_dir);
/// \endcode
class BaseRenderer {
public:
    virtual ~BaseRenderer() = default;

    // ========================================================================
    // Language Metadata
    // ========================================================================

    [[nodiscard]] virtual LanguageMetadata get_metadata() const = 0;

    [[nodiscard]] virtual std::string get_language_name() const = 0;

    [[nodiscard]] virtual std::string get_file_extension() const = 0;

    // ========================================================================
    // Generator Options (for CLI driver)
    // ========================================================================

    /// Prefix of generator options on the command line: --<prefix>-<option>=<value>
    [[nodiscard]] virtual std::string get_option_prefix() const = 0;

    [[nodiscard]] virtual std::vector<OptionDescription> get_options() const {
        return {};
    }

    /// Set a generator option
    /// @throws std::invalid_argument if the option is unknown or the value has the wrong type
    virtual void set_option(const std::string& name, const OptionValue& value);

    // ========================================================================
    // Pipeline Stages
    // ========================================================================

    /// Runs before analysis. May register types in the compilation.
    /// Default: contributes nothing.
    virtual std::vector<OutputFile> post_initialize(model::compilation& compilation,
                                                    const std::filesystem::path& output_dir);

    /// Generate output files for every analyzed class unit
    virtual std::vector<OutputFile> generate_files(
        const analysis::analyzed_compilation& analyzed,
        const std::filesystem::path& output_dir) = 0;
};

}  // namespace sqlmarshal::codegen
