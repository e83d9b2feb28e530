#pragma once

#include "compiler_options.hh"
#include "logger.hh"
#include <sqlmarshal/analysis.hh>
#include <sqlmarshal/base_renderer.hh>
#include <sqlmarshal/codegen/option_description.hh>
#include <sqlmarshal/model.hh>

namespace sqlmarshal::driver {

/// Runs the generation pipeline for every input model
class Compiler {
public:
    explicit Compiler(const CompilerOptions& options, Logger& logger);

    /// Returns 0 on success, 1 if any input failed
    int compile();

private:
    // ========================================================================
    // Pipeline Stages
    // ========================================================================

    /// Load the declaration model and apply --nullable
    model::compilation load_model(const std::filesystem::path& input);

    /// Renderer for the target language with generator options applied
    codegen::BaseRenderer& select_renderer();

    /// Analyze and print diagnostics. Returns false on errors.
    bool run_analysis(const model::compilation& compilation,
                      analysis::analysis_result& out_result);

    /// Generate all files of one input. Returns false on errors.
    bool process(const std::filesystem::path& input, codegen::BaseRenderer& renderer);

    std::filesystem::path output_directory() const;

    void write_output_files(const std::vector<codegen::OutputFile>& files);

    void print_outputs(const std::vector<codegen::OutputFile>& files);

    const CompilerOptions& options_;
    Logger& logger_;
};

}  // namespace sqlmarshal::driver
