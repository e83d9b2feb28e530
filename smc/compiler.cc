#include "compiler.hh"
#include <sqlmarshal/errors.hh>
#include <sqlmarshal/model_loader.hh>
#include <sqlmarshal/renderer_registry.hh>
#include <fstream>
#include <iostream>

namespace sqlmarshal::driver {

using namespace sqlmarshal::codegen;

Compiler::Compiler(const CompilerOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
}

int Compiler::compile() {
    try {
        BaseRenderer& renderer = select_renderer();

        bool ok = true;
        for (const auto& input : options_.input_files) {
            ok = process(input, renderer) && ok;
        }

        if (!ok) {
            return 1;
        }
        if (options_.output_mode == OutputMode::Generate) {
            logger_.success("Generation successful");
        }
        return 0;

    } catch (const std::exception& e) {
        logger_.error(e.what());
        return 1;
    }
}

// ============================================================================
// Pipeline Stages
// ============================================================================

model::compilation Compiler::load_model(const std::filesystem::path& input) {
    logger_.verbose("Loading: " + input.string());

    model::ModelLoader loader;
    model::compilation compilation = loader.build_from_file(input.string());

    if (options_.nullable_override) {
        compilation.nullable = *options_.nullable_override;
    }

    logger_.debug(std::to_string(compilation.types.size()) + " type(s) declared");
    return compilation;
}

BaseRenderer& Compiler::select_renderer() {
    auto* renderer = RendererRegistry::instance().get_renderer(options_.target_language);
    if (!renderer) {
        throw std::runtime_error("Renderer not found for language: " + options_.target_language);
    }

    for (const auto& [option_name, option_value] : options_.generator_options) {
        renderer->set_option(option_name, option_value);
    }
    return *renderer;
}

bool Compiler::run_analysis(const model::compilation& compilation,
                            analysis::analysis_result& out_result) {
    logger_.verbose("Analyzing declarations...");

    analysis::analysis_options analysis_opts;
    analysis_opts.warnings_as_errors = options_.warnings_as_errors;
    analysis_opts.suppress_warnings = options_.suppress_all_warnings;

    out_result = analysis::analyze(compilation, analysis_opts);

    for (const auto& diag : out_result.diagnostics) {
        logger_.report(diag);
    }

    if (out_result.has_errors()) {
        logger_.error("Total errors: " + std::to_string(out_result.error_count()));
    }
    if (out_result.has_warnings()) {
        logger_.warning("Total warnings: " + std::to_string(out_result.warning_count()));
    }

    if (out_result.analyzed) {
        for (const auto& skipped : out_result.analyzed->skipped_nested) {
            logger_.verbose("Skipped " + skipped + ": enclosing type is nested");
        }
    }

    return !out_result.has_errors() && out_result.analyzed.has_value();
}

bool Compiler::process(const std::filesystem::path& input, BaseRenderer& renderer) {
    try {
        logger_.info("Processing: " + input.string());

        model::compilation compilation = load_model(input);
        const std::filesystem::path output_dir = output_directory();

        std::vector<OutputFile> files = renderer.post_initialize(compilation, output_dir);

        analysis::analysis_result result;
        if (!run_analysis(compilation, result)) {
            return false;
        }

        logger_.verbose("Generating " + renderer.get_language_name() + " for " +
                        std::to_string(result.analyzed->units.size()) + " type(s)");

        auto generated = renderer.generate_files(*result.analyzed, output_dir);
        files.insert(files.end(),
                     std::make_move_iterator(generated.begin()),
                     std::make_move_iterator(generated.end()));

        if (options_.output_mode == OutputMode::PrintOutputs) {
            print_outputs(files);
        } else {
            write_output_files(files);
        }
        return true;

    } catch (const model_error& e) {
        logger_.error(input.string() + ": " + e.what());
        return false;
    } catch (const unsupported_type_error& e) {
        logger_.error(input.string() + ": " + e.what());
        return false;
    }
}

std::filesystem::path Compiler::output_directory() const {
    if (options_.output_dir.empty()) {
        return std::filesystem::current_path();
    }
    return options_.output_dir;
}

// ============================================================================
// Output
// ============================================================================

void Compiler::write_output_files(const std::vector<OutputFile>& files) {
    for (const auto& file : files) {
        logger_.verbose("Writing: " + file.path.string());

        auto parent = file.path.parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        std::ofstream ofs(file.path, std::ios::binary);
        if (!ofs) {
            throw std::runtime_error("Failed to open file for writing: " + file.path.string());
        }

        ofs << file.content;

        if (!ofs) {
            throw std::runtime_error("Failed to write file: " + file.path.string());
        }

        logger_.success("Generated: " + file.path.string());
    }
}

void Compiler::print_outputs(const std::vector<OutputFile>& files) {
    for (const auto& file : files) {
        std::cout << file.path.filename().string() << "\n";
    }
}

}  // namespace sqlmarshal::driver
