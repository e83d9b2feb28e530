#pragma once

#include <sqlmarshal/codegen/option_description.hh>
#include <sqlmarshal/model.hh>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sqlmarshal::driver {

enum class OutputMode {
    Generate,     // Write generated files (default)
    PrintOutputs  // Print the file names that would be written, one per line
};

/// Driver configuration parsed from the command line
struct CompilerOptions {
    // ========================================================================
    // Input/Output
    // ========================================================================

    std::vector<std::filesystem::path> input_files;  // Declaration models (YAML)
    std::filesystem::path output_dir;                 // Empty: current directory

    std::string target_language = "csharp";

    /// Generator options keyed by option name, from --<prefix>-<option>=<value>
    std::map<std::string, codegen::OptionValue> generator_options;

    // ========================================================================
    // Analysis
    // ========================================================================

    /// --nullable=<mode> replaces the mode recorded in the model
    std::optional<model::nullable_context> nullable_override;

    bool warnings_as_errors = false;   // -Werror
    bool suppress_all_warnings = false; // -w

    // ========================================================================
    // Diagnostics
    // ========================================================================

    bool verbose = false;  // -v, --verbose
    bool quiet = false;    // -q, --quiet

    OutputMode output_mode = OutputMode::Generate;
};

/// Parse command-line arguments.
/// --help, --version and --list-generators print and exit.
/// @throws std::runtime_error on invalid arguments
CompilerOptions parse_command_line(int argc, char** argv);

void print_help(const char* program_name);

void print_version();

/// List registered generators with their options
void print_generators();

}  // namespace sqlmarshal::driver
