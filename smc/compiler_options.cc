#include "compiler_options.hh"
#include <sqlmarshal/renderer_registry.hh>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string_view>

namespace sqlmarshal::driver {

using namespace sqlmarshal::codegen;

namespace {

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// Value of "-o dir" or "-odir"
std::string take_value(const char* flag, int argc, char** argv, int& i) {
    std::string value = argv[i] + std::strlen(flag);
    if (value.empty() && i + 1 < argc) {
        value = argv[++i];
    }
    if (value.empty()) {
        throw std::runtime_error(std::string("Option ") + flag + " requires argument");
    }
    return value;
}

struct generator_option {
    std::string name;
    OptionValue value;
};

// --<prefix>-<option>=<value>; nullopt when the prefix names no generator
std::optional<generator_option> parse_generator_option(
    const char* arg,
    const std::map<std::string, BaseRenderer*>& prefix_to_renderer)
{
    std::string_view sv(arg + 2);

    size_t dash_pos = sv.find('-');
    if (dash_pos == std::string_view::npos) {
        return std::nullopt;
    }

    std::string prefix(sv.substr(0, dash_pos));
    auto it = prefix_to_renderer.find(prefix);
    if (it == prefix_to_renderer.end()) {
        return std::nullopt;
    }

    std::string_view rest = sv.substr(dash_pos + 1);
    size_t eq_pos = rest.find('=');
    std::string option_name(rest.substr(0, eq_pos));
    std::string value_text(rest.substr(eq_pos + 1));

    auto options = it->second->get_options();
    auto opt_it = std::find_if(options.begin(), options.end(),
        [&](const OptionDescription& opt) { return opt.name == option_name; });

    if (opt_it == options.end()) {
        throw std::runtime_error("Unknown option for " + prefix + " generator: " + option_name);
    }

    try {
        return generator_option{option_name, parse_option_value(*opt_it, value_text)};
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }
}

}  // namespace

// ============================================================================
// Main Parser
// ============================================================================

CompilerOptions parse_command_line(int argc, char** argv) {
    CompilerOptions opts;

    auto& registry = RendererRegistry::instance();
    std::map<std::string, BaseRenderer*> prefix_to_renderer;
    for (const auto& name : registry.get_available_languages()) {
        if (auto* renderer = registry.get_renderer(name)) {
            prefix_to_renderer[renderer->get_option_prefix()] = renderer;
        }
    }

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            std::exit(0);
        }

        if (std::strcmp(arg, "--version") == 0) {
            print_version();
            std::exit(0);
        }

        if (std::strcmp(arg, "--list-generators") == 0) {
            print_generators();
            std::exit(0);
        }

        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }

        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            opts.quiet = true;
            continue;
        }

        if (std::strcmp(arg, "--print-outputs") == 0) {
            opts.output_mode = OutputMode::PrintOutputs;
            continue;
        }

        if (starts_with(arg, "--nullable=")) {
            std::string mode = arg + std::strlen("--nullable=");
            auto context = model::parse_nullable_context(mode);
            if (!context) {
                throw std::runtime_error(
                    "Invalid nullable mode: " + mode +
                    " (expected: enable, disable, warnings, annotations)");
            }
            opts.nullable_override = *context;
            continue;
        }

        if (std::strcmp(arg, "-Werror") == 0) {
            opts.warnings_as_errors = true;
            continue;
        }

        if (std::strcmp(arg, "-w") == 0) {
            opts.suppress_all_warnings = true;
            continue;
        }

        if (starts_with(arg, "-o")) {
            opts.output_dir = take_value("-o", argc, argv, i);
            continue;
        }

        if (starts_with(arg, "-t")) {
            opts.target_language = take_value("-t", argc, argv, i);
            continue;
        }

        if (starts_with(arg, "--") && std::strchr(arg + 2, '=')) {
            if (auto option = parse_generator_option(arg, prefix_to_renderer)) {
                opts.generator_options[option->name] = option->value;
                continue;
            }
        }

        if (arg[0] == '-') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        opts.input_files.push_back(arg);
    }

    if (opts.input_files.empty()) {
        throw std::runtime_error("No input files specified");
    }

    if (opts.quiet && opts.verbose) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose");
    }

    if (!registry.has_renderer(opts.target_language)) {
        std::string message = "Unknown target language: " + opts.target_language;
        auto available = registry.get_available_languages();
        if (!available.empty()) {
            message += "\n\nAvailable languages:";
            for (const auto& lang : available) {
                message += "\n  - " + lang;
            }
        }
        throw std::runtime_error(message);
    }

    return opts;
}

// ============================================================================
// Help and Info
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <model.yaml>...\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "  --list-generators       List available code generators\n";
    std::cout << "\n";

    std::cout << "Output:\n";
    std::cout << "  -o <dir>                Output directory (default: current directory)\n";
    std::cout << "  -t <lang>               Target language (default: csharp)\n";
    std::cout << "  --print-outputs         Print generated file names and exit\n";
    std::cout << "\n";

    std::cout << "Analysis:\n";
    std::cout << "  --nullable=<mode>       Override the nullable context of the model\n";
    std::cout << "                          (enable, disable, warnings, annotations)\n";
    std::cout << "  -w                      Suppress all warnings\n";
    std::cout << "  -Werror                 Treat all warnings as errors\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (errors only)\n";
    std::cout << "\n";

    std::cout << "Generator Options:\n";
    std::cout << "  --<prefix>-<option>=<value>    Set generator-specific option\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " repository.yaml\n";
    std::cout << "  " << program_name << " -o Generated --cs-default-context=db repository.yaml\n";
}

void print_version() {
    std::cout << "SqlMarshal Code Generator v0.1.0\n";
}

void print_generators() {
    auto& registry = RendererRegistry::instance();

    std::cout << "Available code generators:\n\n";

    for (const auto& name : registry.get_available_languages()) {
        auto* renderer = registry.get_renderer(name);
        if (!renderer) continue;

        const auto metadata = renderer->get_metadata();
        std::cout << "  " << name << " (" << metadata.name << ", " << metadata.version << ")\n";
        std::cout << "    Prefix: " << renderer->get_option_prefix() << "\n";
        std::cout << "    Extension: " << metadata.file_extension << "\n";

        auto options = renderer->get_options();
        if (!options.empty()) {
            std::cout << "    Options:\n";
            for (const auto& opt : options) {
                std::cout << "      --" << renderer->get_option_prefix()
                          << "-" << opt.name << "=<value>\n";
                std::cout << "        " << opt.description << "\n";
                if (opt.default_value) {
                    std::cout << "        Default: " << *opt.default_value << "\n";
                }
            }
        }
        std::cout << "\n";
    }
}

}  // namespace sqlmarshal::driver
