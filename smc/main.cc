#include <exception>
#include <iostream>

#include "compiler.hh"
#include "compiler_options.hh"
#include "logger.hh"

int main(int argc, char* argv[]) {
    using namespace sqlmarshal::driver;

    try {
        CompilerOptions opts = parse_command_line(argc, argv);

        LogLevel log_level = LogLevel::Normal;
        if (opts.quiet) log_level = LogLevel::Quiet;
        if (opts.verbose) log_level = LogLevel::Verbose;

        // --print-outputs output is consumed by build scripts
        if (opts.output_mode == OutputMode::PrintOutputs && !opts.verbose) {
            log_level = LogLevel::Quiet;
        }

        Logger logger(log_level, ColorMode::Auto);

        Compiler compiler(opts, logger);
        return compiler.compile();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
