#pragma once

#include <sqlmarshal/analysis.hh>
#include <string>

namespace sqlmarshal::driver {

enum class LogLevel {
    Quiet,   // Errors only
    Normal,  // + warnings, notes, info, success
    Verbose, // + pipeline progress
    Debug    // + internals
};

enum class ColorMode {
    Auto,
    Always,
    Never
};

/**
 * Console logger of the sqlmarshal driver, colored through termcolor.
 *
 * Errors and warnings go to stderr, everything else to stdout. Analysis
 * diagnostics are printed in "symbol: level: message [code]" form.
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                    ColorMode color = ColorMode::Auto);

    void error(const std::string& message);
    void warning(const std::string& message);
    void note(const std::string& message);
    void info(const std::string& message);
    void success(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

    /// Print one analysis diagnostic at its own level
    void report(const analysis::diagnostic& diag);

    void set_level(LogLevel level) { level_ = level; }
    [[nodiscard]] LogLevel get_level() const { return level_; }

private:
    bool should_log(LogLevel required_level) const;

    LogLevel level_;
    ColorMode color_mode_;
};

}  // namespace sqlmarshal::driver
