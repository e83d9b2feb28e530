//
// Diagnostic formatting and utilities
//

#include <sqlmarshal/analysis.hh>
#include <algorithm>
#include <sstream>

namespace sqlmarshal::analysis {

// ============================================================================
// Diagnostic Formatting
// ============================================================================

std::string diagnostic::format() const {
    std::ostringstream oss;

    // Format: symbol: level: message [code]
    if (!symbol.empty()) {
        oss << symbol << ": ";
    }

    switch (level) {
        case diagnostic_level::error:
            oss << "error: ";
            break;
        case diagnostic_level::warning:
            oss << "warning: ";
            break;
        case diagnostic_level::note:
            oss << "note: ";
            break;
    }

    oss << message;

    if (!code.empty()) {
        oss << " [" << code << "]";
    }

    return oss.str();
}

// ============================================================================
// Analysis Result Methods
// ============================================================================

bool analysis_result::has_errors() const {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::error; });
}

bool analysis_result::has_warnings() const {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::warning; });
}

size_t analysis_result::error_count() const {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::error; }));
}

size_t analysis_result::warning_count() const {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::warning; }));
}

void analysis_result::print_diagnostics(std::ostream& os) const {
    for (const auto& diag : diagnostics) {
        os << diag.format() << "\n";
    }

    if (!diagnostics.empty()) {
        size_t errors = error_count();
        size_t warnings = warning_count();

        if (errors > 0) {
            os << errors << " error" << (errors != 1 ? "s" : "");
        }
        if (warnings > 0) {
            if (errors > 0) os << ", ";
            os << warnings << " warning" << (warnings != 1 ? "s" : "");
        }
        if (errors > 0 || warnings > 0) {
            os << " generated.\n";
        }
    }
}

}  // namespace sqlmarshal::analysis
