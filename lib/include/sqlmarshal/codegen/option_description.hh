#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace sqlmarshal::codegen {

enum class OptionType {
    Bool,      // true/false, on/off, yes/no, 1/0
    String     // Arbitrary string value
};

/// Generator-specific command-line option
struct OptionDescription {
    std::string name;                          // "emit-attributes", "default-context"
    OptionType type;
    std::string description;
    std::optional<std::string> default_value;

    bool is_required() const {
        return !default_value.has_value();
    }
};

using OptionValue = std::variant<bool, std::string>;

/// One generated file
struct OutputFile {
    std::filesystem::path path;  // output_dir + file name
    std::string content;
};

/// Parse an option value according to its description
/// @throws std::invalid_argument for malformed booleans
OptionValue parse_option_value(const OptionDescription& option, const std::string& text);

}  // namespace sqlmarshal::codegen
