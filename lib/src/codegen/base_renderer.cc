#include <sqlmarshal/base_renderer.hh>
#include <stdexcept>

namespace sqlmarshal::codegen {

void BaseRenderer::set_option(const std::string& name, const OptionValue& value) {
    (void)value;
    throw std::invalid_argument(get_option_prefix() + " generator has no option: " + name);
}

std::vector<OutputFile> BaseRenderer::post_initialize(model::compilation& compilation,
                                                      const std::filesystem::path& output_dir) {
    (void)compilation;
    (void)output_dir;
    return {};
}

OptionValue parse_option_value(const OptionDescription& option, const std::string& text) {
    switch (option.type) {
        case OptionType::Bool:
            if (text == "true" || text == "yes" || text == "on" || text == "1") {
                return true;
            }
            if (text == "false" || text == "no" || text == "off" || text == "0") {
                return false;
            }
            throw std::invalid_argument(
                "Invalid boolean value for " + option.name + ": " + text +
                " (expected: true/false, yes/no, on/off, 1/0)");

        case OptionType::String:
            return text;
    }
    return text;
}

}  // namespace sqlmarshal::codegen
