#include <sqlmarshal/name_mapper.hh>
#include <cctype>

namespace sqlmarshal {

std::string to_snake_case(const std::string& identifier) {
    std::string name = identifier;
    if (!name.empty() && name.front() == '@') {
        name.erase(0, 1);
    }

    auto is_upper = [](char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; };
    auto is_lower_or_digit = [](char c) {
        return std::islower(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c));
    };

    std::string result;
    result.reserve(name.size() + name.size() / 2);

    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (is_upper(c) && i > 0 && name[i - 1] != '_') {
            // Word boundary: "aB" or the last capital of an acronym ("HTTPStatus")
            bool after_lower = is_lower_or_digit(name[i - 1]);
            bool acronym_end = is_upper(name[i - 1]) &&
                               i + 1 < name.size() &&
                               std::islower(static_cast<unsigned char>(name[i + 1]));
            if (after_lower || acronym_end) {
                result += '_';
            }
        }
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    return result;
}

std::string external_parameter_name(const std::string& identifier) {
    return "@" + to_snake_case(identifier);
}

}  // namespace sqlmarshal
