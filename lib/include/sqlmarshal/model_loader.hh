#pragma once

#include <string>
#include <sqlmarshal/errors.hh>
#include <sqlmarshal/model.hh>

// fkYAML uses versioned namespaces, so we need to include the header
#include <fkYAML/node.hpp>

namespace sqlmarshal::model {

/**
 * Parse C# type text into a type reference.
 *
 * Accepts qualified names, generic argument lists and a trailing `?`:
 *   "int", "string?", "IList<Foo.Item>", "Dictionary<string, List<int?>>"
 *
 * A leading `global::` alias qualifier is dropped.
 *
 * @throws model_error if the text is not a well-formed type name
 */
type_ref parse_type_name(const std::string& text);

/**
 * Builds the declaration model from a YAML description of a compilation.
 *
 * Ordered collections (types, fields, properties, methods, parameters) are
 * YAML sequences so that declaration order survives loading; ordinal
 * positions of properties and parameters are their sequence indices.
 *
 * Example usage:
 *   ModelLoader loader;
 *   model::compilation c = loader.build_from_file("repository.yaml");
 */
class ModelLoader {
public:
    ModelLoader();
    ~ModelLoader();

    /**
     * Build compilation from a YAML file.
     *
     * @throws model_error for structural errors
     * @throws std::runtime_error for file I/O and YAML syntax errors
     */
    compilation build_from_file(const std::string& path);

    /**
     * Build compilation from a parsed YAML node (for testing).
     *
     * @throws model_error for structural errors
     */
    compilation build_from_yaml(const fkyaml::node& root);

private:
    type_def build_type(const fkyaml::node& node);
    member_def build_member(const fkyaml::node& node, const std::string& owner);
    method_def build_method(const fkyaml::node& node, const std::string& owner);
    parameter_def build_parameter(const fkyaml::node& node, const std::string& owner);
    attribute_usage build_attribute(const fkyaml::node& node, const std::string& owner);
    std::vector<attribute_usage> build_attributes(const fkyaml::node& node,
                                                  const std::string& owner);

    // Required string entry of a mapping
    static std::string require_string(const fkyaml::node& node,
                                      const std::string& key,
                                      const std::string& owner);

    // Optional string entry of a mapping (empty when absent)
    static std::string optional_string(const fkyaml::node& node,
                                       const std::string& key,
                                       const std::string& owner);

    // Scalar converted to text (strings, integers, booleans)
    static std::string scalar_text(const fkyaml::node& node, const std::string& owner);

    static type_ref parse_type(const std::string& text, const std::string& owner);
};

}  // namespace sqlmarshal::model
