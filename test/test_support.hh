//
// Helpers shared by the unit tests
//

#pragma once

#include <sqlmarshal/model.hh>
#include <sqlmarshal/model_loader.hh>
#include <string>

namespace test_support {

/// Build a compilation from inline YAML
inline sqlmarshal::model::compilation load_model(const std::string& yaml) {
    sqlmarshal::model::ModelLoader loader;
    return loader.build_from_yaml(fkyaml::node::deserialize(yaml));
}

/// Declare both marker attribute types the way a user project would
inline void declare_markers(sqlmarshal::model::compilation& compilation) {
    sqlmarshal::model::type_def generation;
    generation.name = "SqlMarshalAttribute";
    generation.kind = sqlmarshal::model::type_kind::attribute;
    compilation.types.push_back(generation);

    sqlmarshal::model::type_def raw;
    raw.name = "RawSqlAttribute";
    raw.kind = sqlmarshal::model::type_kind::attribute;
    compilation.types.push_back(raw);
}

}  // namespace test_support
