#pragma once

#include <string>

namespace sqlmarshal {

/// Convert an identifier to snake_case: "clientId" -> "client_id",
/// "HTTPStatus" -> "http_status", "user2Id" -> "user2_id".
/// Existing underscores are kept; a leading '@' verbatim marker is dropped.
std::string to_snake_case(const std::string& identifier);

/// Database-facing name of a parameter: "@" + snake_case(identifier)
std::string external_parameter_name(const std::string& identifier);

}  // namespace sqlmarshal
