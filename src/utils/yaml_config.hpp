#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace aerobuild {

// Reads a YAML document whose root is a mapping of scalars into a flat JSON object.
// Plain scalars that parse as numbers become JSON numbers, plain true/false become
// booleans, null stays null and everything else (quoted scalars included) is a string.
// On failure returns nullopt and, when error is non-null, a message with the YAML line.
std::optional<nlohmann::json> parseYamlConfig(const std::string& content, std::string* error = nullptr);

} // namespace aerobuild
