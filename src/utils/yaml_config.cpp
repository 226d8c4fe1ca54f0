#include "utils/yaml_config.hpp"
#include <yaml-cpp/yaml.h>

namespace aerobuild {
namespace {

bool fail(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

std::string where(const YAML::Node& node) {
    return "line " + std::to_string(node.Mark().line + 1);
}

// Plain scalars carry the "?" tag, quoted ones "!".
nlohmann::json scalarToJson(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    if (node.Tag() != "?") {
        return text;
    }
    if (text == "true") {
        return true;
    }
    if (text == "false") {
        return false;
    }
    double number = 0.0;
    if (YAML::convert<double>::decode(node, number)) {
        return number;
    }
    return text;
}

bool convertMapping(const YAML::Node& root, nlohmann::json& out, std::string* error) {
    for (const auto& item : root) {
        const YAML::Node& key = item.first;
        const YAML::Node& value = item.second;
        if (!key.IsScalar() || key.Scalar().empty()) {
            return fail(error, where(key) + ": keys must be non-empty scalars");
        }
        const std::string& name = key.Scalar();
        if (out.contains(name)) {
            return fail(error, where(key) + ": duplicate key '" + name + "'");
        }
        if (value.IsNull()) {
            out[name] = nullptr;
        } else if (value.IsScalar()) {
            out[name] = scalarToJson(value);
        } else {
            return fail(error, where(value) + ": value of '" + name + "' must be a scalar");
        }
    }
    return true;
}

} // namespace

std::optional<nlohmann::json> parseYamlConfig(const std::string& content, std::string* error) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::ParserException& e) {
        fail(error, "line " + std::to_string(e.mark.line + 1) + ": " + e.msg);
        return std::nullopt;
    }

    if (!root.IsMap()) {
        fail(error, "document root must be a mapping");
        return std::nullopt;
    }

    nlohmann::json out = nlohmann::json::object();
    if (!convertMapping(root, out, error)) {
        return std::nullopt;
    }
    return out;
}

} // namespace aerobuild
