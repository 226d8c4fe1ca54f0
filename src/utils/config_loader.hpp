#pragma once

#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <optional>

namespace aerobuild {
    using json = nlohmann::json;

    inline std::optional<std::string> readConfigFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "Failed to open config file: " << path << std::endl;
            return std::nullopt;
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    // Comments (// and /* */) are accepted.
    inline std::optional<json> parseJsonConfig(const std::string& content, const std::string& origin) {
        try {
            return json::parse(content, nullptr, true, true);
        } catch (const json::parse_error& e) {
            std::cerr << "Failed to parse JSON from " << origin << ": " << e.what() << std::endl;
            return std::nullopt;
        }
    }
}
