#pragma once

#include "aircraft/aircraft_params.hpp"
#include "aircraft/params_error.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace aerobuild {

// Builds a record from a flat JSON object. Throws ParameterLoadError.
AircraftParams loadParameters(const nlohmann::json& doc);

// YAML text whose root is a flat mapping of scalars.
AircraftParams loadParametersFromText(const std::string& text, const std::string& origin = "<text>");

// ".json" files are read as JSON, anything else as YAML. Writes nothing to stdout.
AircraftParams loadParametersFromFile(const std::string& path);

// Flat document using the persisted key names; loadParameters(toJson(p)) reproduces p.
nlohmann::json toJson(const AircraftParams& params);

/**
 * @brief Where an aircraft definition comes from.
 *
 * Additional aircraft are added as further sources or files, never by changing
 * the coefficient buildup or the axis transform.
 */
class ParameterSource {
public:
    virtual ~ParameterSource() = default;
    virtual std::string describe() const = 0;
    virtual AircraftParams load() const = 0;
};

class JsonParameterSource : public ParameterSource {
public:
    explicit JsonParameterSource(nlohmann::json doc);

    std::string describe() const override { return "<json>"; }
    AircraftParams load() const override;

private:
    nlohmann::json m_doc;
};

class TextParameterSource : public ParameterSource {
public:
    explicit TextParameterSource(std::string text);

    std::string describe() const override { return "<text>"; }
    AircraftParams load() const override;

private:
    std::string m_text;
};

class FileParameterSource : public ParameterSource {
public:
    explicit FileParameterSource(std::string path);

    std::string describe() const override { return m_path; }
    AircraftParams load() const override;

private:
    std::string m_path;
};

} // namespace aerobuild
