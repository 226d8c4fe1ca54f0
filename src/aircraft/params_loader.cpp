#include "aircraft/params_loader.hpp"
#include "aircraft/aircraft_config_keys.hpp"
#include "utils/config_loader.hpp"
#include "utils/yaml_config.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <unordered_set>
#include <utility>
#include <vector>

namespace aerobuild {
namespace {

using CoefficientField = std::pair<const char*, double*>;

std::vector<CoefficientField> coefficientFields(AeroCoefficientSet& c) {
    return {
        {ConfigKeys::C_D_0, &c.drag.c0},
        {ConfigKeys::C_D_ALPHA, &c.drag.alpha},
        {ConfigKeys::C_D_ALPHA_Q, &c.drag.alphaQ},
        {ConfigKeys::C_D_ALPHA_DELTAE, &c.drag.alphaDeltaE},
        {ConfigKeys::C_D_ALPHA2, &c.drag.alpha2},
        {ConfigKeys::C_D_ALPHA2_Q, &c.drag.alpha2Q},
        {ConfigKeys::C_D_ALPHA2_DELTAE, &c.drag.alpha2DeltaE},
        {ConfigKeys::C_D_ALPHA3, &c.drag.alpha3},
        {ConfigKeys::C_D_ALPHA3_Q, &c.drag.alpha3Q},
        {ConfigKeys::C_D_ALPHA4, &c.drag.alpha4},

        {ConfigKeys::C_Y_BETA, &c.sideForce.beta},
        {ConfigKeys::C_Y_P, &c.sideForce.p},
        {ConfigKeys::C_Y_R, &c.sideForce.r},
        {ConfigKeys::C_Y_DELTAA, &c.sideForce.deltaA},
        {ConfigKeys::C_Y_DELTAR, &c.sideForce.deltaR},

        {ConfigKeys::C_L_0, &c.lift.c0},
        {ConfigKeys::C_L_ALPHA, &c.lift.alpha},
        {ConfigKeys::C_L_Q, &c.lift.q},
        {ConfigKeys::C_L_DELTAE, &c.lift.deltaE},
        {ConfigKeys::C_L_ALPHA_Q, &c.lift.alphaQ},
        {ConfigKeys::C_L_ALPHA2, &c.lift.alpha2},
        {ConfigKeys::C_L_ALPHA3, &c.lift.alpha3},
        {ConfigKeys::C_L_ALPHA4, &c.lift.alpha4},

        {ConfigKeys::C_ROLL_BETA, &c.roll.beta},
        {ConfigKeys::C_ROLL_P, &c.roll.p},
        {ConfigKeys::C_ROLL_R, &c.roll.r},
        {ConfigKeys::C_ROLL_DELTAA, &c.roll.deltaA},
        {ConfigKeys::C_ROLL_DELTAR, &c.roll.deltaR},

        {ConfigKeys::C_M_0, &c.pitch.c0},
        {ConfigKeys::C_M_ALPHA, &c.pitch.alpha},
        {ConfigKeys::C_M_Q, &c.pitch.q},
        {ConfigKeys::C_M_DELTAE, &c.pitch.deltaE},
        {ConfigKeys::C_M_ALPHA_Q, &c.pitch.alphaQ},
        {ConfigKeys::C_M_ALPHA2_Q, &c.pitch.alpha2Q},
        {ConfigKeys::C_M_ALPHA2_DELTAE, &c.pitch.alpha2DeltaE},
        {ConfigKeys::C_M_ALPHA3_Q, &c.pitch.alpha3Q},
        {ConfigKeys::C_M_ALPHA3_DELTAE, &c.pitch.alpha3DeltaE},
        {ConfigKeys::C_M_ALPHA4, &c.pitch.alpha4},

        {ConfigKeys::C_N_BETA, &c.yaw.beta},
        {ConfigKeys::C_N_P, &c.yaw.p},
        {ConfigKeys::C_N_R, &c.yaw.r},
        {ConfigKeys::C_N_DELTAA, &c.yaw.deltaA},
        {ConfigKeys::C_N_DELTAR, &c.yaw.deltaR},
        {ConfigKeys::C_N_BETA2, &c.yaw.beta2},
        {ConfigKeys::C_N_BETA3, &c.yaw.beta3},
    };
}

const std::unordered_set<std::string>& knownKeys() {
    static const std::unordered_set<std::string> keys = [] {
        std::unordered_set<std::string> k = {
            ConfigKeys::NAME, ConfigKeys::MASS, ConfigKeys::IXX, ConfigKeys::IYY, ConfigKeys::IZZ,
            ConfigKeys::IXZ, ConfigKeys::WING_AREA, ConfigKeys::WING_SPAN, ConfigKeys::MAC
        };
        AeroCoefficientSet scratch;
        for (const auto& field : coefficientFields(scratch)) {
            k.insert(field.first);
        }
        return k;
    }();
    return keys;
}

double numberField(const nlohmann::json& doc, const char* key) {
    const auto& value = doc.at(key);
    if (!value.is_number()) {
        throw ParameterLoadError(LoadErrorKind::TypeMismatch,
            std::string(key) + " must be a number, got " + value.dump());
    }
    double v = value.get<double>();
    if (!std::isfinite(v)) {
        throw ParameterLoadError(LoadErrorKind::TypeMismatch, std::string(key) + " must be finite");
    }
    return v;
}

double requiredNumber(const nlohmann::json& doc, const char* key) {
    if (!doc.contains(key)) {
        throw ParameterLoadError(LoadErrorKind::MissingRequiredField, std::string("missing '") + key + "'");
    }
    return numberField(doc, key);
}

double optionalNumber(const nlohmann::json& doc, const char* key) {
    return doc.contains(key) ? numberField(doc, key) : 0.0;
}

std::string requiredName(const nlohmann::json& doc) {
    if (!doc.contains(ConfigKeys::NAME)) {
        throw ParameterLoadError(LoadErrorKind::MissingRequiredField,
            std::string("missing '") + ConfigKeys::NAME + "'");
    }
    const auto& value = doc.at(ConfigKeys::NAME);
    if (!value.is_string()) {
        throw ParameterLoadError(LoadErrorKind::TypeMismatch,
            std::string(ConfigKeys::NAME) + " must be text, got " + value.dump());
    }
    return value.get<std::string>();
}

bool hasJsonExtension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".json";
}

} // namespace

AircraftParams loadParameters(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ParameterLoadError(LoadErrorKind::MalformedSource, "aircraft definition must be a key-value mapping");
    }

    // Presence and type here; value ranges are enforced by AircraftParams.
    std::string name = requiredName(doc);

    MassProperties mass;
    mass.mass = requiredNumber(doc, ConfigKeys::MASS);
    mass.ixx = requiredNumber(doc, ConfigKeys::IXX);
    mass.iyy = requiredNumber(doc, ConfigKeys::IYY);
    mass.izz = requiredNumber(doc, ConfigKeys::IZZ);

    Geometry geometry;
    geometry.wingArea = requiredNumber(doc, ConfigKeys::WING_AREA);
    geometry.wingSpan = requiredNumber(doc, ConfigKeys::WING_SPAN);
    geometry.mac = requiredNumber(doc, ConfigKeys::MAC);

    mass.ixz = optionalNumber(doc, ConfigKeys::IXZ);

    AeroCoefficientSet coefficients;
    for (const auto& field : coefficientFields(coefficients)) {
        *field.second = optionalNumber(doc, field.first);
    }

    for (const auto& item : doc.items()) {
        if (knownKeys().count(item.key()) == 0) {
            std::cerr << "Warning: ignoring unknown aircraft parameter '" << item.key()
                      << "' in " << name << std::endl;
        }
    }

    return AircraftParams(std::move(name), mass, geometry, coefficients);
}

AircraftParams loadParametersFromText(const std::string& text, const std::string& origin) {
    std::string error;
    auto doc = parseYamlConfig(text, &error);
    if (!doc) {
        throw ParameterLoadError(LoadErrorKind::MalformedSource, origin + ": " + error);
    }
    return loadParameters(*doc);
}

AircraftParams loadParametersFromFile(const std::string& path) {
    auto content = readConfigFile(path);
    if (!content) {
        throw ParameterLoadError(LoadErrorKind::SourceUnavailable, "cannot open " + path);
    }

    if (hasJsonExtension(path)) {
        auto doc = parseJsonConfig(*content, path);
        if (!doc) {
            throw ParameterLoadError(LoadErrorKind::MalformedSource, path + " is not valid JSON");
        }
        return loadParameters(*doc);
    }

    return loadParametersFromText(*content, path);
}

nlohmann::json toJson(const AircraftParams& params) {
    nlohmann::json doc = nlohmann::json::object();
    doc[ConfigKeys::NAME] = params.name();
    doc[ConfigKeys::MASS] = params.mass().mass;
    doc[ConfigKeys::IXX] = params.mass().ixx;
    doc[ConfigKeys::IYY] = params.mass().iyy;
    doc[ConfigKeys::IZZ] = params.mass().izz;
    doc[ConfigKeys::IXZ] = params.mass().ixz;
    doc[ConfigKeys::WING_AREA] = params.geometry().wingArea;
    doc[ConfigKeys::WING_SPAN] = params.geometry().wingSpan;
    doc[ConfigKeys::MAC] = params.geometry().mac;

    AeroCoefficientSet coefficients = params.coefficients();
    for (const auto& field : coefficientFields(coefficients)) {
        doc[field.first] = *field.second;
    }
    return doc;
}

JsonParameterSource::JsonParameterSource(nlohmann::json doc)
    : m_doc(std::move(doc))
{
}

AircraftParams JsonParameterSource::load() const {
    return loadParameters(m_doc);
}

TextParameterSource::TextParameterSource(std::string text)
    : m_text(std::move(text))
{
}

AircraftParams TextParameterSource::load() const {
    return loadParametersFromText(m_text);
}

FileParameterSource::FileParameterSource(std::string path)
    : m_path(std::move(path))
{
}

AircraftParams FileParameterSource::load() const {
    return loadParametersFromFile(m_path);
}

} // namespace aerobuild
