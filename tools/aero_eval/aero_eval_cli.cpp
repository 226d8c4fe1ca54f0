#include "aero_eval/aero_eval_cli.hpp"
#include "aircraft/aerodynamic_model.hpp"
#include "aircraft/params_loader.hpp"

#include <cmath>
#include <exception>
#include <iomanip>
#include <memory>

namespace aerobuild {
namespace {

constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

void printVec(std::ostream& out, const char* label, const Vec3& v, const char* unit) {
    out << "  " << std::left << std::setw(8) << label << std::right
        << std::setw(14) << v.x << std::setw(14) << v.y << std::setw(14) << v.z
        << "  " << unit << "\n";
}

void printSummary(std::ostream& out, const AeroEvalConfig& cfg, const AircraftParams& params,
                  const AeroForces& loads) {
    if (cfg.state.airspeed <= PhysicsConstants::AIRSPEED_EPSILON) {
        out << "Note: airspeed at or below epsilon, rate terms are zero\n";
    }

    const auto& c = loads.coefficients;
    out << std::fixed << std::setprecision(6);
    out << "Aircraft: " << params.name() << "\n";
    out << "  alpha " << cfg.state.alpha / kDegToRad << " deg, beta "
        << cfg.state.beta / kDegToRad << " deg, V " << cfg.state.airspeed
        << " m/s, qbar " << loads.dynamicPressure << " Pa\n";
    out << "Coefficients:\n"
        << "  cD " << c.cD << "  cY " << c.cY << "  cL " << c.cL << "\n"
        << "  cl " << c.cl << "  cm " << c.cm << "  cn " << c.cn << "\n";
    out << std::setprecision(2) << "Body loads:\n";
    printVec(out, "force", loads.force, "N");
    printVec(out, "moment", loads.moment, "N m");
}

} // namespace

void printAeroEvalUsage(std::ostream& out) {
    out << "Usage: aero_eval --aircraft <path> [--airspeed <m/s>] [--density <kg/m^3>]\n"
        << "                 [--alpha-deg <deg>] [--beta-deg <deg>]\n"
        << "                 [--p <rad/s>] [--q <rad/s>] [--r <rad/s>]\n"
        << "                 [--elevator-deg <deg>] [--aileron-deg <deg>] [--rudder-deg <deg>]\n"
        << "                 [--dump-json]\n";
}

bool parseAeroEvalArgs(int argc, const char* const* argv, AeroEvalConfig& cfg, std::ostream& err) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) -> bool {
            if (i + 1 >= argc) {
                err << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };
        auto nextNumber = [&](double& out) -> bool {
            std::string v;
            if (!next(v)) return false;
            double parsed = 0.0;
            try {
                size_t used = 0;
                parsed = std::stod(v, &used);
                if (used != v.size()) {
                    err << "Invalid number for " << arg << ": " << v << "\n";
                    return false;
                }
            } catch (const std::exception&) {
                err << "Invalid number for " << arg << ": " << v << "\n";
                return false;
            }
            if (!std::isfinite(parsed)) {
                err << "Value for " << arg << " must be finite, got " << v << "\n";
                return false;
            }
            out = parsed;
            return true;
        };
        auto nextAngle = [&](double& out) -> bool {
            double deg = 0.0;
            if (!nextNumber(deg)) return false;
            out = deg * kDegToRad;
            return true;
        };

        if (arg == "--aircraft") {
            if (!next(cfg.aircraftPath)) return false;
        } else if (arg == "--airspeed") {
            if (!nextNumber(cfg.state.airspeed)) return false;
        } else if (arg == "--density") {
            if (!nextNumber(cfg.density)) return false;
        } else if (arg == "--alpha-deg") {
            if (!nextAngle(cfg.state.alpha)) return false;
        } else if (arg == "--beta-deg") {
            if (!nextAngle(cfg.state.beta)) return false;
        } else if (arg == "--p") {
            if (!nextNumber(cfg.state.p)) return false;
        } else if (arg == "--q") {
            if (!nextNumber(cfg.state.q)) return false;
        } else if (arg == "--r") {
            if (!nextNumber(cfg.state.r)) return false;
        } else if (arg == "--elevator-deg") {
            if (!nextAngle(cfg.state.elevator)) return false;
        } else if (arg == "--aileron-deg") {
            if (!nextAngle(cfg.state.aileron)) return false;
        } else if (arg == "--rudder-deg") {
            if (!nextAngle(cfg.state.rudder)) return false;
        } else if (arg == "--dump-json") {
            cfg.dumpJson = true;
        } else {
            err << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    if (cfg.aircraftPath.empty()) {
        err << "--aircraft is required\n";
        return false;
    }
    if (cfg.state.airspeed < 0.0 || cfg.density < 0.0) {
        err << "Airspeed and density must be >= 0\n";
        return false;
    }
    return true;
}

nlohmann::json buildAeroEvalReport(const AircraftParams& params, const AeroForces& loads) {
    nlohmann::json out;
    out["aircraft"] = toJson(params);
    out["dynamic_pressure"] = loads.dynamicPressure;
    out["force"] = loads.force;
    out["moment"] = loads.moment;
    return out;
}

int runAeroEval(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    AeroEvalConfig cfg;
    if (!parseAeroEvalArgs(argc, argv, cfg, err)) {
        printAeroEvalUsage(err);
        return AERO_EVAL_USAGE_ERROR;
    }

    std::shared_ptr<const AircraftParams> params;
    try {
        params = std::make_shared<AircraftParams>(loadParametersFromFile(cfg.aircraftPath));
    } catch (const ParameterLoadError& e) {
        err << "Failed to load aircraft: " << e.what() << std::endl;
        return AERO_EVAL_LOAD_ERROR;
    }

    StabilityDerivativeModel model(params);
    AeroForces loads = model.evaluate(cfg.state, cfg.density);

    if (cfg.dumpJson) {
        out << buildAeroEvalReport(*params, loads).dump(2) << "\n";
        return AERO_EVAL_OK;
    }

    out << "Loaded aircraft '" << params->name() << "' from " << cfg.aircraftPath << "\n";
    printSummary(out, cfg, *params, loads);
    return AERO_EVAL_OK;
}

} // namespace aerobuild
