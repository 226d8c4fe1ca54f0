#pragma once

#include "aircraft/aircraft_params.hpp"
#include "aircraft/physics/flight_state.hpp"
#include "aircraft/physics/forces/force_moment_assembly.hpp"
#include "aircraft/physics/physics_constants.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace aerobuild {

constexpr int AERO_EVAL_OK = 0;
constexpr int AERO_EVAL_USAGE_ERROR = 1;
constexpr int AERO_EVAL_LOAD_ERROR = 2;

struct AeroEvalConfig {
    std::string aircraftPath;
    FlightState state;
    double density = PhysicsConstants::SEA_LEVEL_DENSITY;
    bool dumpJson = false;
};

void printAeroEvalUsage(std::ostream& out);

// Angles are given in degrees on the command line and stored in radians.
bool parseAeroEvalArgs(int argc, const char* const* argv, AeroEvalConfig& cfg, std::ostream& err);

// The --dump-json document: loaded record, dynamic pressure, body force and moment.
nlohmann::json buildAeroEvalReport(const AircraftParams& params, const AeroForces& loads);

// Whole tool. Results go to out, diagnostics to err; returns the process exit code.
int runAeroEval(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace aerobuild
