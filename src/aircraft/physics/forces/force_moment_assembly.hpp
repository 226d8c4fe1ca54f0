#pragma once

#include "aircraft/aircraft_params.hpp"
#include "aircraft/physics/coefficient_buildup.hpp"
#include "aircraft/physics/flight_state.hpp"
#include "math/vec3.hpp"

namespace aerobuild {

/**
 * @brief Dimensional aerodynamic loads handed to the rigid-body integrator.
 *
 * force is in body axes (N). moment is (roll, pitch, yaw) about the body axes (N m).
 * The coefficients and dynamic pressure that produced them are kept for diagnostics.
 */
struct AeroForces {
    Vec3 force;
    Vec3 moment;
    Vec3 windForce; // (D, Y, L) magnitudes before the axis transform
    AeroCoefficients coefficients;
    double dynamicPressure = 0.0;
};

// qbar = 0.5 rho V^2
double dynamicPressure(double airDensity, double airspeed);

AeroForces assembleForcesAndMoments(const Geometry& geometry, const AeroCoefficients& coefficients,
                                    double alpha, double beta, double qbar);

// Full pipeline: coefficient buildup, dimensionalization, wind-to-body transform.
// Pure; safe to call concurrently against one shared AircraftParams.
AeroForces evaluate(const AircraftParams& params, const FlightState& state, double airDensity);

}
