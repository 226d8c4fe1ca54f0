#pragma once

#include "aircraft/aircraft_params.hpp"
#include "aircraft/physics/flight_state.hpp"
#include "math/vec3.hpp"

namespace aerobuild {

struct AeroCoefficients {
    double cD = 0.0; // drag
    double cY = 0.0; // side force
    double cL = 0.0; // lift
    double cl = 0.0; // roll moment
    double cm = 0.0; // pitch moment
    double cn = 0.0; // yaw moment
};

// (p_hat, q_hat, r_hat) = (p b, q c, r b) / 2V, or zero when V <= AIRSPEED_EPSILON.
Vec3 nondimensionalRates(const Geometry& geometry, const FlightState& state);

/**
 * @brief Polynomial stability-derivative buildup of the six coefficients.
 *
 * alpha and beta are not clamped. The polynomials are curve fits over the
 * identification envelope of the source data and extrapolate silently
 * outside it.
 */
AeroCoefficients computeCoefficients(const AircraftParams& params, const FlightState& state);

}
