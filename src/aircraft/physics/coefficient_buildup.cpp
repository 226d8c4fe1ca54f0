#include "aircraft/physics/coefficient_buildup.hpp"
#include "aircraft/physics/physics_constants.hpp"

namespace aerobuild {

Vec3 nondimensionalRates(const Geometry& geometry, const FlightState& state) {
    if (state.airspeed <= PhysicsConstants::AIRSPEED_EPSILON) {
        return Vec3(0, 0, 0);
    }
    double twoV = 2.0 * state.airspeed;
    return Vec3(
        state.p * geometry.wingSpan / twoV,
        state.q * geometry.mac / twoV,
        state.r * geometry.wingSpan / twoV
    );
}

AeroCoefficients computeCoefficients(const AircraftParams& params, const FlightState& state) {
    const AeroCoefficientSet& k = params.coefficients();
    Vec3 rates = nondimensionalRates(params.geometry(), state);
    double pHat = rates.x;
    double qHat = rates.y;
    double rHat = rates.z;

    double a = state.alpha;
    double a2 = a * a;
    double a3 = a2 * a;
    double a4 = a3 * a;
    double b = state.beta;
    double b2 = b * b;
    double b3 = b2 * b;
    double de = state.elevator;
    double da = state.aileron;
    double dr = state.rudder;

    AeroCoefficients c;

    c.cD = k.drag.c0
         + k.drag.alpha * a
         + k.drag.alphaQ * a * qHat
         + k.drag.alphaDeltaE * a * de
         + k.drag.alpha2 * a2
         + k.drag.alpha2Q * a2 * qHat
         + k.drag.alpha2DeltaE * a2 * de
         + k.drag.alpha3 * a3
         + k.drag.alpha3Q * a3 * qHat
         + k.drag.alpha4 * a4;

    c.cY = k.sideForce.beta * b
         + k.sideForce.p * pHat
         + k.sideForce.r * rHat
         + k.sideForce.deltaA * da
         + k.sideForce.deltaR * dr;

    c.cL = k.lift.c0
         + k.lift.alpha * a
         + k.lift.q * qHat
         + k.lift.deltaE * de
         + k.lift.alphaQ * a * qHat
         + k.lift.alpha2 * a2
         + k.lift.alpha3 * a3
         + k.lift.alpha4 * a4;

    c.cl = k.roll.beta * b
         + k.roll.p * pHat
         + k.roll.r * rHat
         + k.roll.deltaA * da
         + k.roll.deltaR * dr;

    c.cm = k.pitch.c0
         + k.pitch.alpha * a
         + k.pitch.q * qHat
         + k.pitch.deltaE * de
         + k.pitch.alphaQ * a * qHat
         + k.pitch.alpha2Q * a2 * qHat
         + k.pitch.alpha2DeltaE * a2 * de
         + k.pitch.alpha3Q * a3 * qHat
         + k.pitch.alpha3DeltaE * a3 * de
         + k.pitch.alpha4 * a4;

    c.cn = k.yaw.beta * b
         + k.yaw.p * pHat
         + k.yaw.r * rHat
         + k.yaw.deltaA * da
         + k.yaw.deltaR * dr
         + k.yaw.beta2 * b2
         + k.yaw.beta3 * b3;

    return c;
}

}
