#include "aircraft/physics/forces/force_moment_assembly.hpp"
#include "aircraft/physics/forces/axis_transform.hpp"

namespace aerobuild {

double dynamicPressure(double airDensity, double airspeed) {
    return 0.5 * airDensity * airspeed * airspeed;
}

AeroForces assembleForcesAndMoments(const Geometry& geometry, const AeroCoefficients& coefficients,
                                    double alpha, double beta, double qbar) {
    AeroForces out;
    out.coefficients = coefficients;
    out.dynamicPressure = qbar;

    double qS = qbar * geometry.wingArea;

    out.windForce = Vec3(
        qS * coefficients.cD,
        qS * coefficients.cY,
        qS * coefficients.cL
    );
    out.force = windToBody(out.windForce, alpha, beta);

    out.moment = Vec3(
        qS * geometry.wingSpan * coefficients.cl,
        qS * geometry.mac * coefficients.cm,
        qS * geometry.wingSpan * coefficients.cn
    );

    return out;
}

AeroForces evaluate(const AircraftParams& params, const FlightState& state, double airDensity) {
    AeroCoefficients coefficients = computeCoefficients(params, state);
    double qbar = dynamicPressure(airDensity, state.airspeed);
    return assembleForcesAndMoments(params.geometry(), coefficients, state.alpha, state.beta, qbar);
}

}
