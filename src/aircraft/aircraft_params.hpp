#pragma once

#include "math/mat3.hpp"
#include <string>

namespace aerobuild {

struct MassProperties {
    double mass = 0.0; // kg
    double ixx = 0.0;  // kg m^2
    double iyy = 0.0;
    double izz = 0.0;
    double ixz = 0.0;  // sign as given by the source data
};

struct Geometry {
    double wingArea = 0.0; // S, m^2
    double wingSpan = 0.0; // b, m
    double mac = 0.0;      // c, m
};

struct DragCoefficients {
    double c0 = 0.0;
    double alpha = 0.0;
    double alphaQ = 0.0;
    double alphaDeltaE = 0.0;
    double alpha2 = 0.0;
    double alpha2Q = 0.0;
    double alpha2DeltaE = 0.0;
    double alpha3 = 0.0;
    double alpha3Q = 0.0;
    double alpha4 = 0.0;
};

struct SideForceCoefficients {
    double beta = 0.0;
    double p = 0.0;
    double r = 0.0;
    double deltaA = 0.0;
    double deltaR = 0.0;
};

struct LiftCoefficients {
    double c0 = 0.0;
    double alpha = 0.0;
    double q = 0.0;
    double deltaE = 0.0;
    double alphaQ = 0.0;
    double alpha2 = 0.0;
    double alpha3 = 0.0;
    double alpha4 = 0.0;
};

struct RollCoefficients {
    double beta = 0.0;
    double p = 0.0;
    double r = 0.0;
    double deltaA = 0.0;
    double deltaR = 0.0;
};

struct PitchCoefficients {
    double c0 = 0.0;
    double alpha = 0.0;
    double q = 0.0;
    double deltaE = 0.0;
    double alphaQ = 0.0;
    double alpha2Q = 0.0;
    double alpha2DeltaE = 0.0;
    double alpha3Q = 0.0;
    double alpha3DeltaE = 0.0;
    double alpha4 = 0.0;
};

struct YawCoefficients {
    double beta = 0.0;
    double p = 0.0;
    double r = 0.0;
    double deltaA = 0.0;
    double deltaR = 0.0;
    double beta2 = 0.0;
    double beta3 = 0.0;
};

/**
 * @brief Stability derivatives grouped by axis. Unset entries contribute nothing.
 */
struct AeroCoefficientSet {
    DragCoefficients drag;
    SideForceCoefficients sideForce;
    LiftCoefficients lift;
    RollCoefficients roll;
    PitchCoefficients pitch;
    YawCoefficients yaw;
};

/**
 * @brief Immutable parameter record for one aircraft.
 *
 * Built once at load time and shared read-only (const reference or
 * shared_ptr<const AircraftParams>) by every evaluation. The constructor
 * rejects non-positive geometry and mass properties with ParameterLoadError.
 */
class AircraftParams {
public:
    AircraftParams(std::string name, const MassProperties& mass, const Geometry& geometry,
                   const AeroCoefficientSet& coefficients);

    const std::string& name() const { return m_name; }
    const MassProperties& mass() const { return m_mass; }
    const Geometry& geometry() const { return m_geometry; }
    const AeroCoefficientSet& coefficients() const { return m_coefficients; }

    // [[ixx, 0, -ixz], [0, iyy, 0], [-ixz, 0, izz]]
    const Mat3& inertiaTensor() const { return m_inertia; }
    const Mat3& inverseInertiaTensor() const { return m_inertiaInv; }

private:
    std::string m_name;
    MassProperties m_mass;
    Geometry m_geometry;
    AeroCoefficientSet m_coefficients;
    Mat3 m_inertia;
    Mat3 m_inertiaInv;
};

} // namespace aerobuild
