#include "aircraft/aircraft_params.hpp"
#include "aircraft/params_error.hpp"
#include <utility>

namespace aerobuild {

const char* toString(LoadErrorKind kind) {
    switch (kind) {
        case LoadErrorKind::MissingRequiredField: return "MissingRequiredField";
        case LoadErrorKind::TypeMismatch: return "TypeMismatch";
        case LoadErrorKind::InvalidGeometry: return "InvalidGeometry";
        case LoadErrorKind::InvalidMassProperties: return "InvalidMassProperties";
        case LoadErrorKind::SourceUnavailable: return "SourceUnavailable";
        case LoadErrorKind::MalformedSource: return "MalformedSource";
    }
    return "Unknown";
}

namespace {

void requirePositive(double value, const char* field, LoadErrorKind kind) {
    // Written so that NaN fails too.
    if (!(value > 0.0)) {
        throw ParameterLoadError(kind, std::string(field) + " must be > 0, got " + std::to_string(value));
    }
}

} // namespace

AircraftParams::AircraftParams(std::string name, const MassProperties& mass, const Geometry& geometry,
                               const AeroCoefficientSet& coefficients)
    : m_name(std::move(name))
    , m_mass(mass)
    , m_geometry(geometry)
    , m_coefficients(coefficients)
{
    requirePositive(m_geometry.wingArea, "wing_area", LoadErrorKind::InvalidGeometry);
    requirePositive(m_geometry.wingSpan, "wing_span", LoadErrorKind::InvalidGeometry);
    requirePositive(m_geometry.mac, "mac", LoadErrorKind::InvalidGeometry);

    requirePositive(m_mass.mass, "mass", LoadErrorKind::InvalidMassProperties);
    requirePositive(m_mass.ixx, "ixx", LoadErrorKind::InvalidMassProperties);
    requirePositive(m_mass.iyy, "iyy", LoadErrorKind::InvalidMassProperties);
    requirePositive(m_mass.izz, "izz", LoadErrorKind::InvalidMassProperties);

    // With positive diagonals this is the full positive-definiteness condition.
    double xzDet = m_mass.ixx * m_mass.izz - m_mass.ixz * m_mass.ixz;
    if (!(xzDet > 0.0)) {
        throw ParameterLoadError(LoadErrorKind::InvalidMassProperties,
            "inertia tensor is not positive definite (ixz^2 >= ixx * izz)");
    }

    m_inertia = Mat3::fromRows(
        Vec3(m_mass.ixx, 0.0, -m_mass.ixz),
        Vec3(0.0, m_mass.iyy, 0.0),
        Vec3(-m_mass.ixz, 0.0, m_mass.izz)
    );

    // Block inverse: the y axis decouples from the x-z pair.
    m_inertiaInv = Mat3::fromRows(
        Vec3(m_mass.izz / xzDet, 0.0, m_mass.ixz / xzDet),
        Vec3(0.0, 1.0 / m_mass.iyy, 0.0),
        Vec3(m_mass.ixz / xzDet, 0.0, m_mass.ixx / xzDet)
    );
}

} // namespace aerobuild
