#pragma once

#include "aircraft/aircraft_params.hpp"
#include "aircraft/physics/coefficient_buildup.hpp"
#include "aircraft/physics/flight_state.hpp"
#include "aircraft/physics/forces/force_moment_assembly.hpp"
#include <memory>

namespace aerobuild {

class AerodynamicModel {
public:
    virtual ~AerodynamicModel() = default;
    virtual const char* name() const = 0;
    virtual AeroCoefficients coefficients(const FlightState& state) const = 0;
    virtual AeroForces evaluate(const FlightState& state, double airDensity) const = 0;
};

/**
 * @brief Polynomial stability-derivative model over a shared, immutable record.
 *
 * Holds no mutable state, so one instance (or many instances sharing one
 * record) may be evaluated from several threads without locking.
 */
class StabilityDerivativeModel : public AerodynamicModel {
public:
    explicit StabilityDerivativeModel(std::shared_ptr<const AircraftParams> params);

    const char* name() const override { return "StabilityDerivativeModel"; }
    AeroCoefficients coefficients(const FlightState& state) const override;
    AeroForces evaluate(const FlightState& state, double airDensity) const override;

    const AircraftParams& params() const { return *m_params; }

private:
    std::shared_ptr<const AircraftParams> m_params;
};

}
