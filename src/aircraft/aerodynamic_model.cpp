#include "aircraft/aerodynamic_model.hpp"
#include <stdexcept>
#include <utility>

namespace aerobuild {

StabilityDerivativeModel::StabilityDerivativeModel(std::shared_ptr<const AircraftParams> params)
    : m_params(std::move(params))
{
    if (!m_params) {
        throw std::invalid_argument("StabilityDerivativeModel requires aircraft parameters");
    }
}

AeroCoefficients StabilityDerivativeModel::coefficients(const FlightState& state) const {
    return computeCoefficients(*m_params, state);
}

AeroForces StabilityDerivativeModel::evaluate(const FlightState& state, double airDensity) const {
    return aerobuild::evaluate(*m_params, state, airDensity);
}

}
