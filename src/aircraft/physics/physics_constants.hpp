#pragma once

namespace aerobuild {

namespace PhysicsConstants {

constexpr double SEA_LEVEL_DENSITY = 1.225;

// At or below this airspeed (m/s) the non-dimensional rates are taken as zero.
constexpr double AIRSPEED_EPSILON = 1e-3;

}

}
