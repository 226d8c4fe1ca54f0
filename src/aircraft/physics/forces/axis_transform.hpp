#pragma once

#include "math/mat3.hpp"
#include "math/vec3.hpp"

namespace aerobuild {

// Direction cosine matrix taking wind-axis components to body axes
// (x forward, y right, z down), sideslip rotation first, then angle of attack.
Mat3 windToBodyMatrix(double alpha, double beta);

// windForce = (D, Y, L) as scalar magnitudes. Drag and lift act along the
// negative wind x and z axes, so the rotated vector is windToBodyMatrix * (-D, Y, -L).
// At alpha = beta = 0 the result is exactly (-D, Y, -L).
Vec3 windToBody(const Vec3& windForce, double alpha, double beta);

}
