#include "aircraft/physics/forces/axis_transform.hpp"
#include <cmath>

namespace aerobuild {

Mat3 windToBodyMatrix(double alpha, double beta) {
    double ca = std::cos(alpha);
    double sa = std::sin(alpha);
    double cb = std::cos(beta);
    double sb = std::sin(beta);

    return Mat3::fromRows(
        Vec3(ca * cb, -ca * sb, -sa),
        Vec3(sb, cb, 0.0),
        Vec3(sa * cb, -sa * sb, ca)
    );
}

Vec3 windToBody(const Vec3& windForce, double alpha, double beta) {
    Vec3 wind(-windForce.x, windForce.y, -windForce.z);
    return windToBodyMatrix(alpha, beta) * wind;
}

}
