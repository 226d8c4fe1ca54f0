#include <gtest/gtest.h>
#include "aircraft/physics/forces/axis_transform.hpp"
#include <cmath>

using namespace aerobuild;

namespace {
constexpr double EPSILON = 1e-12;
constexpr double PI = 3.14159265358979323846;
}

TEST(AxisTransformTest, ZeroAnglesReduceToCanonicalAlignment) {
    const double D = 1234.5;
    const double L = 98765.25;
    Vec3 body = windToBody(Vec3(D, 0.0, L), 0.0, 0.0);
    EXPECT_EQ(body.x, -D);
    EXPECT_EQ(body.y, 0.0);
    EXPECT_EQ(body.z, -L);
}

TEST(AxisTransformTest, ZeroAnglesPassSideForceThrough) {
    Vec3 body = windToBody(Vec3(10.0, -42.0, 20.0), 0.0, 0.0);
    EXPECT_EQ(body.x, -10.0);
    EXPECT_EQ(body.y, -42.0);
    EXPECT_EQ(body.z, -20.0);
}

TEST(AxisTransformTest, MatchesExpandedFormula) {
    const double D = 500.0, Y = -120.0, L = 8000.0;
    for (double alpha : {-0.2, 0.05, 0.3, 0.9}) {
        for (double beta : {-0.3, 0.0, 0.1, 0.25}) {
            double ca = std::cos(alpha), sa = std::sin(alpha);
            double cb = std::cos(beta), sb = std::sin(beta);
            Vec3 body = windToBody(Vec3(D, Y, L), alpha, beta);
            EXPECT_NEAR(body.x, ca * cb * -D + (-ca * sb) * Y + (-sa) * -L, 1e-9);
            EXPECT_NEAR(body.y, sb * -D + cb * Y, 1e-9);
            EXPECT_NEAR(body.z, sa * cb * -D + (-sa * sb) * Y + ca * -L, 1e-9);
        }
    }
}

TEST(AxisTransformTest, RotationPreservesMagnitude) {
    Vec3 wind(300.0, 45.0, 6000.0);
    Vec3 body = windToBody(wind, 0.35, -0.12);
    EXPECT_NEAR(body.length(), wind.length(), 1e-9);
}

TEST(AxisTransformTest, MatrixIsOrthonormal) {
    Mat3 m = windToBodyMatrix(0.4, 0.2);
    Mat3 product = m * m.transposed();
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            EXPECT_NEAR(product(row, col), row == col ? 1.0 : 0.0, EPSILON);
        }
    }
    EXPECT_NEAR(m.determinant(), 1.0, EPSILON);
}

TEST(AxisTransformTest, PureAngleOfAttackTiltsLiftForward) {
    // At 90 degrees alpha the lift vector lies along body +x and drag along -z.
    Vec3 body = windToBody(Vec3(1.0, 0.0, 2.0), PI / 2.0, 0.0);
    EXPECT_NEAR(body.x, 2.0, EPSILON);
    EXPECT_NEAR(body.y, 0.0, EPSILON);
    EXPECT_NEAR(body.z, -1.0, EPSILON);
}

TEST(AxisTransformTest, PureSideslipMixesDragIntoSideAxis) {
    double beta = 0.2;
    Vec3 body = windToBody(Vec3(100.0, 0.0, 0.0), 0.0, beta);
    EXPECT_NEAR(body.x, -100.0 * std::cos(beta), EPSILON);
    EXPECT_NEAR(body.y, -100.0 * std::sin(beta), EPSILON);
    EXPECT_NEAR(body.z, 0.0, EPSILON);
}
