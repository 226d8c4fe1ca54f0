#pragma once

#include "math/vec3.hpp"

namespace aerobuild {

// Row-major 3x3 matrix, m[row * 3 + col].
struct Mat3 {
    double m[9] = {1, 0, 0, 0, 1, 0, 0, 0, 1};

    static Mat3 fromRows(const Vec3& r0, const Vec3& r1, const Vec3& r2) {
        Mat3 r;
        r.m[0] = r0.x; r.m[1] = r0.y; r.m[2] = r0.z;
        r.m[3] = r1.x; r.m[4] = r1.y; r.m[5] = r1.z;
        r.m[6] = r2.x; r.m[7] = r2.y; r.m[8] = r2.z;
        return r;
    }

    double operator()(int row, int col) const { return m[row * 3 + col]; }

    Mat3 operator*(const Mat3& o) const {
        Mat3 r;
        for (int row = 0; row < 3; ++row) {
            for (int col = 0; col < 3; ++col) {
                r.m[row * 3 + col] = m[row * 3 + 0] * o.m[0 * 3 + col]
                                   + m[row * 3 + 1] * o.m[1 * 3 + col]
                                   + m[row * 3 + 2] * o.m[2 * 3 + col];
            }
        }
        return r;
    }

    Vec3 operator*(const Vec3& v) const {
        return Vec3(
            m[0] * v.x + m[1] * v.y + m[2] * v.z,
            m[3] * v.x + m[4] * v.y + m[5] * v.z,
            m[6] * v.x + m[7] * v.y + m[8] * v.z
        );
    }

    Mat3 transposed() const {
        Mat3 r;
        for (int row = 0; row < 3; ++row) {
            for (int col = 0; col < 3; ++col) {
                r.m[col * 3 + row] = m[row * 3 + col];
            }
        }
        return r;
    }

    double determinant() const {
        return m[0] * (m[4] * m[8] - m[5] * m[7])
             - m[1] * (m[3] * m[8] - m[5] * m[6])
             + m[2] * (m[3] * m[7] - m[4] * m[6]);
    }
};

}
