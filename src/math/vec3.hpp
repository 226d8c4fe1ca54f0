#pragma once

#include <nlohmann/json.hpp>
#include <cmath>

namespace aerobuild {

struct Vec3 {
    double x, y, z;

    Vec3(double x = 0, double y = 0, double z = 0) : x(x), y(y), z(z) {}

    // JSON conversion
    friend void to_json(nlohmann::json& j, const Vec3& v) {
        j = nlohmann::json::array({v.x, v.y, v.z});
    }

    bool operator==(const Vec3& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const Vec3& o) const { return !(*this == o); }

    double length() const {
        return std::sqrt(x * x + y * y + z * z);
    }
};

}
