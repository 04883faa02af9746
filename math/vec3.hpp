#ifndef TETRIS_MATH_VEC3_HPP
#define TETRIS_MATH_VEC3_HPP

#include <cmath>
#include <cstddef>

namespace tetris {

struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Vec3() = default;
    constexpr Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    // Arithmetic operators
    constexpr Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    constexpr Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    constexpr Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vec3 operator/(double scalar) const {
        return {x / scalar, y / scalar, z / scalar};
    }

    // Dot product
    constexpr double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    // Cross product
    constexpr Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    constexpr double length_squared() const {
        return x * x + y * y + z * z;
    }

    double length() const {
        return std::sqrt(length_squared());
    }

    double distance_to(const Vec3& other) const {
        return (*this - other).length();
    }

    // Exact component-wise comparison
    constexpr bool operator==(const Vec3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    constexpr bool operator!=(const Vec3& other) const {
        return !(*this == other);
    }

    constexpr bool is_zero() const {
        return x == 0.0 && y == 0.0 && z == 0.0;
    }

    constexpr double operator[](size_t i) const {
        if (i == 0) return x;
        if (i == 1) return y;
        return z;
    }
};

// Three points are collinear when (a - b) x (a - c) vanishes.
constexpr bool collinear(const Vec3& a, const Vec3& b, const Vec3& c) {
    return (a - b).cross(a - c).is_zero();
}

// Rotate `p` about `origin`: roll about x, then pitch about y, then yaw
// about z. Angles in radians.
inline Vec3 rotate_euler(const Vec3& p, double yaw, double pitch, double roll,
                         const Vec3& origin = {}) {
    Vec3 d = p - origin;

    double c = std::cos(roll), s = std::sin(roll);
    d = {d.x, c * d.y - s * d.z, s * d.y + c * d.z};

    c = std::cos(pitch); s = std::sin(pitch);
    d = {c * d.x + s * d.z, d.y, -s * d.x + c * d.z};

    c = std::cos(yaw); s = std::sin(yaw);
    d = {c * d.x - s * d.y, s * d.x + c * d.y, d.z};

    return d + origin;
}

namespace vec3 {
    constexpr Vec3 zero() { return {0.0, 0.0, 0.0}; }
    constexpr Vec3 unit_x() { return {1.0, 0.0, 0.0}; }
    constexpr Vec3 unit_y() { return {0.0, 1.0, 0.0}; }
    constexpr Vec3 unit_z() { return {0.0, 0.0, 1.0}; }
}

}  // namespace tetris

#endif // TETRIS_MATH_VEC3_HPP
