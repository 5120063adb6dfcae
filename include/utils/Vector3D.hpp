/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_3D_HPP
#define VECTOR_3D_HPP

#include <cmath>
#include <format>
#include <ostream>

// World-space vector. Y is up; the ground plane is XZ.
class Vector3D {
public:
    // Constructors
    Vector3D() : m_x(0.0f), m_y(0.0f), m_z(0.0f) {}
    Vector3D(float x, float y, float z) : m_x(x), m_y(y), m_z(z) {}

    // Getters and setters
    float getX() const { return m_x; }
    float getY() const { return m_y; }
    float getZ() const { return m_z; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }
    void setZ(float z) { m_z = z; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y + m_z * m_z; }

    Vector3D normalized() const {
        float lenSq = lengthSquared();
        if (lenSq < 0.0001f) return Vector3D(0.0f, 0.0f, 0.0f);
        float invLen = 1.0f / std::sqrt(lenSq);
        return Vector3D(m_x * invLen, m_y * invLen, m_z * invLen);
    }

    float dot(const Vector3D& v2) const {
        return m_x * v2.m_x + m_y * v2.m_y + m_z * v2.m_z;
    }

    // Same vector with the vertical component removed
    Vector3D flattened() const { return Vector3D(m_x, 0.0f, m_z); }

    // Same point moved to height y
    Vector3D withY(float y) const { return Vector3D(m_x, y, m_z); }

    // Operator overloads
    Vector3D operator+(const Vector3D& v2) const {
        return Vector3D(m_x + v2.m_x, m_y + v2.m_y, m_z + v2.m_z);
    }

    friend Vector3D& operator+=(Vector3D& v1, const Vector3D& v2) {
        v1.m_x += v2.m_x;
        v1.m_y += v2.m_y;
        v1.m_z += v2.m_z;
        return v1;
    }

    Vector3D operator*(float scalar) const {
        return Vector3D(m_x * scalar, m_y * scalar, m_z * scalar);
    }

    Vector3D& operator*=(float scalar) {
        m_x *= scalar;
        m_y *= scalar;
        m_z *= scalar;
        return *this;
    }

    Vector3D operator-(const Vector3D& v2) const {
        return Vector3D(m_x - v2.m_x, m_y - v2.m_y, m_z - v2.m_z);
    }

    friend Vector3D& operator-=(Vector3D& v1, const Vector3D& v2) {
        v1.m_x -= v2.m_x;
        v1.m_y -= v2.m_y;
        v1.m_z -= v2.m_z;
        return v1;
    }

    Vector3D operator/(float scalar) const {
        return Vector3D(m_x / scalar, m_y / scalar, m_z / scalar);
    }

    bool operator==(const Vector3D& v2) const {
        return m_x == v2.m_x && m_y == v2.m_y && m_z == v2.m_z;
    }
    bool operator!=(const Vector3D& v2) const { return !(*this == v2); }

    static float distanceSquared(const Vector3D& a, const Vector3D& b) {
        float dx = a.m_x - b.m_x;
        float dy = a.m_y - b.m_y;
        float dz = a.m_z - b.m_z;
        return dx * dx + dy * dy + dz * dz;
    }

    static float distance(const Vector3D& a, const Vector3D& b) {
        return std::sqrt(distanceSquared(a, b));
    }

    // Distance on the ground plane, ignoring height
    static float horizontalDistance(const Vector3D& a, const Vector3D& b) {
        float dx = a.m_x - b.m_x;
        float dz = a.m_z - b.m_z;
        return std::sqrt(dx * dx + dz * dz);
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
    float m_z{0.0f};
};

// Stream operator for test output
inline std::ostream& operator<<(std::ostream& os, const Vector3D& v) {
    return os << "(" << v.getX() << ", " << v.getY() << ", " << v.getZ() << ")";
}

template <>
struct std::formatter<Vector3D> : std::formatter<std::string_view> {
    auto format(const Vector3D& v, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "({:.2f}, {:.2f}, {:.2f})",
                              v.getX(), v.getY(), v.getZ());
    }
};

#endif  // VECTOR_3D_HPP
