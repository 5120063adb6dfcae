/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ORIENTATION_HPP
#define ORIENTATION_HPP

#include "utils/Vector3D.hpp"
#include <cmath>

// Horizontal facing of an agent. Agents never pitch or roll, so the look
// vector always lies in the XZ plane and has unit length.
class Orientation {
public:
    Orientation() : m_look(0.0f, 0.0f, -1.0f) {}
    explicit Orientation(const Vector3D& look) : m_look(0.0f, 0.0f, -1.0f) { setLook(look); }

    const Vector3D& getLookVector() const { return m_look; }

    // Ignores zero and purely vertical directions, keeping the old facing
    void setLook(const Vector3D& direction) {
        Vector3D flat = direction.flattened();
        if (flat.lengthSquared() < 0.0001f) return;
        m_look = flat.normalized();
    }

    // Rotation about Y, radians, 0 facing -Z
    float getYaw() const { return std::atan2(-m_look.getX(), -m_look.getZ()); }

    static Orientation fromYaw(float yaw) {
        return Orientation(Vector3D(-std::sin(yaw), 0.0f, -std::cos(yaw)));
    }

    static Orientation lookAt(const Vector3D& from, const Vector3D& to) {
        Orientation o;
        o.setLook(to - from);
        return o;
    }

    bool operator==(const Orientation& other) const { return m_look == other.m_look; }
    bool operator!=(const Orientation& other) const { return !(*this == other); }

private:
    Vector3D m_look;
};

#endif // ORIENTATION_HPP
