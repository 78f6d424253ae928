/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_3D_HPP
#define VECTOR_3D_HPP

#include <cmath>
#include <ostream>

// A simple 3D vector class, +Y is up
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

    // Exact comparison; a default-constructed vector is zero
    bool isZero() const { return m_x == 0.0f && m_y == 0.0f && m_z == 0.0f; }

    // Degenerate vectors normalize to +X
    Vector3D normalized() const {
        float lenSq = lengthSquared();
        if (lenSq < 0.0001f) return Vector3D(1.0f, 0.0f, 0.0f);
        float invLen = 1.0f / std::sqrt(lenSq);
        return Vector3D(m_x * invLen, m_y * invLen, m_z * invLen);
    }

    float dot(const Vector3D& v2) const {
        return m_x * v2.m_x + m_y * v2.m_y + m_z * v2.m_z;
    }

    /**
     * Rotate about the vertical (+Y) axis. Positive angles turn +Z towards +X,
     * the same convention as a quaternion built with RotateY(radians).
     */
    Vector3D rotatedY(float radians) const {
        float c = std::cos(radians);
        float s = std::sin(radians);
        return Vector3D(m_x * c + m_z * s, m_y, -m_x * s + m_z * c);
    }

    // Operator overloads
    Vector3D operator+(const Vector3D& v2) const {
        return Vector3D(m_x + v2.m_x, m_y + v2.m_y, m_z + v2.m_z);
    }

    Vector3D& operator+=(const Vector3D& v2) {
        m_x += v2.m_x;
        m_y += v2.m_y;
        m_z += v2.m_z;
        return *this;
    }

    Vector3D operator-(const Vector3D& v2) const {
        return Vector3D(m_x - v2.m_x, m_y - v2.m_y, m_z - v2.m_z);
    }

    Vector3D& operator-=(const Vector3D& v2) {
        m_x -= v2.m_x;
        m_y -= v2.m_y;
        m_z -= v2.m_z;
        return *this;
    }

    Vector3D operator-() const { return Vector3D(-m_x, -m_y, -m_z); }

    Vector3D operator*(float scalar) const {
        return Vector3D(m_x * scalar, m_y * scalar, m_z * scalar);
    }

    Vector3D& operator*=(float scalar) {
        m_x *= scalar;
        m_y *= scalar;
        m_z *= scalar;
        return *this;
    }

    Vector3D operator/(float scalar) const {
        return Vector3D(m_x / scalar, m_y / scalar, m_z / scalar);
    }

    bool operator==(const Vector3D& v2) const {
        return m_x == v2.m_x && m_y == v2.m_y && m_z == v2.m_z;
    }

    bool operator!=(const Vector3D& v2) const { return !(*this == v2); }

private:
    float m_x{0.0f};
    float m_y{0.0f};
    float m_z{0.0f};
};

// Stream output for logging and Boost.Test diagnostics
inline std::ostream& operator<<(std::ostream& os, const Vector3D& v) {
    return os << "(" << v.getX() << ", " << v.getY() << ", " << v.getZ() << ")";
}

#endif  // VECTOR_3D_HPP
