// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <openxr/openxr.h>

#include <algorithm>
#include <cmath>

namespace math_utils
{

constexpr XrVector3f add(const XrVector3f& a, const XrVector3f& b)
{
    return { a.x + b.x, a.y + b.y, a.z + b.z };
}

constexpr XrVector3f subtract(const XrVector3f& a, const XrVector3f& b)
{
    return { a.x - b.x, a.y - b.y, a.z - b.z };
}

constexpr XrVector3f scale(const XrVector3f& v, float s)
{
    return { v.x * s, v.y * s, v.z * s };
}

constexpr float dot(const XrVector3f& a, const XrVector3f& b)
{
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

// Linear interpolation, t is not clamped
constexpr XrVector3f lerp(const XrVector3f& a, const XrVector3f& b, float t)
{
    return { a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t, a.z + (b.z - a.z) * t };
}

constexpr XrVector3f midpoint(const XrVector3f& a, const XrVector3f& b)
{
    return lerp(a, b, 0.5f);
}

inline float length(const XrVector3f& v)
{
    return std::sqrt(dot(v, v));
}

inline float distance(const XrVector3f& a, const XrVector3f& b)
{
    return length(subtract(a, b));
}

// Unit vector along v, or the zero vector when v is degenerate
inline XrVector3f normalize(const XrVector3f& v)
{
    float len = length(v);
    if (len < 1e-6f)
        return { 0.0f, 0.0f, 0.0f };
    return scale(v, 1.0f / len);
}

constexpr XrVector3f rotate_vector(const XrVector3f& v, const XrQuaternionf& q)
{
    // t = 2 * cross(q.xyz, v)
    float tx = 2.0f * (q.y * v.z - q.z * v.y);
    float ty = 2.0f * (q.z * v.x - q.x * v.z);
    float tz = 2.0f * (q.x * v.y - q.y * v.x);

    // v' = v + q.w * t + cross(q.xyz, t)
    return { v.x + q.w * tx + (q.y * tz - q.z * ty), v.y + q.w * ty + (q.z * tx - q.x * tz),
             v.z + q.w * tz + (q.x * ty - q.y * tx) };
}

// Euler angles in degrees (x = roll, y = pitch, z = yaw)
inline XrVector3f to_euler_degrees(const XrQuaternionf& q)
{
    constexpr float rad_to_deg = 57.29577951308232f;

    float sinr_cosp = 2.0f * (q.w * q.x + q.y * q.z);
    float cosr_cosp = 1.0f - 2.0f * (q.x * q.x + q.y * q.y);
    float roll = std::atan2(sinr_cosp, cosr_cosp);

    float sinp = std::clamp(2.0f * (q.w * q.y - q.z * q.x), -1.0f, 1.0f);
    float pitch = std::asin(sinp);

    float siny_cosp = 2.0f * (q.w * q.z + q.x * q.y);
    float cosy_cosp = 1.0f - 2.0f * (q.y * q.y + q.z * q.z);
    float yaw = std::atan2(siny_cosp, cosy_cosp);

    return { roll * rad_to_deg, pitch * rad_to_deg, yaw * rad_to_deg };
}

} // namespace math_utils
