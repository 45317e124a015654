// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// Synthetic hand joint generation

#include <algorithm>
#include <cmath>
#include <math_utils/vector_math.hpp>
#include <skeleton/openxr_conversion.hpp>
#include <synthetic_rig/hand_generator.hpp>

namespace plugins
{
namespace synthetic_rig
{

void HandGenerator::generate(
    XrHandJointLocationEXT* joints, const XrPosef& wrist_pose, bool is_left_hand, float curl, float scale)
{
    calculate_positions(joints, wrist_pose, is_left_hand, curl, scale);
    calculate_orientations(joints, wrist_pose);
}

std::array<XrPosef, handbind::JOINT_SLOT_COUNT> HandGenerator::generate_rig(const XrPosef& wrist_pose,
                                                                            bool is_left_hand,
                                                                            float curl,
                                                                            float scale)
{
    XrHandJointLocationEXT joints[XR_HAND_JOINT_COUNT_EXT] = {};
    generate(joints, wrist_pose, is_left_hand, curl, scale);

    std::array<XrPosef, handbind::JOINT_SLOT_COUNT> rig{};

    // A rig joint sits at the start of the canonical bone it drives
    for (size_t f = 0; f < handbind::FINGER_COUNT; ++f)
    {
        for (size_t b = 0; b < handbind::BONES_PER_FINGER; ++b)
        {
            auto slot = handbind::get_joint_slot(static_cast<handbind::FingerType>(f), static_cast<handbind::BoneType>(b));
            rig[handbind::to_index(slot)] = joints[handbind::OPENXR_FINGER_CHAINS[f][b]].pose;
        }
    }

    rig[handbind::to_index(handbind::JointSlot::Wrist)] = joints[XR_HAND_JOINT_WRIST_EXT].pose;

    // Fingers point along -Z from the wrist, so the elbow sits along +Z
    XrPosef elbow = wrist_pose;
    elbow.position = math_utils::add(
        wrist_pose.position, math_utils::rotate_vector({ 0.0f, 0.0f, ELBOW_DISTANCE * scale }, wrist_pose.orientation));
    rig[handbind::to_index(handbind::JointSlot::Elbow)] = elbow;

    return rig;
}

void HandGenerator::calculate_positions(
    XrHandJointLocationEXT* joints, const XrPosef& wrist_pose, bool is_left_hand, float curl, float scale)
{
    // Joint offsets in meters - OpenXR coordinate system: X+ = right, Y+ = up, Z- = forward
    // Left hand: X+ = thumb side, Y+ = back of hand, Z- = direction the fingers point
    const Vec3 offsets[XR_HAND_JOINT_COUNT_EXT] = { { 0.0f, 0.015f, -0.035f }, // Palm
                                                    { 0.0f, 0.0f, 0.0f }, // Wrist
                                                    // Thumb
                                                    { 0.025f, 0.005f, -0.015f },
                                                    { 0.035f, 0.010f, -0.030f },
                                                    { 0.040f, 0.012f, -0.050f },
                                                    { 0.042f, 0.013f, -0.062f },
                                                    // Index
                                                    { 0.018f, 0.003f, -0.055f },
                                                    { 0.020f, 0.000f, -0.095f },
                                                    { 0.020f, 0.000f, -0.125f },
                                                    { 0.019f, 0.000f, -0.145f },
                                                    { 0.019f, 0.000f, -0.155f },
                                                    // Middle
                                                    { 0.005f, 0.002f, -0.055f },
                                                    { 0.005f, 0.000f, -0.100f },
                                                    { 0.005f, 0.000f, -0.135f },
                                                    { 0.005f, 0.000f, -0.160f },
                                                    { 0.005f, 0.000f, -0.175f },
                                                    // Ring
                                                    { -0.008f, 0.003f, -0.055f },
                                                    { -0.010f, 0.000f, -0.095f },
                                                    { -0.012f, 0.000f, -0.128f },
                                                    { -0.013f, 0.000f, -0.150f },
                                                    { -0.014f, 0.000f, -0.163f },
                                                    // Little
                                                    { -0.022f, 0.005f, -0.050f },
                                                    { -0.025f, 0.000f, -0.080f },
                                                    { -0.027f, 0.000f, -0.103f },
                                                    { -0.029f, 0.000f, -0.120f },
                                                    { -0.030f, 0.000f, -0.130f } };

    const float curl_clamped = std::clamp(curl, 0.0f, 1.0f);

    Vec3 local[XR_HAND_JOINT_COUNT_EXT];
    std::copy(std::begin(offsets), std::end(offsets), std::begin(local));

    // Thumb: METACARPAL, PROXIMAL, DISTAL, TIP follow each other in the joint set
    for (int segment = 0; segment < 4; ++segment)
    {
        Vec3& offset = local[XR_HAND_JOINT_THUMB_METACARPAL_EXT + segment];
        float curl_amount = curl_clamped * (0.2f + 0.1f * segment);
        offset.z += curl_amount * 0.03f;
        offset.x *= (1.0f - curl_clamped * 0.3f);
    }

    // Other fingers: METACARPAL .. TIP, pulled back toward the palm and bent downward
    for (size_t f = 1; f < handbind::FINGER_COUNT; ++f)
    {
        const auto& chain = handbind::OPENXR_FINGER_CHAINS[f];
        for (size_t segment = 0; segment < chain.size(); ++segment)
        {
            Vec3& offset = local[chain[segment]];
            float curl_amount = curl_clamped * (0.3f + 0.15f * segment);
            offset.z += curl_amount * 0.04f;
            offset.y -= curl_amount * 0.02f * segment;
        }
    }

    for (int i = 0; i < XR_HAND_JOINT_COUNT_EXT; i++)
    {
        float x = is_left_hand ? local[i].x : -local[i].x;
        XrVector3f offset_vec = math_utils::scale({ x, local[i].y, local[i].z }, scale);

        joints[i].pose.position =
            math_utils::add(wrist_pose.position, math_utils::rotate_vector(offset_vec, wrist_pose.orientation));
        joints[i].pose.orientation = wrist_pose.orientation;
        joints[i].locationFlags = XR_SPACE_LOCATION_POSITION_VALID_BIT | XR_SPACE_LOCATION_ORIENTATION_VALID_BIT |
                                  XR_SPACE_LOCATION_POSITION_TRACKED_BIT | XR_SPACE_LOCATION_ORIENTATION_TRACKED_BIT;
    }

    // Radii shrink toward the fingertips
    joints[XR_HAND_JOINT_PALM_EXT].radius = 0.015f * scale;
    joints[XR_HAND_JOINT_WRIST_EXT].radius = 0.015f * scale;
    const float chain_radii[] = { 0.012f, 0.012f, 0.010f, 0.008f, 0.006f };
    for (const auto& chain : handbind::OPENXR_FINGER_CHAINS)
    {
        for (size_t segment = 0; segment < chain.size(); ++segment)
        {
            joints[chain[segment]].radius = chain_radii[segment] * scale;
        }
    }
}

void HandGenerator::calculate_orientations(XrHandJointLocationEXT* joints, const XrPosef& wrist_pose)
{
    XrVector3f hand_up = math_utils::rotate_vector({ 0.0f, 1.0f, 0.0f }, wrist_pose.orientation);

    for (const auto& chain : handbind::OPENXR_FINGER_CHAINS)
    {
        for (size_t segment = 0; segment + 1 < chain.size(); ++segment)
        {
            // The thumb chain repeats its metacarpal joint
            if (chain[segment] == chain[segment + 1])
                continue;

            XrVector3f dir = math_utils::subtract(joints[chain[segment + 1]].pose.position, joints[chain[segment]].pose.position);
            joints[chain[segment]].pose.orientation = quaternion_look_at(dir, hand_up);
        }

        joints[chain.back()].pose.orientation = joints[chain[chain.size() - 2]].pose.orientation;
    }

    XrVector3f palm_dir = math_utils::subtract(
        joints[XR_HAND_JOINT_MIDDLE_METACARPAL_EXT].pose.position, joints[XR_HAND_JOINT_PALM_EXT].pose.position);
    joints[XR_HAND_JOINT_PALM_EXT].pose.orientation = quaternion_look_at(palm_dir, hand_up);
}

XrQuaternionf HandGenerator::quaternion_look_at(const XrVector3f& direction, const XrVector3f& up)
{
    float dir_len = math_utils::length(direction);
    if (dir_len < 0.0001f)
        return { 0.0f, 0.0f, 0.0f, 1.0f };

    XrVector3f forward = math_utils::scale(direction, 1.0f / dir_len);
    XrVector3f right = { up.y * forward.z - up.z * forward.y, up.z * forward.x - up.x * forward.z,
                         up.x * forward.y - up.y * forward.x };

    float right_len = math_utils::length(right);
    if (right_len < 0.0001f)
        right = { 1.0f, 0.0f, 0.0f };
    else
        right = math_utils::scale(right, 1.0f / right_len);

    XrVector3f actual_up = { forward.y * right.z - forward.z * right.y, forward.z * right.x - forward.x * right.z,
                             forward.x * right.y - forward.y * right.x };

    float m00 = right.x, m01 = right.y, m02 = right.z;
    float m10 = actual_up.x, m11 = actual_up.y, m12 = actual_up.z;
    float m20 = forward.x, m21 = forward.y, m22 = forward.z;

    float trace = m00 + m11 + m22;
    XrQuaternionf q;

    if (trace > 0.0f)
    {
        float s = 0.5f / std::sqrt(trace + 1.0f);
        q.w = 0.25f / s;
        q.x = (m21 - m12) * s;
        q.y = (m02 - m20) * s;
        q.z = (m10 - m01) * s;
    }
    else if (m00 > m11 && m00 > m22)
    {
        float s = 2.0f * std::sqrt(1.0f + m00 - m11 - m22);
        q.w = (m21 - m12) / s;
        q.x = 0.25f * s;
        q.y = (m01 + m10) / s;
        q.z = (m02 + m20) / s;
    }
    else if (m11 > m22)
    {
        float s = 2.0f * std::sqrt(1.0f + m11 - m00 - m22);
        q.w = (m02 - m20) / s;
        q.x = (m01 + m10) / s;
        q.y = 0.25f * s;
        q.z = (m12 + m21) / s;
    }
    else
    {
        float s = 2.0f * std::sqrt(1.0f + m22 - m00 - m11);
        q.w = (m10 - m01) / s;
        q.x = (m02 + m20) / s;
        q.y = (m12 + m21) / s;
        q.z = 0.25f * s;
    }

    return q;
}

} // namespace synthetic_rig
} // namespace plugins
