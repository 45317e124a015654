// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// Synthetic hand joint generation
#pragma once

#include <binding/joint_slot.hpp>
#include <openxr/openxr.h>

#include <array>

namespace plugins
{
namespace synthetic_rig
{

// Forearm length behind the wrist, in meters at scale 1
constexpr float ELBOW_DISTANCE = 0.25f;

class HandGenerator
{
public:
    HandGenerator() = default;
    ~HandGenerator() = default;

    // Generate XR_HAND_JOINT_COUNT_EXT tracked joints in world space from a world-space wrist pose.
    // scale multiplies every joint offset from the wrist.
    void generate(XrHandJointLocationEXT* joints,
                  const XrPosef& wrist_pose,
                  bool is_left_hand,
                  float curl = 0.0f,
                  float scale = 1.0f);

    // World pose of a rig joint for every binding slot, laid out like the tracked hand
    std::array<XrPosef, handbind::JOINT_SLOT_COUNT> generate_rig(const XrPosef& wrist_pose,
                                                                 bool is_left_hand,
                                                                 float curl = 0.0f,
                                                                 float scale = 1.0f);

private:
    struct Vec3
    {
        float x, y, z;
    };

    XrQuaternionf quaternion_look_at(const XrVector3f& direction, const XrVector3f& up);
    void calculate_positions(
        XrHandJointLocationEXT* joints, const XrPosef& wrist_pose, bool is_left_hand, float curl, float scale);
    void calculate_orientations(XrHandJointLocationEXT* joints, const XrPosef& wrist_pose);
};

} // namespace synthetic_rig
} // namespace plugins
