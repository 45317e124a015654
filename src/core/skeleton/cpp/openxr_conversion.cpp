// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/skeleton/openxr_conversion.hpp"

#include <math_utils/vector_math.hpp>

#include <stdexcept>

namespace handbind
{

namespace
{

constexpr XrSpaceLocationFlags VALID_TRACKED_FLAGS =
    XR_SPACE_LOCATION_POSITION_VALID_BIT | XR_SPACE_LOCATION_ORIENTATION_VALID_BIT |
    XR_SPACE_LOCATION_POSITION_TRACKED_BIT | XR_SPACE_LOCATION_ORIENTATION_TRACKED_BIT;

void write_joint(XrHandJointLocationEXT& joint, const XrVector3f& position, const XrQuaternionf& orientation, float radius)
{
    joint.pose.position = position;
    joint.pose.orientation = orientation;
    joint.radius = radius;
    joint.locationFlags = VALID_TRACKED_FLAGS;
}

} // namespace

CanonicalHand from_openxr_joints(const XrHandJointLocationEXT* joints)
{
    if (joints == nullptr)
    {
        throw std::invalid_argument("from_openxr_joints: joints must not be null");
    }

    CanonicalHand hand;

    for (size_t f = 0; f < FINGER_COUNT; ++f)
    {
        const auto& chain = OPENXR_FINGER_CHAINS[f];
        Finger& finger = hand.fingers[f];

        for (size_t b = 0; b < BONES_PER_FINGER; ++b)
        {
            const XrHandJointLocationEXT& prev = joints[chain[b]];
            const XrHandJointLocationEXT& next = joints[chain[b + 1]];

            Bone& bone = finger.bones[b];
            bone.prev_joint = prev.pose.position;
            bone.next_joint = next.pose.position;
            bone.center = math_utils::midpoint(prev.pose.position, next.pose.position);
            XrVector3f span = math_utils::subtract(next.pose.position, prev.pose.position);
            bone.direction = math_utils::normalize(span);
            bone.length = math_utils::length(span);
            bone.width = prev.radius * 2.0f;
            bone.rotation = prev.pose.orientation;
        }

        finger.tip_position = joints[chain[BONES_PER_FINGER]].pose.position;
    }

    const XrHandJointLocationEXT& wrist = joints[XR_HAND_JOINT_WRIST_EXT];
    const XrHandJointLocationEXT& palm = joints[XR_HAND_JOINT_PALM_EXT];

    hand.wrist_position = wrist.pose.position;
    hand.palm_position = palm.pose.position;
    hand.stabilized_palm_position = palm.pose.position;
    hand.palm_width = math_utils::distance(hand.index().bone(BoneType::Proximal).prev_joint,
                                           hand.pinky().bone(BoneType::Proximal).prev_joint);

    hand.arm.prev_joint = wrist.pose.position;
    hand.arm.next_joint = wrist.pose.position;
    hand.arm.center = wrist.pose.position;
    hand.arm.direction = { 0.0f, 0.0f, 0.0f };
    hand.arm.length = 0.0f;
    hand.arm.width = wrist.radius * 2.0f;
    hand.arm.rotation = wrist.pose.orientation;

    return hand;
}

void to_openxr_joints(const CanonicalHand& hand, XrHandJointLocationEXT* out_joints)
{
    if (out_joints == nullptr)
    {
        throw std::invalid_argument("to_openxr_joints: out_joints must not be null");
    }

    for (size_t f = 0; f < FINGER_COUNT; ++f)
    {
        const auto& chain = OPENXR_FINGER_CHAINS[f];
        const Finger& finger = hand.fingers[f];

        // The thumb metacarpal shares its joint with the thumb proximal bone, which is written last
        for (size_t b = 0; b < BONES_PER_FINGER; ++b)
        {
            const Bone& bone = finger.bones[b];
            write_joint(out_joints[chain[b]], bone.prev_joint, bone.rotation, bone.width * 0.5f);
        }

        const Bone& distal = finger.bone(BoneType::Distal);
        write_joint(out_joints[chain[BONES_PER_FINGER]], distal.next_joint, distal.rotation, distal.width * 0.5f);
    }

    const Bone& middle_metacarpal = hand.middle().bone(BoneType::Metacarpal);
    write_joint(out_joints[XR_HAND_JOINT_PALM_EXT], hand.palm_position, middle_metacarpal.rotation,
                middle_metacarpal.width * 0.5f);
    write_joint(out_joints[XR_HAND_JOINT_WRIST_EXT], hand.wrist_position, hand.arm.rotation, hand.arm.width * 0.5f);
}

} // namespace handbind
