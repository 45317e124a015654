// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/retarget/retargeter.hpp"

#include <math_utils/vector_math.hpp>

#include <array>
#include <optional>

namespace handbind
{

namespace
{

using JointPosition = std::optional<XrVector3f>;

// Present only if the joint is bound and its handle still resolves
JointPosition locate_position(const BoundJoint& joint, const ITransformSource& transforms)
{
    if (!joint.transform)
    {
        return std::nullopt;
    }

    auto pose = transforms.locate(*joint.transform);
    if (!pose)
    {
        return std::nullopt;
    }
    return pose->position;
}

// Write the joints, center, direction (prev - next) and length of a bone or arm.
// Width, type and rotation are left as they were.
template <typename Segment>
void set_segment(Segment& segment, const XrVector3f& prev_joint, const XrVector3f& next_joint)
{
    segment.prev_joint = prev_joint;
    segment.next_joint = next_joint;
    segment.center = math_utils::midpoint(prev_joint, next_joint);
    segment.direction = math_utils::subtract(prev_joint, next_joint);
    segment.length = math_utils::length(segment.direction);
}

void retarget_finger(const std::array<JointPosition, BONES_PER_FINGER>& joints,
                     const JointPosition& wrist,
                     float fingertip_scale,
                     Finger& finger)
{
    constexpr size_t metacarpal = to_index(BoneType::Metacarpal);
    constexpr size_t proximal = to_index(BoneType::Proximal);
    constexpr size_t intermediate = to_index(BoneType::Intermediate);
    constexpr size_t distal = to_index(BoneType::Distal);

    for (size_t b = 0; b < BONES_PER_FINGER; ++b)
    {
        Bone& bone = finger.bones[b];

        if (b == distal)
        {
            // No rig joint sits at the fingertip: extend past the distal joint along the tracked
            // bone, by a fraction of the intermediate-to-distal distance
            if (joints[intermediate] && joints[distal])
            {
                const XrVector3f& distal_position = *joints[distal];
                float segment_length = math_utils::distance(*joints[intermediate], distal_position);

                XrVector3f tip_position = math_utils::add(
                    distal_position, math_utils::scale(math_utils::normalize(bone.direction), segment_length * fingertip_scale));

                finger.tip_position = tip_position;
                set_segment(bone, distal_position, tip_position);
            }
            continue;
        }

        if (joints[b] && joints[b + 1])
        {
            set_segment(bone, *joints[b], *joints[b + 1]);
        }
        else if (b == metacarpal)
        {
            // Rigs often lack metacarpals: start the bone halfway between wrist and proximal
            if (joints[proximal] && wrist)
            {
                set_segment(bone, math_utils::midpoint(*wrist, *joints[proximal]), *joints[proximal]);
            }
        }
    }
}

} // namespace

CanonicalHand* retarget(const BoundHand& bound_hand,
                        const ITransformSource& transforms,
                        CanonicalHand* hand,
                        float fingertip_scale)
{
    if (hand == nullptr)
    {
        return hand;
    }

    const JointPosition wrist = locate_position(bound_hand.wrist, transforms);
    const JointPosition elbow = locate_position(bound_hand.elbow, transforms);

    for (size_t f = 0; f < FINGER_COUNT; ++f)
    {
        std::array<JointPosition, BONES_PER_FINGER> joints;
        for (size_t b = 0; b < BONES_PER_FINGER; ++b)
        {
            joints[b] = locate_position(bound_hand.fingers[f].bound_joints[b], transforms);
        }
        retarget_finger(joints, wrist, fingertip_scale, hand->fingers[f]);
    }

    if (wrist)
    {
        hand->wrist_position = *wrist;
        hand->arm.next_joint = *wrist;

        if (elbow)
        {
            set_segment(hand->arm, *elbow, *wrist);
            hand->arm.next_joint = *elbow;
        }
    }

    hand->palm_position = math_utils::midpoint(hand->wrist_position, hand->middle().bone(BoneType::Proximal).prev_joint);
    hand->stabilized_palm_position = hand->palm_position;
    hand->palm_width = math_utils::distance(hand->pinky().bone(BoneType::Proximal).prev_joint,
                                            hand->index().bone(BoneType::Proximal).prev_joint);

    // Final value of the arm's wrist end
    hand->arm.next_joint = hand->wrist_position;

    return hand;
}

CanonicalHand* retarget(const BoundHand& bound_hand,
                        const ITransformSource& transforms,
                        CanonicalHand* hand,
                        const RetargetConfig& config)
{
    return retarget(bound_hand, transforms, hand, config.fingertip_scale);
}

} // namespace handbind
