// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/binding/bound_hand.hpp"

#include <math_utils/vector_math.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace handbind
{

BoundJoint& BoundHand::joint(JointSlot slot)
{
    return const_cast<BoundJoint&>(static_cast<const BoundHand&>(*this).joint(slot));
}

const BoundJoint& BoundHand::joint(JointSlot slot) const
{
    if (slot == JointSlot::Wrist)
    {
        return wrist;
    }
    if (slot == JointSlot::Elbow)
    {
        return elbow;
    }

    auto finger_bone = get_finger_bone(slot);
    return fingers[to_index(finger_bone->finger)].bound_joints[to_index(finger_bone->bone)];
}

void BoundHand::bind(JointSlot slot, TransformHandle handle, const ITransformSource& transforms)
{
    auto pose = transforms.locate(handle);
    if (!pose)
    {
        throw std::invalid_argument(std::string("Cannot bind ") + to_string(slot) +
                                    ": unknown transform handle " + std::to_string(handle));
    }

    BoundJoint& bound = joint(slot);
    bound.transform = handle;
    bound.start_transform.position = pose->position;
    bound.start_transform.rotation = math_utils::to_euler_degrees(pose->orientation);
    bound.start_transform.scale = { 1.0f, 1.0f, 1.0f };
}

void BoundHand::unbind(JointSlot slot)
{
    joint(slot).transform.reset();
}

size_t BoundHand::bound_count() const
{
    size_t count = 0;
    for (size_t i = 0; i < JOINT_SLOT_COUNT; ++i)
    {
        if (joint(static_cast<JointSlot>(i)).is_bound())
        {
            ++count;
        }
    }
    return count;
}

void clamp_scale_offsets(BoundHand& hand)
{
    hand.scale_offset = std::clamp(hand.scale_offset, SCALE_OFFSET_MIN, SCALE_OFFSET_MAX);
    hand.elbow_offset = std::clamp(hand.elbow_offset, SCALE_OFFSET_MIN, SCALE_OFFSET_MAX);
    for (BoundFinger& finger : hand.fingers)
    {
        finger.fingertip_scale_offset = std::clamp(finger.fingertip_scale_offset, SCALE_OFFSET_MIN, SCALE_OFFSET_MAX);
    }
}

} // namespace handbind
