// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/binding/joint_slot.hpp"

#include <stdexcept>
#include <string>

namespace handbind
{

std::optional<FingerBone> get_finger_bone(JointSlot slot)
{
    if (slot == JointSlot::Wrist || slot == JointSlot::Elbow)
    {
        return std::nullopt;
    }

    size_t index = to_index(slot);
    if (index >= FINGER_SLOT_COUNT)
    {
        throw std::out_of_range("Invalid joint slot: " + std::to_string(index));
    }
    return JOINT_SLOT_MAPPING[index];
}

const char* to_string(JointSlot slot)
{
    static const char* const names[JOINT_SLOT_COUNT] = {
        "THUMB_METACARPAL", "THUMB_PROXIMAL", "THUMB_INTERMEDIATE", "THUMB_DISTAL",
        "INDEX_METACARPAL", "INDEX_PROXIMAL", "INDEX_INTERMEDIATE", "INDEX_DISTAL",
        "MIDDLE_METACARPAL", "MIDDLE_PROXIMAL", "MIDDLE_INTERMEDIATE", "MIDDLE_DISTAL",
        "RING_METACARPAL", "RING_PROXIMAL", "RING_INTERMEDIATE", "RING_DISTAL",
        "PINKY_METACARPAL", "PINKY_PROXIMAL", "PINKY_INTERMEDIATE", "PINKY_DISTAL",
        "WRIST", "ELBOW"
    };

    size_t index = to_index(slot);
    if (index < JOINT_SLOT_COUNT)
    {
        return names[index];
    }
    return "UNKNOWN";
}

} // namespace handbind
