// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/binding/bone_names.hpp"

#include <array>
#include <stdexcept>

namespace handbind
{

const char* to_string(JointGroup group)
{
    switch (group)
    {
    case JointGroup::Thumb:
        return "thumb";
    case JointGroup::Index:
        return "index";
    case JointGroup::Middle:
        return "middle";
    case JointGroup::Ring:
        return "ring";
    case JointGroup::Pinky:
        return "pinky";
    case JointGroup::Wrist:
        return "wrist";
    case JointGroup::Elbow:
        return "elbow";
    default:
        return "unknown";
    }
}

JointGroup get_joint_group(JointSlot slot)
{
    if (slot == JointSlot::Wrist)
    {
        return JointGroup::Wrist;
    }
    if (slot == JointSlot::Elbow)
    {
        return JointGroup::Elbow;
    }

    // FingerType and the finger groups share ordinals
    return static_cast<JointGroup>(to_index(get_finger_bone(slot)->finger));
}

const std::vector<std::string>& get_name_definitions(JointGroup group)
{
    static const std::array<std::vector<std::string>, to_index(JointGroup::COUNT)> definitions = { {
        { "thumb" },
        { "index" },
        { "middle" },
        { "ring" },
        { "pinky", "little" },
        { "wrist", "hand", "palm" },
        { "elbow", "lowerArm", "forearm" },
    } };

    size_t index = to_index(group);
    if (index >= definitions.size())
    {
        throw std::out_of_range("Invalid joint group: " + std::to_string(index));
    }
    return definitions[index];
}

} // namespace handbind
