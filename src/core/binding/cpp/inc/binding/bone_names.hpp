// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// Rig bone name synonyms consumed by auto-binding tools
#pragma once

#include "joint_slot.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace handbind
{

enum class JointGroup
{
    Thumb = 0,
    Index,
    Middle,
    Ring,
    Pinky,
    Wrist,
    Elbow,

    COUNT // Number of groups (keep last)
};

constexpr size_t to_index(JointGroup group)
{
    return static_cast<size_t>(group);
}

const char* to_string(JointGroup group);

// Group a slot's rig bone is named after (finger slots map to their finger)
JointGroup get_joint_group(JointSlot slot);

// Case-insensitive substrings that identify a rig bone belonging to the group.
// Throws std::out_of_range for values outside the enum.
const std::vector<std::string>& get_name_definitions(JointGroup group);

} // namespace handbind
