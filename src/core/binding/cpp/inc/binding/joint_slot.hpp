// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <skeleton/canonical_hand.hpp>

#include <array>
#include <cstddef>
#include <optional>

namespace handbind
{

// Rig joints a hand binding can attach to
enum class JointSlot
{
    ThumbMetacarpal = 0,
    ThumbProximal,
    ThumbIntermediate,
    ThumbDistal,

    IndexMetacarpal,
    IndexProximal,
    IndexIntermediate,
    IndexDistal,

    MiddleMetacarpal,
    MiddleProximal,
    MiddleIntermediate,
    MiddleDistal,

    RingMetacarpal,
    RingProximal,
    RingIntermediate,
    RingDistal,

    PinkyMetacarpal,
    PinkyProximal,
    PinkyIntermediate,
    PinkyDistal,

    Wrist,
    Elbow,

    COUNT // Number of slots (keep last)
};

constexpr size_t to_index(JointSlot slot)
{
    return static_cast<size_t>(slot);
}

constexpr size_t JOINT_SLOT_COUNT = to_index(JointSlot::COUNT);
constexpr size_t FINGER_SLOT_COUNT = FINGER_COUNT * BONES_PER_FINGER;

struct FingerBone
{
    FingerType finger;
    BoneType bone;
};

// Finger slots, indexed by slot ordinal. Wrist and elbow have no finger bone.
constexpr std::array<FingerBone, FINGER_SLOT_COUNT> JOINT_SLOT_MAPPING = { {
    { FingerType::Thumb, BoneType::Metacarpal },
    { FingerType::Thumb, BoneType::Proximal },
    { FingerType::Thumb, BoneType::Intermediate },
    { FingerType::Thumb, BoneType::Distal },
    { FingerType::Index, BoneType::Metacarpal },
    { FingerType::Index, BoneType::Proximal },
    { FingerType::Index, BoneType::Intermediate },
    { FingerType::Index, BoneType::Distal },
    { FingerType::Middle, BoneType::Metacarpal },
    { FingerType::Middle, BoneType::Proximal },
    { FingerType::Middle, BoneType::Intermediate },
    { FingerType::Middle, BoneType::Distal },
    { FingerType::Ring, BoneType::Metacarpal },
    { FingerType::Ring, BoneType::Proximal },
    { FingerType::Ring, BoneType::Intermediate },
    { FingerType::Ring, BoneType::Distal },
    { FingerType::Pinky, BoneType::Metacarpal },
    { FingerType::Pinky, BoneType::Proximal },
    { FingerType::Pinky, BoneType::Intermediate },
    { FingerType::Pinky, BoneType::Distal },
} };

constexpr JointSlot get_joint_slot(FingerType finger, BoneType bone)
{
    return static_cast<JointSlot>(to_index(finger) * BONES_PER_FINGER + to_index(bone));
}

/**
 * @brief Look up the canonical finger bone a slot drives.
 *
 * @return std::nullopt for Wrist and Elbow
 * @throws std::out_of_range for values outside the enum
 */
std::optional<FingerBone> get_finger_bone(JointSlot slot);

const char* to_string(JointSlot slot);

} // namespace handbind
