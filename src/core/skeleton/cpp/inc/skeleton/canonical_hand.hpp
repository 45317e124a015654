// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <openxr/openxr.h>

#include <array>
#include <cstddef>
#include <string>

namespace handbind
{

// Fingers of the canonical tracked hand, thumb first
enum class FingerType
{
    Thumb = 0,
    Index,
    Middle,
    Ring,
    Pinky,

    COUNT // Number of fingers (keep last)
};

// Bones of a canonical finger, ordered from the palm outwards
enum class BoneType
{
    Metacarpal = 0,
    Proximal,
    Intermediate,
    Distal,

    COUNT // Number of bones per finger (keep last)
};

constexpr size_t to_index(FingerType finger)
{
    return static_cast<size_t>(finger);
}

constexpr size_t to_index(BoneType bone)
{
    return static_cast<size_t>(bone);
}

constexpr size_t FINGER_COUNT = to_index(FingerType::COUNT);
constexpr size_t BONES_PER_FINGER = to_index(BoneType::COUNT);

const char* to_string(FingerType finger);
const char* to_string(BoneType bone);

// "index_proximal" style name, for logging
std::string get_bone_name(FingerType finger, BoneType bone);

/**
 * @brief One bone of the canonical hand.
 *
 * Geometry written by the retargeter follows direction = prev_joint - next_joint.
 * Bones converted from a tracking runtime carry the unit vector prev -> next instead.
 */
struct Bone
{
    XrVector3f prev_joint{};
    XrVector3f next_joint{};
    XrVector3f center{};
    XrVector3f direction{};
    float length = 0.0f;
    float width = 0.0f;
    BoneType type = BoneType::Metacarpal;
    XrQuaternionf rotation{ 0.0f, 0.0f, 0.0f, 1.0f };
};

struct Finger
{
    FingerType type = FingerType::Thumb;
    std::array<Bone, BONES_PER_FINGER> bones;
    XrVector3f tip_position{};

    Bone& bone(BoneType bone_type)
    {
        return bones[to_index(bone_type)];
    }

    const Bone& bone(BoneType bone_type) const
    {
        return bones[to_index(bone_type)];
    }
};

// Forearm segment from elbow (prev_joint) to wrist (next_joint)
struct Arm
{
    XrVector3f prev_joint{};
    XrVector3f next_joint{};
    XrVector3f center{};
    XrVector3f direction{};
    float length = 0.0f;
    float width = 0.0f;
    XrQuaternionf rotation{ 0.0f, 0.0f, 0.0f, 1.0f };
};

/**
 * @brief Fixed-topology hand skeleton as produced by a hand tracking runtime.
 *
 * Five fingers of four bones each, plus wrist, palm and forearm data.
 * Default construction yields a zeroed hand with finger and bone types set.
 */
struct CanonicalHand
{
    CanonicalHand();

    std::array<Finger, FINGER_COUNT> fingers;

    XrVector3f wrist_position{};
    XrVector3f palm_position{};
    XrVector3f stabilized_palm_position{};
    float palm_width = 0.0f;

    Arm arm;

    Finger& finger(FingerType finger_type)
    {
        return fingers[to_index(finger_type)];
    }

    const Finger& finger(FingerType finger_type) const
    {
        return fingers[to_index(finger_type)];
    }

    Bone& bone(FingerType finger_type, BoneType bone_type)
    {
        return finger(finger_type).bone(bone_type);
    }

    const Bone& bone(FingerType finger_type, BoneType bone_type) const
    {
        return finger(finger_type).bone(bone_type);
    }

    Finger& thumb()
    {
        return finger(FingerType::Thumb);
    }
    Finger& index()
    {
        return finger(FingerType::Index);
    }
    Finger& middle()
    {
        return finger(FingerType::Middle);
    }
    Finger& ring()
    {
        return finger(FingerType::Ring);
    }
    Finger& pinky()
    {
        return finger(FingerType::Pinky);
    }

    const Finger& thumb() const
    {
        return finger(FingerType::Thumb);
    }
    const Finger& index() const
    {
        return finger(FingerType::Index);
    }
    const Finger& middle() const
    {
        return finger(FingerType::Middle);
    }
    const Finger& ring() const
    {
        return finger(FingerType::Ring);
    }
    const Finger& pinky() const
    {
        return finger(FingerType::Pinky);
    }
};

} // namespace handbind
