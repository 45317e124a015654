// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/skeleton/canonical_hand.hpp"

namespace handbind
{

const char* to_string(FingerType finger)
{
    switch (finger)
    {
    case FingerType::Thumb:
        return "thumb";
    case FingerType::Index:
        return "index";
    case FingerType::Middle:
        return "middle";
    case FingerType::Ring:
        return "ring";
    case FingerType::Pinky:
        return "pinky";
    default:
        return "unknown";
    }
}

const char* to_string(BoneType bone)
{
    switch (bone)
    {
    case BoneType::Metacarpal:
        return "metacarpal";
    case BoneType::Proximal:
        return "proximal";
    case BoneType::Intermediate:
        return "intermediate";
    case BoneType::Distal:
        return "distal";
    default:
        return "unknown";
    }
}

std::string get_bone_name(FingerType finger, BoneType bone)
{
    return std::string(to_string(finger)) + "_" + to_string(bone);
}

CanonicalHand::CanonicalHand()
{
    for (size_t f = 0; f < FINGER_COUNT; ++f)
    {
        fingers[f].type = static_cast<FingerType>(f);
        for (size_t b = 0; b < BONES_PER_FINGER; ++b)
        {
            fingers[f].bones[b].type = static_cast<BoneType>(b);
        }
    }
}

} // namespace handbind
