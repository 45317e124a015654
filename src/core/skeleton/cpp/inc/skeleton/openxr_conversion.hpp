// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// Conversion between CanonicalHand and the XR_EXT_hand_tracking joint layout
#pragma once

#include "canonical_hand.hpp"

#include <openxr/openxr.h>

#include <array>

namespace handbind
{

// OpenXR joints bounding the four bones of each finger, in XR_HAND_JOINT_SET_DEFAULT_EXT order.
// Bone b of a finger spans chain[b] -> chain[b + 1]. OpenXR has no thumb intermediate joint,
// so the thumb metacarpal is a zero-length bone sitting on the thumb metacarpal joint.
constexpr std::array<std::array<XrHandJointEXT, BONES_PER_FINGER + 1>, FINGER_COUNT> OPENXR_FINGER_CHAINS = { {
    { XR_HAND_JOINT_THUMB_METACARPAL_EXT, XR_HAND_JOINT_THUMB_METACARPAL_EXT, XR_HAND_JOINT_THUMB_PROXIMAL_EXT,
      XR_HAND_JOINT_THUMB_DISTAL_EXT, XR_HAND_JOINT_THUMB_TIP_EXT },
    { XR_HAND_JOINT_INDEX_METACARPAL_EXT, XR_HAND_JOINT_INDEX_PROXIMAL_EXT, XR_HAND_JOINT_INDEX_INTERMEDIATE_EXT,
      XR_HAND_JOINT_INDEX_DISTAL_EXT, XR_HAND_JOINT_INDEX_TIP_EXT },
    { XR_HAND_JOINT_MIDDLE_METACARPAL_EXT, XR_HAND_JOINT_MIDDLE_PROXIMAL_EXT, XR_HAND_JOINT_MIDDLE_INTERMEDIATE_EXT,
      XR_HAND_JOINT_MIDDLE_DISTAL_EXT, XR_HAND_JOINT_MIDDLE_TIP_EXT },
    { XR_HAND_JOINT_RING_METACARPAL_EXT, XR_HAND_JOINT_RING_PROXIMAL_EXT, XR_HAND_JOINT_RING_INTERMEDIATE_EXT,
      XR_HAND_JOINT_RING_DISTAL_EXT, XR_HAND_JOINT_RING_TIP_EXT },
    { XR_HAND_JOINT_LITTLE_METACARPAL_EXT, XR_HAND_JOINT_LITTLE_PROXIMAL_EXT, XR_HAND_JOINT_LITTLE_INTERMEDIATE_EXT,
      XR_HAND_JOINT_LITTLE_DISTAL_EXT, XR_HAND_JOINT_LITTLE_TIP_EXT },
} };

/**
 * @brief Build a canonical hand from XR_HAND_JOINT_COUNT_EXT joint locations.
 *
 * Bone direction is the unit vector prev -> next, bone width is the diameter of the
 * joint at prev_joint and bone rotation is that joint's orientation. The arm collapses
 * onto the wrist joint since OpenXR reports no elbow.
 *
 * @throws std::invalid_argument if joints is null
 */
CanonicalHand from_openxr_joints(const XrHandJointLocationEXT* joints);

/**
 * @brief Write a canonical hand into XR_HAND_JOINT_COUNT_EXT joint locations.
 *
 * Every joint is flagged valid and tracked. Radii are half the owning bone width.
 *
 * @throws std::invalid_argument if out_joints is null
 */
void to_openxr_joints(const CanonicalHand& hand, XrHandJointLocationEXT* out_joints);

} // namespace handbind
