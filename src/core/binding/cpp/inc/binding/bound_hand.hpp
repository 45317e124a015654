// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "joint_slot.hpp"
#include "transform_source.hpp"

#include <openxr/openxr.h>
#include <skeleton/canonical_hand.hpp>

#include <array>
#include <cstddef>
#include <optional>

namespace handbind
{

// Scale offsets are kept inside this range by the binding editor
constexpr float SCALE_OFFSET_MIN = -1.0f;
constexpr float SCALE_OFFSET_MAX = 3.0f;

// Position, Euler rotation (degrees) and scale of a transform
struct TransformStore
{
    XrVector3f position{};
    XrVector3f rotation{};
    XrVector3f scale{};
};

// A rig transform attached to one joint slot
struct BoundJoint
{
    std::optional<TransformHandle> transform; // Non-owning; resolved through ITransformSource
    TransformStore start_transform; // Snapshot taken at bind time
    TransformStore offset;

    bool is_bound() const
    {
        return transform.has_value();
    }
};

struct BoundFinger
{
    std::array<BoundJoint, BONES_PER_FINGER> bound_joints; // Metacarpal -> Distal
    float fingertip_base_length = 0.0f;
    float fingertip_scale_offset = 1.0f;
};

/**
 * @brief Binding of a user rig to the canonical hand.
 *
 * Created and edited by the binding tool, read by the retargeter every frame.
 */
struct BoundHand
{
    std::array<BoundFinger, FINGER_COUNT> fingers; // Thumb -> Pinky
    BoundJoint wrist;
    BoundJoint elbow;
    float base_scale = 0.0f;
    XrVector3f start_scale{};
    float scale_offset = 1.0f;
    float elbow_offset = 1.0f;

    BoundJoint& joint(JointSlot slot);
    const BoundJoint& joint(JointSlot slot) const;

    /**
     * @brief Attach a transform to a slot and snapshot its current pose.
     *
     * @throws std::invalid_argument if transforms cannot locate the handle
     * @throws std::out_of_range for values outside the JointSlot enum
     */
    void bind(JointSlot slot, TransformHandle handle, const ITransformSource& transforms);

    // Detach a slot; start and offset transforms are kept
    void unbind(JointSlot slot);

    // Number of slots with a transform attached
    size_t bound_count() const;
};

// Clamp hand, elbow and fingertip scale offsets into [SCALE_OFFSET_MIN, SCALE_OFFSET_MAX]
void clamp_scale_offsets(BoundHand& hand);

} // namespace handbind
