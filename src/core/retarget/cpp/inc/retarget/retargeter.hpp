// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "retarget_config.hpp"

#include <binding/bound_hand.hpp>
#include <binding/transform_source.hpp>
#include <skeleton/canonical_hand.hpp>

namespace handbind
{

/**
 * @brief Fit a canonical hand to the joints of a bound rig.
 *
 * Reads the current world position of every bound joint through transforms and
 * rewrites the bone geometry, wrist, arm and palm fields of hand in place. Bones whose
 * joints are unbound, or whose handles no longer resolve, keep their previous values.
 * The bound hand and the transform source are not modified.
 *
 * Not safe to call concurrently on the same hand.
 *
 * @param bound_hand Rig binding
 * @param transforms Source of current world poses for the bound handles
 * @param hand Canonical hand to update; may be null
 * @param fingertip_scale Fingertip length relative to the last rigged finger segment
 * @return hand, or null without doing anything if hand is null
 */
CanonicalHand* retarget(const BoundHand& bound_hand,
                        const ITransformSource& transforms,
                        CanonicalHand* hand,
                        float fingertip_scale = DEFAULT_FINGERTIP_SCALE);

CanonicalHand* retarget(const BoundHand& bound_hand,
                        const ITransformSource& transforms,
                        CanonicalHand* hand,
                        const RetargetConfig& config);

} // namespace handbind
