// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace handbind
{

constexpr float DEFAULT_FINGERTIP_SCALE = 0.8f;

/**
 * @brief Configuration for retargeting a bound rig onto a canonical hand
 */
struct RetargetConfig
{
    // Fingertip length as a fraction of the intermediate-to-distal joint distance
    float fingertip_scale = DEFAULT_FINGERTIP_SCALE;
};

} // namespace handbind
