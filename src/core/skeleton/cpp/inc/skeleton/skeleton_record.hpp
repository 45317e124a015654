// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "canonical_hand.hpp"

#include <flatbuffers/flatbuffers.h>
#include <schema/hand_skeleton_generated.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace handbind
{

// Build a HandSkeletonRecord table for the given hand inside builder (not finished)
flatbuffers::Offset<HandSkeletonRecord> serialize_skeleton(flatbuffers::FlatBufferBuilder& builder,
                                                           const CanonicalHand& hand,
                                                           int64_t timestamp);

// Serialize into a finished, self-contained buffer
std::vector<uint8_t> serialize_skeleton(const CanonicalHand& hand, int64_t timestamp);

/**
 * @brief Rebuild a CanonicalHand from a record.
 *
 * @throws std::runtime_error if the record lacks the bone or tip arrays, or their sizes are wrong
 */
CanonicalHand deserialize_skeleton(const HandSkeletonRecord& record);

/**
 * @brief Verify and decode a finished HandSkeletonRecord buffer.
 *
 * @throws std::runtime_error if the buffer fails FlatBuffers verification or is malformed
 */
CanonicalHand read_skeleton_record(const uint8_t* data, size_t size, int64_t* out_timestamp = nullptr);

} // namespace handbind
