// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/skeleton/skeleton_record.hpp"

#include <stdexcept>
#include <string>

namespace handbind
{

namespace
{

Vec3 to_fb(const XrVector3f& v)
{
    return Vec3(v.x, v.y, v.z);
}

Quat to_fb(const XrQuaternionf& q)
{
    return Quat(q.x, q.y, q.z, q.w);
}

XrVector3f from_fb(const Vec3& v)
{
    return { v.x(), v.y(), v.z() };
}

XrQuaternionf from_fb(const Quat& q)
{
    return { q.x(), q.y(), q.z(), q.w() };
}

// Optional struct fields decode to zero when absent
XrVector3f from_fb(const Vec3* v)
{
    return v ? from_fb(*v) : XrVector3f{ 0.0f, 0.0f, 0.0f };
}

} // namespace

flatbuffers::Offset<HandSkeletonRecord> serialize_skeleton(flatbuffers::FlatBufferBuilder& builder,
                                                           const CanonicalHand& hand,
                                                           int64_t timestamp)
{
    std::vector<BoneState> bones;
    bones.reserve(FINGER_COUNT * BONES_PER_FINGER);
    std::vector<Vec3> tips;
    tips.reserve(FINGER_COUNT);

    for (const Finger& finger : hand.fingers)
    {
        for (const Bone& bone : finger.bones)
        {
            bones.emplace_back(to_fb(bone.prev_joint), to_fb(bone.next_joint), to_fb(bone.center),
                               to_fb(bone.direction), to_fb(bone.rotation), bone.length, bone.width,
                               static_cast<BoneKind>(to_index(bone.type)));
        }
        tips.push_back(to_fb(finger.tip_position));
    }

    auto bones_offset = builder.CreateVectorOfStructs(bones);
    auto tips_offset = builder.CreateVectorOfStructs(tips);

    Vec3 wrist = to_fb(hand.wrist_position);
    Vec3 palm = to_fb(hand.palm_position);
    Vec3 stabilized_palm = to_fb(hand.stabilized_palm_position);
    ArmState arm(to_fb(hand.arm.prev_joint), to_fb(hand.arm.next_joint), to_fb(hand.arm.center),
                 to_fb(hand.arm.direction), to_fb(hand.arm.rotation), hand.arm.length, hand.arm.width);

    return CreateHandSkeletonRecord(
        builder, bones_offset, tips_offset, &wrist, &palm, &stabilized_palm, hand.palm_width, &arm, timestamp);
}

std::vector<uint8_t> serialize_skeleton(const CanonicalHand& hand, int64_t timestamp)
{
    flatbuffers::FlatBufferBuilder builder(1024);
    builder.Finish(serialize_skeleton(builder, hand, timestamp));
    return std::vector<uint8_t>(builder.GetBufferPointer(), builder.GetBufferPointer() + builder.GetSize());
}

CanonicalHand deserialize_skeleton(const HandSkeletonRecord& record)
{
    const auto* bones = record.bones();
    const auto* tips = record.tip_positions();

    if (bones == nullptr || bones->size() != FINGER_COUNT * BONES_PER_FINGER)
    {
        throw std::runtime_error("HandSkeletonRecord must contain " +
                                 std::to_string(FINGER_COUNT * BONES_PER_FINGER) + " bones");
    }
    if (tips == nullptr || tips->size() != FINGER_COUNT)
    {
        throw std::runtime_error("HandSkeletonRecord must contain " + std::to_string(FINGER_COUNT) + " tip positions");
    }

    CanonicalHand hand;
    for (size_t f = 0; f < FINGER_COUNT; ++f)
    {
        Finger& finger = hand.fingers[f];
        for (size_t b = 0; b < BONES_PER_FINGER; ++b)
        {
            const BoneState* state = bones->Get(static_cast<flatbuffers::uoffset_t>(f * BONES_PER_FINGER + b));
            if (static_cast<size_t>(state->kind()) != b)
            {
                throw std::runtime_error("HandSkeletonRecord bone " + get_bone_name(finger.type, static_cast<BoneType>(b)) +
                                         " has mismatched kind " + std::to_string(static_cast<int>(state->kind())));
            }

            Bone& bone = finger.bones[b];
            bone.prev_joint = from_fb(state->prev_joint());
            bone.next_joint = from_fb(state->next_joint());
            bone.center = from_fb(state->center());
            bone.direction = from_fb(state->direction());
            bone.rotation = from_fb(state->rotation());
            bone.length = state->length();
            bone.width = state->width();
        }
        finger.tip_position = from_fb(tips->Get(static_cast<flatbuffers::uoffset_t>(f)));
    }

    hand.wrist_position = from_fb(record.wrist_position());
    hand.palm_position = from_fb(record.palm_position());
    hand.stabilized_palm_position = from_fb(record.stabilized_palm_position());
    hand.palm_width = record.palm_width();

    if (const ArmState* arm = record.arm())
    {
        hand.arm.prev_joint = from_fb(arm->prev_joint());
        hand.arm.next_joint = from_fb(arm->next_joint());
        hand.arm.center = from_fb(arm->center());
        hand.arm.direction = from_fb(arm->direction());
        hand.arm.rotation = from_fb(arm->rotation());
        hand.arm.length = arm->length();
        hand.arm.width = arm->width();
    }

    return hand;
}

CanonicalHand read_skeleton_record(const uint8_t* data, size_t size, int64_t* out_timestamp)
{
    if (data == nullptr || size == 0)
    {
        throw std::runtime_error("HandSkeletonRecord buffer is empty");
    }

    flatbuffers::Verifier verifier(data, size);
    if (!VerifyHandSkeletonRecordBuffer(verifier))
    {
        throw std::runtime_error("HandSkeletonRecord buffer failed verification");
    }

    const HandSkeletonRecord* record = GetHandSkeletonRecord(data);
    if (out_timestamp)
    {
        *out_timestamp = record->timestamp();
    }
    return deserialize_skeleton(*record);
}

} // namespace handbind
