// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// Tests for the synthetic hand and rig generator, and retargeting a tracked hand onto a synthetic rig.

#include <binding/bound_hand.hpp>
#include <binding/transform_source.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <math_utils/vector_math.hpp>
#include <retarget/retargeter.hpp>
#include <skeleton/openxr_conversion.hpp>
#include <synthetic_rig/hand_generator.hpp>

#include <array>

using handbind::BoneType;
using handbind::FingerType;
using handbind::JointSlot;
using plugins::synthetic_rig::HandGenerator;

namespace
{

const XrPosef IDENTITY_WRIST = { { 0.0f, 0.0f, 0.0f, 1.0f }, { 0.0f, 0.0f, 0.0f } };

void check_vec(const XrVector3f& actual, const XrVector3f& expected)
{
    CHECK(actual.x == Catch::Approx(expected.x).margin(1e-5));
    CHECK(actual.y == Catch::Approx(expected.y).margin(1e-5));
    CHECK(actual.z == Catch::Approx(expected.z).margin(1e-5));
}

// Bind every slot of a fresh BoundHand to its own transform holding the given rig pose
handbind::BoundHand bind_rig(const std::array<XrPosef, handbind::JOINT_SLOT_COUNT>& rig,
                             handbind::TransformRegistry& transforms)
{
    handbind::BoundHand bound_hand;
    for (size_t i = 0; i < handbind::JOINT_SLOT_COUNT; ++i)
    {
        bound_hand.bind(static_cast<JointSlot>(i), transforms.add(rig[i]), transforms);
    }
    return bound_hand;
}

} // namespace

// =============================================================================
// Generator Tests
// =============================================================================
TEST_CASE("Rig joints sit on the tracked joints", "[synthetic_rig]")
{
    HandGenerator generator;
    XrHandJointLocationEXT joints[XR_HAND_JOINT_COUNT_EXT] = {};
    generator.generate(joints, IDENTITY_WRIST, true, 0.3f);
    auto rig = generator.generate_rig(IDENTITY_WRIST, true, 0.3f);

    for (size_t f = 0; f < handbind::FINGER_COUNT; ++f)
    {
        for (size_t b = 0; b < handbind::BONES_PER_FINGER; ++b)
        {
            auto slot = handbind::get_joint_slot(static_cast<FingerType>(f), static_cast<BoneType>(b));
            INFO(handbind::to_string(slot));
            check_vec(rig[handbind::to_index(slot)].position,
                      joints[handbind::OPENXR_FINGER_CHAINS[f][b]].pose.position);
        }
    }

    check_vec(rig[handbind::to_index(JointSlot::Wrist)].position, joints[XR_HAND_JOINT_WRIST_EXT].pose.position);
    check_vec(rig[handbind::to_index(JointSlot::Elbow)].position, { 0.0f, 0.0f, plugins::synthetic_rig::ELBOW_DISTANCE });
}

TEST_CASE("Rig scale multiplies offsets from the wrist", "[synthetic_rig]")
{
    HandGenerator generator;
    const XrPosef wrist_pose = { { 0.0f, 0.0f, 0.0f, 1.0f }, { 0.5f, 1.0f, -0.2f } };
    auto natural = generator.generate_rig(wrist_pose, true);
    auto doubled = generator.generate_rig(wrist_pose, true, 0.0f, 2.0f);

    for (size_t i = 0; i < handbind::JOINT_SLOT_COUNT; ++i)
    {
        INFO(handbind::to_string(static_cast<JointSlot>(i)));
        XrVector3f natural_offset = math_utils::subtract(natural[i].position, wrist_pose.position);
        XrVector3f doubled_offset = math_utils::subtract(doubled[i].position, wrist_pose.position);
        check_vec(doubled_offset, math_utils::scale(natural_offset, 2.0f));
    }
}

TEST_CASE("Right hand mirrors the left hand", "[synthetic_rig]")
{
    HandGenerator generator;
    XrHandJointLocationEXT left[XR_HAND_JOINT_COUNT_EXT] = {};
    XrHandJointLocationEXT right[XR_HAND_JOINT_COUNT_EXT] = {};
    generator.generate(left, IDENTITY_WRIST, true);
    generator.generate(right, IDENTITY_WRIST, false);

    for (int i = 0; i < XR_HAND_JOINT_COUNT_EXT; ++i)
    {
        INFO("joint " << i);
        CHECK(right[i].pose.position.x == Catch::Approx(-left[i].pose.position.x));
        CHECK(right[i].pose.position.y == Catch::Approx(left[i].pose.position.y));
        CHECK(right[i].pose.position.z == Catch::Approx(left[i].pose.position.z));
    }
}

// =============================================================================
// Retargeting onto a synthetic rig
// =============================================================================
TEST_CASE("Retargeting onto a same-size rig keeps the tracked joints", "[synthetic_rig][retarget]")
{
    HandGenerator generator;
    const XrPosef wrist_pose = { { 0.0f, 0.0f, 0.0f, 1.0f }, { 0.0f, 1.2f, -0.3f } };
    const float curl = 0.4f;

    XrHandJointLocationEXT joints[XR_HAND_JOINT_COUNT_EXT] = {};
    generator.generate(joints, wrist_pose, true, curl);
    const handbind::CanonicalHand tracked = handbind::from_openxr_joints(joints);

    handbind::TransformRegistry transforms;
    handbind::BoundHand bound_hand = bind_rig(generator.generate_rig(wrist_pose, true, curl), transforms);

    handbind::CanonicalHand hand = tracked;
    REQUIRE(handbind::retarget(bound_hand, transforms, &hand) == &hand);

    SECTION("Rigged bones span the tracked joints")
    {
        for (size_t f = 0; f < handbind::FINGER_COUNT; ++f)
        {
            for (size_t b = 0; b < handbind::to_index(BoneType::Distal); ++b)
            {
                INFO(handbind::get_bone_name(static_cast<FingerType>(f), static_cast<BoneType>(b)));
                const handbind::Bone& expected = tracked.fingers[f].bones[b];
                const handbind::Bone& actual = hand.fingers[f].bones[b];
                check_vec(actual.prev_joint, expected.prev_joint);
                check_vec(actual.next_joint, expected.next_joint);
                check_vec(actual.center, expected.center);
                CHECK(actual.length == Catch::Approx(expected.length).margin(1e-5));

                // Retargeted direction runs next -> prev and is not normalized
                check_vec(actual.direction, math_utils::subtract(expected.prev_joint, expected.next_joint));
            }
        }
    }

    SECTION("Fingertips extend along the tracked distal bone")
    {
        for (size_t f = 0; f < handbind::FINGER_COUNT; ++f)
        {
            INFO(handbind::to_string(static_cast<FingerType>(f)));
            const handbind::Finger& tracked_finger = tracked.fingers[f];
            const handbind::Finger& finger = hand.fingers[f];

            float segment = tracked_finger.bone(BoneType::Intermediate).length;
            XrVector3f expected_tip = math_utils::add(
                tracked_finger.bone(BoneType::Distal).prev_joint,
                math_utils::scale(tracked_finger.bone(BoneType::Distal).direction,
                                  segment * handbind::DEFAULT_FINGERTIP_SCALE));

            check_vec(finger.tip_position, expected_tip);
            check_vec(finger.bone(BoneType::Distal).next_joint, expected_tip);
            CHECK(finger.bone(BoneType::Distal).length ==
                  Catch::Approx(segment * handbind::DEFAULT_FINGERTIP_SCALE).margin(1e-5));
        }
    }

    SECTION("Wrist, palm and arm")
    {
        check_vec(hand.wrist_position, tracked.wrist_position);
        CHECK(hand.palm_width == Catch::Approx(tracked.palm_width).margin(1e-5));
        check_vec(hand.palm_position,
                  math_utils::midpoint(tracked.wrist_position, tracked.middle().bone(BoneType::Proximal).prev_joint));

        CHECK(hand.arm.length == Catch::Approx(plugins::synthetic_rig::ELBOW_DISTANCE).margin(1e-5));
        check_vec(hand.arm.next_joint, tracked.wrist_position);
        check_vec(hand.arm.prev_joint, math_utils::add(wrist_pose.position, { 0.0f, 0.0f, 0.25f }));
    }
}

TEST_CASE("Retargeting onto a larger rig scales the bones", "[synthetic_rig][retarget]")
{
    HandGenerator generator;
    XrHandJointLocationEXT joints[XR_HAND_JOINT_COUNT_EXT] = {};
    generator.generate(joints, IDENTITY_WRIST, false);
    const handbind::CanonicalHand tracked = handbind::from_openxr_joints(joints);

    handbind::TransformRegistry transforms;
    handbind::BoundHand bound_hand = bind_rig(generator.generate_rig(IDENTITY_WRIST, false, 0.0f, 1.5f), transforms);

    handbind::CanonicalHand hand = tracked;
    handbind::retarget(bound_hand, transforms, &hand, handbind::RetargetConfig{ 1.0f });

    for (size_t f = 0; f < handbind::FINGER_COUNT; ++f)
    {
        for (size_t b = 0; b < handbind::to_index(BoneType::Distal); ++b)
        {
            INFO(handbind::get_bone_name(static_cast<FingerType>(f), static_cast<BoneType>(b)));
            CHECK(hand.fingers[f].bones[b].length ==
                  Catch::Approx(tracked.fingers[f].bones[b].length * 1.5f).margin(1e-5));
        }

        // With a fingertip scale of 1 the distal bone repeats the scaled intermediate length
        CHECK(hand.fingers[f].bone(BoneType::Distal).length ==
              Catch::Approx(tracked.fingers[f].bone(BoneType::Intermediate).length * 1.5f).margin(1e-5));
    }
    CHECK(hand.palm_width == Catch::Approx(tracked.palm_width * 1.5f).margin(1e-5));
    CHECK(hand.arm.length == Catch::Approx(plugins::synthetic_rig::ELBOW_DISTANCE * 1.5f).margin(1e-5));
}
