// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// Unit tests for the joint slot topology and bone name tables.

#include <binding/bone_names.hpp>
#include <binding/joint_slot.hpp>
#include <catch2/catch_test_macros.hpp>

#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using handbind::BoneType;
using handbind::FingerType;
using handbind::JointSlot;

// =============================================================================
// Compile-time verification of the slot layout.
// =============================================================================
static_assert(handbind::JOINT_SLOT_COUNT == 22, "Expected 20 finger slots plus wrist and elbow");
static_assert(handbind::FINGER_SLOT_COUNT == 20);
static_assert(handbind::to_index(JointSlot::Wrist) == handbind::FINGER_SLOT_COUNT);
static_assert(handbind::get_joint_slot(FingerType::Thumb, BoneType::Metacarpal) == JointSlot::ThumbMetacarpal);
static_assert(handbind::get_joint_slot(FingerType::Middle, BoneType::Intermediate) == JointSlot::MiddleIntermediate);
static_assert(handbind::get_joint_slot(FingerType::Pinky, BoneType::Distal) == JointSlot::PinkyDistal);
static_assert(handbind::JOINT_SLOT_MAPPING[handbind::to_index(JointSlot::RingProximal)].finger == FingerType::Ring);
static_assert(handbind::JOINT_SLOT_MAPPING[handbind::to_index(JointSlot::RingProximal)].bone == BoneType::Proximal);

// =============================================================================
// Topology table
// =============================================================================
TEST_CASE("Every finger slot maps to a distinct finger bone", "[binding][topology]")
{
    std::set<std::pair<FingerType, BoneType>> seen;

    for (size_t i = 0; i < handbind::FINGER_SLOT_COUNT; ++i)
    {
        auto slot = static_cast<JointSlot>(i);
        auto finger_bone = handbind::get_finger_bone(slot);
        REQUIRE(finger_bone.has_value());
        CHECK(seen.insert({ finger_bone->finger, finger_bone->bone }).second);

        // Inverse lookup returns the same slot
        CHECK(handbind::get_joint_slot(finger_bone->finger, finger_bone->bone) == slot);
    }

    CHECK(seen.size() == handbind::FINGER_SLOT_COUNT);
}

TEST_CASE("Wrist and elbow have no finger bone", "[binding][topology]")
{
    CHECK_FALSE(handbind::get_finger_bone(JointSlot::Wrist).has_value());
    CHECK_FALSE(handbind::get_finger_bone(JointSlot::Elbow).has_value());
}

TEST_CASE("Out of range slot is rejected", "[binding][topology]")
{
    CHECK_THROWS_AS(handbind::get_finger_bone(JointSlot::COUNT), std::out_of_range);
    CHECK(std::string(handbind::to_string(JointSlot::COUNT)) == "UNKNOWN");
}

TEST_CASE("Slot names", "[binding][topology]")
{
    CHECK(std::string(handbind::to_string(JointSlot::ThumbMetacarpal)) == "THUMB_METACARPAL");
    CHECK(std::string(handbind::to_string(JointSlot::IndexDistal)) == "INDEX_DISTAL");
    CHECK(std::string(handbind::to_string(JointSlot::Wrist)) == "WRIST");
    CHECK(std::string(handbind::to_string(JointSlot::Elbow)) == "ELBOW");
}

// =============================================================================
// Bone name synonyms
// =============================================================================
TEST_CASE("Bone name definitions per group", "[binding][names]")
{
    using Names = std::vector<std::string>;

    CHECK(handbind::get_name_definitions(handbind::JointGroup::Thumb) == Names{ "thumb" });
    CHECK(handbind::get_name_definitions(handbind::JointGroup::Index) == Names{ "index" });
    CHECK(handbind::get_name_definitions(handbind::JointGroup::Middle) == Names{ "middle" });
    CHECK(handbind::get_name_definitions(handbind::JointGroup::Ring) == Names{ "ring" });
    CHECK(handbind::get_name_definitions(handbind::JointGroup::Pinky) == Names{ "pinky", "little" });
    CHECK(handbind::get_name_definitions(handbind::JointGroup::Wrist) == Names{ "wrist", "hand", "palm" });
    CHECK(handbind::get_name_definitions(handbind::JointGroup::Elbow) == Names{ "elbow", "lowerArm", "forearm" });

    CHECK_THROWS_AS(handbind::get_name_definitions(handbind::JointGroup::COUNT), std::out_of_range);
}

TEST_CASE("Slots resolve to their name group", "[binding][names]")
{
    CHECK(handbind::get_joint_group(JointSlot::ThumbDistal) == handbind::JointGroup::Thumb);
    CHECK(handbind::get_joint_group(JointSlot::IndexMetacarpal) == handbind::JointGroup::Index);
    CHECK(handbind::get_joint_group(JointSlot::MiddleProximal) == handbind::JointGroup::Middle);
    CHECK(handbind::get_joint_group(JointSlot::RingIntermediate) == handbind::JointGroup::Ring);
    CHECK(handbind::get_joint_group(JointSlot::PinkyDistal) == handbind::JointGroup::Pinky);
    CHECK(handbind::get_joint_group(JointSlot::Wrist) == handbind::JointGroup::Wrist);
    CHECK(handbind::get_joint_group(JointSlot::Elbow) == handbind::JointGroup::Elbow);
    CHECK(std::string(handbind::to_string(handbind::JointGroup::Pinky)) == "pinky");
}
