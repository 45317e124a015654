// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// Retargets a synthetic tracked hand onto a differently sized synthetic rig and prints the result.

#include <binding/bound_hand.hpp>
#include <binding/transform_source.hpp>
#include <retarget/retargeter.hpp>
#include <skeleton/openxr_conversion.hpp>
#include <skeleton/skeleton_record.hpp>
#include <synthetic_rig/hand_generator.hpp>

#include <array>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace
{

struct DemoConfig
{
    int frames = 10;
    float rig_scale = 1.2f;
    handbind::RetargetConfig retarget;
};

DemoConfig parse_args(int argc, char** argv)
{
    DemoConfig config;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg.find("--frames=") == 0)
        {
            config.frames = std::stoi(arg.substr(9));
        }
        else if (arg.find("--fingertip-scale=") == 0)
        {
            config.retarget.fingertip_scale = std::stof(arg.substr(18));
        }
        else if (arg.find("--rig-scale=") == 0)
        {
            config.rig_scale = std::stof(arg.substr(12));
        }
        else
        {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    if (config.frames <= 0)
    {
        throw std::invalid_argument("--frames must be positive");
    }
    if (config.rig_scale <= 0.0f)
    {
        throw std::invalid_argument("--rig-scale must be positive");
    }
    return config;
}

void print_vec(const XrVector3f& v)
{
    std::cout << "[" << v.x << ", " << v.y << ", " << v.z << "]";
}

void print_hand(const handbind::CanonicalHand& hand)
{
    for (const handbind::Finger& finger : hand.fingers)
    {
        std::cout << "  " << std::setw(6) << std::left << handbind::to_string(finger.type) << std::right;
        for (const handbind::Bone& bone : finger.bones)
        {
            std::cout << " " << std::setw(7) << bone.length;
        }
        std::cout << "  tip=";
        print_vec(finger.tip_position);
        std::cout << std::endl;
    }

    std::cout << "  palm=";
    print_vec(hand.palm_position);
    std::cout << " width=" << hand.palm_width << " arm_length=" << hand.arm.length << std::endl;
}

} // namespace

int main(int argc, char** argv)
{
    DemoConfig config;
    try
    {
        config = parse_args(argc, argv);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Invalid arguments: " << e.what() << std::endl;
        std::cerr << "Usage: retarget_demo [--frames=N] [--fingertip-scale=S] [--rig-scale=K]" << std::endl;
        return 1;
    }

    std::cout << "HandBind Retarget Demo" << std::endl;
    std::cout << "Frames: " << config.frames << ", rig scale: " << config.rig_scale
              << ", fingertip scale: " << config.retarget.fingertip_scale << std::endl;

    plugins::synthetic_rig::HandGenerator generator;
    const XrPosef wrist_pose = { { 0.0f, 0.0f, 0.0f, 1.0f }, { 0.0f, 1.2f, -0.3f } };

    // Register one scene transform per rig joint and bind every slot to it
    handbind::TransformRegistry transforms;
    handbind::BoundHand bound_hand;
    auto rig = generator.generate_rig(wrist_pose, true, 0.0f, config.rig_scale);
    std::array<handbind::TransformHandle, handbind::JOINT_SLOT_COUNT> handles{};
    for (size_t i = 0; i < handbind::JOINT_SLOT_COUNT; ++i)
    {
        handles[i] = transforms.add(rig[i]);
        bound_hand.bind(static_cast<handbind::JointSlot>(i), handles[i], transforms);
    }
    std::cout << "Bound " << bound_hand.bound_count() << " rig joints" << std::endl;

    std::cout << std::fixed << std::setprecision(3);

    for (int frame = 0; frame < config.frames; ++frame)
    {
        float curl = 0.5f - 0.5f * std::cos(6.2831853f * static_cast<float>(frame) / static_cast<float>(config.frames));

        // Tracked hand at natural size, rig at its own size, same curl
        XrHandJointLocationEXT tracked[XR_HAND_JOINT_COUNT_EXT] = {};
        generator.generate(tracked, wrist_pose, true, curl);
        handbind::CanonicalHand hand = handbind::from_openxr_joints(tracked);

        rig = generator.generate_rig(wrist_pose, true, curl, config.rig_scale);
        for (size_t i = 0; i < handbind::JOINT_SLOT_COUNT; ++i)
        {
            transforms.set_pose(handles[i], rig[i]);
        }

        handbind::retarget(bound_hand, transforms, &hand, config.retarget);

        auto record = handbind::serialize_skeleton(hand, frame);

        std::cout << "\n=== Frame " << frame << " (curl " << curl << ", record " << record.size() << " bytes) ==="
                  << std::endl;
        print_hand(hand);
    }

    std::cout << "\nDone." << std::endl;
    return 0;
}
