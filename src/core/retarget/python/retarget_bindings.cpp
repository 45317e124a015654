// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <binding/bone_names.hpp>
#include <binding/bound_hand.hpp>
#include <binding/joint_slot.hpp>
#include <binding/transform_source.hpp>
#include <openxr/openxr.h>
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <retarget/retargeter.hpp>
#include <skeleton/canonical_hand.hpp>

#include <array>
#include <string>

namespace py = pybind11;

namespace
{

py::array_t<float> to_array(const XrVector3f& v)
{
    py::array_t<float> result(3);
    auto out = result.mutable_unchecked<1>();
    out(0) = v.x;
    out(1) = v.y;
    out(2) = v.z;
    return result;
}

py::array_t<float> to_array(const XrQuaternionf& q)
{
    py::array_t<float> result(4);
    auto out = result.mutable_unchecked<1>();
    out(0) = q.x;
    out(1) = q.y;
    out(2) = q.z;
    out(3) = q.w;
    return result;
}

XrPosef make_pose(const std::array<float, 3>& position, const std::array<float, 4>& orientation)
{
    XrPosef pose{};
    pose.position = { position[0], position[1], position[2] };
    pose.orientation = { orientation[0], orientation[1], orientation[2], orientation[3] };
    return pose;
}

} // namespace

PYBIND11_MODULE(_handbind, m)
{
    m.doc() = "HandBind - retarget rigged hands onto the canonical tracked hand";

    py::enum_<handbind::FingerType>(m, "FingerType")
        .value("THUMB", handbind::FingerType::Thumb)
        .value("INDEX", handbind::FingerType::Index)
        .value("MIDDLE", handbind::FingerType::Middle)
        .value("RING", handbind::FingerType::Ring)
        .value("PINKY", handbind::FingerType::Pinky);

    py::enum_<handbind::BoneType>(m, "BoneType")
        .value("METACARPAL", handbind::BoneType::Metacarpal)
        .value("PROXIMAL", handbind::BoneType::Proximal)
        .value("INTERMEDIATE", handbind::BoneType::Intermediate)
        .value("DISTAL", handbind::BoneType::Distal);

    py::enum_<handbind::JointSlot> joint_slot(m, "JointSlot");
    for (size_t i = 0; i < handbind::JOINT_SLOT_COUNT; ++i)
    {
        auto slot = static_cast<handbind::JointSlot>(i);
        joint_slot.value(handbind::to_string(slot), slot);
    }

    py::enum_<handbind::JointGroup>(m, "JointGroup")
        .value("THUMB", handbind::JointGroup::Thumb)
        .value("INDEX", handbind::JointGroup::Index)
        .value("MIDDLE", handbind::JointGroup::Middle)
        .value("RING", handbind::JointGroup::Ring)
        .value("PINKY", handbind::JointGroup::Pinky)
        .value("WRIST", handbind::JointGroup::Wrist)
        .value("ELBOW", handbind::JointGroup::Elbow);

    m.def(
        "get_finger_bone",
        [](handbind::JointSlot slot) -> py::object
        {
            auto finger_bone = handbind::get_finger_bone(slot);
            if (!finger_bone)
            {
                return py::none();
            }
            return py::make_tuple(finger_bone->finger, finger_bone->bone);
        },
        py::arg("slot"), "Return (FingerType, BoneType) for a finger slot, None for WRIST and ELBOW.");

    m.def("get_name_definitions", &handbind::get_name_definitions, py::arg("group"),
          "Case-insensitive rig bone name substrings for a joint group.");

    py::class_<handbind::TransformRegistry>(m, "TransformRegistry")
        .def(py::init<>())
        .def(
            "add", [](handbind::TransformRegistry& self, const std::array<float, 3>& position,
                      const std::array<float, 4>& orientation) { return self.add(make_pose(position, orientation)); },
            py::arg("position"), py::arg("orientation") = std::array<float, 4>{ 0.0f, 0.0f, 0.0f, 1.0f })
        .def(
            "set_pose",
            [](handbind::TransformRegistry& self, handbind::TransformHandle handle, const std::array<float, 3>& position,
               const std::array<float, 4>& orientation) { self.set_pose(handle, make_pose(position, orientation)); },
            py::arg("handle"), py::arg("position"), py::arg("orientation") = std::array<float, 4>{ 0.0f, 0.0f, 0.0f, 1.0f })
        .def("remove", &handbind::TransformRegistry::remove, py::arg("handle"))
        .def("contains", &handbind::TransformRegistry::contains, py::arg("handle"))
        .def("__len__", &handbind::TransformRegistry::size);

    py::class_<handbind::BoundHand>(m, "BoundHand")
        .def(py::init<>())
        .def(
            "bind",
            [](handbind::BoundHand& self, handbind::JointSlot slot, handbind::TransformHandle handle,
               const handbind::TransformRegistry& transforms) { self.bind(slot, handle, transforms); },
            py::arg("slot"), py::arg("handle"), py::arg("transforms"))
        .def("unbind", &handbind::BoundHand::unbind, py::arg("slot"))
        .def(
            "is_bound", [](const handbind::BoundHand& self, handbind::JointSlot slot)
            { return self.joint(slot).is_bound(); }, py::arg("slot"))
        .def("bound_count", &handbind::BoundHand::bound_count)
        .def_readwrite("scale_offset", &handbind::BoundHand::scale_offset)
        .def_readwrite("elbow_offset", &handbind::BoundHand::elbow_offset)
        .def_readwrite("base_scale", &handbind::BoundHand::base_scale);

    py::class_<handbind::Bone>(m, "Bone")
        .def_property_readonly("prev_joint", [](const handbind::Bone& self) { return to_array(self.prev_joint); })
        .def_property_readonly("next_joint", [](const handbind::Bone& self) { return to_array(self.next_joint); })
        .def_property_readonly("center", [](const handbind::Bone& self) { return to_array(self.center); })
        .def_property_readonly("direction", [](const handbind::Bone& self) { return to_array(self.direction); })
        .def_property_readonly("rotation", [](const handbind::Bone& self) { return to_array(self.rotation); })
        .def_readonly("length", &handbind::Bone::length)
        .def_readonly("width", &handbind::Bone::width)
        .def_readonly("type", &handbind::Bone::type);

    py::class_<handbind::Arm>(m, "Arm")
        .def_property_readonly("prev_joint", [](const handbind::Arm& self) { return to_array(self.prev_joint); })
        .def_property_readonly("next_joint", [](const handbind::Arm& self) { return to_array(self.next_joint); })
        .def_property_readonly("center", [](const handbind::Arm& self) { return to_array(self.center); })
        .def_property_readonly("direction", [](const handbind::Arm& self) { return to_array(self.direction); })
        .def_readonly("length", &handbind::Arm::length)
        .def_readonly("width", &handbind::Arm::width);

    py::class_<handbind::CanonicalHand>(m, "CanonicalHand")
        .def(py::init<>())
        .def(
            "bone",
            [](const handbind::CanonicalHand& self, handbind::FingerType finger, handbind::BoneType bone)
                -> const handbind::Bone& { return self.bone(finger, bone); },
            py::arg("finger"), py::arg("bone"), py::return_value_policy::reference_internal)
        .def(
            "tip_position", [](const handbind::CanonicalHand& self, handbind::FingerType finger)
            { return to_array(self.finger(finger).tip_position); }, py::arg("finger"))
        .def_property_readonly(
            "wrist_position", [](const handbind::CanonicalHand& self) { return to_array(self.wrist_position); })
        .def_property_readonly(
            "palm_position", [](const handbind::CanonicalHand& self) { return to_array(self.palm_position); })
        .def_property_readonly("stabilized_palm_position", [](const handbind::CanonicalHand& self)
                               { return to_array(self.stabilized_palm_position); })
        .def_readonly("palm_width", &handbind::CanonicalHand::palm_width)
        .def_readonly("arm", &handbind::CanonicalHand::arm, py::return_value_policy::reference_internal);

    m.def(
        "retarget",
        [](const handbind::BoundHand& bound_hand, const handbind::TransformRegistry& transforms,
           handbind::CanonicalHand* hand, float fingertip_scale)
        { return handbind::retarget(bound_hand, transforms, hand, fingertip_scale); },
        py::arg("bound_hand"), py::arg("transforms"), py::arg("hand").none(true),
        py::arg("fingertip_scale") = handbind::DEFAULT_FINGERTIP_SCALE, py::return_value_policy::reference,
        "Fit hand to the bound rig in place and return it. Returns None if hand is None.");
}
