// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/binding/transform_source.hpp"

#include <stdexcept>
#include <string>

namespace handbind
{

TransformHandle TransformRegistry::add(const XrPosef& pose)
{
    TransformHandle handle = next_handle_++;
    poses_.emplace(handle, pose);
    return handle;
}

void TransformRegistry::set_pose(TransformHandle handle, const XrPosef& pose)
{
    auto it = poses_.find(handle);
    if (it == poses_.end())
    {
        throw std::out_of_range("Unknown transform handle: " + std::to_string(handle));
    }
    it->second = pose;
}

bool TransformRegistry::remove(TransformHandle handle)
{
    return poses_.erase(handle) > 0;
}

bool TransformRegistry::contains(TransformHandle handle) const
{
    return poses_.find(handle) != poses_.end();
}

size_t TransformRegistry::size() const
{
    return poses_.size();
}

std::optional<XrPosef> TransformRegistry::locate(TransformHandle handle) const
{
    auto it = poses_.find(handle);
    if (it == poses_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

} // namespace handbind
