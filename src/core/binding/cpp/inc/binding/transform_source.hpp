// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <openxr/openxr.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace handbind
{

// Opaque identity of a transform owned by the host scene graph
using TransformHandle = uint64_t;

// Host scene graph seam: resolves a handle to the transform's current world pose.
// A handle that no longer resolves is treated as unbound by the retargeter.
class ITransformSource
{
public:
    virtual ~ITransformSource() = default;

    virtual std::optional<XrPosef> locate(TransformHandle handle) const = 0;
};

// In-memory transform source for hosts without a scene graph of their own
class TransformRegistry : public ITransformSource
{
public:
    TransformRegistry() = default;

    // Register a transform and return its handle. Handles are never reused.
    TransformHandle add(const XrPosef& pose);

    // Throws std::out_of_range if the handle is not registered
    void set_pose(TransformHandle handle, const XrPosef& pose);

    // Returns false if the handle was not registered
    bool remove(TransformHandle handle);

    bool contains(TransformHandle handle) const;
    size_t size() const;

    std::optional<XrPosef> locate(TransformHandle handle) const override;

private:
    std::unordered_map<TransformHandle, XrPosef> poses_;
    TransformHandle next_handle_ = 1;
};

} // namespace handbind
