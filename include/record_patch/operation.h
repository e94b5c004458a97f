// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file operation.h
/// @brief Validated patch operations.
///
/// Operations are built by build_patch() only, after their pointers and
/// values passed validation. Each alternative holds what its interpreter
/// needs at apply time and nothing else.

#pragma once

#include <record_patch/api.h>
#include <record_patch/pointer.h>
#include <record_patch/value.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace record_patch {

class Patch;

enum class OpKind {
    Add,
    Remove,
    Replace,
    Move,
    Copy,
    Test,
    Merge
};

/// Operation name as used in patch specifications ("add", "remove", ...)
[[nodiscard]] RECORD_PATCH_API std::string_view op_kind_name(OpKind kind) noexcept;

struct AddOp {
    Pointer path;
    Value value;
};

struct RemoveOp {
    Pointer path;
};

struct ReplaceOp {
    Pointer path;
    Value value;
};

struct MoveOp {
    Pointer path;
    Pointer from;
};

struct CopyOp {
    Pointer path;
    Pointer from;
};

struct TestOp {
    Pointer path;
    Value value;
};

/// Patch an existing object or map, or add value if there is none
struct MergeOp {
    Pointer path;
    Value value;                               ///< null members stripped
    std::shared_ptr<const Patch> patch;
    std::optional<std::string> add_error;      ///< why value cannot be added, if so
};

using Operation = std::variant<AddOp, RemoveOp, ReplaceOp, MoveOp, CopyOp, TestOp, MergeOp>;

[[nodiscard]] RECORD_PATCH_API OpKind operation_kind(const Operation& op) noexcept;

/// Target pointer of any operation
[[nodiscard]] RECORD_PATCH_API const Pointer& operation_path(const Operation& op) noexcept;

} // namespace record_patch
