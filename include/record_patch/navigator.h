// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file navigator.h
/// @brief Read and modify the record element addressed by a resolved Pointer.
///
/// Records are persistent Values: every modifying call rebinds the caller's
/// Value& to a new root that shares all untouched subtrees with the old one.
///
/// Navigation to the object owning the target property goes through the
/// pointer's owner lens and is strict: a missing or null intermediate
/// element is a DataError. Below the owner, absence is data, not an error:
///
/// | Pointer target          | Missing value reads as |
/// |-------------------------|------------------------|
/// | whole property          | null                   |
/// | array element / "-"     | std::nullopt           |
/// | map element             | std::nullopt           |

#pragma once

#include <record_patch/api.h>
#include <record_patch/pointer.h>
#include <record_patch/value.h>

#include <optional>

namespace record_patch {

/// Read the addressed value.
/// @throws DataError if an intermediate element is missing or null, or a
///         collection holds a value of the wrong type
[[nodiscard]] RECORD_PATCH_API std::optional<Value> get_by_pointer(const Value& record, const Pointer& ptr);

/// Insert before an array index ("-" and index == size append), set a map
/// key, or set the whole property. Writing null to a whole property clears
/// it. An absent collection is created on element writes.
/// @return the previous value; std::nullopt for array insertions and absent
///         map keys, null for an unset property
/// @throws UsageError for the root pointer
/// @throws DataError if the record does not fit the pointer
RECORD_PATCH_API std::optional<Value> add_by_pointer(Value& record, const Pointer& ptr, Value value);

/// Like add_by_pointer(), except that an array element must exist and is
/// overwritten in place.
/// @throws DataError if the addressed array element does not exist
RECORD_PATCH_API std::optional<Value> replace_by_pointer(Value& record, const Pointer& ptr, Value value);

/// Erase an array element (shifting the tail left) or a map key, or clear
/// the whole property.
/// @return the erased value; std::nullopt if no element was there, null if
///         the property was unset
/// @throws UsageError for the root pointer
RECORD_PATCH_API std::optional<Value> remove_by_pointer(Value& record, const Pointer& ptr);

} // namespace record_patch
