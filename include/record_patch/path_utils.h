// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_utils.h
/// @brief Path traversal utilities behind the pointer lenses.
///
/// Two flavours:
/// - strict get: every step must exist and be non-null, otherwise DataError
///   (used to reach the object owning a pointer's target property)
/// - set: rebuilds the persistent tree along the path

#pragma once

#include <record_patch/api.h>
#include <record_patch/value.h>

namespace record_patch {

/// Set value at a single path element (key or index)
[[nodiscard]] inline Value set_at_path_element(const Value& current, const PathElement& elem, Value new_val)
{
    if (auto* key = std::get_if<std::string>(&elem)) {
        return current.set(*key, std::move(new_val));
    } else {
        return current.set(std::get<std::size_t>(elem), std::move(new_val));
    }
}

/// Get the value at one path element
/// @throws DataError if the element is missing or null
[[nodiscard]] RECORD_PATCH_API Value get_at_path_element_strict(const Value& current, const PathElement& elem);

/// Get the value at a full path
/// @throws DataError naming the first missing step
[[nodiscard]] RECORD_PATCH_API Value get_at_path_strict(const Value& root, const Path& path);

/// Rebuild root with new_val placed at path (recursive, structural sharing)
[[nodiscard]] RECORD_PATCH_API Value set_at_path_direct(const Value& root, const Path& path, Value new_val);

} // namespace record_patch
