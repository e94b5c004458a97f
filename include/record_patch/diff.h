// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff.h
/// @brief Patch specifications computed from two versions of a record.
///
/// The result is an ordinary operation list: build it with build_patch() and
/// apply it to the old record to get a record equal to the new one.
///
/// Arrays are aligned greedily, first match wins:
/// @code
/// old: ["A","B","C","D","E","F","G"]
/// new: ["A","B","E","F","G"]
/// ->   [{"op":"remove","path":"/arr/2"}, {"op":"remove","path":"/arr/2"}]
/// @endcode
///
/// Arrays of nested objects are matched by the nested objects' id property,
/// and matched elements are diffed property by property.

#pragma once

#include <record_patch/api.h>
#include <record_patch/patch.h>
#include <record_patch/schema.h>
#include <record_patch/value.h>

#include <string_view>

namespace record_patch {

/// Operation list turning old_record into new_record.
///
/// View, calculated and record meta properties are ignored. Id properties
/// are never removed.
///
/// @throws UsageError if the record type is unknown, old_record is not an
///         object, or a nested object array's type has no id property
/// @throws SyntaxError if new_record is not an object, has properties the
///         record type does not declare, or holds values of the wrong shape
[[nodiscard]] RECORD_PATCH_API Value diff_records(const RecordTypes& types,
                                                  std::string_view record_type_name,
                                                  const Value& old_record,
                                                  const Value& new_record);

/// build_patch() over diff_records()
[[nodiscard]] RECORD_PATCH_API Patch build_diff_patch(const RecordTypes& types,
                                                      std::string_view record_type_name,
                                                      const Value& old_record,
                                                      const Value& new_record);

} // namespace record_patch
