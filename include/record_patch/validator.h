// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file validator.h
/// @brief Build-time validation of patch operation targets, values and sources.
///
/// Every check runs while a Patch is being built and nothing here looks at
/// a record. Violations are SyntaxErrors naming the 1-based operation
/// number, except merge_addition_error(), whose result waits for apply.

#pragma once

#include <record_patch/api.h>
#include <record_patch/pointer.h>
#include <record_patch/schema.h>
#include <record_patch/value.h>

#include <optional>
#include <string>
#include <string_view>

namespace record_patch {

/// How an operation uses the location a pointer addresses
enum class PointerUse {
    Read,   ///< test target, copy source
    Set,    ///< add, replace, merge, move and copy destination
    Erase   ///< remove target, move source
};

class RECORD_PATCH_API OperationValidator {
public:
    /// @param op_number 1-based position of the operation in its list
    /// @param op_name   operation name as written in the specification
    OperationValidator(const RecordTypes& types,
                       const PropertiesContainer& record_type,
                       std::size_t op_number,
                       std::string op_name);

    /// Resolve the operation's "path" or "from" member.
    ///
    /// @param field     member name, for messages
    /// @param pointer   member value; nullptr if absent
    /// @throws SyntaxError if the member is not a string, the pointer does
    ///         not resolve, addresses the whole record, or its target does
    ///         not allow the use
    [[nodiscard]] Pointer resolve(std::string_view field,
                                  const Value* pointer,
                                  bool disallow_trailing_dash,
                                  PointerUse use) const;

    /// Check a literal value against the target of path_ptr.
    ///
    /// @param value      nullptr if the operation has no value member
    /// @param for_update false for test values, where generated nested object
    ///                   properties must be present too
    void validate_value(const Pointer& path_ptr, const Value* value, bool for_update) const;

    /// Reason the null-stripped value of a merge operation could not be
    /// added where path_ptr has no value yet; nullopt if it can.
    /// A merge into an existing object may be partial, so this is not an
    /// error until the merge has to add.
    [[nodiscard]] std::optional<std::string> merge_addition_error(const Pointer& path_ptr,
                                                                  const Value& added) const;

    /// Check that the value at from_ptr fits the target of path_ptr.
    void validate_from(const Pointer& path_ptr, const Pointer& from_ptr, bool for_move) const;

    [[nodiscard]] std::size_t op_number() const noexcept { return op_number_; }
    [[nodiscard]] const std::string& op_name() const noexcept { return op_name_; }

private:
    const RecordTypes& types_;
    const PropertiesContainer& record_type_;
    std::size_t op_number_;
    std::string op_name_;
};

/// True for "YYYY-MM-DDTHH:MM:SS.sssZ" strings naming a valid UTC instant
[[nodiscard]] RECORD_PATCH_API bool is_valid_datetime(std::string_view text);

/// True for "Target#id" strings referring to a record of the property's
/// reference target (the id part must be numeric for numeric target ids)
[[nodiscard]] RECORD_PATCH_API bool is_valid_ref_value(const RecordTypes& types,
                                                       const Value& value,
                                                       const PropertyDescriptor& prop);

/// True if a value of from_prop's nested objects can be stored in to_prop
[[nodiscard]] RECORD_PATCH_API bool is_compatible_objects(const PropertyDescriptor& from_prop,
                                                          const PropertyDescriptor& to_prop);

} // namespace record_patch
