// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief Record patches: building from specifications and applying to records.
///
/// Patch specification format (RFC 6902 plus "merge"):
/// @code
/// [
///   { "op": "add",     "path": "/tags/-",    "value": "urgent" },
///   { "op": "remove",  "path": "/notes/old" },
///   { "op": "replace", "path": "/items/0/qty", "value": 3 },
///   { "op": "move",    "path": "/tags/0",    "from": "/tags/2" },
///   { "op": "copy",    "path": "/billTo",    "from": "/shipTo" },
///   { "op": "test",    "path": "/status",    "value": "NEW" },
///   { "op": "merge",   "path": "/shipTo",    "value": { ... },
///                      "patch": [ ... operations on /shipTo/... ] }
/// ]
/// @endcode
///
/// Usage:
/// @code
/// auto types = RecordTypesLibrary::from_json(definition_text);
/// Patch patch = build_patch_from_json(types, "Order", patch_text);
///
/// PatchHandlers handlers;
/// handlers.on_set = [](OpKind, const Pointer& ptr, const Value&, const std::optional<Value>&) {
///     std::cout << "changed " << ptr.to_string() << "\n";
/// };
///
/// if (!patch.apply(order, handlers)) {
///     // a test operation failed
/// }
/// @endcode

#pragma once

#include <record_patch/api.h>
#include <record_patch/operation.h>
#include <record_patch/schema.h>
#include <record_patch/value.h>

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace record_patch {

/// Change notification callbacks; any of them may be left empty.
struct PatchHandlers {
    /// Array element inserted, or map key added
    std::function<void(OpKind, const Pointer&, const Value& new_value, const std::optional<Value>& old_value)>
        on_insert;

    /// Array element or map key removed
    std::function<void(OpKind, const Pointer&, const Value& old_value)>
        on_remove;

    /// Property (or existing map key) set; new_value is null when cleared
    std::function<void(OpKind, const Pointer&, const Value& new_value, const std::optional<Value>& old_value)>
        on_set;

    /// Test operation evaluated
    std::function<void(const Pointer&, const Value& value, bool passed)>
        on_test;
};

class RECORD_PATCH_API Patch {
public:
    Patch(std::vector<Operation> ops,
          std::set<std::string> involved_prop_paths,
          std::set<std::string> updated_prop_paths);

    /// Apply the operations to record, in order.
    ///
    /// Stops at the first failed test operation. There is no rollback: the
    /// operations before it stay applied. Apply to a copy (cheap for
    /// persistent Values) and keep it only on success for all-or-nothing.
    ///
    /// @return false if a test operation failed
    /// @throws DataError if the record does not fit an operation, or a merge
    ///         has to add a value that is incomplete on its own
    bool apply(Value& record, const PatchHandlers& handlers = {}) const;

    [[nodiscard]] const std::vector<Operation>& operations() const noexcept { return ops_; }
    [[nodiscard]] std::size_t size() const noexcept { return ops_.size(); }
    [[nodiscard]] bool empty() const noexcept { return ops_.empty(); }

    /// Dot-notation paths of all properties read, erased or updated
    [[nodiscard]] const std::set<std::string>& involved_prop_paths() const noexcept { return involved_; }

    /// Dot-notation paths of properties the patch may change, including the
    /// nested objects containing them
    [[nodiscard]] const std::set<std::string>& updated_prop_paths() const noexcept { return updated_; }

private:
    std::vector<Operation> ops_;
    std::set<std::string> involved_;
    std::set<std::string> updated_;
};

// ============================================================
// Builders
// ============================================================

/// Build a patch from an operation list Value.
/// @throws UsageError if the record type is unknown or spec is not an array
/// @throws SyntaxError if an operation is invalid for the record type
[[nodiscard]] RECORD_PATCH_API Patch build_patch(const RecordTypes& types,
                                                 std::string_view record_type_name,
                                                 const Value& spec);

/// Build a patch from JSON patch text.
/// @throws SyntaxError if the text is not valid JSON
[[nodiscard]] RECORD_PATCH_API Patch build_patch_from_json(const RecordTypes& types,
                                                           std::string_view record_type_name,
                                                           const std::string& json_text);

/// Build a patch from an RFC 7396 merge patch: null members remove,
/// arrays and scalars replace, objects merge recursively.
/// @throws SyntaxError if merge_patch is not an object or does not fit the
///         record type
[[nodiscard]] RECORD_PATCH_API Patch build_merge_patch(const RecordTypes& types,
                                                       std::string_view record_type_name,
                                                       const Value& merge_patch);

/// Operation list Value equivalent to an RFC 7396 merge patch
[[nodiscard]] RECORD_PATCH_API Value merge_patch_to_spec(const Value& merge_patch);

} // namespace record_patch
