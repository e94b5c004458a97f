// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file record_types.h
/// @brief In-memory record types library built from a definition Value.
///
/// Definition format:
/// @code
/// {
///   "recordTypes": {
///     "Order": {
///       "properties": {
///         "id":       { "valueType": "number", "role": "id" },
///         "customer": { "valueType": "ref(Customer)" },
///         "tags":     { "valueType": "string[]", "optional": true },
///         "notes":    { "valueType": "string{}", "optional": true },
///         "items":    { "valueType": "object[]", "properties": { ... } },
///         "payment":  { "valueType": "object", "optional": true,
///                       "typePropertyName": "type",
///                       "subtypes": {
///                         "CARD": { "properties": { ... } },
///                         "CASH": { "properties": { ... } }
///                       },
///                       "properties": { ... common properties ... } }
///       }
///     }
///   }
/// }
/// @endcode
///
/// Value types: string, number, boolean, datetime, object, ref(Target),
/// each optionally followed by "[]" (array) or "{}" (map).
///
/// Property flags (all default to false unless noted):
/// - optional
/// - modifiable (default true; false for id, view, calculated, recordMeta)
/// - role: "id"
/// - view, calculated, generated, recordMeta
///
/// Properties are listed in name order.

#pragma once

#include <record_patch/api.h>
#include <record_patch/schema.h>
#include <record_patch/value.h>

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace record_patch {

class RECORD_PATCH_API RecordTypesLibrary final : public RecordTypes {
public:
    /// @throws UsageError if the definition is malformed
    explicit RecordTypesLibrary(const Value& definition);

    /// @throws UsageError if the JSON text or the definition is malformed
    [[nodiscard]] static RecordTypesLibrary from_json(const std::string& json_text);

    RecordTypesLibrary(RecordTypesLibrary&&) noexcept;
    RecordTypesLibrary& operator=(RecordTypesLibrary&&) noexcept;
    ~RecordTypesLibrary() override;

    RecordTypesLibrary(const RecordTypesLibrary&) = delete;
    RecordTypesLibrary& operator=(const RecordTypesLibrary&) = delete;

    [[nodiscard]] bool has_record_type(std::string_view name) const override;
    [[nodiscard]] const PropertiesContainer& record_type(std::string_view name) const override;

    [[nodiscard]] std::vector<std::string> record_type_names() const;

private:
    std::map<std::string, std::unique_ptr<PropertiesContainer>, std::less<>> types_;
};

} // namespace record_patch
