// value_compare.h - Structural comparison of record values

#pragma once

#include <record_patch/api.h>
#include <record_patch/value.h>

namespace record_patch {

/// Deep structural equality in record terms:
/// - numbers compare by numeric value (int64 5 equals double 5.0)
/// - vectors compare element by element, in order
/// - maps compare key by key; a member holding null is the same as an absent one
/// Equal immer containers sharing the same root are detected in O(1).
[[nodiscard]] RECORD_PATCH_API bool values_equal(const Value& a, const Value& b);

/// True for null, an empty vector and an empty map
[[nodiscard]] RECORD_PATCH_API bool is_empty_value(const Value& v);

/// Equality for whole-collection property values: null, absent and empty
/// collections are all the same thing
[[nodiscard]] RECORD_PATCH_API bool collections_equal(const Value& a, const Value& b);

namespace detail {

[[nodiscard]] bool maps_equal(const ValueMap& a, const ValueMap& b);
[[nodiscard]] bool vectors_equal(const ValueVector& a, const ValueVector& b);

} // namespace detail

} // namespace record_patch
