// lager_lens.h - Type-erased lenses over record values using lager::lens<Value, Value>

#pragma once

#include <record_patch/api.h>
#include <record_patch/value.h>

#include <lager/lens.hpp>
#include <lager/lenses.hpp>

namespace record_patch {

using LagerValueLens = lager::lens<Value, Value>;

/// Lens focusing the value at path.
///
/// - Empty path: identity lens
/// - Getter: strict traversal, throws DataError on a missing or null step
/// - Setter: rebuilds the record along the path
///
/// Use with lager::view / lager::set / lager::over.
[[nodiscard]] RECORD_PATCH_API LagerValueLens record_path_lens(const Path& path);

} // namespace record_patch
