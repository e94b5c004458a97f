// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types raised by the patch engine.
///
/// - UsageError:  the caller passed something unusable (unknown record type,
///                a patch specification that is not an array, a non-object
///                original record, a nested object array without
///                an id property handed to the differ).
/// - SyntaxError: the patch, merge patch or new record is invalid against
///                the record type (bad pointer, non-modifiable target, value
///                of the wrong type, incompatible move/copy).
/// - DataError:   the record being patched does not match what a validated
///                pointer expects (missing intermediate object, nothing to
///                remove or copy, no object for a partial merge to patch).
///
/// Usage and syntax errors are thrown before any record is touched.
/// A data error may be thrown by Patch::apply() after earlier operations
/// already modified the record.

#pragma once

#include "api.h"

#include <stdexcept>
#include <string>

namespace record_patch {

class RECORD_PATCH_API PatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RECORD_PATCH_API UsageError : public PatchError {
public:
    using PatchError::PatchError;
};

class RECORD_PATCH_API SyntaxError : public PatchError {
public:
    using PatchError::PatchError;
};

class RECORD_PATCH_API DataError : public PatchError {
public:
    using PatchError::PatchError;
};

} // namespace record_patch
