// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_pointer.h
/// @brief JSON Pointer (RFC 6901) token handling.
///
///   "/items/0/name"  ->  ["items", "0", "name"]
///
/// RFC 6901: https://datatracker.ietf.org/doc/html/rfc6901
///
/// - Paths start with "/" (root reference)
/// - Segments separated by "/"
/// - Escape sequences: "~0" -> "~", "~1" -> "/"
/// - Empty pointer "" refers to the whole document
///
/// Tokens are plain strings here; deciding whether a token is a property
/// name, an array index or a map key is the resolver's job (pointer.h).

#pragma once

#include <record_patch/api.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace record_patch {

/// Escape one token: "~" -> "~0", "/" -> "~1"
[[nodiscard]] RECORD_PATCH_API std::string escape_token(std::string_view token);

/// Unescape one token; nullopt if it holds a "~" not followed by 0 or 1
[[nodiscard]] RECORD_PATCH_API std::optional<std::string> unescape_token(std::string_view token);

/// Split a pointer into unescaped tokens
/// @throws SyntaxError if the pointer does not start with "/" or holds a bad escape
[[nodiscard]] RECORD_PATCH_API std::vector<std::string> parse_json_pointer(std::string_view pointer);

/// Join tokens back into a pointer string, escaping each
[[nodiscard]] RECORD_PATCH_API std::string tokens_to_json_pointer(const std::vector<std::string>& tokens);

/// Decimal array index without leading zeros ("0", "17"; not "01", "-", "")
[[nodiscard]] RECORD_PATCH_API bool is_array_index(std::string_view token) noexcept;

} // namespace record_patch
