// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_utils.cpp
/// @brief Implementation of path traversal utilities.

#include <record_patch/path_utils.h>
#include <record_patch/errors.h>

namespace record_patch {

namespace {

Value set_at_path_recursive(
    const Value& root,
    const Path& path,
    std::size_t path_index,
    Value new_val)
{
    if (path_index >= path.size()) {
        return new_val;  // Base case: replace current node
    }

    const auto& elem = path[path_index];
    Value current_child = get_at_path_element_strict(root, elem);
    Value new_child = set_at_path_recursive(current_child, path, path_index + 1, std::move(new_val));
    return set_at_path_element(root, elem, std::move(new_child));
}

} // anonymous namespace

Value get_at_path_element_strict(const Value& current, const PathElement& elem)
{
    if (auto* key = std::get_if<std::string>(&elem)) {
        const Value* found = current.find(*key);
        if (!found || found->is_null()) {
            detail::log_element_error("get_at_path_element_strict", *key, "missing in record");
            throw DataError("Missing record element " + *key + ".");
        }
        return *found;
    }

    const auto index = std::get<std::size_t>(elem);
    if (!current.contains(index)) {
        detail::log_element_error("get_at_path_element_strict", index, "missing in record");
        throw DataError("Missing record array element " + std::to_string(index) + ".");
    }
    Value item = current.at(index);
    if (item.is_null()) {
        detail::log_element_error("get_at_path_element_strict", index, "is null in record");
        throw DataError("Record array element " + std::to_string(index) + " is null.");
    }
    return item;
}

Value get_at_path_strict(const Value& root, const Path& path)
{
    Value current = root;
    for (std::size_t i = 0; i < path.size(); ++i) {
        try {
            current = get_at_path_element_strict(current, path[i]);
        } catch (const DataError&) {
            Path prefix(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(i + 1));
            throw DataError("Missing intermediate record element at " + path_to_string(prefix) + ".");
        }
    }
    return current;
}

Value set_at_path_direct(const Value& root, const Path& path, Value new_val)
{
    if (path.empty()) {
        return new_val;
    }
    return set_at_path_recursive(root, path, 0, std::move(new_val));
}

} // namespace record_patch
