// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Transient-backed builders for map and vector Values.
///
/// Patch specifications produced by the differ and by merge patch
/// conversion are assembled with these:
/// @code
///   Value spec = VectorBuilder()
///       .push_back(operation_builder("replace", "/name")
///           .set("value", "Alice")
///           .finish())
///       .finish();
/// @endcode

#pragma once

#include "value.h"

namespace record_patch {

template <typename MemoryPolicy>
class BasicMapBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_map = BasicValueMap<MemoryPolicy>;

    BasicMapBuilder() : transient_(value_map{}.transient()) {}

    BasicMapBuilder(BasicMapBuilder&&) noexcept = default;
    BasicMapBuilder& operator=(BasicMapBuilder&&) noexcept = default;

    // a copied transient would alias the same nodes
    BasicMapBuilder(const BasicMapBuilder&) = delete;
    BasicMapBuilder& operator=(const BasicMapBuilder&) = delete;

    BasicMapBuilder& set(const std::string& key, value_type val) {
        transient_.set(key, BasicValueBox<MemoryPolicy>{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    /// The builder must not be used after finish()
    [[nodiscard]] value_type finish() { return value_type{transient_.persistent()}; }

private:
    typename value_map::transient_type transient_;
};

template <typename MemoryPolicy>
class BasicVectorBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_vector = BasicValueVector<MemoryPolicy>;

    BasicVectorBuilder() : transient_(value_vector{}.transient()) {}

    BasicVectorBuilder(BasicVectorBuilder&&) noexcept = default;
    BasicVectorBuilder& operator=(BasicVectorBuilder&&) noexcept = default;

    BasicVectorBuilder(const BasicVectorBuilder&) = delete;
    BasicVectorBuilder& operator=(const BasicVectorBuilder&) = delete;

    BasicVectorBuilder& push_back(value_type val) {
        transient_.push_back(BasicValueBox<MemoryPolicy>{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    /// The builder must not be used after finish()
    [[nodiscard]] value_type finish() { return value_type{transient_.persistent()}; }

private:
    typename value_vector::transient_type transient_;
};

using MapBuilder    = BasicMapBuilder<thread_safe_memory_policy>;
using VectorBuilder = BasicVectorBuilder<thread_safe_memory_policy>;

/// Operation map with "op" and "path" already set
inline MapBuilder operation_builder(const char* op, const std::string& path)
{
    MapBuilder builder;
    builder.set("op", op).set("path", path);
    return builder;
}

RECORD_PATCH_EXTERN_TEMPLATE class BasicMapBuilder<thread_safe_memory_policy>;
RECORD_PATCH_EXTERN_TEMPLATE class BasicVectorBuilder<thread_safe_memory_policy>;

} // namespace record_patch
