// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Dynamic value type for records and patch specifications.
///
/// Alternatives: null (std::monostate), bool, int64, double, string, and the
/// persistent immer map and flex_vector. Records handed to Patch::apply()
/// have a map at the root. A patch specification is a vector of operation
/// maps, whether it came from JSON text or was assembled with builders.h.
///
/// Updates return a new Value that shares structure with the old one, so
/// keeping earlier record versions around is cheap.
/// Accessors are soft: a wrong type or missing element yields null (or the
/// unchanged Value) and is reported through detail::log_*.

#pragma once

#include "record_patch_config.h"
#include "api.h"

#include <immer/box.hpp>
#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>

#include <cmath>
#include <cstdint>
#include <iostream>
#include <source_location> // for std::source_location (C++20)
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace record_patch {

namespace detail {

// Soft accessor failures. The caller gets null or an unchanged Value back;
// with RECORD_PATCH_VERBOSE_LOG the reason and call site go to stderr.

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if RECORD_PATCH_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " at " << loc.file_name() << ":" << loc.line() << "\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

/// Element is a map key (string) or an array index
template <typename Element>
void log_element_error(
    std::string_view func,
    const Element& element,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if RECORD_PATCH_VERBOSE_LOG
    std::cerr << "[" << func << "] ";
    if constexpr (std::is_convertible_v<const Element&, std::string_view>) {
        std::cerr << "key '" << element << "' ";
    } else {
        std::cerr << "index " << element << " ";
    }
    std::cerr << reason << " at " << loc.file_name() << ":" << loc.line() << "\n";
#else
    (void)func;
    (void)element;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueMap = immer::map<std::string,
                                 BasicValueBox<MemoryPolicy>,
                                 std::hash<std::string>,
                                 std::equal_to<std::string>,
                                 MemoryPolicy>;

// flex_vector: array patches insert and erase in the middle
template <typename MemoryPolicy>
using BasicValueVector = immer::flex_vector<BasicValueBox<MemoryPolicy>,
                                            MemoryPolicy>;

using PathElement = std::variant<std::string, std::size_t>;
using Path        = std::vector<PathElement>;

template <typename MemoryPolicy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;

    std::variant<int64_t,
                 double,
                 bool,
                 std::string,
                 value_map,
                 value_vector,
                 std::monostate>
        data;

    constexpr BasicValue() noexcept : data(std::monostate{}) {}
    constexpr BasicValue(int v) noexcept : data(static_cast<int64_t>(v)) {}
    constexpr BasicValue(int64_t v) noexcept : data(v) {}
    constexpr BasicValue(double v) noexcept : data(v) {}
    constexpr BasicValue(bool v) noexcept : data(v) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_map v) : data(std::move(v)) {}
    BasicValue(value_vector v) : data(std::move(v)) {}

    static BasicValue map(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue vector(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_map() const noexcept { return is<value_map>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<int64_t>() || is<double>(); }

    /// Finite number (JSON cannot carry NaN or infinities, code can)
    [[nodiscard]] bool is_finite_number() const noexcept {
        if (is<int64_t>()) return true;
        if (auto* d = get_if<double>()) return std::isfinite(*d);
        return false;
    }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        detail::log_element_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        detail::log_element_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    /// Map member lookup without logging; nullptr when absent or not a map
    [[nodiscard]] const BasicValue* find(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return &found->get();
        }
        return nullptr;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] value_map as_map(value_map default_val = {}) const {
        if (auto* p = get_if<value_map>()) return *p;
        return default_val;
    }

    [[nodiscard]] value_vector as_vector(value_vector default_val = {}) const {
        if (auto* p = get_if<value_vector>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return count(key) > 0; }

    [[nodiscard]] bool contains(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) return index < v->size();
        return false;
    }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* m = get_if<value_map>()) return m->set(key, value_box{std::move(val)});
        detail::log_element_error("Value::set", key, "cannot set on non-map type");
        return *this;
    }

    [[nodiscard]] BasicValue set(std::size_t index, BasicValue val) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return v->set(index, value_box{std::move(val)});
        }
        detail::log_element_error("Value::set", index, "cannot set on non-vector type");
        return *this;
    }

    [[nodiscard]] BasicValue erase(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->erase(key);
        detail::log_element_error("Value::erase", key, "cannot erase from non-map type");
        return *this;
    }

    [[nodiscard]] BasicValue erase(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return v->erase(index);
        }
        detail::log_element_error("Value::erase", index, "out of range or type mismatch");
        return *this;
    }

    /// Insert before index; index == size() appends
    [[nodiscard]] BasicValue insert(std::size_t index, BasicValue val) const {
        if (auto* v = get_if<value_vector>()) {
            if (index <= v->size()) return v->insert(index, value_box{std::move(val)});
        }
        detail::log_element_error("Value::insert", index, "out of range or type mismatch");
        return *this;
    }

    [[nodiscard]] BasicValue push_back(BasicValue val) const {
        if (auto* v = get_if<value_vector>()) return v->push_back(value_box{std::move(val)});
        detail::log_access_error("Value::push_back", "cannot append to non-vector type");
        return *this;
    }

    [[nodiscard]] std::size_t count(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->count(key);
        return 0;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }

    using size_type = std::size_t;
};

// ============================================================
// Memory Policy
// ============================================================

/// Thread-safe memory policy: atomic refcount + spinlock-protected free list
using thread_safe_memory_policy = immer::default_memory_policy;

// ============================================================
// Value - the record value type
//
// Atomic reference counting: a Patch and the literal Values it holds can
// be applied from several threads at once, each thread to its own record.
// ============================================================
using Value       = BasicValue<thread_safe_memory_policy>;
using ValueBox    = BasicValueBox<thread_safe_memory_policy>;
using ValueMap    = BasicValueMap<thread_safe_memory_policy>;
using ValueVector = BasicValueVector<thread_safe_memory_policy>;

/// Representation equality: int 1 and double 1.0 differ here.
/// Use values_equal() (value_compare.h) for record semantics.
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

// ============================================================
// Utility functions
// ============================================================

/// Print a record as indented "key: json" lines, members in key order
RECORD_PATCH_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

/// Path as JSON Pointer text (e.g. "/items/0/name"); "/" for the root
[[nodiscard]] RECORD_PATCH_API std::string path_to_string(const Path& path);

// ============================================================
// JSON text conversion
// ============================================================

/// Serialize to JSON text. Map members are written in sorted key order.
[[nodiscard]] RECORD_PATCH_API std::string to_json(const Value& val, bool compact = true);

/// Parse JSON text. Integers that fit int64 stay int64, other numbers are double.
/// On failure returns null and, if error_out is given, stores the reason
/// with the offset of the offending character.
[[nodiscard]] RECORD_PATCH_API Value from_json(const std::string& json_str, std::string* error_out = nullptr);

RECORD_PATCH_EXTERN_TEMPLATE struct BasicValue<thread_safe_memory_policy>;

} // namespace record_patch
