// value_compare.cpp - Structural comparison of record values

#include <record_patch/value_compare.h>

namespace record_patch {

namespace detail {

namespace {

std::size_t non_null_count(const ValueMap& m)
{
    std::size_t n = 0;
    for (const auto& [k, v] : m) {
        if (!v->is_null()) ++n;
    }
    return n;
}

} // anonymous namespace

bool maps_equal(const ValueMap& a, const ValueMap& b)
{
    // immer container identity check - O(1)
    if (a.identity() == b.identity()) [[likely]] {
        return true;
    }

    if (non_null_count(a) != non_null_count(b)) {
        return false;
    }
    for (const auto& [k, v] : a) {
        if (v->is_null()) {
            continue;
        }
        auto* other = b.find(k);
        if (!other || !values_equal(*v, other->get())) {
            return false;
        }
    }
    return true;
}

bool vectors_equal(const ValueVector& a, const ValueVector& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    auto it_b = b.begin();
    for (const auto& v : a) {
        if (!values_equal(*v, **it_b)) {
            return false;
        }
        ++it_b;
    }
    return true;
}

} // namespace detail

bool values_equal(const Value& a, const Value& b)
{
    if (a.is_number() && b.is_number()) {
        if (auto* ia = a.get_if<int64_t>()) {
            if (auto* ib = b.get_if<int64_t>()) {
                return *ia == *ib;
            }
        }
        return a.as_number() == b.as_number();
    }

    if (a.data.index() != b.data.index()) {
        return false;
    }

    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = *b.get_if<T>();
        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return detail::maps_equal(lhs, rhs);
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return detail::vectors_equal(lhs, rhs);
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

bool is_empty_value(const Value& v)
{
    if (v.is_null()) return true;
    if (auto* m = v.get_if<ValueMap>()) return m->empty();
    if (auto* vec = v.get_if<ValueVector>()) return vec->empty();
    return false;
}

bool collections_equal(const Value& a, const Value& b)
{
    if (is_empty_value(a)) {
        return is_empty_value(b);
    }
    return values_equal(a, b);
}

} // namespace record_patch
