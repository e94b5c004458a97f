// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.cpp
/// @brief Patch application: one interpreter overload per operation kind.

#include <record_patch/patch.h>
#include <record_patch/errors.h>
#include <record_patch/navigator.h>
#include <record_patch/value_compare.h>

namespace record_patch {

std::string_view op_kind_name(OpKind kind) noexcept
{
    switch (kind) {
        case OpKind::Add:     return "add";
        case OpKind::Remove:  return "remove";
        case OpKind::Replace: return "replace";
        case OpKind::Move:    return "move";
        case OpKind::Copy:    return "copy";
        case OpKind::Test:    return "test";
        case OpKind::Merge:   return "merge";
    }
    return "unknown";
}

OpKind operation_kind(const Operation& op) noexcept
{
    return static_cast<OpKind>(op.index());
}

const Pointer& operation_path(const Operation& op) noexcept
{
    return std::visit([](const auto& o) -> const Pointer& { return o.path; }, op);
}

namespace {

/// Whole collections compare with null, absent and empty all alike
bool differs(const Value& record, const Pointer& ptr, const Value& value)
{
    const PropertyDescriptor& prop = *ptr.prop();
    auto current = get_by_pointer(record, ptr);

    if (!ptr.collection_element() && !prop.is_scalar()) {
        return !collections_equal(current.value_or(Value{}), value);
    }
    return !current || !values_equal(*current, value);
}

/// True if "add" of value at ptr would change the record
bool needs_add(const Value& record, const Pointer& ptr, const Value& value)
{
    if (ptr.collection_element() && ptr.prop()->is_array()) {
        return true;  // insertion always grows the array
    }
    return differs(record, ptr, value);
}

/// True if "replace" of value at ptr would change the record
bool needs_replace(const Value& record, const Pointer& ptr, const Value& value)
{
    return differs(record, ptr, value);
}

struct OperationInterpreter
{
    Value& record;
    const PatchHandlers& handlers;

    bool operator()(const AddOp& op) const
    {
        add_value(OpKind::Add, op.path, op.value);
        return true;
    }

    bool operator()(const RemoveOp& op) const
    {
        erase_value(OpKind::Remove, op.path, "remove");
        return true;
    }

    bool operator()(const ReplaceOp& op) const
    {
        if (needs_replace(record, op.path, op.value)) {
            auto old = replace_by_pointer(record, op.path, op.value);
            if (handlers.on_set) {
                handlers.on_set(OpKind::Replace, op.path, op.value, old);
            }
        }
        return true;
    }

    bool operator()(const MoveOp& op) const
    {
        if (op.path == op.from) {
            return true;
        }
        Value value = erase_value(OpKind::Move, op.from, "move");
        add_value(OpKind::Move, op.path, value);
        return true;
    }

    bool operator()(const CopyOp& op) const
    {
        auto value = get_by_pointer(record, op.from);
        if (!value) {
            throw DataError("No value to copy at " + op.from.to_string() + ".");
        }
        add_value(OpKind::Copy, op.path, *value);
        return true;
    }

    bool operator()(const TestOp& op) const
    {
        const bool passed = !needs_replace(record, op.path, op.value);
        if (handlers.on_test) {
            handlers.on_test(op.path, op.value, passed);
        }
        if (!passed) {
            detail::log_access_error("Patch::apply", "test failed at " + op.path.to_string());
        }
        return passed;
    }

    bool operator()(const MergeOp& op) const
    {
        auto current = get_by_pointer(record, op.path);
        if (current && !current->is_null()) {
            return op.patch->apply(record, handlers);
        }
        if (op.add_error) {
            throw DataError("Cannot add merge value at " + op.path.to_string() + ": " + *op.add_error);
        }
        add_value(OpKind::Merge, op.path, op.value);
        return true;
    }

private:
    void add_value(OpKind kind, const Pointer& ptr, const Value& value) const
    {
        if (!needs_add(record, ptr, value)) {
            return;
        }
        auto old = add_by_pointer(record, ptr, value);
        if (ptr.collection_element() && (ptr.prop()->is_array() || !old)) {
            if (handlers.on_insert) {
                handlers.on_insert(kind, ptr, value, old);
            }
        } else if (handlers.on_set) {
            handlers.on_set(kind, ptr, value, old);
        }
    }

    /// Erase at ptr; the erased value (null for an unset property)
    Value erase_value(OpKind kind, const Pointer& ptr, std::string_view verb) const
    {
        auto old = remove_by_pointer(record, ptr);

        if (ptr.collection_element()) {
            if (!old) {
                throw DataError("No value to " + std::string(verb) + " at " + ptr.to_string() + ".");
            }
            if (handlers.on_remove) {
                handlers.on_remove(kind, ptr, *old);
            }
            return *old;
        }

        Value removed = old.value_or(Value{});
        if (!is_empty_value(removed) && handlers.on_set) {
            handlers.on_set(kind, ptr, Value{}, removed);
        }
        return removed;
    }
};

} // anonymous namespace

Patch::Patch(std::vector<Operation> ops,
             std::set<std::string> involved_prop_paths,
             std::set<std::string> updated_prop_paths)
    : ops_(std::move(ops))
    , involved_(std::move(involved_prop_paths))
    , updated_(std::move(updated_prop_paths))
{}

bool Patch::apply(Value& record, const PatchHandlers& handlers) const
{
    const OperationInterpreter interpreter{record, handlers};
    for (const auto& op : ops_) {
        if (!std::visit(interpreter, op)) {
            return false;
        }
    }
    return true;
}

} // namespace record_patch
