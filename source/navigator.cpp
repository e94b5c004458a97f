// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file navigator.cpp
/// @brief Pointer-addressed record access through owner lenses.

#include <record_patch/navigator.h>
#include <record_patch/errors.h>

#include <lager/lenses.hpp>

namespace record_patch {

namespace {

[[noreturn]] void data_error(std::string_view func, const std::string& message)
{
    detail::log_access_error(func, message);
    throw DataError(message);
}

/// Object owning the pointer's target property
Value view_owner(const Value& record, const Pointer& ptr, std::string_view func)
{
    Value owner = lager::view(ptr.owner_lens(), record);
    if (!owner.is_map()) {
        data_error(func, "Record element at " + path_to_string(ptr.owner_path()) + " is not an object.");
    }
    return owner;
}

/// Collection value of the property (null if unset), checked for its type
Value collection_of(const Value& owner, const Pointer& ptr, std::string_view func)
{
    const PointerSegment& seg = ptr.property_segment();
    const Value* member = owner.find(seg.key);
    if (!member || member->is_null()) {
        return Value{};
    }
    const bool type_ok = seg.prop->is_array() ? member->is_vector() : member->is_map();
    if (!type_ok) {
        data_error(func, "Record property " + ptr.prop_path() + " is not " +
                         (seg.prop->is_array() ? "an array." : "a map."));
    }
    return *member;
}

Value empty_collection(const PropertyDescriptor& prop)
{
    return prop.is_array() ? Value{ValueVector{}} : Value{ValueMap{}};
}

void require_not_root(const Pointer& ptr, std::string_view func)
{
    if (ptr.is_root()) {
        throw UsageError(std::string(func) + ": operation on the whole record is not allowed.");
    }
}

void store_owner(Value& record, const Pointer& ptr, Value owner)
{
    record = lager::set(ptr.owner_lens(), record, std::move(owner));
}

std::optional<Value> write(Value& record, const Pointer& ptr, Value value, bool overwrite)
{
    const char* func = overwrite ? "replace_by_pointer" : "add_by_pointer";
    require_not_root(ptr, func);

    Value owner = view_owner(record, ptr, func);
    const PointerSegment& prop_seg = ptr.property_segment();

    if (!ptr.collection_element()) {
        const Value* member = owner.find(prop_seg.key);
        Value old = member ? *member : Value{};
        if (value.is_null()) {
            if (member) {
                store_owner(record, ptr, owner.erase(prop_seg.key));
            }
        } else {
            store_owner(record, ptr, owner.set(prop_seg.key, std::move(value)));
        }
        return old;
    }

    const PointerSegment& elem = ptr.last_segment();
    if (value.is_null() && prop_seg.prop->is_object()) {
        data_error(func, "Nested object element at " + ptr.to_string() + " may not be null.");
    }

    Value collection = collection_of(owner, ptr, func);
    if (collection.is_null()) {
        collection = empty_collection(*prop_seg.prop);
    }

    std::optional<Value> old;
    switch (elem.kind) {
    case PointerSegment::Kind::Append:
        if (overwrite) {
            data_error(func, "No array element to replace at " + ptr.to_string() + ".");
        }
        collection = collection.push_back(std::move(value));
        break;

    case PointerSegment::Kind::Index:
        if (overwrite) {
            if (elem.index >= collection.size()) {
                data_error(func, "No array element to replace at " + ptr.to_string() + ".");
            }
            old = collection.at(elem.index);
            collection = collection.set(elem.index, std::move(value));
        } else {
            if (elem.index > collection.size()) {
                data_error(func, "Array index at " + ptr.to_string() + " is past the end of the array.");
            }
            collection = collection.insert(elem.index, std::move(value));
        }
        break;

    case PointerSegment::Kind::Key:
        if (const Value* found = collection.find(elem.key)) {
            old = *found;
        }
        collection = collection.set(elem.key, std::move(value));
        break;

    case PointerSegment::Kind::Property:
        break;
    }

    store_owner(record, ptr, owner.set(prop_seg.key, std::move(collection)));
    return old;
}

} // anonymous namespace

std::optional<Value> get_by_pointer(const Value& record, const Pointer& ptr)
{
    if (ptr.is_root()) {
        return record;
    }

    Value owner = view_owner(record, ptr, "get_by_pointer");
    const PointerSegment& prop_seg = ptr.property_segment();

    if (!ptr.collection_element()) {
        const Value* member = owner.find(prop_seg.key);
        return member ? *member : Value{};
    }

    Value collection = collection_of(owner, ptr, "get_by_pointer");
    if (collection.is_null()) {
        return std::nullopt;
    }

    const PointerSegment& elem = ptr.last_segment();
    switch (elem.kind) {
    case PointerSegment::Kind::Index:
        if (elem.index < collection.size()) {
            return collection.at(elem.index);
        }
        return std::nullopt;

    case PointerSegment::Kind::Key:
        if (const Value* found = collection.find(elem.key)) {
            return *found;
        }
        return std::nullopt;

    default:
        return std::nullopt;
    }
}

std::optional<Value> add_by_pointer(Value& record, const Pointer& ptr, Value value)
{
    return write(record, ptr, std::move(value), false);
}

std::optional<Value> replace_by_pointer(Value& record, const Pointer& ptr, Value value)
{
    return write(record, ptr, std::move(value), true);
}

std::optional<Value> remove_by_pointer(Value& record, const Pointer& ptr)
{
    require_not_root(ptr, "remove_by_pointer");

    Value owner = view_owner(record, ptr, "remove_by_pointer");
    const PointerSegment& prop_seg = ptr.property_segment();

    if (!ptr.collection_element()) {
        const Value* member = owner.find(prop_seg.key);
        if (!member) {
            return Value{};
        }
        Value old = *member;
        store_owner(record, ptr, owner.erase(prop_seg.key));
        return old;
    }

    Value collection = collection_of(owner, ptr, "remove_by_pointer");
    if (collection.is_null()) {
        return std::nullopt;
    }

    const PointerSegment& elem = ptr.last_segment();
    std::optional<Value> old;
    if (elem.kind == PointerSegment::Kind::Index) {
        if (elem.index >= collection.size()) {
            return std::nullopt;
        }
        old = collection.at(elem.index);
        collection = collection.erase(elem.index);
    } else if (elem.kind == PointerSegment::Kind::Key) {
        const Value* found = collection.find(elem.key);
        if (!found) {
            return std::nullopt;
        }
        old = *found;
        collection = collection.erase(elem.key);
    } else {
        return std::nullopt;
    }

    store_owner(record, ptr, owner.set(prop_seg.key, std::move(collection)));
    return old;
}

} // namespace record_patch
