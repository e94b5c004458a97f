// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file validator.cpp
/// @brief Patch operation validation against record types.

#include <record_patch/validator.h>
#include <record_patch/errors.h>

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <set>

namespace record_patch {

namespace {

using ErrorMessage = std::optional<std::string>;

bool all_digits(std::string_view text, std::size_t pos, std::size_t len)
{
    for (std::size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

int digits_value(std::string_view text, std::size_t pos, std::size_t len)
{
    int result = 0;
    for (std::size_t i = pos; i < pos + len; ++i) {
        result = result * 10 + (text[i] - '0');
    }
    return result;
}

bool is_valid_object_value(const RecordTypes& types,
                           const Value& value,
                           const PropertiesContainer& container,
                           bool for_update);

/// Check a value as a scalar of the property (for collections, as one element)
ErrorMessage invalid_scalar_value(const RecordTypes& types,
                                  const Value& value,
                                  const PropertyDescriptor& prop,
                                  bool for_update)
{
    if (value.is_null()) {
        if (prop.is_object()) {
            return "unexpected null instead of an object.";
        }
        return std::nullopt;
    }

    switch (prop.scalar_kind()) {
    case ScalarKind::String:
        if (!value.is_string()) return "expected string.";
        break;
    case ScalarKind::Number:
        if (!value.is_finite_number()) return "expected number.";
        break;
    case ScalarKind::Boolean:
        if (!value.is_bool()) return "expected boolean.";
        break;
    case ScalarKind::Datetime:
        if (!value.is_string() || !is_valid_datetime(value.as_string_view())) {
            return "expected ISO 8601 string.";
        }
        break;
    case ScalarKind::Ref:
        if (!is_valid_ref_value(types, value, prop)) {
            return "expected " + prop.ref_target() + " reference.";
        }
        break;
    case ScalarKind::Object:
        if (!is_valid_object_value(types, value, *prop.nested_properties(), for_update)) {
            return "expected matching object properties.";
        }
        break;
    }
    return std::nullopt;
}

/// Check a value as the whole value of the property
ErrorMessage invalid_whole_value(const RecordTypes& types,
                                 const Value& value,
                                 const PropertyDescriptor& prop,
                                 bool for_update)
{
    if (prop.is_array()) {
        const auto* items = value.get_if<ValueVector>();
        if (!items) {
            return "expected an array.";
        }
        if (!prop.optional() && items->empty()) {
            return "empty array for required property.";
        }
        for (const auto& item : *items) {
            if (auto err = invalid_scalar_value(types, item.get(), prop, for_update)) {
                return err;
            }
        }
        return std::nullopt;
    }

    if (prop.is_map()) {
        const auto* entries = value.get_if<ValueMap>();
        if (!entries) {
            return "expected an object.";
        }
        if (!prop.optional() && entries->empty()) {
            return "empty object for required property.";
        }
        for (const auto& [key, entry] : *entries) {
            if (auto err = invalid_scalar_value(types, entry.get(), prop, for_update)) {
                return err;
            }
        }
        return std::nullopt;
    }

    return invalid_scalar_value(types, value, prop, for_update);
}

bool is_valid_object_value(const RecordTypes& types,
                           const Value& value,
                           const PropertiesContainer& container,
                           bool for_update)
{
    if (!value.is_map()) {
        return false;
    }

    for (const auto& name : container.all_property_names()) {
        const PropertyDescriptor* prop = container.property(name);
        if (prop->is_view() || prop->is_calculated() || prop->is_subtype()) {
            continue;
        }
        const Value* member = value.find(name);
        if (!member || member->is_null()) {
            if (!prop->optional() && (!for_update || !prop->is_generated())) {
                return false;
            }
        } else if (invalid_whole_value(types, *member, *prop, for_update)) {
            return false;
        }
    }

    if (container.is_polymorph()) {
        const Value* type = value.find(container.type_property_name());
        if (!type || !type->is_string()) {
            return false;
        }
        const PropertyDescriptor* subtype = container.property(type->as_string_view());
        if (!subtype || !subtype->is_subtype()) {
            return false;
        }
        return is_valid_object_value(types, value, *subtype->nested_properties(), for_update);
    }

    return true;
}

bool same_structure(const PropertyDescriptor& a, const PropertyDescriptor& b)
{
    return a.structure() == b.structure();
}

} // anonymous namespace

// ============================================================
// Value format checks
// ============================================================

bool is_valid_datetime(std::string_view text)
{
    // YYYY-MM-DDTHH:MM:SS.sssZ
    if (text.size() != 24 ||
        !all_digits(text, 0, 4) || text[4] != '-' ||
        !all_digits(text, 5, 2) || text[7] != '-' ||
        !all_digits(text, 8, 2) || text[10] != 'T' ||
        !all_digits(text, 11, 2) || text[13] != ':' ||
        !all_digits(text, 14, 2) || text[16] != ':' ||
        !all_digits(text, 17, 2) || text[19] != '.' ||
        !all_digits(text, 20, 3) || text[23] != 'Z') {
        return false;
    }

    if (digits_value(text, 11, 2) > 23 ||
        digits_value(text, 14, 2) > 59 ||
        digits_value(text, 17, 2) > 59) {
        return false;
    }

    try {
        boost::gregorian::date date(
            static_cast<unsigned short>(digits_value(text, 0, 4)),
            static_cast<unsigned short>(digits_value(text, 5, 2)),
            static_cast<unsigned short>(digits_value(text, 8, 2)));
        return !date.is_special();
    } catch (const std::out_of_range&) {
        // bad year, month or day of month
        return false;
    }
}

bool is_valid_ref_value(const RecordTypes& types, const Value& value, const PropertyDescriptor& prop)
{
    if (!value.is_string()) {
        return false;
    }

    const std::string_view ref = value.as_string_view();
    const auto hash = ref.find('#');
    if (hash == std::string_view::npos || hash == 0 || hash == ref.size() - 1) {
        return false;
    }

    const std::string_view target = ref.substr(0, hash);
    if (target != prop.ref_target() || !types.has_record_type(target)) {
        return false;
    }

    const PropertiesContainer& target_type = types.record_type(target);
    const PropertyDescriptor* id_prop = target_type.property(target_type.id_property_name());
    if (id_prop && id_prop->scalar_kind() == ScalarKind::Number) {
        const std::string id(ref.substr(hash + 1));
        char* end = nullptr;
        const double number = std::strtod(id.c_str(), &end);
        if (end != id.c_str() + id.size() || !std::isfinite(number)) {
            return false;
        }
    }

    return true;
}

bool is_compatible_objects(const PropertyDescriptor& from_prop, const PropertyDescriptor& to_prop)
{
    const PropertiesContainer& from = *from_prop.nested_properties();
    const PropertiesContainer& to = *to_prop.nested_properties();

    const auto& to_names = to.all_property_names();
    std::set<std::string> unmatched(to_names.begin(), to_names.end());

    for (const auto& name : from.all_property_names()) {
        const PropertyDescriptor* p1 = from.property(name);
        if (p1->is_view() || p1->is_calculated()) {
            continue;
        }
        const PropertyDescriptor* p2 = to.property(name);
        if (!p2) {
            if (!p1->optional()) {
                return false;
            }
            continue;
        }
        unmatched.erase(name);

        if (!p1->optional() && p2->optional()) {
            return false;
        }
        if (!same_structure(*p1, *p2) || p1->scalar_kind() != p2->scalar_kind()) {
            return false;
        }
        if (p1->is_ref() && p1->ref_target() != p2->ref_target()) {
            return false;
        }
        if (p1->is_object() && !is_compatible_objects(*p1, *p2)) {
            return false;
        }
    }

    for (const auto& name : unmatched) {
        const PropertyDescriptor* p2 = to.property(name);
        if (!p2->is_view() && !p2->is_calculated()) {
            return false;
        }
    }

    return true;
}

// ============================================================
// OperationValidator
// ============================================================

OperationValidator::OperationValidator(const RecordTypes& types,
                                       const PropertiesContainer& record_type,
                                       std::size_t op_number,
                                       std::string op_name)
    : types_(types)
    , record_type_(record_type)
    , op_number_(op_number)
    , op_name_(std::move(op_name))
{}

Pointer OperationValidator::resolve(std::string_view field,
                                    const Value* pointer,
                                    bool disallow_trailing_dash,
                                    PointerUse use) const
{
    const std::string prefix = "Invalid patch operation #" + std::to_string(op_number_) + ": ";

    if (!pointer || !pointer->is_string()) {
        throw SyntaxError(prefix + std::string(field) + " is missing or is not a string.");
    }

    Pointer ptr;
    try {
        ptr = resolve_pointer(record_type_, pointer->as_string_view(), disallow_trailing_dash);
    } catch (const SyntaxError& e) {
        throw SyntaxError(prefix + e.what());
    }

    if (ptr.is_root()) {
        throw SyntaxError(prefix + "Patch operations involving top records as a whole are not allowed.");
    }

    const PropertyDescriptor& prop = *ptr.prop();
    if (use == PointerUse::Set) {
        if (!prop.modifiable()) {
            throw SyntaxError(prefix + "May not update non-modifiable property " + ptr.prop_path() + ".");
        }
    } else if (use == PointerUse::Erase) {
        if (!ptr.collection_element() && !prop.optional()) {
            throw SyntaxError(prefix + "May not remove a required property " + ptr.prop_path() + ".");
        }
    }

    return ptr;
}

void OperationValidator::validate_value(const Pointer& path_ptr, const Value* value, bool for_update) const
{
    auto fail = [this](const std::string& message) {
        throw SyntaxError("Invalid value in patch operation #" + std::to_string(op_number_) +
                          " (" + op_name_ + "): " + message);
    };

    if (!value) {
        fail("no value is provided for the operation.");
    }

    const PropertyDescriptor& prop = *path_ptr.prop();
    const bool element = path_ptr.collection_element();

    if (op_name_ == "merge") {
        if (!value->is_map()) {
            fail("merge value must be a non-null object.");
        }
        const bool whole_map = prop.is_map() && !element;
        const bool single_object = prop.is_object() && (prop.is_scalar() || element);
        if (!whole_map && !single_object) {
            fail("invalid merge target record element type.");
        }
        return;
    }

    if (value->is_null()) {
        if (!element && !prop.optional()) {
            fail("null for required property.");
        }
        if (element && prop.is_object()) {
            fail("null for nested object collection element.");
        }
        return;
    }

    ErrorMessage err = element
        ? invalid_scalar_value(types_, *value, prop, for_update)
        : invalid_whole_value(types_, *value, prop, for_update);
    if (err) {
        fail(*err);
    }
}

std::optional<std::string> OperationValidator::merge_addition_error(const Pointer& path_ptr,
                                                                   const Value& added) const
{
    const PropertyDescriptor& prop = *path_ptr.prop();
    return path_ptr.collection_element()
        ? invalid_scalar_value(types_, added, prop, true)
        : invalid_whole_value(types_, added, prop, true);
}

void OperationValidator::validate_from(const Pointer& path_ptr, const Pointer& from_ptr, bool for_move) const
{
    auto fail = [this](const std::string& message) {
        throw SyntaxError("Invalid \"from\" pointer in patch operation #" + std::to_string(op_number_) +
                          " (" + op_name_ + "): " + message);
    };

    if (for_move && path_ptr.is_child_of(from_ptr)) {
        fail("may not move location into one of its children.");
    }

    const PropertyDescriptor& from_prop = *from_ptr.prop();
    const PropertyDescriptor& to_prop = *path_ptr.prop();

    if (from_prop.scalar_kind() != to_prop.scalar_kind()) {
        fail("incompatible property value types.");
    }
    if (to_prop.is_ref() && from_prop.ref_target() != to_prop.ref_target()) {
        fail("incompatible reference property targets.");
    }
    if (to_prop.is_object() && !is_compatible_objects(from_prop, to_prop)) {
        fail("incompatible nested objects.");
    }

    if (to_prop.is_array() && !path_ptr.collection_element()) {
        if (!from_prop.is_array() || from_ptr.collection_element()) {
            fail("not an array.");
        }
    } else if (to_prop.is_map() && !path_ptr.collection_element()) {
        if (!from_prop.is_map() || from_ptr.collection_element()) {
            fail("not a map.");
        }
    } else if (!from_prop.is_scalar() && !from_ptr.collection_element()) {
        fail("not a scalar.");
    }
}

} // namespace record_patch
