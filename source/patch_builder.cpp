// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch_builder.cpp
/// @brief Building validated patches from operation lists and merge patches.

#include <record_patch/patch.h>
#include <record_patch/builders.h>
#include <record_patch/errors.h>
#include <record_patch/json_pointer.h>
#include <record_patch/validator.h>

#include <algorithm>

namespace record_patch {

namespace {

/// RFC 7396 applied to nothing: null members disappear at every level
Value strip_null_members(const Value& value)
{
    const auto* members = value.get_if<ValueMap>();
    if (!members) {
        return value;
    }
    MapBuilder builder;
    for (const auto& [key, member] : *members) {
        if (!member->is_null()) {
            builder.set(key, strip_null_members(*member));
        }
    }
    return builder.finish();
}

std::vector<std::string> sorted_keys(const ValueMap& map)
{
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& [key, member] : map) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

/// Shared state of one build_patch() call, nested merge operation lists
/// included
class BuildContext {
public:
    BuildContext(const RecordTypes& types, const PropertiesContainer& record_type)
        : types_(types)
        , record_type_(record_type)
    {}

    std::vector<Operation> parse_operations(const ValueVector& defs)
    {
        std::vector<Operation> ops;
        ops.reserve(defs.size());
        std::size_t op_number = 0;
        for (const auto& def : defs) {
            ops.push_back(parse_operation(*def, ++op_number));
        }
        return ops;
    }

    std::set<std::string> involved;
    std::set<std::string> updated;

private:
    const RecordTypes& types_;
    const PropertiesContainer& record_type_;

    Operation parse_operation(const Value& def, std::size_t op_number)
    {
        const std::string prefix = "Invalid patch operation #" + std::to_string(op_number) + ": ";

        if (!def.is_map()) {
            throw SyntaxError(prefix + "operation specification is not an object.");
        }
        const Value* op = def.find("op");
        if (!op || !op->is_string()) {
            throw SyntaxError(prefix + "op is missing or is not a string.");
        }

        const std::string op_name = op->as_string();
        const OperationValidator validator(types_, record_type_, op_number, op_name);
        const Value* path = def.find("path");
        const Value* value = def.find("value");

        if (op_name == "add") {
            Pointer ptr = validator.resolve("path", path, false, PointerUse::Set);
            validator.validate_value(ptr, value, true);
            add_involved_property(ptr, true);
            return AddOp{std::move(ptr), *value};
        }

        if (op_name == "remove") {
            Pointer ptr = validator.resolve("path", path, true, PointerUse::Erase);
            add_involved_property(ptr, true);
            return RemoveOp{std::move(ptr)};
        }

        if (op_name == "replace") {
            Pointer ptr = validator.resolve("path", path, true, PointerUse::Set);
            validator.validate_value(ptr, value, true);
            add_involved_property(ptr, true);
            return ReplaceOp{std::move(ptr), *value};
        }

        if (op_name == "move") {
            Pointer ptr = validator.resolve("path", path, false, PointerUse::Set);
            Pointer from = validator.resolve("from", def.find("from"), true, PointerUse::Erase);
            validator.validate_from(ptr, from, true);
            add_involved_property(ptr, true);
            add_involved_property(from, true);
            return MoveOp{std::move(ptr), std::move(from)};
        }

        if (op_name == "copy") {
            Pointer ptr = validator.resolve("path", path, false, PointerUse::Set);
            Pointer from = validator.resolve("from", def.find("from"), true, PointerUse::Read);
            validator.validate_from(ptr, from, false);
            add_involved_property(ptr, true);
            add_involved_property(from, false);
            return CopyOp{std::move(ptr), std::move(from)};
        }

        if (op_name == "test") {
            Pointer ptr = validator.resolve("path", path, true, PointerUse::Read);
            validator.validate_value(ptr, value, false);
            add_involved_property(ptr, false);
            return TestOp{std::move(ptr), *value};
        }

        if (op_name == "merge") {
            Pointer ptr = validator.resolve("path", path, true, PointerUse::Set);
            const Value* nested = def.find("patch");
            if (!nested || !nested->is_vector()) {
                throw SyntaxError(prefix + "patch is not an array.");
            }
            validator.validate_value(ptr, value, true);
            add_involved_property(ptr, true);
            auto nested_patch = std::make_shared<const Patch>(
                parse_operations(nested->as_vector()), std::set<std::string>{}, std::set<std::string>{});
            Value added = strip_null_members(*value);
            auto add_error = validator.merge_addition_error(ptr, added);
            return MergeOp{std::move(ptr), std::move(added), std::move(nested_patch), std::move(add_error)};
        }

        throw SyntaxError(prefix + "unknown operation \"" + op_name + "\".");
    }

    void add_involved_property(const Pointer& ptr, bool updating)
    {
        const std::string& prop_path = ptr.prop_path();

        if (updating) {
            // containing nested objects change too
            for (auto dot = prop_path.find('.'); dot != std::string::npos; dot = prop_path.find('.', dot + 1)) {
                updated.insert(prop_path.substr(0, dot));
            }
        }

        const PropertyDescriptor& prop = *ptr.prop();
        if (prop.is_object()) {
            add_involved_object(*prop.nested_properties(), updating);
        } else {
            involved.insert(prop_path);
            if (updating) {
                updated.insert(prop_path);
            }
        }
    }

    void add_involved_object(const PropertiesContainer& container, bool updating)
    {
        for (const auto& name : container.all_property_names()) {
            const PropertyDescriptor* prop = container.property(name);
            if (prop->is_calculated() || prop->is_view()) {
                continue;
            }
            if (prop->is_object()) {
                add_involved_object(*prop->nested_properties(), updating);
            } else {
                const std::string prop_path = container.nested_path() + name;
                involved.insert(prop_path);
                if (updating) {
                    updated.insert(prop_path);
                }
            }
        }
    }
};

void merge_level(const std::string& base_ptr, const ValueMap& level, VectorBuilder& ops)
{
    for (const auto& key : sorted_keys(level)) {
        const Value& merge_val = level.find(key)->get();
        const std::string path = base_ptr + "/" + escape_token(key);

        if (merge_val.is_null()) {
            ops.push_back(operation_builder("remove", path).finish());
        } else if (const auto* nested = merge_val.get_if<ValueMap>()) {
            VectorBuilder nested_ops;
            merge_level(path, *nested, nested_ops);
            ops.push_back(operation_builder("merge", path)
                .set("value", merge_val)
                .set("patch", nested_ops.finish())
                .finish());
        } else {
            ops.push_back(operation_builder("replace", path)
                .set("value", merge_val)
                .finish());
        }
    }
}

} // anonymous namespace

Patch build_patch(const RecordTypes& types, std::string_view record_type_name, const Value& spec)
{
    if (!types.has_record_type(record_type_name)) {
        throw UsageError("Unknown record type " + std::string(record_type_name) + ".");
    }
    const PropertiesContainer& record_type = types.record_type(record_type_name);

    const auto* defs = spec.get_if<ValueVector>();
    if (!defs) {
        throw UsageError("Patch specification is not an array.");
    }

    BuildContext context(types, record_type);
    std::vector<Operation> ops = context.parse_operations(*defs);
    return Patch(std::move(ops), std::move(context.involved), std::move(context.updated));
}

Patch build_patch_from_json(const RecordTypes& types, std::string_view record_type_name, const std::string& json_text)
{
    std::string error;
    Value spec = from_json(json_text, &error);
    if (!error.empty()) {
        throw SyntaxError("Invalid patch specification JSON: " + error);
    }
    return build_patch(types, record_type_name, spec);
}

Value merge_patch_to_spec(const Value& merge_patch)
{
    const auto* level = merge_patch.get_if<ValueMap>();
    if (!level) {
        throw SyntaxError("Merge patch must be an object.");
    }
    VectorBuilder ops;
    merge_level("", *level, ops);
    return ops.finish();
}

Patch build_merge_patch(const RecordTypes& types, std::string_view record_type_name, const Value& merge_patch)
{
    return build_patch(types, record_type_name, merge_patch_to_spec(merge_patch));
}

} // namespace record_patch
