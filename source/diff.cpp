// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff.cpp
/// @brief Record diff: property-wise comparison and greedy array alignment.

#include <record_patch/diff.h>
#include <record_patch/builders.h>
#include <record_patch/errors.h>
#include <record_patch/json_pointer.h>
#include <record_patch/value_compare.h>

#include <set>

namespace record_patch {

namespace {

bool is_absent(const Value* v)
{
    return !v || v->is_null();
}

class Differ {
public:
    explicit Differ(VectorBuilder& spec)
        : spec_(spec)
    {}

    void diff_objects(const PropertiesContainer& container,
                      const std::string& prefix,
                      const Value& old_obj,
                      const Value& new_obj)
    {
        std::set<std::string> unrecognized;
        for (const auto& [name, member] : new_obj.as_map()) {
            unrecognized.insert(name);
        }

        diff_object_props(container, prefix, old_obj, new_obj, unrecognized);

        if (container.is_polymorph()) {
            const std::string& type_prop = container.type_property_name();
            unrecognized.erase(type_prop);

            const Value* old_type = old_obj.find(type_prop);
            const Value* new_type = new_obj.find(type_prop);
            if (is_absent(old_type) || is_absent(new_type) || !values_equal(*old_type, *new_type)) {
                throw SyntaxError("Polymorphic object type does not match at " + prefix + ".");
            }
            const PropertyDescriptor* subtype = container.property(old_type->as_string_view());
            if (!subtype || !subtype->is_subtype()) {
                throw SyntaxError("Invalid polymorphic object type at " + prefix + ".");
            }
            diff_object_props(*subtype->nested_properties(),
                              prefix + escape_token(subtype->name() + ":"),
                              old_obj, new_obj, unrecognized);
        }

        if (!unrecognized.empty()) {
            std::string names;
            for (const auto& name : unrecognized) {
                names += (names.empty() ? "" : ", ") + name;
            }
            throw SyntaxError("Unrecognized properties for " + container.record_type_name() +
                              " at " + prefix + ": " + names);
        }
    }

private:
    VectorBuilder& spec_;

    void emit_remove(const std::string& path)
    {
        spec_.push_back(operation_builder("remove", path).finish());
    }

    void emit(const char* op, const std::string& path, const Value& value)
    {
        spec_.push_back(operation_builder(op, path)
            .set("value", value)
            .finish());
    }

    void diff_object_props(const PropertiesContainer& container,
                           const std::string& prefix,
                           const Value& old_obj,
                           const Value& new_obj,
                           std::set<std::string>& unrecognized)
    {
        for (const auto& name : container.all_property_names()) {
            const PropertyDescriptor& prop = *container.property(name);
            if (prop.is_subtype()) {
                continue;
            }
            unrecognized.erase(name);

            if (prop.is_view() || prop.is_calculated() || prop.is_record_meta()) {
                continue;
            }

            const Value* old_val = old_obj.find(name);
            const Value* new_val = new_obj.find(name);
            const std::string path = prefix + escape_token(name);

            if (is_absent(new_val)) {
                if (!is_absent(old_val) && !prop.is_id()) {
                    emit_remove(path);
                }
                continue;
            }

            if (prop.is_array()) {
                const auto* new_items = new_val->get_if<ValueVector>();
                if (!new_items) {
                    throw SyntaxError("Provided value for " + container.record_type_name() +
                                      " property at " + path + " is not an array.");
                }
                const auto* old_items = is_absent(old_val) ? nullptr : old_val->get_if<ValueVector>();
                if (new_items->empty()) {
                    if (old_items && !old_items->empty()) {
                        emit_remove(path);
                    }
                } else if (!old_items || old_items->empty()) {
                    emit("replace", path, *new_val);
                } else if (prop.is_object()) {
                    diff_object_arrays(prop, path, *old_items, *new_items);
                } else {
                    diff_value_arrays(path, *old_items, *new_items);
                }

            } else if (prop.is_map()) {
                const auto* new_entries = new_val->get_if<ValueMap>();
                if (!new_entries) {
                    throw SyntaxError("Provided value for " + container.record_type_name() +
                                      " property at " + path + " is not an object.");
                }
                const auto* old_entries = is_absent(old_val) ? nullptr : old_val->get_if<ValueMap>();
                if (new_entries->empty()) {
                    if (old_entries && !old_entries->empty()) {
                        emit_remove(path);
                    }
                } else if (!old_entries || old_entries->empty()) {
                    emit("replace", path, *new_val);
                } else {
                    diff_maps(prop, path, *old_entries, *new_entries);
                }

            } else if (prop.is_object()) {
                if (!new_val->is_map()) {
                    throw SyntaxError("Provided value for " + container.record_type_name() +
                                      " property at " + path + " is not an object.");
                }
                if (is_absent(old_val) || !old_val->is_map()) {
                    emit("replace", path, *new_val);
                } else {
                    diff_objects(*prop.nested_properties(), path + "/", *old_val, *new_val);
                }

            } else if (is_absent(old_val) || !values_equal(*old_val, *new_val)) {
                emit("replace", path, *new_val);
            }
        }
    }

    /// Two-cursor alignment shared by scalar and nested object arrays.
    ///
    /// match(old, new) decides whether two elements are the same element,
    /// on_match(old, new, element_ptr) handles a kept pair. With
    /// pair_unmatched, unmatched runs are paired up as replacements before
    /// removing or adding the excess.
    template <typename Match, typename OnMatch>
    void align_arrays(const std::string& path,
                      const ValueVector& old_items,
                      const ValueVector& new_items,
                      bool pair_unmatched,
                      Match match,
                      OnMatch on_match)
    {
        const std::size_t old_len = old_items.size();
        const std::size_t new_len = new_items.size();
        std::size_t i = 0;
        std::size_t j = 0;
        std::size_t t = 0;

        auto at_t = [&] { return path + "/" + std::to_string(t); };
        auto keep = [&] {
            on_match(old_items[i].get(), new_items[j].get(), at_t());
            ++i;
            ++j;
            ++t;
        };
        auto add_at_t = [&] {
            emit("add", at_t(), new_items[j].get());
            ++j;
            ++t;
        };
        auto replace_at_t = [&] {
            emit("replace", at_t(), new_items[j].get());
            ++i;
            ++j;
            ++t;
        };
        auto remove_at_t = [&] {
            emit_remove(at_t());
            ++i;
        };

        while (i < old_len && j < new_len) {
            const Value& old_val = old_items[i].get();
            if (match(old_val, new_items[j].get())) {
                keep();
                continue;
            }

            // old element further ahead in new: insert the elements before it
            std::size_t d = j;
            while (d < new_len && !match(old_val, new_items[d].get())) {
                ++d;
            }
            if (d < new_len) {
                while (j < d) {
                    add_at_t();
                }
                keep();
                continue;
            }

            // old element gone: find the next old element still in new
            std::size_t s = i + 1;
            for (; s < old_len; ++s) {
                for (d = j; d < new_len; ++d) {
                    if (match(old_items[s].get(), new_items[d].get())) {
                        break;
                    }
                }
                if (d < new_len) {
                    break;
                }
            }
            if (s >= old_len) {
                break;
            }

            if (pair_unmatched) {
                while (i < s && j < d) {
                    replace_at_t();
                }
            }
            while (i < s) {
                remove_at_t();
            }
            while (j < d) {
                add_at_t();
            }
            keep();
        }

        if (pair_unmatched) {
            while (i < old_len && j < new_len) {
                replace_at_t();
            }
        }
        while (i < old_len) {
            remove_at_t();
        }
        for (; j < new_len; ++j) {
            emit("add", path + "/-", new_items[j].get());
        }
    }

    void diff_value_arrays(const std::string& path, const ValueVector& old_items, const ValueVector& new_items)
    {
        align_arrays(path, old_items, new_items, true,
            [](const Value& a, const Value& b) { return values_equal(a, b); },
            [](const Value&, const Value&, const std::string&) {});
    }

    void diff_object_arrays(const PropertyDescriptor& prop,
                            const std::string& path,
                            const ValueVector& old_items,
                            const ValueVector& new_items)
    {
        const PropertiesContainer& nested = *prop.nested_properties();
        const std::string& id_prop = nested.id_property_name();
        if (id_prop.empty()) {
            throw UsageError("Nested object elements without id property are not supported.");
        }

        align_arrays(path, old_items, new_items, false,
            [&id_prop](const Value& a, const Value& b) {
                const Value* a_id = a.find(id_prop);
                const Value* b_id = b.find(id_prop);
                return !is_absent(a_id) && !is_absent(b_id) && values_equal(*a_id, *b_id);
            },
            [this, &nested](const Value& a, const Value& b, const std::string& element_ptr) {
                diff_objects(nested, element_ptr + "/", a, b);
            });
    }

    void diff_maps(const PropertyDescriptor& prop,
                   const std::string& path,
                   const ValueMap& old_entries,
                   const ValueMap& new_entries)
    {
        std::set<std::string> new_keys;
        for (const auto& [key, entry] : new_entries) {
            new_keys.insert(key);
        }

        std::set<std::string> keys_to_remove;
        for (const auto& [key, entry] : old_entries) {
            if (!entry->is_null()) {
                keys_to_remove.insert(key);
            }
        }

        for (const auto& key : new_keys) {
            const Value& new_val = new_entries.find(key)->get();
            if (new_val.is_null()) {
                continue;
            }
            keys_to_remove.erase(key);

            const auto* old_box = old_entries.find(key);
            const std::string entry_path = path + "/" + escape_token(key);
            if (!old_box || old_box->get().is_null()) {
                emit("add", entry_path, new_val);
            } else if (prop.is_object()) {
                if (!new_val.is_map()) {
                    throw SyntaxError("Provided nested object at " + entry_path + " is not an object.");
                }
                diff_objects(*prop.nested_properties(), entry_path + "/", old_box->get(), new_val);
            } else if (!values_equal(old_box->get(), new_val)) {
                emit("replace", entry_path, new_val);
            }
        }

        for (const auto& key : keys_to_remove) {
            emit_remove(path + "/" + escape_token(key));
        }
    }
};

} // anonymous namespace

Value diff_records(const RecordTypes& types,
                   std::string_view record_type_name,
                   const Value& old_record,
                   const Value& new_record)
{
    if (!types.has_record_type(record_type_name)) {
        throw UsageError("Unknown record type " + std::string(record_type_name) + ".");
    }
    const PropertiesContainer& record_type = types.record_type(record_type_name);

    if (!old_record.is_map()) {
        throw UsageError("Specified original record is not a non-null object.");
    }
    if (!new_record.is_map()) {
        throw SyntaxError("Specified new record is not a non-null object.");
    }

    VectorBuilder spec;
    Differ(spec).diff_objects(record_type, "/", old_record, new_record);
    return spec.finish();
}

Patch build_diff_patch(const RecordTypes& types,
                       std::string_view record_type_name,
                       const Value& old_record,
                       const Value& new_record)
{
    return build_patch(types, record_type_name, diff_records(types, record_type_name, old_record, new_record));
}

} // namespace record_patch
