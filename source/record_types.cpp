// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file record_types.cpp
/// @brief RecordTypesLibrary: schema objects loaded from a definition Value.

#include <record_patch/record_types.h>
#include <record_patch/errors.h>

#include <algorithm>

namespace record_patch {

std::string_view scalar_kind_name(ScalarKind kind) noexcept
{
    switch (kind) {
        case ScalarKind::String:   return "string";
        case ScalarKind::Number:   return "number";
        case ScalarKind::Boolean:  return "boolean";
        case ScalarKind::Datetime: return "datetime";
        case ScalarKind::Ref:      return "ref";
        case ScalarKind::Object:   return "object";
    }
    return "unknown";
}

std::string PropertyDescriptor::property_path() const
{
    return container().nested_path() + name();
}

namespace {

class DefinedContainer;

struct PropertyFlags {
    bool optional = false;
    bool modifiable = true;
    bool id = false;
    bool calculated = false;
    bool view = false;
    bool record_meta = false;
    bool generated = false;
    bool subtype = false;
};

class DefinedProperty final : public PropertyDescriptor {
public:
    DefinedProperty(std::string name,
                    const PropertiesContainer& container,
                    StructureKind structure,
                    ScalarKind scalar_kind,
                    PropertyFlags flags,
                    std::string ref_target)
        : name_(std::move(name))
        , container_(&container)
        , structure_(structure)
        , scalar_kind_(scalar_kind)
        , flags_(flags)
        , ref_target_(std::move(ref_target))
    {}

    const std::string& name() const override { return name_; }
    const PropertiesContainer& container() const override { return *container_; }
    StructureKind structure() const override { return structure_; }
    ScalarKind scalar_kind() const override { return scalar_kind_; }
    bool optional() const override { return flags_.optional; }
    bool modifiable() const override { return flags_.modifiable; }
    bool is_id() const override { return flags_.id; }
    bool is_calculated() const override { return flags_.calculated; }
    bool is_view() const override { return flags_.view; }
    bool is_record_meta() const override { return flags_.record_meta; }
    bool is_generated() const override { return flags_.generated; }
    bool is_subtype() const override { return flags_.subtype; }
    const std::string& ref_target() const override { return ref_target_; }
    const PropertiesContainer* nested_properties() const override { return nested_.get(); }

    void set_nested(std::unique_ptr<DefinedContainer> nested);

private:
    std::string name_;
    const PropertiesContainer* container_;
    StructureKind structure_;
    ScalarKind scalar_kind_;
    PropertyFlags flags_;
    std::string ref_target_;
    std::unique_ptr<PropertiesContainer> nested_;
};

class DefinedContainer final : public PropertiesContainer {
public:
    DefinedContainer(std::string record_type_name, std::string nested_path)
        : record_type_name_(std::move(record_type_name))
        , nested_path_(std::move(nested_path))
    {}

    const std::string& record_type_name() const override { return record_type_name_; }
    const std::string& nested_path() const override { return nested_path_; }
    const std::vector<std::string>& all_property_names() const override { return names_; }

    const PropertyDescriptor* property(std::string_view name) const override {
        auto it = properties_.find(name);
        return it != properties_.end() ? it->second.get() : nullptr;
    }

    const std::string& id_property_name() const override { return id_property_name_; }
    bool is_polymorph() const override { return !type_property_name_.empty(); }
    const std::string& type_property_name() const override { return type_property_name_; }

    DefinedProperty& add_property(std::unique_ptr<DefinedProperty> prop) {
        const std::string name = prop->name();
        if (prop->is_id()) {
            id_property_name_ = name;
        }
        names_.insert(std::upper_bound(names_.begin(), names_.end(), name), name);
        auto& slot = properties_[name];
        slot = std::move(prop);
        return *slot;
    }

    void set_type_property_name(std::string name) { type_property_name_ = std::move(name); }

private:
    std::string record_type_name_;
    std::string nested_path_;
    std::vector<std::string> names_;
    std::map<std::string, std::unique_ptr<DefinedProperty>, std::less<>> properties_;
    std::string id_property_name_;
    std::string type_property_name_;
};

void DefinedProperty::set_nested(std::unique_ptr<DefinedContainer> nested)
{
    nested_ = std::move(nested);
}

struct ParsedValueType {
    StructureKind structure = StructureKind::Scalar;
    ScalarKind scalar_kind = ScalarKind::String;
    std::string ref_target;
};

[[noreturn]] void invalid_definition(const std::string& where, const std::string& what)
{
    throw UsageError("Invalid record types definition at " + where + ": " + what);
}

ParsedValueType parse_value_type(const std::string& where, std::string_view text)
{
    ParsedValueType result;

    if (text.ends_with("[]")) {
        result.structure = StructureKind::Array;
        text.remove_suffix(2);
    } else if (text.ends_with("{}")) {
        result.structure = StructureKind::Map;
        text.remove_suffix(2);
    }

    if (text == "string") {
        result.scalar_kind = ScalarKind::String;
    } else if (text == "number") {
        result.scalar_kind = ScalarKind::Number;
    } else if (text == "boolean") {
        result.scalar_kind = ScalarKind::Boolean;
    } else if (text == "datetime") {
        result.scalar_kind = ScalarKind::Datetime;
    } else if (text == "object") {
        result.scalar_kind = ScalarKind::Object;
    } else if (text.starts_with("ref(") && text.ends_with(")") && text.size() > 5) {
        result.scalar_kind = ScalarKind::Ref;
        result.ref_target = std::string(text.substr(4, text.size() - 5));
    } else {
        invalid_definition(where, "unknown value type \"" + std::string(text) + "\".");
    }

    return result;
}

bool flag(const Value& def, const char* name, bool default_val)
{
    const Value* v = def.find(name);
    if (!v || v->is_null()) {
        return default_val;
    }
    if (!v->is_bool()) {
        throw UsageError(std::string("Invalid record types definition: flag ") + name + " is not a boolean.");
    }
    return v->as_bool();
}

class DefinitionLoader {
public:
    explicit DefinitionLoader(std::vector<std::string>& ref_targets)
        : ref_targets_(ref_targets) {}

    void load_properties(DefinedContainer& container, const Value& container_def, const std::string& where)
    {
        const Value* props = container_def.find("properties");
        if (!props || !props->is_map()) {
            invalid_definition(where, "missing properties object.");
        }
        for (const auto& [name, box] : props->as_map()) {
            load_property(container, name, *box, where + "." + name);
        }
    }

private:
    std::vector<std::string>& ref_targets_;

    void load_property(DefinedContainer& container,
                       const std::string& name,
                       const Value& def,
                       const std::string& where)
    {
        if (!def.is_map()) {
            invalid_definition(where, "property definition is not an object.");
        }
        if (name.empty() || name.find(':') != std::string::npos) {
            invalid_definition(where, "invalid property name.");
        }

        const Value* vt = def.find("valueType");
        if (!vt || !vt->is_string()) {
            invalid_definition(where, "missing valueType.");
        }
        ParsedValueType type = parse_value_type(where, vt->as_string_view());

        PropertyFlags flags;
        const Value* role = def.find("role");
        flags.id = role && role->as_string_view() == "id";
        flags.view = flag(def, "view", false);
        flags.calculated = flag(def, "calculated", false);
        flags.record_meta = flag(def, "recordMeta", false);
        flags.generated = flag(def, "generated", flags.record_meta);
        flags.optional = flag(def, "optional", false);
        const bool read_only = flags.id || flags.view || flags.calculated || flags.record_meta;
        flags.modifiable = flag(def, "modifiable", !read_only);

        if (flags.id && type.structure != StructureKind::Scalar) {
            invalid_definition(where, "id property must be scalar.");
        }
        if (flags.id && type.scalar_kind != ScalarKind::String && type.scalar_kind != ScalarKind::Number) {
            invalid_definition(where, "id property must be a string or a number.");
        }
        if (type.scalar_kind == ScalarKind::Ref) {
            ref_targets_.push_back(type.ref_target);
        }

        auto prop = std::make_unique<DefinedProperty>(
            name, container, type.structure, type.scalar_kind, flags, type.ref_target);

        if (type.scalar_kind == ScalarKind::Object) {
            auto nested = std::make_unique<DefinedContainer>(
                container.record_type_name(), container.nested_path() + name + ".");
            load_properties(*nested, def, where);
            load_subtypes(*nested, def, where);
            prop->set_nested(std::move(nested));
        }

        container.add_property(std::move(prop));
    }

    void load_subtypes(DefinedContainer& container, const Value& def, const std::string& where)
    {
        const Value* type_prop = def.find("typePropertyName");
        const Value* subtypes = def.find("subtypes");
        if (!type_prop && !subtypes) {
            return;
        }
        if (!type_prop || !type_prop->is_string() || !subtypes || !subtypes->is_map() || subtypes->size() == 0) {
            invalid_definition(where, "polymorphic object needs typePropertyName and subtypes.");
        }
        if (container.property(type_prop->as_string_view())) {
            invalid_definition(where, "type property may not be declared as a regular property.");
        }
        container.set_type_property_name(type_prop->as_string());

        for (const auto& [subtype_name, subtype_def] : subtypes->as_map()) {
            const std::string sub_where = where + "<" + subtype_name + ">";
            if (container.property(subtype_name)) {
                invalid_definition(sub_where, "subtype name clashes with a property.");
            }
            PropertyFlags flags;
            flags.subtype = true;
            flags.optional = true;
            auto prop = std::make_unique<DefinedProperty>(
                subtype_name, container, StructureKind::Scalar, ScalarKind::Object, flags, std::string{});

            // subtype properties are stored flat in the object
            auto nested = std::make_unique<DefinedContainer>(
                container.record_type_name(), container.nested_path());
            load_properties(*nested, *subtype_def, sub_where);
            prop->set_nested(std::move(nested));

            container.add_property(std::move(prop));
        }
    }
};

} // anonymous namespace

RecordTypesLibrary::RecordTypesLibrary(const Value& definition)
{
    const Value* record_types = definition.find("recordTypes");
    if (!record_types || !record_types->is_map()) {
        throw UsageError("Invalid record types definition: missing recordTypes object.");
    }

    std::vector<std::string> ref_targets;
    DefinitionLoader loader(ref_targets);

    for (const auto& [type_name, type_def] : record_types->as_map()) {
        auto container = std::make_unique<DefinedContainer>(type_name, std::string{});
        loader.load_properties(*container, *type_def, type_name);
        if (container->id_property_name().empty()) {
            throw UsageError("Invalid record types definition: record type " + type_name +
                             " has no id property.");
        }
        types_.emplace(type_name, std::move(container));
    }

    for (const auto& target : ref_targets) {
        if (!has_record_type(target)) {
            throw UsageError("Invalid record types definition: reference to unknown record type " +
                             target + ".");
        }
    }
}

RecordTypesLibrary RecordTypesLibrary::from_json(const std::string& json_text)
{
    std::string error;
    Value definition = record_patch::from_json(json_text, &error);
    if (!error.empty()) {
        throw UsageError("Invalid record types definition JSON: " + error);
    }
    return RecordTypesLibrary(definition);
}

RecordTypesLibrary::RecordTypesLibrary(RecordTypesLibrary&&) noexcept = default;
RecordTypesLibrary& RecordTypesLibrary::operator=(RecordTypesLibrary&&) noexcept = default;
RecordTypesLibrary::~RecordTypesLibrary() = default;

bool RecordTypesLibrary::has_record_type(std::string_view name) const
{
    return types_.find(name) != types_.end();
}

const PropertiesContainer& RecordTypesLibrary::record_type(std::string_view name) const
{
    auto it = types_.find(name);
    if (it == types_.end()) {
        throw UsageError("Unknown record type " + std::string(name) + ".");
    }
    return *it->second;
}

std::vector<std::string> RecordTypesLibrary::record_type_names() const
{
    std::vector<std::string> names;
    names.reserve(types_.size());
    for (const auto& [name, container] : types_) {
        names.push_back(name);
    }
    return names;
}

} // namespace record_patch
