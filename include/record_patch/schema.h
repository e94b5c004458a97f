// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file schema.h
/// @brief Read-only view of the record type schema consumed by the patch engine.
///
/// The engine never owns or mutates schema objects. Any schema provider
/// implementing these interfaces plugs in; RecordTypesLibrary (record_types.h)
/// is the in-memory provider built from a definition Value.
///
/// Model:
/// - A RecordTypes library maps record type names to PropertiesContainers.
/// - A PropertiesContainer lists the properties of a record type or of a
///   nested object, in a fixed order.
/// - A PropertyDescriptor is a scalar, an array or a map of one scalar kind.
///   The "object" scalar kind carries a nested PropertiesContainer.
///
/// Polymorphic nested objects: the container names a type property (whose
/// value selects the subtype) and lists one subtype pseudo-property per
/// subtype. A subtype pseudo-property is a scalar object whose nested
/// container holds the subtype-specific properties. Those properties live
/// flat in the object value and are addressed with "Subtype:prop" tokens.

#pragma once

#include <record_patch/api.h>

#include <string>
#include <string_view>
#include <vector>

namespace record_patch {

enum class StructureKind {
    Scalar,
    Array,
    Map
};

enum class ScalarKind {
    String,
    Number,
    Boolean,
    Datetime,
    Ref,
    Object
};

[[nodiscard]] RECORD_PATCH_API std::string_view scalar_kind_name(ScalarKind kind) noexcept;

class PropertiesContainer;

class RECORD_PATCH_API PropertyDescriptor {
public:
    virtual ~PropertyDescriptor() = default;

    [[nodiscard]] virtual const std::string& name() const = 0;

    /// Container that declares the property
    [[nodiscard]] virtual const PropertiesContainer& container() const = 0;

    [[nodiscard]] virtual StructureKind structure() const = 0;
    [[nodiscard]] virtual ScalarKind scalar_kind() const = 0;

    [[nodiscard]] virtual bool optional() const = 0;
    [[nodiscard]] virtual bool modifiable() const = 0;
    [[nodiscard]] virtual bool is_id() const = 0;
    [[nodiscard]] virtual bool is_calculated() const = 0;
    [[nodiscard]] virtual bool is_view() const = 0;
    [[nodiscard]] virtual bool is_record_meta() const = 0;
    [[nodiscard]] virtual bool is_generated() const = 0;
    [[nodiscard]] virtual bool is_subtype() const = 0;

    /// Target record type name for Ref properties, empty otherwise
    [[nodiscard]] virtual const std::string& ref_target() const = 0;

    /// Nested properties for Object properties, nullptr otherwise
    [[nodiscard]] virtual const PropertiesContainer* nested_properties() const = 0;

    [[nodiscard]] bool is_scalar() const { return structure() == StructureKind::Scalar; }
    [[nodiscard]] bool is_array() const { return structure() == StructureKind::Array; }
    [[nodiscard]] bool is_map() const { return structure() == StructureKind::Map; }
    [[nodiscard]] bool is_ref() const { return scalar_kind() == ScalarKind::Ref; }
    [[nodiscard]] bool is_object() const { return scalar_kind() == ScalarKind::Object; }

    /// Dot-notation property path, e.g. "nestedObjProp.name"
    [[nodiscard]] std::string property_path() const;
};

class RECORD_PATCH_API PropertiesContainer {
public:
    virtual ~PropertiesContainer() = default;

    /// Name of the record type the container belongs to
    [[nodiscard]] virtual const std::string& record_type_name() const = 0;

    /// Dot-notation prefix of the container's properties: empty at the
    /// record level, "nestedObjProp." for a nested object
    [[nodiscard]] virtual const std::string& nested_path() const = 0;

    [[nodiscard]] virtual const std::vector<std::string>& all_property_names() const = 0;

    /// nullptr if the container has no such property
    [[nodiscard]] virtual const PropertyDescriptor* property(std::string_view name) const = 0;

    /// Empty if the container has no id property
    [[nodiscard]] virtual const std::string& id_property_name() const = 0;

    [[nodiscard]] virtual bool is_polymorph() const = 0;

    /// Name of the subtype discriminator property of a polymorphic container
    [[nodiscard]] virtual const std::string& type_property_name() const = 0;
};

class RECORD_PATCH_API RecordTypes {
public:
    virtual ~RecordTypes() = default;

    [[nodiscard]] virtual bool has_record_type(std::string_view name) const = 0;

    /// @throws UsageError if the record type is unknown
    [[nodiscard]] virtual const PropertiesContainer& record_type(std::string_view name) const = 0;
};

} // namespace record_patch
