// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file pointer.h
/// @brief Record element pointers: JSON Pointers resolved against a record type.
///
/// A Pointer is resolved once, against the schema only, and never looks at
/// record data. Every token is checked at resolution time:
///
///   "/nestedObjArrayProp/0/name"
///       Property(nestedObjArrayProp) -> Index(0) -> Property(name)
///
///   "/simpleMapProp/some~1key"
///       Property(simpleMapProp) -> Key("some/key")
///
///   "/simpleArrayProp/-"
///       Property(simpleArrayProp) -> Append
///
/// The pointer's target is the property named by its last Property segment,
/// either as a whole or, when followed by an element segment, one of its
/// collection elements.

#pragma once

#include <record_patch/api.h>
#include <record_patch/lager_lens.h>
#include <record_patch/schema.h>
#include <record_patch/value.h>

#include <string>
#include <string_view>
#include <vector>

namespace record_patch {

struct PointerSegment {
    enum class Kind {
        Property,  ///< property of a record or nested object
        Index,     ///< array element
        Key,       ///< map element
        Append     ///< "-": past the last array element
    };

    Kind kind = Kind::Property;

    /// Unescaped token as written in the pointer ("Subtype:prop" for
    /// polymorphic subtype properties)
    std::string token;

    /// Member name in the record value: the property name or the map key
    std::string key;

    std::size_t index = 0;

    /// Property addressed (Property) or whose element is addressed (others)
    const PropertyDescriptor* prop = nullptr;

    [[nodiscard]] bool is_element() const noexcept { return kind != Kind::Property; }
};

class RECORD_PATCH_API Pointer {
public:
    /// Root pointer ("")
    Pointer();

    [[nodiscard]] bool is_root() const noexcept { return segments_.empty(); }

    /// Target property, nullptr for the root pointer
    [[nodiscard]] const PropertyDescriptor* prop() const noexcept {
        return segments_.empty() ? nullptr : segments_.back().prop;
    }

    /// True if the pointer addresses one array or map element rather than
    /// a whole property
    [[nodiscard]] bool collection_element() const noexcept {
        return !segments_.empty() && segments_.back().is_element();
    }

    /// True if the pointer ends with "-"
    [[nodiscard]] bool is_append() const noexcept {
        return !segments_.empty() && segments_.back().kind == PointerSegment::Kind::Append;
    }

    [[nodiscard]] const std::vector<PointerSegment>& segments() const noexcept { return segments_; }

    /// The property segment (for element pointers, the collection's segment)
    [[nodiscard]] const PointerSegment& property_segment() const;

    /// Last segment, for element pointers the element segment
    [[nodiscard]] const PointerSegment& last_segment() const { return segments_.back(); }

    /// RFC 6901 string form
    [[nodiscard]] const std::string& to_string() const noexcept { return string_; }

    /// Dot-notation property path, e.g. "nestedObjArrayProp.name"
    [[nodiscard]] const std::string& prop_path() const noexcept { return prop_path_; }

    /// Path from the record root to the object owning the target property
    [[nodiscard]] const Path& owner_path() const noexcept { return owner_path_; }

    /// Lens focusing the object owning the target property
    [[nodiscard]] const LagerValueLens& owner_lens() const noexcept { return owner_lens_; }

    /// True if this pointer lies strictly below other
    [[nodiscard]] bool is_child_of(const Pointer& other) const;

    bool operator==(const Pointer& other) const { return string_ == other.string_; }
    bool operator!=(const Pointer& other) const { return !(*this == other); }

private:
    friend RECORD_PATCH_API Pointer resolve_pointer(const PropertiesContainer&, std::string_view, bool);

    std::vector<PointerSegment> segments_;
    std::string string_;
    std::string prop_path_;
    Path owner_path_;
    LagerValueLens owner_lens_;
};

/// Resolve a pointer string against a record type.
///
/// @param record_type          the record type the pointer starts at
/// @param pointer              RFC 6901 pointer; "" is the root pointer
/// @param disallow_trailing_dash reject a final "-" token
/// @throws SyntaxError if the pointer is invalid for the record type
[[nodiscard]] RECORD_PATCH_API Pointer resolve_pointer(
    const PropertiesContainer& record_type,
    std::string_view pointer,
    bool disallow_trailing_dash);

} // namespace record_patch
