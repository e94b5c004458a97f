// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file pointer.cpp
/// @brief Pointer resolution against record types.

#include <record_patch/pointer.h>
#include <record_patch/errors.h>
#include <record_patch/json_pointer.h>

#include <zug/compose.hpp>

#include <stdexcept>

namespace record_patch {

Pointer::Pointer()
    : owner_lens_(zug::identity)
{}

const PointerSegment& Pointer::property_segment() const
{
    if (segments_.empty()) {
        throw UsageError("Root pointer has no property segment.");
    }
    if (segments_.back().is_element()) {
        return segments_[segments_.size() - 2];
    }
    return segments_.back();
}

bool Pointer::is_child_of(const Pointer& other) const
{
    if (other.segments_.size() >= segments_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < other.segments_.size(); ++i) {
        if (segments_[i].token != other.segments_[i].token) {
            return false;
        }
    }
    return true;
}

namespace {

[[noreturn]] void invalid_pointer(std::string_view pointer, const std::string& reason)
{
    throw SyntaxError("Invalid property pointer \"" + std::string(pointer) + "\": " + reason);
}

/// Look up a property token in a container, handling "Subtype:prop"
const PropertyDescriptor* find_property(const PropertiesContainer& container,
                                        const std::string& token,
                                        std::string& member)
{
    if (container.is_polymorph()) {
        auto colon = token.find(':');
        if (colon != std::string::npos) {
            const PropertyDescriptor* subtype = container.property(std::string_view(token).substr(0, colon));
            if (!subtype || !subtype->is_subtype()) {
                return nullptr;
            }
            member = token.substr(colon + 1);
            return subtype->nested_properties()->property(member);
        }
    }

    const PropertyDescriptor* prop = container.property(token);
    if (prop && prop->is_subtype()) {
        // subtype pseudo-properties are not addressable themselves
        return nullptr;
    }
    member = token;
    return prop;
}

} // anonymous namespace

Pointer resolve_pointer(const PropertiesContainer& record_type,
                        std::string_view pointer,
                        bool disallow_trailing_dash)
{
    const std::vector<std::string> tokens = parse_json_pointer(pointer);

    Pointer result;
    result.string_ = tokens_to_json_pointer(tokens);

    enum class Expect { Property, Element, Nothing };

    const PropertiesContainer* container = &record_type;
    const PropertyDescriptor* current = nullptr;
    Expect expect = Expect::Property;
    Path path;
    std::size_t owner_path_size = 0;

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        PointerSegment seg;
        seg.token = token;

        switch (expect) {
        case Expect::Nothing:
            invalid_pointer(pointer, "property " + current->property_path() + " is not an object or a collection.");

        case Expect::Property: {
            const PropertyDescriptor* prop = find_property(*container, token, seg.key);
            if (!prop) {
                invalid_pointer(pointer, "record type " + container->record_type_name() +
                                " has no property \"" + token + "\" at " +
                                (container->nested_path().empty() ? std::string("top level") : container->nested_path()) +
                                ".");
            }
            seg.kind = PointerSegment::Kind::Property;
            seg.prop = prop;
            current = prop;
            owner_path_size = path.size();
            path.emplace_back(seg.key);

            if (!prop->is_scalar()) {
                expect = Expect::Element;
            } else if (prop->is_object()) {
                container = prop->nested_properties();
                expect = Expect::Property;
            } else {
                expect = Expect::Nothing;
            }
            break;
        }

        case Expect::Element: {
            seg.prop = current;
            if (current->is_array()) {
                if (token == "-") {
                    if (i + 1 < tokens.size()) {
                        invalid_pointer(pointer, "\"-\" may only be the last token.");
                    }
                    if (disallow_trailing_dash) {
                        invalid_pointer(pointer, "\"-\" is not allowed in this context.");
                    }
                    seg.kind = PointerSegment::Kind::Append;
                } else if (is_array_index(token)) {
                    seg.kind = PointerSegment::Kind::Index;
                    try {
                        seg.index = static_cast<std::size_t>(std::stoull(token));
                    } catch (const std::out_of_range&) {
                        invalid_pointer(pointer, "array index " + token + " is out of range.");
                    }
                    path.emplace_back(seg.index);
                } else {
                    invalid_pointer(pointer, "\"" + token + "\" is not a valid array index.");
                }
            } else {
                seg.kind = PointerSegment::Kind::Key;
                seg.key = token;
                path.emplace_back(seg.key);
            }

            if (current->is_object()) {
                container = current->nested_properties();
                expect = Expect::Property;
            } else {
                expect = Expect::Nothing;
            }
            break;
        }
        }

        result.segments_.push_back(std::move(seg));
    }

    if (current) {
        result.prop_path_ = current->property_path();
        result.owner_path_.assign(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(owner_path_size));
        result.owner_lens_ = record_path_lens(result.owner_path_);
    }

    return result;
}

} // namespace record_patch
