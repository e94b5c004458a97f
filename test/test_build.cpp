// test_build.cpp - Tests for patch building and operation validation

#include <catch2/catch_all.hpp>
#include <record_patch/errors.h>
#include <record_patch/patch.h>
#include <record_patch/validator.h>

#include "test_fixtures.h"

using namespace record_patch;
using test_fixtures::json;
using test_fixtures::record_types;

using Catch::Matchers::ContainsSubstring;

namespace {

Patch build(const std::string& spec_json)
{
    return build_patch(record_types(), "Record1", json(spec_json));
}

} // anonymous namespace

// ============================================================
// Valid patches
// ============================================================

TEST_CASE("Build a valid patch", "[build]") {
    Patch patch = build(R"([
        { "op": "add",     "path": "/simpleArrayProp",   "value": [7, 10] },
        { "op": "replace", "path": "/simpleArrayProp/0", "value": 5 },
        { "op": "remove",  "path": "/simpleArrayProp/0" },
        { "op": "move",    "path": "/simpleArrayProp/-", "from": "/optionalSimpleProp" },
        { "op": "copy",    "path": "/simpleMapProp/key1", "from": "/simpleProp" },
        { "op": "test",    "path": "/simpleProp",        "value": "some value" }
    ])");

    REQUIRE(patch.size() == 6);
    REQUIRE(operation_kind(patch.operations()[0]) == OpKind::Add);
    REQUIRE(operation_kind(patch.operations()[3]) == OpKind::Move);
    REQUIRE(operation_kind(patch.operations()[5]) == OpKind::Test);
    REQUIRE(operation_path(patch.operations()[4]).to_string() == "/simpleMapProp/key1");

    const auto& move = std::get<MoveOp>(patch.operations()[3]);
    REQUIRE(move.from.to_string() == "/optionalSimpleProp");
    REQUIRE(move.path.is_append());
}

TEST_CASE("Build from JSON text", "[build]") {
    Patch patch = build_patch_from_json(record_types(), "Record1",
        R"([{"op": "replace", "path": "/simpleProp", "value": "x"}])");
    REQUIRE(patch.size() == 1);

    REQUIRE_THROWS_AS(build_patch_from_json(record_types(), "Record1", "[{"), SyntaxError);
    REQUIRE(build_patch_from_json(record_types(), "Record1", "[]").empty());
}

TEST_CASE("Operation names", "[build]") {
    REQUIRE(op_kind_name(OpKind::Add) == "add");
    REQUIRE(op_kind_name(OpKind::Merge) == "merge");
}

// ============================================================
// Specification structure errors
// ============================================================

TEST_CASE("Patch specification structure errors", "[build][errors]") {
    SECTION("unknown record type") {
        REQUIRE_THROWS_AS(build_patch(record_types(), "Nope", json("[]")), UsageError);
    }

    SECTION("not an array") {
        REQUIRE_THROWS_AS(build(R"({"op": "add"})"), UsageError);
        REQUIRE_THROWS_WITH(build(R"({"op": "add"})"), "Patch specification is not an array.");
        REQUIRE_THROWS_AS(build_patch_from_json(record_types(), "Record1", "\"text\""), UsageError);
    }

    SECTION("operation is not an object") {
        REQUIRE_THROWS_AS(build(R"([42])"), SyntaxError);
    }

    SECTION("op missing") {
        REQUIRE_THROWS_WITH(build(R"([{"path": "/simpleProp"}])"),
                            "Invalid patch operation #1: op is missing or is not a string.");
    }

    SECTION("unknown op names its position") {
        REQUIRE_THROWS_WITH(build(R"([
            { "op": "test", "path": "/simpleProp", "value": "x" },
            { "op": "frobnicate", "path": "/simpleProp" }
        ])"), "Invalid patch operation #2: unknown operation \"frobnicate\".");
    }

    SECTION("path missing or not a string") {
        REQUIRE_THROWS_WITH(build(R"([{"op": "remove"}])"),
                            "Invalid patch operation #1: path is missing or is not a string.");
        REQUIRE_THROWS_AS(build(R"([{"op": "remove", "path": 5}])"), SyntaxError);
        REQUIRE_THROWS_WITH(build(R"([{"op": "copy", "path": "/simpleProp"}])"),
                            ContainsSubstring("from is missing or is not a string."));
    }
}

// ============================================================
// Pointer checks
// ============================================================

TEST_CASE("Patch operation pointer checks", "[build][errors]") {
    SECTION("unresolvable pointer") {
        REQUIRE_THROWS_WITH(build(R"([{"op": "remove", "path": "/nope"}])"),
                            ContainsSubstring("Invalid patch operation #1: ") &&
                            ContainsSubstring("\"/nope\""));
    }

    SECTION("whole record") {
        REQUIRE_THROWS_WITH(build(R"([{"op": "replace", "path": "", "value": {}}])"),
                            ContainsSubstring("top records as a whole"));
    }

    SECTION("non-modifiable properties") {
        REQUIRE_THROWS_WITH(build(R"([{"op": "replace", "path": "/id", "value": 2}])"),
                            "Invalid patch operation #1: May not update non-modifiable property id.");
        REQUIRE_THROWS_AS(build(R"([{"op": "add", "path": "/version", "value": 2}])"), SyntaxError);
        REQUIRE_THROWS_AS(build(R"([{"op": "add", "path": "/calcProp", "value": 2}])"), SyntaxError);
        REQUIRE_THROWS_AS(build(R"([{"op": "add", "path": "/nestedObjArrayProp/0/id", "value": 2}])"),
                          SyntaxError);
    }

    SECTION("required properties cannot be removed") {
        REQUIRE_THROWS_WITH(build(R"([{"op": "remove", "path": "/simpleProp"}])"),
                            ContainsSubstring("May not remove a required property simpleProp."));
        REQUIRE_THROWS_AS(build(R"([{"op": "move", "path": "/optionalSimpleProp", "from": "/id"}])"),
                          SyntaxError);
    }

    SECTION("elements of required collections can be removed") {
        REQUIRE_NOTHROW(build(R"([{"op": "remove", "path": "/simpleArrayProp/0"}])"));
        REQUIRE_NOTHROW(build(R"([{"op": "remove", "path": "/simpleMapProp/a"}])"));
        REQUIRE_NOTHROW(build(R"([{"op": "remove", "path": "/optionalSimpleProp"}])"));
    }

    SECTION("test reads non-modifiable properties") {
        REQUIRE_NOTHROW(build(R"([{"op": "test", "path": "/id", "value": 1}])"));
        REQUIRE_NOTHROW(build(R"([{"op": "test", "path": "/version", "value": 1}])"));
    }

    SECTION("trailing dash") {
        REQUIRE_NOTHROW(build(R"([{"op": "add", "path": "/simpleArrayProp/-", "value": 1}])"));
        REQUIRE_NOTHROW(build(R"([{"op": "copy", "path": "/simpleArrayProp/-", "from": "/simpleArrayProp/0"}])"));
        REQUIRE_THROWS_AS(build(R"([{"op": "remove", "path": "/simpleArrayProp/-"}])"), SyntaxError);
        REQUIRE_THROWS_AS(build(R"([{"op": "replace", "path": "/simpleArrayProp/-", "value": 1}])"), SyntaxError);
        REQUIRE_THROWS_AS(build(R"([{"op": "test", "path": "/simpleArrayProp/-", "value": 1}])"), SyntaxError);
        REQUIRE_THROWS_AS(build(R"([{"op": "copy", "path": "/optionalSimpleProp", "from": "/simpleArrayProp/-"}])"),
                          SyntaxError);
    }
}

// ============================================================
// Value checks
// ============================================================

TEST_CASE("Patch operation value checks", "[build][errors]") {
    SECTION("value missing") {
        REQUIRE_THROWS_WITH(build(R"([{"op": "add", "path": "/simpleProp"}])"),
                            "Invalid value in patch operation #1 (add): no value is provided for the operation.");
    }

    SECTION("scalar types") {
        REQUIRE_THROWS_WITH(build(R"([{"op": "replace", "path": "/simpleProp", "value": 1}])"),
                            ContainsSubstring("expected string."));
        REQUIRE_THROWS_WITH(build(R"([{"op": "replace", "path": "/optionalSimpleProp", "value": "1"}])"),
                            ContainsSubstring("expected number."));
        REQUIRE_THROWS_WITH(build(R"([{"op": "replace", "path": "/flagProp", "value": 0}])"),
                            ContainsSubstring("expected boolean."));
        REQUIRE_THROWS_AS(build(R"([{"op": "add", "path": "/simpleArrayProp/0", "value": "x"}])"), SyntaxError);
        REQUIRE_THROWS_AS(build(R"([{"op": "add", "path": "/simpleMapProp/k", "value": false}])"), SyntaxError);
    }

    SECTION("datetime") {
        REQUIRE_NOTHROW(build(R"([{"op": "add", "path": "/dateProp", "value": "2024-02-29T23:59:59.999Z"}])"));
        REQUIRE_THROWS_WITH(build(R"([{"op": "add", "path": "/dateProp", "value": "2023-02-29T00:00:00.000Z"}])"),
                            ContainsSubstring("expected ISO 8601 string."));
        REQUIRE_THROWS_AS(build(R"([{"op": "add", "path": "/dateProp", "value": "2024-01-01"}])"), SyntaxError);
    }

    SECTION("references") {
        REQUIRE_NOTHROW(build(R"([{"op": "add", "path": "/refProp", "value": "Record2#abc"}])"));
        REQUIRE_NOTHROW(build(R"([{"op": "add", "path": "/refArrayProp/-", "value": "Record2#x"}])"));
        REQUIRE_THROWS_WITH(build(R"([{"op": "add", "path": "/refProp", "value": "Record1#1"}])"),
                            ContainsSubstring("expected Record2 reference."));
        REQUIRE_THROWS_AS(build(R"([{"op": "add", "path": "/refProp", "value": "Record2#"}])"), SyntaxError);
        REQUIRE_THROWS_AS(build(R"([{"op": "add", "path": "/refProp", "value": "abc"}])"), SyntaxError);
    }

    SECTION("nulls") {
        REQUIRE_NOTHROW(build(R"([{"op": "replace", "path": "/optionalSimpleProp", "value": null}])"));
        REQUIRE_NOTHROW(build(R"([{"op": "add", "path": "/simpleArrayProp/-", "value": null}])"));
        REQUIRE_THROWS_WITH(build(R"([{"op": "replace", "path": "/simpleProp", "value": null}])"),
                            ContainsSubstring("null for required property."));
        REQUIRE_THROWS_WITH(build(R"([{"op": "add", "path": "/nestedObjArrayProp/0", "value": null}])"),
                            ContainsSubstring("null for nested object collection element."));
    }

    SECTION("whole collections") {
        REQUIRE_THROWS_WITH(build(R"([{"op": "replace", "path": "/simpleArrayProp", "value": []}])"),
                            ContainsSubstring("empty array for required property."));
        REQUIRE_NOTHROW(build(R"([{"op": "replace", "path": "/optionalArrayProp", "value": []}])"));
        REQUIRE_THROWS_WITH(build(R"([{"op": "replace", "path": "/simpleArrayProp", "value": 1}])"),
                            ContainsSubstring("expected an array."));
        REQUIRE_THROWS_WITH(build(R"([{"op": "replace", "path": "/simpleMapProp", "value": {}}])"),
                            ContainsSubstring("empty object for required property."));
        REQUIRE_THROWS_AS(build(R"([{"op": "replace", "path": "/simpleMapProp", "value": {"a": 1}}])"),
                          SyntaxError);
    }

    SECTION("nested objects") {
        REQUIRE_NOTHROW(build(R"([{"op": "replace", "path": "/nestedObjProp", "value": {"prop1": "x"}}])"));
        REQUIRE_THROWS_WITH(build(R"([{"op": "replace", "path": "/nestedObjProp", "value": {}}])"),
                            ContainsSubstring("expected matching object properties."));
        REQUIRE_THROWS_AS(build(R"([{"op": "replace", "path": "/nestedObjProp", "value": {"prop1": 1}}])"),
                          SyntaxError);
        REQUIRE_NOTHROW(build(R"([{"op": "add", "path": "/nestedObjArrayProp/-",
                                   "value": {"id": 5, "prop1": "five"}}])"));
        REQUIRE_THROWS_AS(build(R"([{"op": "add", "path": "/nestedObjArrayProp", "value": [{"prop1": "x"}]}])"),
                          SyntaxError);
    }

    SECTION("generated properties may be omitted from updates only") {
        REQUIRE_NOTHROW(build(R"([{"op": "add", "path": "/optionalNestedObjProp", "value": {"prop1": "x"}}])"));
        REQUIRE_THROWS_AS(build(R"([{"op": "test", "path": "/optionalNestedObjProp", "value": {"prop1": "x"}}])"),
                          SyntaxError);
        REQUIRE_NOTHROW(build(R"([{"op": "test", "path": "/optionalNestedObjProp",
                                   "value": {"prop1": "x", "generatedProp": 1}}])"));
    }

    SECTION("polymorphic objects") {
        REQUIRE_NOTHROW(build(R"([{"op": "add", "path": "/payment",
                                   "value": {"type": "CARD", "amount": 10, "last4": "1234"}}])"));
        REQUIRE_NOTHROW(build(R"([{"op": "add", "path": "/payment", "value": {"type": "CASH", "amount": 10}}])"));
        REQUIRE_THROWS_AS(build(R"([{"op": "add", "path": "/payment", "value": {"type": "CARD", "amount": 10}}])"),
                          SyntaxError);
        REQUIRE_THROWS_AS(build(R"([{"op": "add", "path": "/payment", "value": {"type": "GOLD", "amount": 10}}])"),
                          SyntaxError);
        REQUIRE_THROWS_AS(build(R"([{"op": "add", "path": "/payment", "value": {"amount": 10}}])"),
                          SyntaxError);
        REQUIRE_NOTHROW(build(R"([{"op": "replace", "path": "/payment/CARD:last4", "value": "9999"}])"));
    }
}

// ============================================================
// "from" checks
// ============================================================

TEST_CASE("Patch operation from checks", "[build][errors]") {
    SECTION("move into a child") {
        REQUIRE_THROWS_WITH(build(R"([{"op": "move", "path": "/optionalNestedObjProp/prop2",
                                       "from": "/optionalNestedObjProp"}])"),
                            "Invalid \"from\" pointer in patch operation #1 (move): "
                            "may not move location into one of its children.");
    }

    SECTION("value types") {
        REQUIRE_THROWS_WITH(build(R"([{"op": "copy", "path": "/simpleProp", "from": "/optionalSimpleProp"}])"),
                            ContainsSubstring("incompatible property value types."));
        REQUIRE_THROWS_AS(build(R"([{"op": "copy", "path": "/optionalArrayProp", "from": "/simpleArrayProp"}])"),
                          SyntaxError);
    }

    SECTION("structures") {
        REQUIRE_NOTHROW(build(R"([{"op": "copy", "path": "/optionalSimpleProp", "from": "/simpleArrayProp/0"}])"));
        REQUIRE_THROWS_WITH(build(R"([{"op": "copy", "path": "/optionalSimpleProp", "from": "/simpleArrayProp"}])"),
                            ContainsSubstring("not a scalar."));
        REQUIRE_THROWS_AS(build(R"([{"op": "copy", "path": "/simpleArrayProp/-", "from": "/simpleArrayProp"}])"),
                          SyntaxError);
        REQUIRE_THROWS_WITH(build(R"([{"op": "copy", "path": "/optionalArrayProp", "from": "/simpleProp"}])"),
                            ContainsSubstring("not an array."));
        REQUIRE_THROWS_WITH(build(R"([{"op": "copy", "path": "/simpleMapProp", "from": "/simpleProp"}])"),
                            ContainsSubstring("not a map."));
        REQUIRE_NOTHROW(build(R"([{"op": "copy", "path": "/optionalArrayProp/0", "from": "/simpleMapProp/a"}])"));
    }

    SECTION("reference targets") {
        REQUIRE_NOTHROW(build(R"([{"op": "copy", "path": "/refProp", "from": "/refArrayProp/0"}])"));
    }

    SECTION("nested objects") {
        REQUIRE_NOTHROW(build(R"([{"op": "copy", "path": "/nestedObjMapProp/x", "from": "/nestedObjProp"}])"));
        REQUIRE_THROWS_WITH(build(R"([{"op": "copy", "path": "/nestedObjProp", "from": "/optionalNestedObjProp"}])"),
                            ContainsSubstring("incompatible nested objects."));
    }
}

TEST_CASE("is_compatible_objects", "[build][validator]") {
    const PropertiesContainer& rt = record_types().record_type("Record1");
    const PropertyDescriptor& nested = *rt.property("nestedObjProp");
    const PropertyDescriptor& nested_map = *rt.property("nestedObjMapProp");
    const PropertyDescriptor& optional_nested = *rt.property("optionalNestedObjProp");

    REQUIRE(is_compatible_objects(nested, nested_map));
    REQUIRE(is_compatible_objects(nested_map, nested));
    REQUIRE_FALSE(is_compatible_objects(optional_nested, nested));
    REQUIRE_FALSE(is_compatible_objects(nested, optional_nested));
}

TEST_CASE("is_valid_datetime", "[build][validator]") {
    REQUIRE(is_valid_datetime("2017-07-04T12:30:00.000Z"));
    REQUIRE(is_valid_datetime("2000-02-29T00:00:00.000Z"));
    REQUIRE_FALSE(is_valid_datetime("1900-02-29T00:00:00.000Z"));
    REQUIRE_FALSE(is_valid_datetime("2017-13-01T00:00:00.000Z"));
    REQUIRE_FALSE(is_valid_datetime("2017-07-04T24:00:00.000Z"));
    REQUIRE_FALSE(is_valid_datetime("2017-07-04T12:30:00Z"));
    REQUIRE_FALSE(is_valid_datetime("2017-07-04 12:30:00.000Z"));
}

// ============================================================
// Merge operation structure
// ============================================================

TEST_CASE("Merge operation checks", "[build][merge][errors]") {
    SECTION("nested patch required") {
        REQUIRE_THROWS_WITH(build(R"([{"op": "merge", "path": "/nestedObjProp", "value": {}}])"),
                            "Invalid patch operation #1: patch is not an array.");
    }

    SECTION("value must be an object") {
        REQUIRE_THROWS_WITH(build(R"([{"op": "merge", "path": "/nestedObjProp", "value": 1, "patch": []}])"),
                            ContainsSubstring("merge value must be a non-null object."));
    }

    SECTION("target must be an object or a map") {
        REQUIRE_THROWS_WITH(build(R"([{"op": "merge", "path": "/simpleProp", "value": {}, "patch": []}])"),
                            ContainsSubstring("invalid merge target record element type."));
        REQUIRE_THROWS_AS(build(R"([{"op": "merge", "path": "/nestedObjArrayProp", "value": {}, "patch": []}])"),
                          SyntaxError);
        REQUIRE_NOTHROW(build(R"([{"op": "merge", "path": "/nestedObjArrayProp/0", "value": {}, "patch": []}])"));
        REQUIRE_NOTHROW(build(R"([{"op": "merge", "path": "/simpleMapProp", "value": {}, "patch": []}])"));
    }

    SECTION("value is kept without nulls and checked for adding") {
        Patch complete = build(R"([{"op": "merge", "path": "/optionalNestedObjProp",
                                    "value": {"prop1": "x", "prop2": null}, "patch": []}])");
        const auto& merge = std::get<MergeOp>(complete.operations()[0]);
        REQUIRE(to_json(merge.value) == R"({"prop1":"x"})");
        REQUIRE_FALSE(merge.add_error.has_value());

        Patch partial = build(R"([{"op": "merge", "path": "/optionalNestedObjProp",
                                   "value": {"prop2": "x"}, "patch": []}])");
        REQUIRE(std::get<MergeOp>(partial.operations()[0]).add_error == "expected matching object properties.");

        Patch empty_map = build(R"([{"op": "merge", "path": "/simpleMapProp", "value": {"a": null}, "patch": []}])");
        REQUIRE(std::get<MergeOp>(empty_map.operations()[0]).add_error == "empty object for required property.");
    }

    SECTION("nested operations are validated") {
        REQUIRE_THROWS_AS(build(R"([{"op": "merge", "path": "/nestedObjProp", "value": {"prop1": 1},
                                     "patch": [{"op": "replace", "path": "/nestedObjProp/prop1", "value": 1}]}])"),
                          SyntaxError);
    }
}

// ============================================================
// Involved and updated properties
// ============================================================

TEST_CASE("Involved and updated property paths", "[build]") {
    SECTION("scalar, nested and read-only uses") {
        Patch patch = build(R"([
            { "op": "replace", "path": "/nestedObjArrayProp/0/prop1", "value": "x" },
            { "op": "test",    "path": "/simpleProp", "value": "hello" },
            { "op": "copy",    "path": "/optionalSimpleProp", "from": "/simpleArrayProp/0" }
        ])");

        REQUIRE(patch.involved_prop_paths() == std::set<std::string>{
            "nestedObjArrayProp.prop1", "optionalSimpleProp", "simpleArrayProp", "simpleProp"});
        REQUIRE(patch.updated_prop_paths() == std::set<std::string>{
            "nestedObjArrayProp", "nestedObjArrayProp.prop1", "optionalSimpleProp"});
    }

    SECTION("move updates both ends") {
        Patch patch = build(R"([{"op": "move", "path": "/simpleArrayProp/-", "from": "/optionalSimpleProp"}])");
        REQUIRE(patch.updated_prop_paths() == std::set<std::string>{"optionalSimpleProp", "simpleArrayProp"});
    }

    SECTION("nested objects expand to their leaf properties") {
        Patch patch = build(R"([{"op": "add", "path": "/optionalNestedObjProp", "value": {"prop1": "x"}}])");
        REQUIRE(patch.involved_prop_paths() == std::set<std::string>{
            "optionalNestedObjProp.generatedProp", "optionalNestedObjProp.prop1", "optionalNestedObjProp.prop2"});
        REQUIRE(patch.updated_prop_paths() == patch.involved_prop_paths());
    }

    SECTION("polymorphic objects include every subtype's properties") {
        Patch patch = build(R"([{"op": "test", "path": "/payment", "value": {"type": "CASH", "amount": 1}}])");
        REQUIRE(patch.involved_prop_paths() == std::set<std::string>{
            "payment.amount", "payment.currency", "payment.last4"});
        REQUIRE(patch.updated_prop_paths().empty());
    }

    SECTION("merge collects its nested operations") {
        Patch patch = build(R"([{"op": "merge", "path": "/nestedObjProp", "value": {"prop1": "x"},
                                 "patch": [{"op": "replace", "path": "/nestedObjProp/prop1", "value": "x"}]}])");
        REQUIRE(patch.involved_prop_paths() == std::set<std::string>{"nestedObjProp.prop1"});
        REQUIRE(patch.updated_prop_paths() == std::set<std::string>{"nestedObjProp", "nestedObjProp.prop1"});
    }
}
