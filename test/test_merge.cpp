// test_merge.cpp - Tests for RFC 7396 merge patches

#include <catch2/catch_all.hpp>
#include <record_patch/errors.h>
#include <record_patch/patch.h>
#include <record_patch/value_compare.h>

#include "test_fixtures.h"

#include <vector>

using namespace record_patch;
using test_fixtures::json;
using test_fixtures::record_types;
using test_fixtures::sample_record;

namespace {

Patch build_merge(const std::string& merge_json)
{
    return build_merge_patch(record_types(), "Record1", json(merge_json));
}

} // anonymous namespace

// ============================================================
// Merge patch to operation list
// ============================================================

TEST_CASE("merge_patch_to_spec", "[merge]") {
    SECTION("members become operations in key order") {
        Value spec = merge_patch_to_spec(json(R"({"c": [1], "b": null, "a": {"x~y": 1}})"));
        REQUIRE(to_json(spec) ==
            R"([{"op":"merge","patch":[{"op":"replace","path":"/a/x~0y","value":1}],"path":"/a","value":{"x~y":1}},)"
            R"({"op":"remove","path":"/b"},)"
            R"({"op":"replace","path":"/c","value":[1]}])");
    }

    SECTION("empty merge patch") {
        REQUIRE(merge_patch_to_spec(json("{}")).size() == 0);
    }

    SECTION("not an object") {
        REQUIRE_THROWS_WITH(merge_patch_to_spec(json("[]")), "Merge patch must be an object.");
        REQUIRE_THROWS_AS(merge_patch_to_spec(Value{}), SyntaxError);
        REQUIRE_THROWS_AS(build_merge(R"("text")"), SyntaxError);
    }
}

// ============================================================
// Building
// ============================================================

TEST_CASE("Merge patch validation", "[merge][errors]") {
    SECTION("unknown property") {
        REQUIRE_THROWS_AS(build_merge(R"({"nope": 1})"), SyntaxError);
        REQUIRE_THROWS_AS(build_merge(R"({"nestedObjProp": {"nope": 1}})"), SyntaxError);
    }

    SECTION("wrong value type") {
        REQUIRE_THROWS_AS(build_merge(R"({"simpleProp": 5})"), SyntaxError);
    }

    SECTION("removing a required property") {
        REQUIRE_THROWS_AS(build_merge(R"({"simpleProp": null})"), SyntaxError);
    }

    SECTION("non-modifiable property") {
        REQUIRE_THROWS_AS(build_merge(R"({"id": 2})"), SyntaxError);
    }

    SECTION("merging into a scalar") {
        REQUIRE_THROWS_AS(build_merge(R"({"simpleProp": {"a": 1}})"), SyntaxError);
    }
}

// ============================================================
// Applying
// ============================================================

TEST_CASE("Apply merge patch", "[merge][apply]") {
    Value record = sample_record();

    SECTION("scalars, arrays, maps and nested objects") {
        Patch patch = build_merge(R"({
            "simpleProp": "new",
            "optionalSimpleProp": null,
            "simpleArrayProp": [9],
            "simpleMapProp": { "a": null, "c": "C" },
            "nestedObjProp": { "prop1": "changed" }
        })");
        REQUIRE(patch.apply(record));

        Value expected = json(R"json({
            "id": 1,
            "version": 3,
            "simpleProp": "new",
            "simpleArrayProp": [9],
            "simpleMapProp": { "b": "B", "c": "C" },
            "nestedObjProp": { "prop1": "changed" },
            "nestedObjArrayProp": [
                { "id": 10, "prop1": "ten" },
                { "id": 20, "prop1": "twenty" }
            ]
        })json");
        REQUIRE(values_equal(record, expected));
    }

    SECTION("absent object is added without its null members") {
        Patch patch = build_merge(R"({"optionalNestedObjProp": {"prop1": "x", "prop2": null}})");
        REQUIRE(patch.apply(record));
        REQUIRE(to_json(record.at("optionalNestedObjProp")) == R"({"prop1":"x"})");
    }

    SECTION("absent object cannot be added incomplete") {
        Patch patch = build_merge(R"({"optionalNestedObjProp": {"prop2": "x"}})");
        REQUIRE_THROWS_AS(patch.apply(record), DataError);
        REQUIRE_THROWS_WITH(patch.apply(record),
            "Cannot add merge value at /optionalNestedObjProp: expected matching object properties.");
        REQUIRE(record.find("optionalNestedObjProp") == nullptr);

        record = record.set("optionalNestedObjProp", json(R"({"prop1": "p"})"));
        REQUIRE(patch.apply(record));
        REQUIRE(to_json(record.at("optionalNestedObjProp")) == R"({"prop1":"p","prop2":"x"})");
    }

    SECTION("absent map entry cannot be added incomplete") {
        record = record.set("nestedObjMapProp", json(R"({"k": {"prop1": "v"}})"));
        REQUIRE_THROWS_AS(build_merge(R"({"nestedObjMapProp": {"j": {}}})").apply(record), DataError);
        REQUIRE(to_json(record.at("nestedObjMapProp")) == R"({"k":{"prop1":"v"}})");
    }

    SECTION("existing object is patched in place") {
        record = record.set("optionalNestedObjProp", json(R"({"prop1": "x", "prop2": "y", "generatedProp": 7})"));
        Patch patch = build_merge(R"({"optionalNestedObjProp": {"prop2": null}})");
        REQUIRE(patch.apply(record));
        REQUIRE(to_json(record.at("optionalNestedObjProp")) == R"({"generatedProp":7,"prop1":"x"})");
    }

    SECTION("nested object maps") {
        REQUIRE(build_merge(R"({"nestedObjMapProp": {"k": {"prop1": "v"}}})").apply(record));
        REQUIRE(record.at("nestedObjMapProp").at("k").at("prop1").as_string() == "v");

        REQUIRE(build_merge(R"({"nestedObjMapProp": {"k": {"prop1": "w"}, "j": {"prop1": "j"}}})").apply(record));
        REQUIRE(to_json(record.at("nestedObjMapProp")) == R"({"j":{"prop1":"j"},"k":{"prop1":"w"}})");
    }

    SECTION("second run fails on a key it already removed") {
        Patch patch = build_merge(R"({"simpleMapProp": {"b": null, "z": "Z"}, "optionalArrayProp": ["p"]})");
        REQUIRE(patch.apply(record));
        Value once = record;

        int changes = 0;
        PatchHandlers handlers;
        handlers.on_set = [&changes](OpKind, const Pointer&, const Value&, const std::optional<Value>&) { ++changes; };
        handlers.on_insert = [&changes](OpKind, const Pointer&, const Value&, const std::optional<Value>&) { ++changes; };

        REQUIRE_THROWS_AS(patch.apply(record, handlers), DataError);
        REQUIRE(changes == 0);
        REQUIRE(values_equal(record, once));
    }

    SECTION("merge operation kind is reported for additions") {
        std::vector<OpKind> kinds;
        PatchHandlers handlers;
        handlers.on_set = [&kinds](OpKind kind, const Pointer&, const Value&, const std::optional<Value>&) {
            kinds.push_back(kind);
        };
        REQUIRE(build_merge(R"({"optionalNestedObjProp": {"prop1": "x"}, "nestedObjProp": {"prop1": "y"}})")
                    .apply(record, handlers));
        REQUIRE((kinds == std::vector<OpKind>{OpKind::Replace, OpKind::Merge}));
    }
}
