/**
 * @file test_codec.cpp
 * @brief Unit tests for payload decode and encode (GoogleTest)
 *
 * Tests cover:
 * - canonical key order of decoded and encoded objects
 * - nullability, missing fields and JSON kind checks with field paths
 * - polymorphic selection through the discriminator and the catch-all
 * - deferred fields skipped and reported as slots
 * - @include/@skip evaluation and variable resolution
 * - partial decoding with null propagation
 * - encode/decode round trips
 */

#include <gtest/gtest.h>
#include "Fixtures.hpp"
#include "shapeql/Codec.hpp"
#include "shapeql/Errors.hpp"

using namespace shapeql;
using namespace shapeql::testing;

namespace {

std::vector<std::string> object_keys(const Value& object) {
    std::vector<std::string> out;
    for (auto it = object.begin(); it != object.end(); ++it) out.push_back(it.key());
    return out;
}

const char* const INVENTORY = R"({"operations": [{"name": "Inventory", "selections": [
    {"field": "computers", "selections": [
        {"field": "id"}, {"field": "cpu"}, {"field": "year"},
        {"field": "screen", "selections": [{"field": "resolution"}, {"field": "isColor"}]}
    ]}
]}]})";

const char* const HERO = R"({"operations": [{"name": "Hero", "selections": [
    {"field": "hero", "selections": [
        {"field": "name"},
        {"inline": "Droid", "selections": [{"field": "primaryFunction"}]},
        {"inline": "Human", "selections": [{"field": "homePlanet"}, {"field": "height"}]}
    ]}
]}]})";

const char* const DEFERRED_SCREEN = R"({"operations": [{"selections": [
    {"field": "computers", "selections": [
        {"field": "id"},
        {"field": "screen", "directives": [{"name": "defer"}],
         "selections": [{"field": "resolution"}]}
    ]}
]}]})";

} // namespace

class CodecTest : public ::testing::Test {
protected:
    ScalarRegistry scalars;
};

// ============================================================================
// Plain decode
// ============================================================================

TEST_F(CodecTest, DecodeFollowsCanonicalOrder) {
    CanonicalTree tree = compile(INVENTORY);
    Value payload = json(R"({"computers": [
        {"screen": {"isColor": true, "resolution": "512x342"}, "year": 1984, "cpu": "68000", "id": "mac"}
    ]})");

    DecodedResponse result = decode(tree, payload, scalars);
    const Value& mac = result.data["computers"][0];
    EXPECT_EQ(object_keys(mac), (std::vector<std::string>{"id", "cpu", "year", "screen"}));
    EXPECT_EQ(object_keys(mac["screen"]), (std::vector<std::string>{"resolution", "isColor"}));
    EXPECT_TRUE(equivalent(result.data, payload));
    EXPECT_TRUE(result.deferred.empty());
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(CodecTest, DecodeIgnoresUnselectedKeys) {
    CanonicalTree tree = compile(INVENTORY);
    DecodedResponse result = decode(tree, json(R"({"computers": [
        {"id": "a", "cpu": "z80", "screen": {"resolution": "x", "isColor": false, "inches": 9}}
    ], "extensions": {}})"), scalars);
    EXPECT_FALSE(result.data.contains("extensions"));
    EXPECT_FALSE(result.data["computers"][0]["screen"].contains("inches"));
}

TEST_F(CodecTest, AbsentNullableFieldBecomesNull) {
    CanonicalTree tree = compile(INVENTORY);
    DecodedResponse result = decode(tree, json(R"({"computers": [
        {"id": "a", "cpu": "z80", "screen": {"resolution": "x", "isColor": false}}
    ]})"), scalars);
    ASSERT_TRUE(result.data["computers"][0].contains("year"));
    EXPECT_TRUE(result.data["computers"][0]["year"].is_null());
}

TEST_F(CodecTest, IdIntegersDecodeAsStrings) {
    CanonicalTree tree = compile(INVENTORY);
    DecodedResponse result = decode(tree, json(R"({"computers": [
        {"id": 7, "cpu": "z80", "screen": {"resolution": "x", "isColor": false}}
    ]})"), scalars);
    EXPECT_EQ(result.data["computers"][0]["id"], "7");
}

// ============================================================================
// Decode failures
// ============================================================================

TEST_F(CodecTest, MissingRequiredFieldNamesField) {
    CanonicalTree tree = compile_fragment(make_schema(), make_document(R"({
        "fragments": [{"name": "DroidName", "typeCondition": "Droid",
                       "selections": [{"field": "name"}]}]
    })"), "DroidName", strict_options());

    try {
        decode(tree, json("{}"), scalars);
        FAIL() << "expected MissingRequiredField";
    } catch (const MissingRequiredField& e) {
        EXPECT_EQ(e.field(), "name");
        EXPECT_EQ(e.path(), "name");
    }
}

TEST_F(CodecTest, MissingRequiredFieldCarriesPath) {
    CanonicalTree tree = compile(INVENTORY);
    try {
        decode(tree, json(R"({"computers": [
            {"id": "a", "cpu": "z80", "screen": {"resolution": "x", "isColor": true}},
            {"id": "b", "cpu": "6502", "screen": {"isColor": true}}
        ]})"), scalars);
        FAIL() << "expected MissingRequiredField";
    } catch (const MissingRequiredField& e) {
        EXPECT_EQ(e.path(), "computers.1.screen.resolution");
        EXPECT_EQ(e.field(), "resolution");
    }
}

TEST_F(CodecTest, NullInNonNullPositions) {
    CanonicalTree tree = compile(INVENTORY);
    try {
        decode(tree, json(R"({"computers": null})"), scalars);
        FAIL() << "expected NonNullViolation";
    } catch (const NonNullViolation& e) {
        EXPECT_EQ(e.path(), "computers");
    }
    try {
        decode(tree, json(R"({"computers": [null]})"), scalars);
        FAIL() << "expected NonNullViolation";
    } catch (const NonNullViolation& e) {
        EXPECT_EQ(e.path(), "computers.0");
    }
}

TEST_F(CodecTest, NullInNullablePositions) {
    CanonicalTree tree = compile(R"({"operations": [{"selections": [
        {"field": "hero", "selections": [{"field": "friends", "selections": [{"field": "name"}]}]}
    ]}]})");
    DecodedResponse result =
        decode(tree, json(R"({"hero": {"friends": [null, {"name": "Han"}]}})"), scalars);
    EXPECT_TRUE(result.data["hero"]["friends"][0].is_null());
    EXPECT_TRUE(decode(tree, json(R"({"hero": null})"), scalars).data["hero"].is_null());
}

TEST_F(CodecTest, WrongJsonKind) {
    CanonicalTree tree = compile(INVENTORY);
    try {
        decode(tree, json(R"({"computers": {"id": "a"}})"), scalars);
        FAIL() << "expected TypeMismatch";
    } catch (const TypeMismatch& e) {
        EXPECT_EQ(e.path(), "computers");
        EXPECT_EQ(e.expected(), "list");
        EXPECT_EQ(e.actual(), "object");
    }
    try {
        decode(tree, json(R"({"computers": [{"id": "a", "cpu": "z", "screen": "crt"}]})"), scalars);
        FAIL() << "expected TypeMismatch";
    } catch (const TypeMismatch& e) {
        EXPECT_EQ(e.path(), "computers.0.screen");
        EXPECT_EQ(e.expected(), "object");
    }
    EXPECT_THROW(decode(tree, json("[]"), scalars), TypeMismatch);
}

TEST_F(CodecTest, ScalarErrorCarriesPath) {
    CanonicalTree tree = compile(INVENTORY);
    try {
        decode(tree, json(R"({"computers": [
            {"id": "a", "cpu": "z80", "year": 1976, "screen": {"resolution": "x", "isColor": true}},
            {"id": "b", "cpu": "6502", "year": "new", "screen": {"resolution": "x", "isColor": true}}
        ]})"), scalars);
        FAIL() << "expected ScalarCoercionError";
    } catch (const ScalarCoercionError& e) {
        EXPECT_EQ(e.path(), "computers.1.year");
        EXPECT_EQ(e.scalar(), "Int");
    }
}

// ============================================================================
// Polymorphic selection
// ============================================================================

TEST_F(CodecTest, DiscriminatorSelectsVariant) {
    CanonicalTree tree = compile(HERO);
    DecodedResponse result =
        decode(tree, json(R"({"hero": {"__typename": "Droid", "name": "R2"}})"), scalars);

    const Value& hero = result.data["hero"];
    EXPECT_EQ(object_keys(hero), (std::vector<std::string>{"__typename", "name", "primaryFunction"}));
    EXPECT_EQ(hero["name"], "R2");
    EXPECT_TRUE(hero["primaryFunction"].is_null());
    EXPECT_FALSE(hero.contains("homePlanet"));
}

TEST_F(CodecTest, OtherVariantHasOtherFields) {
    CanonicalTree tree = compile(HERO);
    DecodedResponse result = decode(tree, json(R"({"hero": {
        "height": 1.72, "homePlanet": "Tatooine", "name": "Luke", "__typename": "Human"
    }})"), scalars);
    EXPECT_EQ(object_keys(result.data["hero"]),
              (std::vector<std::string>{"__typename", "name", "homePlanet", "height"}));
}

TEST_F(CodecTest, UnhandledTypeWithoutCatchAll) {
    CanonicalTree tree = compile(HERO);
    try {
        decode(tree, json(R"({"hero": {"__typename": "Starship", "name": "Falcon"}})"), scalars);
        FAIL() << "expected UnhandledTypeCondition";
    } catch (const UnhandledTypeCondition& e) {
        EXPECT_EQ(e.type_name(), "Starship");
        EXPECT_EQ(e.path(), "hero");
    }
}

TEST_F(CodecTest, CatchAllTakesBaseFields) {
    CanonicalTree tree = compile(HERO, lenient_options());
    DecodedResponse result = decode(
        tree, json(R"({"hero": {"__typename": "Starship", "name": "Falcon", "length": 34.7}})"),
        scalars);
    EXPECT_EQ(result.data["hero"], json(R"({"__typename": "Starship", "name": "Falcon"})"));
}

TEST_F(CodecTest, TypeWithoutFragmentNeedsCatchAll) {
    const char* const droid_only = R"({"operations": [{"selections": [
        {"field": "hero", "selections": [
            {"field": "name"},
            {"inline": "Droid", "selections": [{"field": "primaryFunction"}]}
        ]}
    ]}]})";
    const Value payload = json(R"({"hero": {"__typename": "Human", "name": "Luke"}})");

    try {
        decode(compile(droid_only), payload, scalars);
        FAIL() << "expected UnhandledTypeCondition";
    } catch (const UnhandledTypeCondition& e) {
        EXPECT_EQ(e.type_name(), "Human");
        EXPECT_EQ(e.path(), "hero");
    }

    DecodedResponse result = decode(compile(droid_only, lenient_options()), payload, scalars);
    EXPECT_EQ(result.data["hero"], payload["hero"]);
}

TEST_F(CodecTest, UnionMemberWithoutFragment) {
    CanonicalTree tree = compile(R"({"operations": [{"selections": [{"field": "search",
        "arguments": {"text": "a"}, "selections": [
            {"inline": "Droid", "selections": [{"field": "name"}]}
        ]}]}]})");
    EXPECT_THROW(decode(tree, json(R"({"search": [{"__typename": "Starship"}]})"), scalars),
                 UnhandledTypeCondition);
    EXPECT_EQ(decode(tree, json(R"({"search": [{"__typename": "Droid", "name": "R2"}]})"),
                     scalars).data["search"][0]["name"], "R2");
}

TEST_F(CodecTest, SameFragmentDirectAndNested) {
    CanonicalTree tree = compile(R"({
        "operations": [{"selections": [{"field": "hero", "selections": [
            {"spread": "HeroDetails"},
            {"inline": "Droid", "selections": [{"spread": "HeroDetails"}, {"field": "primaryFunction"}]}
        ]}]}],
        "fragments": [{"name": "HeroDetails", "typeCondition": "Character",
                       "selections": [{"field": "name"}]}]
    })");
    DecodedResponse droid = decode(tree, json(R"({"hero": {
        "__typename": "Droid", "name": "R2", "primaryFunction": "Astromech"}})"), scalars);
    EXPECT_EQ(droid.data["hero"]["primaryFunction"], "Astromech");

    DecodedResponse human =
        decode(tree, json(R"({"hero": {"__typename": "Human", "name": "Luke"}})"), scalars);
    EXPECT_EQ(human.data["hero"], json(R"({"__typename": "Human", "name": "Luke"})"));
}

TEST_F(CodecTest, AbstractTypeNeedsDiscriminator) {
    CanonicalTree tree = compile(HERO);
    try {
        decode(tree, json(R"({"hero": {"name": "R2"}})"), scalars);
        FAIL() << "expected MissingRequiredField";
    } catch (const MissingRequiredField& e) {
        EXPECT_EQ(e.path(), "hero.__typename");
    }
    EXPECT_THROW(decode(tree, json(R"({"hero": {"__typename": 3, "name": "R2"}})"), scalars),
                 TypeMismatch);
}

TEST_F(CodecTest, ConcreteTypeSuppliesDiscriminator) {
    CanonicalTree tree = compile(R"({
        "operations": [{"selections": [{"field": "computers", "selections": [
            {"field": "id"}, {"spread": "Parts"}
        ]}]}],
        "fragments": [{"name": "Parts", "typeCondition": "Computer",
                       "selections": [{"field": "cpu"}]}]
    })");
    DecodedResponse result = decode(tree, json(R"({"computers": [{"id": "a", "cpu": "z80"}]})"),
                                    scalars);
    EXPECT_EQ(result.data["computers"][0],
              json(R"({"__typename": "Computer", "id": "a", "cpu": "z80"})"));
}

// ============================================================================
// Deferred fields
// ============================================================================

TEST_F(CodecTest, DeferredFieldsAreSkipped) {
    CanonicalTree tree = compile(DEFERRED_SCREEN);
    DecodedResponse result = decode(tree, json(R"({"computers": [
        {"id": "a"}, {"id": "b", "screen": {"resolution": "early"}}
    ]})"), scalars);

    EXPECT_EQ(result.data, json(R"({"computers": [{"id": "a"}, {"id": "b"}]})"));
    ASSERT_EQ(result.deferred.size(), 2u);
    EXPECT_EQ(result.deferred[0].path, parse_path("computers.0"));
    EXPECT_EQ(result.deferred[1].path, parse_path("computers.1"));
    EXPECT_FALSE(result.deferred[0].label.has_value());
    ASSERT_EQ(result.deferred[0].fields.size(), 1u);
    EXPECT_EQ(result.deferred[0].node->fields()[result.deferred[0].fields[0]].response_key,
              "screen");
    EXPECT_EQ(result.deferred[1].describe(), "unlabeled at 'computers.1'");
}

TEST_F(CodecTest, DeferredFragmentSlotPerLabel) {
    CanonicalTree tree = compile(R"({"operations": [{"selections": [
        {"field": "hero", "selections": [
            {"field": "name"},
            {"inline": "Droid", "directives": [{"name": "defer", "arguments": {"label": "droid"}}],
             "selections": [{"field": "primaryFunction"}, {"field": "appearsIn"}]},
            {"field": "friends", "directives": [{"name": "defer", "arguments": {"label": "pals"}}],
             "selections": [{"field": "name"}]}
        ]}
    ]}]})");
    DecodedResponse result =
        decode(tree, json(R"({"hero": {"__typename": "Droid", "name": "R2"}})"), scalars);

    EXPECT_EQ(result.data["hero"], json(R"({"__typename": "Droid", "name": "R2"})"));
    ASSERT_EQ(result.deferred.size(), 2u);
    EXPECT_EQ(result.deferred[0].label, std::optional<std::string>("pals"));
    EXPECT_EQ(result.deferred[1].label, std::optional<std::string>("droid"));
    EXPECT_EQ(result.deferred[1].fields.size(), 2u);
    EXPECT_EQ(result.deferred[1].describe(), "droid at 'hero'");
}

TEST_F(CodecTest, UndeferredDuplicateWins) {
    CanonicalTree tree = compile(R"({"operations": [{"selections": [
        {"field": "computers", "selections": [
            {"field": "cpu", "directives": [{"name": "defer"}]}, {"field": "cpu"}
        ]}
    ]}]})");
    DecodedResponse result = decode(tree, json(R"({"computers": [{"cpu": "z80"}]})"), scalars);
    EXPECT_EQ(result.data["computers"][0]["cpu"], "z80");
    EXPECT_TRUE(result.deferred.empty());
}

// ============================================================================
// Conditions and variables
// ============================================================================

TEST_F(CodecTest, ConditionsFollowVariables) {
    CanonicalTree tree = compile(R"({"operations": [{
        "variables": [{"name": "withName", "type": "Boolean!"}],
        "selections": [{"field": "hero", "selections": [
            {"field": "id"},
            {"field": "name", "directives": [{"name": "include",
                "arguments": {"if": {"kind": "Variable", "variableName": "withName"}}}]}
        ]}]
    }]})");
    const Value payload = json(R"({"hero": {"__typename": "Human", "id": "1000"}})");

    DecodedResponse without = decode(tree, payload, scalars, json(R"({"withName": false})"));
    EXPECT_EQ(without.data["hero"], json(R"({"id": "1000"})"));

    EXPECT_THROW(decode(tree, payload, scalars, json(R"({"withName": true})")),
                 MissingRequiredField);
    EXPECT_THROW(decode(tree, payload, scalars), MissingVariable);
}

TEST_F(CodecTest, DefaultVariablesApply) {
    CanonicalTree tree = compile(R"({"operations": [{
        "variables": [{"name": "terse", "type": "Boolean", "defaultValue": true}],
        "selections": [{"field": "computers", "selections": [
            {"field": "id"},
            {"field": "cpu", "directives": [{"name": "skip",
                "arguments": {"if": {"kind": "Variable", "variableName": "terse"}}}]}
        ]}]
    }]})");
    DecodedResponse result = decode(tree, json(R"({"computers": [{"id": "a"}]})"), scalars);
    EXPECT_EQ(result.data["computers"][0], json(R"({"id": "a"})"));
}

// ============================================================================
// Partial decode
// ============================================================================

TEST_F(CodecTest, PartialNullsNullableScalar) {
    CanonicalTree tree = compile(INVENTORY);
    const Value payload = json(R"({"computers": [
        {"id": "a", "cpu": "z80", "year": "new", "screen": {"resolution": "x", "isColor": true}}
    ]})");

    EXPECT_THROW(decode(tree, payload, scalars), ScalarCoercionError);

    DecodedResponse result = decode_partial(tree, payload, scalars);
    EXPECT_TRUE(result.data["computers"][0]["year"].is_null());
    EXPECT_EQ(result.data["computers"][0]["cpu"], "z80");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].path, parse_path("computers.0.year"));
}

TEST_F(CodecTest, PartialPropagatesToNullableAncestor) {
    CanonicalTree tree = compile(R"({"operations": [{"selections": [
        {"field": "reviews", "selections": [{"field": "stars"}, {"field": "commentary"}]},
        {"field": "hero", "selections": [{"field": "id"}]}
    ]}]})");
    DecodedResponse result = decode_partial(tree, json(R"({
        "reviews": [{"stars": 5}, {"stars": "five"}],
        "hero": {"id": "2001"}
    })"), scalars);

    EXPECT_TRUE(result.data["reviews"].is_null());
    EXPECT_EQ(result.data["hero"], json(R"({"id": "2001"})"));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].path, parse_path("reviews.1.stars"));
}

TEST_F(CodecTest, PartialNullsWholeDataWhenNothingIsNullable) {
    CanonicalTree tree = compile(R"({"operations": [{"selections": [
        {"field": "computers", "selections": [{"field": "cpu"}]}
    ]}]})");
    DecodedResponse result = decode_partial(tree, json(R"({"computers": [{}]})"), scalars);
    EXPECT_TRUE(result.data.is_null());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].path, parse_path("computers.0.cpu"));
}

TEST_F(CodecTest, PartialRecordsEveryError) {
    CanonicalTree tree = compile(INVENTORY);
    DecodedResponse result = decode_partial(tree, json(R"({"computers": [
        {"id": "a", "cpu": "z80", "year": "old", "screen": {"resolution": "x", "isColor": true}},
        {"id": "b", "cpu": "6502", "year": 1977, "screen": {"resolution": "y", "isColor": 1}}
    ]})"), scalars);
    EXPECT_TRUE(result.data.is_null());
    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0].path, parse_path("computers.0.year"));
    EXPECT_EQ(result.errors[1].path, parse_path("computers.1.screen.isColor"));
}

TEST_F(CodecTest, PartialDropsSlotsUnderNulledObjects) {
    CanonicalTree tree = compile(R"({"operations": [{"selections": [
        {"field": "hero", "selections": [
            {"field": "friends", "directives": [{"name": "defer", "arguments": {"label": "f"}}],
             "selections": [{"field": "name"}]},
            {"field": "name"}
        ]}
    ]}]})");
    DecodedResponse result = decode_partial(tree, json(R"({"hero": {"name": null}})"), scalars);
    EXPECT_TRUE(result.data["hero"].is_null());
    EXPECT_TRUE(result.deferred.empty());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].path, parse_path("hero.name"));
}

TEST_F(CodecTest, PartialWithoutErrorsMatchesDecode) {
    CanonicalTree tree = compile(DEFERRED_SCREEN);
    const Value payload = json(R"({"computers": [{"id": "a"}]})");
    DecodedResponse strict = decode(tree, payload, scalars);
    DecodedResponse partial = decode_partial(tree, payload, scalars);
    EXPECT_EQ(partial.data, strict.data);
    EXPECT_EQ(partial.deferred.size(), strict.deferred.size());
    EXPECT_TRUE(partial.errors.empty());
}

// ============================================================================
// Encode
// ============================================================================

TEST_F(CodecTest, EncodeWritesCanonicalOrder) {
    CanonicalTree tree = compile(INVENTORY);
    Value value = Value::object();
    Value mac = Value::object();
    mac["screen"]["isColor"] = false;
    mac["screen"]["resolution"] = "512x342";
    mac["cpu"] = "68000";
    mac["id"] = "mac";
    mac["year"] = 1984;
    value["computers"] = Value::array({mac});

    Value out = encode(tree, value, scalars);
    EXPECT_EQ(out.dump(),
              R"({"computers":[{"id":"mac","cpu":"68000","year":1984,)"
              R"("screen":{"resolution":"512x342","isColor":false}}]})");
}

TEST_F(CodecTest, EncodeFillsNullableAndChecksRequired) {
    CanonicalTree tree = compile(INVENTORY);
    Value out = encode(tree, json(R"({"computers": [
        {"id": "a", "cpu": "z80", "screen": {"resolution": "x", "isColor": true}}
    ]})"), scalars);
    EXPECT_TRUE(out["computers"][0]["year"].is_null());

    EXPECT_THROW(encode(tree, json(R"({"computers": [{"id": "a", "screen": {}}]})"), scalars),
                 MissingRequiredField);
    EXPECT_THROW(encode(tree, json(R"({"computers": [
        {"id": "a", "cpu": 80, "screen": {"resolution": "x", "isColor": true}}
    ]})"), scalars), ScalarCoercionError);
}

TEST_F(CodecTest, EncodeOmitsAbsentDeferredFields) {
    CanonicalTree tree = compile(DEFERRED_SCREEN);
    EXPECT_EQ(encode(tree, json(R"({"computers": [{"id": "a"}]})"), scalars),
              json(R"({"computers": [{"id": "a"}]})"));
    EXPECT_EQ(encode(tree, json(R"({"computers": [{"screen": {"resolution": "x"}, "id": "a"}]})"),
                     scalars),
              json(R"({"computers": [{"id": "a", "screen": {"resolution": "x"}}]})"));
}

TEST_F(CodecTest, EncodeUsesAdapters) {
    CanonicalTree tree = compile(R"({"operations": [{"selections": [
        {"field": "reviews", "selections": [{"field": "stars"}, {"field": "createdAt"}]}
    ]}]})");
    scalars.register_adapter("DateTime", ScalarAdapter{
        [](const Value& v) { return Value(v.get<std::int64_t>() / 1000); },
        [](const Value& v) { return Value(v.get<std::int64_t>() * 1000); }});

    Value wire = encode(tree, json(R"({"reviews": [{"stars": 4, "createdAt": 1700000000}]})"),
                        scalars);
    EXPECT_EQ(wire["reviews"][0]["createdAt"], 1700000000000LL);
    EXPECT_EQ(decode(tree, wire, scalars).data["reviews"][0]["createdAt"], 1700000000);
}

TEST_F(CodecTest, RoundTripPreservesValues) {
    CanonicalTree tree = compile(HERO);
    const Value values[] = {
        json(R"({"hero": {"homePlanet": "Tatooine", "name": "Luke", "__typename": "Human",
                          "height": 1.72}})"),
        json(R"({"hero": {"primaryFunction": "Astromech", "__typename": "Droid", "name": "R2"}})"),
        json(R"({"hero": null})"),
    };
    for (const auto& value : values) {
        Value encoded = encode(tree, value, scalars);
        Value decoded = decode(tree, encoded, scalars).data;
        EXPECT_TRUE(equivalent(decoded, value)) << value.dump();
        EXPECT_EQ(decoded, encoded);
    }
}
