/**
 * @file Fixtures.hpp
 * @brief Shared schema and helpers for the GoogleTest suites
 */

#ifndef SHAPEQL_TESTS_FIXTURES_HPP
#define SHAPEQL_TESTS_FIXTURES_HPP

#include "shapeql/CanonicalTree.hpp"
#include "shapeql/Document.hpp"
#include "shapeql/Schema.hpp"
#include "shapeql/Value.hpp"
#include <string>

namespace shapeql::testing {

inline Value json(const std::string& text) {
    return Value::parse(text);
}

/**
 * @brief Small Star Wars schema plus a computer inventory
 */
inline const Value& schema_json() {
    static const Value schema = Value::parse(R"({
        "queryType": "Query",
        "mutationType": "Mutation",
        "types": [
            {"name": "Query", "kind": "OBJECT", "fields": [
                {"name": "hero", "type": "Character",
                 "args": [{"name": "episode", "type": "Episode"}]},
                {"name": "droid", "type": "Droid", "args": [{"name": "id", "type": "ID!"}]},
                {"name": "search", "type": "[SearchResult]",
                 "args": [{"name": "text", "type": "String!"}]},
                {"name": "computers", "type": "[Computer!]!"},
                {"name": "reviews", "type": "[Review!]"}
            ]},
            {"name": "Mutation", "kind": "OBJECT", "fields": [
                {"name": "createReview", "type": "Review",
                 "args": [{"name": "episode", "type": "Episode"},
                          {"name": "stars", "type": "Int!"}]}
            ]},
            {"name": "Character", "kind": "INTERFACE", "fields": [
                {"name": "id", "type": "ID!"},
                {"name": "name", "type": "String!"},
                {"name": "friends", "type": "[Character]"},
                {"name": "appearsIn", "type": "[Episode]!"}
            ]},
            {"name": "Human", "kind": "OBJECT", "interfaces": ["Character"], "fields": [
                {"name": "id", "type": "ID!"},
                {"name": "name", "type": "String!"},
                {"name": "friends", "type": "[Character]"},
                {"name": "appearsIn", "type": "[Episode]!"},
                {"name": "homePlanet", "type": "String"},
                {"name": "height", "type": "Float"}
            ]},
            {"name": "Droid", "kind": "OBJECT", "interfaces": ["Character"], "fields": [
                {"name": "id", "type": "ID!"},
                {"name": "name", "type": "String!"},
                {"name": "friends", "type": "[Character]"},
                {"name": "appearsIn", "type": "[Episode]!"},
                {"name": "primaryFunction", "type": "String"}
            ]},
            {"name": "Starship", "kind": "OBJECT", "fields": [
                {"name": "id", "type": "ID!"},
                {"name": "name", "type": "String!"},
                {"name": "length", "type": "Float"}
            ]},
            {"name": "SearchResult", "kind": "UNION",
             "possibleTypes": ["Human", "Droid", "Starship"]},
            {"name": "Episode", "kind": "ENUM", "enumValues": ["NEWHOPE", "EMPIRE", "JEDI"]},
            {"name": "Computer", "kind": "OBJECT", "fields": [
                {"name": "id", "type": "ID!"},
                {"name": "cpu", "type": "String!"},
                {"name": "year", "type": "Int"},
                {"name": "screen", "type": "Screen!"},
                {"name": "owner", "type": "Character"}
            ]},
            {"name": "Screen", "kind": "OBJECT", "fields": [
                {"name": "resolution", "type": "String!"},
                {"name": "isColor", "type": "Boolean!"},
                {"name": "calibratedAt", "type": "DateTime"}
            ]},
            {"name": "Review", "kind": "OBJECT", "fields": [
                {"name": "stars", "type": "Int!"},
                {"name": "commentary", "type": "String"},
                {"name": "createdAt", "type": "DateTime"}
            ]},
            {"name": "DateTime", "kind": "SCALAR"}
        ]
    })");
    return schema;
}

inline Schema make_schema() {
    return Schema::from_json(schema_json());
}

inline Document make_document(const std::string& text) {
    return document_from_json(Value::parse(text));
}

inline TreeOptions strict_options() {
    return TreeOptions(TreeOptions::CatchAll::Disabled);
}

inline TreeOptions lenient_options() {
    return TreeOptions(TreeOptions::CatchAll::Enabled);
}

/**
 * @brief Compile the only operation of a document
 */
inline CanonicalTree compile(const std::string& document,
                             const TreeOptions& options = strict_options()) {
    return compile_operation(make_schema(), make_document(document), "", options);
}

} // namespace shapeql::testing

#endif // SHAPEQL_TESTS_FIXTURES_HPP
