#include <gtest/gtest.h>
#include "toolbridge/schema.hpp"
#include "toolbridge/error.hpp"
#include <limits>

using namespace toolbridge;

namespace {

const nlohmann::json kSearchSchema = nlohmann::json::parse(R"({
    "type": "object",
    "properties": {
        "location": {"type": "string", "minLength": 2},
        "adults":   {"type": "integer", "minimum": 1, "maximum": 16},
        "sort":     {"type": "string", "enum": ["price", "rating"]},
        "tags":     {"type": "array", "items": {"type": "string"}},
        "window":   {"type": "object", "properties": {"from": {"type": "string"}}, "required": ["from"]}
    },
    "required": ["location"],
    "additionalProperties": false
})");

std::string failure(const nlohmann::json& args) {
    try {
        validate_arguments(kSearchSchema, args);
    } catch (const InvalidArguments& e) {
        return e.what();
    }
    return {};
}

} // namespace

TEST(Schema, AcceptsValidArguments) {
    EXPECT_NO_THROW(validate_arguments(kSearchSchema, {
        {"location", "Lisbon"}, {"adults", 2}, {"sort", "price"},
        {"tags", {"pool", "wifi"}}, {"window", {{"from", "2025-07-01"}}}
    }));
}

TEST(Schema, MissingRequired) {
    EXPECT_NE(failure(nlohmann::json::object()).find("missing required argument 'location'"), std::string::npos);
}

TEST(Schema, WrongType) {
    EXPECT_NE(failure({{"location", 42}}).find("arguments.location: expected string"), std::string::npos);
}

TEST(Schema, IntegerAcceptsWholeDoubleButNotFraction) {
    EXPECT_TRUE(failure({{"location", "Rome"}, {"adults", 2.0}}).empty());
    EXPECT_FALSE(failure({{"location", "Rome"}, {"adults", 2.5}}).empty());
}

TEST(Schema, IntegerOutsideMachineRange) {
    const nlohmann::json schema = {{"type", "object"}, {"properties", {{"n", {{"type", "integer"}}}}}};
    EXPECT_NO_THROW(validate_arguments(schema, {{"n", 1e300}}));
    EXPECT_NO_THROW(validate_arguments(schema, {{"n", -9.3e18}}));
    EXPECT_THROW(validate_arguments(schema, {{"n", std::numeric_limits<double>::infinity()}}), InvalidArguments);
    EXPECT_THROW(validate_arguments(schema, {{"n", std::numeric_limits<double>::quiet_NaN()}}), InvalidArguments);
    EXPECT_NE(failure({{"location", "Rome"}, {"adults", 1e300}}).find("above maximum"), std::string::npos);
}

TEST(Schema, Bounds) {
    EXPECT_NE(failure({{"location", "Rome"}, {"adults", 0}}).find("below minimum"), std::string::npos);
    EXPECT_NE(failure({{"location", "Rome"}, {"adults", 17}}).find("above maximum"), std::string::npos);
    EXPECT_NE(failure({{"location", "R"}}).find("shorter than"), std::string::npos);
}

TEST(Schema, Enum) {
    EXPECT_NE(failure({{"location", "Rome"}, {"sort", "distance"}}).find("is not one of"), std::string::npos);
}

TEST(Schema, ClosedObjectRejectsUnknownArgument) {
    EXPECT_NE(failure({{"location", "Rome"}, {"pets", true}}).find("arguments.pets: unexpected argument"),
              std::string::npos);
}

TEST(Schema, ArrayItemsReportIndex) {
    EXPECT_NE(failure({{"location", "Rome"}, {"tags", {"ok", 3}}}).find("arguments.tags[1]"), std::string::npos);
}

TEST(Schema, NestedRequired) {
    EXPECT_NE(failure({{"location", "Rome"}, {"window", nlohmann::json::object()}}).find("arguments.window"),
              std::string::npos);
}

TEST(Schema, ArgumentsMustBeObject) {
    EXPECT_THROW(validate_arguments(kSearchSchema, nlohmann::json::array()), InvalidArguments);
}

TEST(Schema, UnknownKeywordsAreIgnored) {
    nlohmann::json schema = {{"type", "object"}, {"patternProperties", {{"^x", {{"type", "number"}}}}}};
    EXPECT_NO_THROW(validate_arguments(schema, {{"xa", "not a number"}}));
}

TEST(Schema, TypeListAndAdditionalPropertiesSchema) {
    nlohmann::json schema = {
        {"type", "object"},
        {"properties", {{"limit", {{"type", {"integer", "null"}}}}}},
        {"additionalProperties", {{"type", "boolean"}}}
    };
    EXPECT_NO_THROW(validate_arguments(schema, {{"limit", nullptr}, {"verbose", true}}));
    EXPECT_THROW(validate_arguments(schema, {{"limit", "ten"}}), InvalidArguments);
    EXPECT_THROW(validate_arguments(schema, {{"verbose", "yes"}}), InvalidArguments);
}
