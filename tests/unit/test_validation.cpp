#include <gtest/gtest.h>
#include "mcptk/validation.hpp"
#include <algorithm>

using namespace mcptk;

namespace {

nlohmann::json make_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"name", {{"type", "string"}}},
            {"count", {{"type", "integer"}}},
            {"ratio", {{"type", "number"}}},
            {"mode", {{"type", "string"}, {"enum", {"fast", "slow"}}}},
            {"tag", {{"type", {"string", "null"}}}}
        }},
        {"required", {"name"}}
    };
}

} // anonymous namespace

TEST(Validation, ValidParams) {
    auto r = validate_against_schema(make_schema(), {{"name", "a"}, {"count", 3}, {"ratio", 1}});
    EXPECT_TRUE(r.is_valid);
    EXPECT_TRUE(r.errors.empty());
}

TEST(Validation, MissingRequired) {
    auto r = validate_against_schema(make_schema(), nlohmann::json::object());
    ASSERT_FALSE(r.is_valid);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].field, "name");
    EXPECT_EQ(r.errors[0].code, validation_code::Required);
}

TEST(Validation, ReportsEveryViolation) {
    auto r = validate_against_schema(make_schema(),
                                     {{"count", "three"}, {"mode", "medium"}});
    ASSERT_FALSE(r.is_valid);
    ASSERT_EQ(r.errors.size(), 3u);

    std::vector<std::string> codes;
    for (const auto& e : r.errors) codes.push_back(e.code);
    EXPECT_NE(std::find(codes.begin(), codes.end(), validation_code::Required), codes.end());
    EXPECT_NE(std::find(codes.begin(), codes.end(), validation_code::InvalidType), codes.end());
    EXPECT_NE(std::find(codes.begin(), codes.end(), validation_code::InvalidEnum), codes.end());
}

TEST(Validation, IntegerIsNotAcceptedAsStringButIsANumber) {
    EXPECT_FALSE(matches_schema_type(5, "string"));
    EXPECT_TRUE(matches_schema_type(5, "number"));
    EXPECT_TRUE(matches_schema_type(5, "integer"));
    EXPECT_FALSE(matches_schema_type(5.5, "integer"));
    EXPECT_TRUE(matches_schema_type(nlohmann::json::array(), "array"));
    EXPECT_TRUE(matches_schema_type(true, "custom-type"));
}

TEST(Validation, TypeUnion) {
    auto schema = make_schema();
    EXPECT_TRUE(validate_against_schema(schema, {{"name", "a"}, {"tag", nullptr}}).is_valid);
    EXPECT_FALSE(validate_against_schema(schema, {{"name", "a"}, {"tag", 1}}).is_valid);
}

TEST(Validation, NonObjectParams) {
    auto r = validate_against_schema(make_schema(), nlohmann::json::array());
    ASSERT_FALSE(r.is_valid);
    EXPECT_EQ(r.errors[0].field, "");
    EXPECT_EQ(r.errors[0].code, validation_code::InvalidType);
}

TEST(Validation, EmptySchemaAcceptsAnything) {
    EXPECT_TRUE(validate_against_schema(nlohmann::json::object(), {{"x", 1}}).is_valid);
    EXPECT_TRUE(validate_against_schema(nullptr, "whatever").is_valid);
}

TEST(Validation, UndeclaredParametersAreIgnored) {
    EXPECT_TRUE(validate_against_schema(make_schema(), {{"name", "a"}, {"extra", 1}}).is_valid);
}
