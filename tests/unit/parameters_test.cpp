#include "common/parameters.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

namespace hearth {
namespace {

TEST(ParametersTest, TypeStringRoundTrip) {
    const auto range = parameter_type_from_string("RangeU64");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(ParameterType::RANGE_U64, *range);
    EXPECT_STREQ("RangeU64", parameter_type_to_string(*range));

    EXPECT_EQ(ParameterType::CHARS_SEQUENCE, parameter_type_from_string("CharsSequence").value());
    EXPECT_FALSE(parameter_type_from_string("rangeu64").has_value());
    EXPECT_FALSE(parameter_type_from_string("Bytes").has_value());
}

TEST(ParametersTest, RangeKindsAcceptTheirBaseType) {
    const auto kind = ParameterKind::range_u64(0, 20, 1, 5);
    EXPECT_STREQ("u64", parameter_kind_type_name(kind));
    EXPECT_TRUE(parameter_value_matches_kind(kind, ParameterValue{uint64_t{7}}));
    EXPECT_FALSE(parameter_value_matches_kind(kind, ParameterValue{uint32_t{7}}));
    EXPECT_FALSE(parameter_value_matches_kind(kind, ParameterValue{7.0}));

    const auto level = ParameterKind::range_f64(0.0, 1.0, 0.1, 0.5);
    EXPECT_STREQ("f64", parameter_kind_type_name(level));
    EXPECT_TRUE(parameter_value_matches_kind(level, ParameterValue{0.25}));
    EXPECT_FALSE(parameter_value_matches_kind(level, ParameterValue{0.25f}));
}

TEST(ParametersTest, ValueTypeNames) {
    EXPECT_STREQ("bool", parameter_value_type_name(ParameterValue{true}));
    EXPECT_STREQ("u8", parameter_value_type_name(ParameterValue{uint8_t{1}}));
    EXPECT_STREQ("f32", parameter_value_type_name(ParameterValue{1.5f}));
    EXPECT_STREQ("String", parameter_value_type_name(ParameterValue{std::string("x")}));
}

TEST(ParametersTest, ValueToString) {
    EXPECT_EQ("true", parameter_value_to_string(ParameterValue{true}));
    EXPECT_EQ("255", parameter_value_to_string(ParameterValue{uint8_t{255}}));
    EXPECT_EQ("18446744073709551615",
              parameter_value_to_string(ParameterValue{std::numeric_limits<uint64_t>::max()}));
    EXPECT_EQ("0.5", parameter_value_to_string(ParameterValue{0.5}));
    EXPECT_EQ("0", parameter_value_to_string(ParameterValue{0.0}));
    EXPECT_EQ("white", parameter_value_to_string(ParameterValue{std::string("white")}));
}

TEST(ParametersTest, FactoriesSetBoundsAndDefaults) {
    const auto kind = ParameterKind::u8(128, 0, 255);
    EXPECT_EQ(ParameterType::U8, kind.type);
    EXPECT_EQ(ParameterValue{uint8_t{128}}, kind.default_value);
    ASSERT_TRUE(kind.min.has_value());
    EXPECT_EQ(ParameterValue{uint8_t{0}}, *kind.min);
    EXPECT_FALSE(kind.step.has_value());

    EXPECT_EQ(ParameterKind::boolean(false), ParameterKind::boolean(false));
    EXPECT_NE(ParameterKind::boolean(false), ParameterKind::boolean(true));
}

TEST(ParametersTest, ParseTextualValues) {
    ParameterValue value;
    std::string error;

    ASSERT_TRUE(parse_parameter_value(ParameterKind::range_u64(0, 20, 1, 0), "5", value, error)) << error;
    EXPECT_EQ(ParameterValue{uint64_t{5}}, value);

    ASSERT_TRUE(parse_parameter_value(ParameterKind::boolean(false), "true", value, error));
    EXPECT_EQ(ParameterValue{true}, value);

    ASSERT_TRUE(parse_parameter_value(ParameterKind::range_f64(0.0, 1.0, 0.1, 0.5), "0.25", value, error));
    EXPECT_EQ(ParameterValue{0.25}, value);

    ASSERT_TRUE(parse_parameter_value(ParameterKind::chars_sequence(""), "warm white", value, error));
    EXPECT_EQ(ParameterValue{std::string("warm white")}, value);
}

TEST(ParametersTest, ParseRejectsMalformedOrOutOfRange) {
    ParameterValue value;
    std::string error;

    EXPECT_FALSE(parse_parameter_value(ParameterKind::u8(0, 0, 255), "256", value, error));
    EXPECT_NE(error.find("out of range"), std::string::npos);
    EXPECT_FALSE(parse_parameter_value(ParameterKind::u32(0, 0, 10), "-1", value, error));
    EXPECT_FALSE(parse_parameter_value(ParameterKind::u32(0, 0, 10), "4x", value, error));
    EXPECT_FALSE(parse_parameter_value(ParameterKind::boolean(false), "yes", value, error));
    EXPECT_FALSE(parse_parameter_value(ParameterKind::f64(0.0, 0.0, 1.0, 0.1), "", value, error));
}

TEST(ParametersTest, FindParameterByName) {
    ParametersSchema schema{{"brightness", ParameterKind::range_u64(0, 20, 1, 0)},
                            {"label", ParameterKind::chars_sequence("white")}};
    ASSERT_NE(nullptr, find_parameter(schema, "label"));
    EXPECT_EQ(ParameterType::CHARS_SEQUENCE, find_parameter(schema, "label")->kind.type);
    EXPECT_EQ(nullptr, find_parameter(schema, "missing"));
}

}  // namespace
}  // namespace hearth
