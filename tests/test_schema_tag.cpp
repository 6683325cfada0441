/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "schema/schema_node.h"

#include <gtest/gtest.h>

using namespace binstruct::schema;

TEST(SchemaTagTest, PlainScalars) {
    const auto n = parse_tag("uint16");
    ASSERT_TRUE(n.is<ScalarNode>());
    const auto& s = n.as<ScalarNode>();
    EXPECT_EQ(s.type, ScalarType::Uint16);
    EXPECT_EQ(s.endian, Endian::Big);
    EXPECT_EQ(s.padded_to, 0u);
    EXPECT_FALSE(s.ref.has_value());
    EXPECT_EQ(s.width(), 2u);

    EXPECT_EQ(parse_tag("float64").as<ScalarNode>().type, ScalarType::Float64);
    EXPECT_EQ(parse_tag("int8").as<ScalarNode>().type, ScalarType::Int8);
}

TEST(SchemaTagTest, LittleEndianSuffix) {
    const auto s = parse_tag("int32le").as<ScalarNode>();
    EXPECT_EQ(s.type, ScalarType::Int32);
    EXPECT_EQ(s.endian, Endian::Little);

    const auto p = parse_tag("uint16le:8").as<ScalarNode>();
    EXPECT_EQ(p.endian, Endian::Little);
    EXPECT_EQ(p.padded_to, 8u);
    EXPECT_EQ(p.width(), 8u);
}

TEST(SchemaTagTest, IntegerReferences) {
    const auto dec = parse_tag("uint8=5").as<ScalarNode>();
    ASSERT_TRUE(dec.ref.has_value());
    EXPECT_EQ(std::get<std::int64_t>(*dec.ref), 5);
    EXPECT_FALSE(dec.negate);

    const auto hex = parse_tag("uint32=0x89504E47").as<ScalarNode>();
    EXPECT_EQ(std::get<std::int64_t>(*hex.ref), 0x89504E47);

    const auto neg = parse_tag("int16=-3").as<ScalarNode>();
    EXPECT_EQ(std::get<std::int64_t>(*neg.ref), -3);
}

TEST(SchemaTagTest, FloatReference) {
    const auto s = parse_tag("float32le=1.5").as<ScalarNode>();
    EXPECT_EQ(s.endian, Endian::Little);
    EXPECT_DOUBLE_EQ(std::get<double>(*s.ref), 1.5);
}

TEST(SchemaTagTest, NegationForms) {
    const auto a = parse_tag("uint8!=0").as<ScalarNode>();
    EXPECT_TRUE(a.negate);
    EXPECT_EQ(std::get<std::int64_t>(*a.ref), 0);

    const auto b = parse_tag("uint8=0!").as<ScalarNode>();
    EXPECT_TRUE(b.negate);
    EXPECT_EQ(std::get<std::int64_t>(*b.ref), 0);

    const auto c = parse_tag("uint16:4!=7").as<ScalarNode>();
    EXPECT_TRUE(c.negate);
    EXPECT_EQ(c.padded_to, 4u);

    const auto s = parse_tag("string:4!=RIFF").as<FixedStringNode>();
    EXPECT_TRUE(s.negate);
    EXPECT_EQ(*s.ref, "RIFF");
}

TEST(SchemaTagTest, Strings) {
    const auto fixed = parse_tag("string:4=ABCD").as<FixedStringNode>();
    EXPECT_EQ(fixed.padded_to, 4u);
    EXPECT_EQ(*fixed.ref, "ABCD");
    EXPECT_FALSE(fixed.negate);

    const auto cs = parse_tag("cstring").as<CStringNode>();
    EXPECT_EQ(cs.padded_to, 0u);
    EXPECT_FALSE(cs.ref.has_value());

    const auto padded = parse_tag("cstring:30").as<CStringNode>();
    EXPECT_EQ(padded.padded_to, 30u);

    const auto eq = parse_tag("cstring=a=b").as<CStringNode>();
    EXPECT_EQ(*eq.ref, "a=b");
}

TEST(SchemaTagTest, RejectsMalformedTags) {
    EXPECT_THROW(parse_tag("uint12"), SchemaError);
    EXPECT_THROW(parse_tag("string"), SchemaError);
    EXPECT_THROW(parse_tag("uint8:x"), SchemaError);
    EXPECT_THROW(parse_tag("uint8:"), SchemaError);
    EXPECT_THROW(parse_tag("uint8=abc"), SchemaError);
    EXPECT_THROW(parse_tag("uint8=12px"), SchemaError);
    EXPECT_THROW(parse_tag("float32=1.5.2"), SchemaError);
    EXPECT_THROW(parse_tag("le"), SchemaError);
    EXPECT_THROW(parse_tag(""), SchemaError);

    EXPECT_TRUE(is_tag("uint32le"));
    EXPECT_TRUE(try_parse_tag("uint16:4!=7").has_value());
    EXPECT_FALSE(try_parse_tag("uint8=abc").has_value());
    EXPECT_FALSE(try_parse_tag("string").has_value());
    EXPECT_FALSE(is_tag("width"));
    EXPECT_FALSE(is_tag("n-1"));
}

TEST(SchemaTagTest, DescribeRoundTripsTags) {
    for (const char* tag : {"uint16", "int32le", "uint8=5", "uint8!=0", "uint16:8", "string:4=ABCD",
                            "cstring", "cstring:30", "float64le"}) {
        EXPECT_EQ(describe_tag(parse_tag(tag)), tag) << tag;
    }
    EXPECT_EQ(describe_tag(parse_tag("uint8=0!")), "uint8!=0");
    EXPECT_EQ(describe_tag(parse_tag("uint32=0x10")), "uint32=16");
}

TEST(SchemaTagTest, FixedWidth) {
    EXPECT_EQ(fixed_width(parse_tag("uint32")), 4u);
    EXPECT_EQ(fixed_width(parse_tag("uint16:8")), 8u);
    EXPECT_EQ(fixed_width(parse_tag("string:5")), 5u);
    EXPECT_EQ(fixed_width(parse_tag("cstring:3")), 3u);
    EXPECT_FALSE(fixed_width(parse_tag("cstring")).has_value());
}

TEST(SchemaTagTest, ScalarTypeTable) {
    EXPECT_EQ(scalar_size(ScalarType::Int8), 1u);
    EXPECT_EQ(scalar_size(ScalarType::Uint16), 2u);
    EXPECT_EQ(scalar_size(ScalarType::Float32), 4u);
    EXPECT_EQ(scalar_size(ScalarType::Float64), 8u);
    EXPECT_TRUE(is_float_type(ScalarType::Float32));
    EXPECT_FALSE(is_float_type(ScalarType::Int32));
    EXPECT_TRUE(is_signed_type(ScalarType::Int16));
    EXPECT_FALSE(is_signed_type(ScalarType::Uint32));
    EXPECT_EQ(scalar_name(ScalarType::Uint32), "uint32");
    EXPECT_EQ(try_parse_scalar_type("float32"), ScalarType::Float32);
    EXPECT_FALSE(try_parse_scalar_type("float16").has_value());
}
