/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "schema/schema_decoder.h"
#include "schema/schema_encoder.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace binstruct::schema;
using Json = nlohmann::ordered_json;

namespace {
std::vector<std::uint8_t> encode_bytes(const Json& description, const Json& record) {
    ByteCursor cursor;
    const std::size_t written = encode(compile_schema(description), cursor, record);
    EXPECT_EQ(written, cursor.length());
    return cursor.take_bytes();
}

// Two nested tagged headers, a float array sized by a field and a trailing
// greeting. Tags are big endian, codes little endian.
const std::vector<std::uint8_t> kMixedBuffer = {
    137, 80, 78, 71, 0, 136, 136, 255,
    137, 80, 78, 71, 0, 136, 136, 255,
    72, 101, 108, 108, 111, 44, 32, 87, 111, 114, 108, 100, 33, 0,
    0, 2,
    0, 1, 2, 3,
    1, 2, 3, 4,
    72, 101, 108, 108, 111, 44, 32, 87, 111, 114, 108, 100, 33, 0,
};

const Json kMixedSchema = {
    {"tag", "uint32"},
    {"code", "uint32le"},
    {"embed", {{"tag", "uint32"}, {"code", "uint32le"}, {"greet", "cstring"}}},
    {"length", "uint16"},
    {"data", Json::array({"float32", "length"})},
    {"greet", "cstring"},
};
}  // namespace

TEST(EncoderTest, RoundTripsMixedBuffer) {
    const auto schema = compile_schema(kMixedSchema);
    ByteCursor in(kMixedBuffer);
    const auto rec = decode(schema, in);
    ASSERT_TRUE(rec.has_value());
    EXPECT_TRUE(in.eof());
    EXPECT_EQ((*rec)["tag"], 0x89504E47u);
    EXPECT_EQ((*rec)["code"], 0xFF888800u);
    EXPECT_EQ((*rec)["embed"]["greet"], "Hello, World!");
    EXPECT_EQ((*rec)["length"], 2);
    EXPECT_EQ((*rec)["data"].size(), 2u);

    ByteCursor out(kMixedBuffer.size());
    EXPECT_EQ(encode(schema, out, *rec), kMixedBuffer.size());
    EXPECT_EQ(out.take_bytes(), kMixedBuffer);
}

TEST(EncoderTest, ScalarByteLayout) {
    const Json def = {{"a", "uint16"}, {"b", "uint16le"}, {"c", "int8"}, {"d", "int32le"}};
    const Json rec = {{"a", 0x0102}, {"b", 0x0102}, {"c", -1}, {"d", -2}};
    EXPECT_EQ(encode_bytes(def, rec),
              (std::vector<std::uint8_t>{1, 2, 2, 1, 0xFF, 0xFE, 0xFF, 0xFF, 0xFF}));
}

TEST(EncoderTest, PaddingIsZeroFilled) {
    const Json def = {{"v", "uint16:4"}, {"s", "string:3"}, {"c", "cstring:4"}, {"z", "cstring"}};
    const Json rec = {{"v", 7}, {"s", "abcdef"}, {"c", "xy"}, {"z", "ok"}};
    EXPECT_EQ(encode_bytes(def, rec),
              (std::vector<std::uint8_t>{0, 7, 0, 0, 'a', 'b', 'c', 'x', 'y', 0, 0, 'o', 'k', 0}));
}

TEST(EncoderTest, ArraysAndNestedStructs) {
    const Json def = {
        {"n", "uint8"},
        {"points", Json::array({Json{{"x", "int8"}, {"y", "int8"}}, "n"})},
        {"rest", Json::array({"uint8", "*"})},
    };
    const Json rec = {
        {"n", 2},
        {"points", Json::array({Json{{"x", 1}, {"y", -1}}, Json{{"x", 3}, {"y", 4}}})},
        {"rest", Json::array({9, 8})},
    };
    EXPECT_EQ(encode_bytes(def, rec), (std::vector<std::uint8_t>{2, 1, 0xFF, 3, 4, 9, 8}));
}

TEST(EncoderTest, ArrayLengthMustMatchRecord) {
    const Json def = {{"n", "uint8"}, {"data", Json::array({"uint8", "n-1"})}};
    EXPECT_EQ(encode_bytes(def, Json{{"n", 3}, {"data", Json::array({1, 2})}}),
              (std::vector<std::uint8_t>{3, 1, 2}));

    ByteCursor cursor;
    const auto schema = compile_schema(def);
    EXPECT_THROW(encode(schema, cursor, Json{{"n", 3}, {"data", Json::array({1, 2, 3})}}), RecordError);
    EXPECT_THROW(encode(compile_schema(Json::array({"uint8", 2})), cursor, Json::array({1})), RecordError);
}

TEST(EncoderTest, RecordShapeErrors) {
    const Json def = {{"a", "uint8"}, {"b", "cstring"}};
    ByteCursor cursor;
    const auto schema = compile_schema(def);
    EXPECT_THROW(encode(schema, cursor, Json{{"a", 1}}), RecordError);
    EXPECT_THROW(encode(schema, cursor, Json{{"a", "x"}, {"b", "y"}}), RecordError);
    EXPECT_THROW(encode(schema, cursor, Json{{"a", 1}, {"b", 2}}), RecordError);
    EXPECT_THROW(encode(schema, cursor, Json::array({1, "y"})), RecordError);

    try {
        encode(compile_schema(Json{{"outer", Json{{"inner", "uint8"}}}}), cursor, Json{{"outer", Json::object()}});
        FAIL() << "expected RecordError";
    } catch (const RecordError& ex) {
        EXPECT_NE(std::string(ex.what()).find("$.outer.inner"), std::string::npos) << ex.what();
    }
}

TEST(EncoderTest, BranchesAreNotEncodable) {
    ByteCursor cursor;
    const auto schema = compile_schema(Json::array({"uint8=1", "uint16"}));
    EXPECT_THROW(encode(schema, cursor, Json(1)), SchemaError);
}

TEST(EncoderTest, FixedCursorReportsBufferFull) {
    ByteCursor cursor(2, Endian::Big, false);
    const auto schema = compile_schema(Json{{"v", "uint32"}});
    EXPECT_THROW(encode(schema, cursor, Json{{"v", 1}}), BufferFullError);
}

TEST(EncoderTest, FloatsAcceptIntegersAndIntegersAcceptWholeFloats) {
    const Json def = {{"f", "float32"}, {"i", "uint8"}};
    EXPECT_EQ(encode_bytes(def, Json{{"f", 1}, {"i", 2.0}}),
              (std::vector<std::uint8_t>{0x3F, 0x80, 0, 0, 2}));
}

TEST(EncoderTest, EncodesAtCursorPosition) {
    ByteCursor cursor(std::vector<std::uint8_t>{0xAA, 0xAA, 0xAA, 0xAA});
    cursor.seek(1);
    const auto schema = compile_schema(Json{{"v", "uint16le"}});
    EXPECT_EQ(encode(schema, cursor, Json{{"v", 0x0201}}), 2u);
    EXPECT_EQ(cursor.take_bytes(), (std::vector<std::uint8_t>{0xAA, 1, 2, 0xAA}));
}

TEST(EncoderTest, StringsMapCharactersToSingleBytes) {
    const Json def = {{"s", "string:3"}, {"c", "cstring"}};
    EXPECT_EQ(encode_bytes(def, Json{{"s", "\xC3\xA9" "a\xC2\x80"}, {"c", "\xC3\xBF"}}),
              (std::vector<std::uint8_t>{0xE9, 'a', 0x80, 0xFF, 0}));

    ByteCursor cursor;
    const auto schema = compile_schema(def);
    // U+0100 has no single-byte form.
    EXPECT_THROW(encode(schema, cursor, Json{{"s", "\xC4\x80"}, {"c", ""}}), RecordError);
    EXPECT_THROW(encode(schema, cursor, Json{{"s", "ok"}, {"c", "\xE2\x82\xAC"}}), RecordError);
}

TEST(EncoderTest, SlackBytesAreNotPreserved) {
    // Bytes after a padded value or a padded cstring terminator have no place
    // in the record, so re-encoding writes zeros there.
    const auto padded = compile_schema(Json{{"v", "uint16:4"}});
    ByteCursor in(std::vector<std::uint8_t>{0, 7, 9, 9});
    const auto rec = decode(padded, in);
    ASSERT_TRUE(rec.has_value());
    ByteCursor out;
    encode(padded, out, *rec);
    EXPECT_EQ(out.take_bytes(), (std::vector<std::uint8_t>{0, 7, 0, 0}));

    const auto cstr = compile_schema(Json{{"name", "cstring:6"}});
    ByteCursor cin(std::vector<std::uint8_t>{'h', 'i', 0, 'x', 'y', 0});
    const auto crec = decode(cstr, cin);
    ASSERT_TRUE(crec.has_value());
    EXPECT_EQ((*crec)["name"], "hi");
    ByteCursor cout;
    encode(cstr, cout, *crec);
    EXPECT_EQ(cout.take_bytes(), (std::vector<std::uint8_t>{'h', 'i', 0, 0, 0, 0}));

    // A fixed string keeps every byte of its slot.
    const auto fixed = compile_schema(Json{{"name", "string:6"}});
    ByteCursor fin(std::vector<std::uint8_t>{'h', 'i', 0, 'x', 'y', 0});
    const auto frec = decode(fixed, fin);
    ASSERT_TRUE(frec.has_value());
    ByteCursor fout;
    encode(fixed, fout, *frec);
    EXPECT_EQ(fout.take_bytes(), (std::vector<std::uint8_t>{'h', 'i', 0, 'x', 'y', 0}));
}

struct RoundTripCase {
    const char* name;
    const char* schema;
    std::vector<std::uint8_t> bytes;
};

class RoundTripTest : public ::testing::TestWithParam<RoundTripCase> {};

TEST_P(RoundTripTest, DecodeThenEncodeIsIdentity) {
    const auto& param = GetParam();
    const auto schema = compile_schema_text(param.schema);
    ByteCursor in(param.bytes);
    const auto rec = decode(schema, in);
    ASSERT_TRUE(rec.has_value());
    EXPECT_TRUE(in.eof());

    // Through JSON text, as the command line tool stores records.
    const Json reparsed = Json::parse(rec->dump());
    ByteCursor out;
    EXPECT_EQ(encode(schema, out, reparsed), param.bytes.size());
    EXPECT_EQ(out.take_bytes(), param.bytes);
}

INSTANTIATE_TEST_SUITE_P(
    Schemas, RoundTripTest,
    ::testing::Values(
        RoundTripCase{"PaddedScalar", R"({"v": "uint16le:4", "w": "int8:2"})", {7, 1, 0, 0, 0xFE, 0}},
        RoundTripCase{"FixedString", R"({"magic": "string:4", "tail": "string:4"})",
                      {0x89, 'P', 'N', 'G', 'a', 0, 0, 0}},
        RoundTripCase{"PaddedCString", R"({"title": "cstring:6", "artist": "cstring"})",
                      {'s', 0xF6, 'n', 'g', 0, 0, 'm', 'e', 0}},
        RoundTripCase{"NegativeLength", R"({"head": "uint8", "body": ["uint8", -1], "tail": "uint8"})",
                      {1, 2, 3, 4, 5}},
        RoundTripCase{"RemainderArray", R"({"n": "uint8", "rest": ["uint16le", "*"]})", {1, 2, 0, 3, 0}},
        RoundTripCase{"MisalignedLittleEndian", R"({"pad": "uint8", "v": ["uint32le", 2], "f": ["float32le", 2]})",
                      {9, 1, 0, 0, 0, 2, 0, 0, 0x80, 0, 0, 0xC0, 0x3F, 0, 0, 0x80, 0xBE}},
        RoundTripCase{"StructArrayByExpression",
                      R"({"n": "uint8", "pts": [{"x": "int8", "y": "uint16le"}, "n-1"]})",
                      {3, 1, 2, 0, 0xFF, 4, 0}}
    ),
    [](const ::testing::TestParamInfo<RoundTripCase>& info) { return std::string(info.param.name); }
);
