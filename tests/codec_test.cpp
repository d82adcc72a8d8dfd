/**
 * @file codec_test.cpp
 * @brief Unit tests for the ISO 8583 codec module
 *
 * Covers:
 * - Presence bitmap decoding and encoding
 * - Field schema invariants
 * - Parsing (fixed, LLVAR, LLLVAR, secondary bitmap, malformed input)
 * - Composing (padding, truncation, overflow, bitmap generation)
 * - iso_message accessors and pretty printing
 */

#include "iso8583/gateway/codec/bitmap.h"
#include "iso8583/gateway/codec/field_schema.h"
#include "iso8583/gateway/codec/iso_codec.h"
#include "iso8583/gateway/codec/iso_message.h"

#include "utils/test_helpers.h"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace iso8583::gateway::codec::test {

using gateway::test::sample_rules;
using gateway::test::sample_schema;
namespace samples = gateway::test::iso_samples;

// =============================================================================
// Bitmap Tests
// =============================================================================

class BitmapTest : public ::testing::Test {};

TEST_F(BitmapTest, DecodePrimaryBitmap) {
    auto result = bitmap::from_hex("6000000000000000");
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(8u, result->size());
    EXPECT_FALSE(result->test(1));
    EXPECT_TRUE(result->test(2));
    EXPECT_TRUE(result->test(3));
    EXPECT_FALSE(result->test(4));
    EXPECT_FALSE(result->test(64));
    EXPECT_FALSE(result->has_secondary());
}

TEST_F(BitmapTest, DecodeLowercaseHex) {
    auto result = bitmap::from_hex("00000000000000ff");
    ASSERT_TRUE(result.has_value());

    for (int field = 57; field <= 64; ++field) {
        EXPECT_TRUE(result->test(field)) << "field " << field;
    }
    EXPECT_EQ("00000000000000FF", result->to_hex());
}

TEST_F(BitmapTest, RejectInvalidHex) {
    auto not_hex = bitmap::from_hex("ZZ00000000000000");
    ASSERT_FALSE(not_hex.has_value());
    EXPECT_EQ(iso_error::invalid_bitmap, not_hex.error());

    auto odd_length = bitmap::from_hex("600");
    ASSERT_FALSE(odd_length.has_value());
    EXPECT_EQ(iso_error::invalid_bitmap, odd_length.error());
}

TEST_F(BitmapTest, SetAndEncode) {
    bitmap present;
    EXPECT_TRUE(present.set(2));
    EXPECT_TRUE(present.set(3));
    EXPECT_TRUE(present.set(64));

    EXPECT_EQ("6000000000000001", present.to_hex());
}

TEST_F(BitmapTest, PrimaryBitmapCannotHoldSecondaryFields) {
    bitmap present;
    EXPECT_FALSE(present.set(65));
    EXPECT_FALSE(present.set(0));
    EXPECT_FALSE(present.test(65));
}

TEST_F(BitmapTest, AppendSecondaryBitmap) {
    auto primary = bitmap::from_hex("8000000000000000");
    auto secondary = bitmap::from_hex("0400000000000000");
    ASSERT_TRUE(primary.has_value());
    ASSERT_TRUE(secondary.has_value());

    EXPECT_TRUE(primary->has_secondary());
    EXPECT_FALSE(primary->covers_secondary());

    primary->append(*secondary);

    EXPECT_TRUE(primary->covers_secondary());
    EXPECT_EQ(16u, primary->size());
    EXPECT_TRUE(primary->test(70));
    EXPECT_FALSE(primary->test(69));
}

// =============================================================================
// Field Schema Tests
// =============================================================================

class FieldSchemaTest : public ::testing::Test {};

TEST_F(FieldSchemaTest, ParseLengthType) {
    EXPECT_EQ(length_type::fixed, parse_length_type("fixed"));
    EXPECT_EQ(length_type::llvar, parse_length_type("LLVAR"));
    EXPECT_EQ(length_type::lllvar, parse_length_type("lllvar"));
    EXPECT_EQ(length_type::unsupported, parse_length_type("bcd"));
    EXPECT_EQ(length_type::unsupported, parse_length_type(""));
}

TEST_F(FieldSchemaTest, ParseLengthTypeComparesWithoutCopying) {
    static_assert(noexcept(parse_length_type(std::string_view{})));

    EXPECT_EQ(length_type::fixed, parse_length_type("Fixed"));
    EXPECT_EQ(length_type::llvar, parse_length_type("llVar"));
    EXPECT_EQ(length_type::lllvar, parse_length_type("LLLvar"));
    EXPECT_EQ(length_type::unsupported, parse_length_type("llllvar"));
    EXPECT_EQ(length_type::unsupported, parse_length_type("llva"));
}

TEST_F(FieldSchemaTest, BuildFromRules) {
    auto schema = field_schema::from_rules(sample_rules());
    ASSERT_TRUE(schema.has_value());

    EXPECT_EQ(sample_rules().size(), schema->size());
    EXPECT_TRUE(schema->contains(2));
    EXPECT_FALSE(schema->contains(5));
    EXPECT_EQ(nullptr, schema->find(5));

    const field_rule* pan = schema->find(2);
    ASSERT_NE(nullptr, pan);
    EXPECT_EQ(length_type::llvar, pan->len_type);
    EXPECT_EQ(19u, pan->max_len);
    EXPECT_TRUE(pan->is_numeric());

    EXPECT_EQ(4u, schema->mti_rule().max_len);
    EXPECT_EQ(16u, schema->bitmap_rule().max_len);
}

TEST_F(FieldSchemaTest, RejectEmptyRules) {
    auto schema = field_schema::from_rules({});
    ASSERT_FALSE(schema.has_value());
    EXPECT_EQ(schema_error::empty_schema, schema.error());
}

TEST_F(FieldSchemaTest, RejectMissingHeaderRules) {
    auto rules = sample_rules();
    rules.erase(0);
    auto without_mti = field_schema::from_rules(rules);
    ASSERT_FALSE(without_mti.has_value());
    EXPECT_EQ(schema_error::missing_mti_rule, without_mti.error());

    rules = sample_rules();
    rules.erase(1);
    auto without_bitmap = field_schema::from_rules(rules);
    ASSERT_FALSE(without_bitmap.has_value());
    EXPECT_EQ(schema_error::missing_bitmap_rule, without_bitmap.error());
}

TEST_F(FieldSchemaTest, RejectInvalidHeaderRules) {
    auto rules = sample_rules();
    rules[1].len_type = length_type::llvar;
    auto variable_bitmap = field_schema::from_rules(rules);
    ASSERT_FALSE(variable_bitmap.has_value());
    EXPECT_EQ(schema_error::header_not_fixed, variable_bitmap.error());

    rules = sample_rules();
    rules[1].max_len = 15;
    auto odd_width = field_schema::from_rules(rules);
    ASSERT_FALSE(odd_width.has_value());
    EXPECT_EQ(schema_error::invalid_bitmap_width, odd_width.error());
}

TEST_F(FieldSchemaTest, BitmapWidthMustBeSixteenHexDigits) {
    for (size_t width : {8u, 14u, 24u, 32u}) {
        auto rules = sample_rules();
        rules[1].max_len = width;
        auto schema = field_schema::from_rules(rules);
        ASSERT_FALSE(schema.has_value()) << "width " << width;
        EXPECT_EQ(schema_error::invalid_bitmap_width, schema.error());
    }
}

TEST_F(FieldSchemaTest, RejectOutOfRangeIndex) {
    auto rules = sample_rules();
    rules[129] = {"n", "Beyond", length_type::fixed, "fixed", 1};
    auto schema = field_schema::from_rules(rules);
    ASSERT_FALSE(schema.has_value());
    EXPECT_EQ(schema_error::invalid_field_index, schema.error());
}

// =============================================================================
// Codec Parse Tests
// =============================================================================

class IsoCodecTest : public ::testing::Test {
protected:
    void SetUp() override { codec_ = std::make_unique<iso_codec>(sample_schema()); }

    std::unique_ptr<iso_codec> codec_;
};

TEST_F(IsoCodecTest, ParseAuthorizationRequest) {
    parse_details details;
    auto fields = codec_->parse(samples::AUTH_REQUEST, &details);
    ASSERT_TRUE(fields.has_value()) << to_string(fields.error());

    EXPECT_EQ(4u, fields->size());
    EXPECT_EQ("0200", fields->at(0));
    EXPECT_EQ("6000000000000000", fields->at(1));
    EXPECT_EQ("4111111111111111", fields->at(2));
    EXPECT_EQ("000000", fields->at(3));

    EXPECT_EQ(samples::AUTH_REQUEST.size(), details.consumed);
    EXPECT_EQ(0u, details.trailing);
    EXPECT_FALSE(details.secondary_bitmap);
    EXPECT_EQ(2u, details.data_field_count);
}

TEST_F(IsoCodecTest, ParseSecondaryBitmap) {
    parse_details details;
    auto fields = codec_->parse(samples::ECHO_REQUEST, &details);
    ASSERT_TRUE(fields.has_value()) << to_string(fields.error());

    EXPECT_EQ("0800", fields->at(0));
    EXPECT_EQ("80200000000000000400000000000000", fields->at(1));
    EXPECT_EQ("000001", fields->at(11));
    EXPECT_EQ("301", fields->at(70));
    EXPECT_TRUE(details.secondary_bitmap);
    EXPECT_EQ(2u, details.data_field_count);
}

TEST_F(IsoCodecTest, ParseToleratesTrailingBytes) {
    std::string data(samples::AUTH_REQUEST);
    data += "XYZ";

    parse_details details;
    auto fields = codec_->parse(data, &details);
    ASSERT_TRUE(fields.has_value());

    EXPECT_EQ("000000", fields->at(3));
    EXPECT_EQ(samples::AUTH_REQUEST.size(), details.consumed);
    EXPECT_EQ(3u, details.trailing);
}

TEST_F(IsoCodecTest, ParseTruncatedMessage) {
    auto data = samples::AUTH_REQUEST.substr(0, samples::AUTH_REQUEST.size() - 1);
    auto fields = codec_->parse(data);
    ASSERT_FALSE(fields.has_value());
    EXPECT_EQ(iso_error::truncated_message, fields.error());

    auto short_mti = codec_->parse("02");
    ASSERT_FALSE(short_mti.has_value());
    EXPECT_EQ(iso_error::truncated_message, short_mti.error());

    auto missing_secondary = codec_->parse("0800" "8020000000000000");
    ASSERT_FALSE(missing_secondary.has_value());
    EXPECT_EQ(iso_error::truncated_message, missing_secondary.error());
}

TEST_F(IsoCodecTest, ParseInvalidBitmap) {
    auto fields = codec_->parse("0200" "60000000000000XY" "000000");
    ASSERT_FALSE(fields.has_value());
    EXPECT_EQ(iso_error::invalid_bitmap, fields.error());
    EXPECT_TRUE(is_decode_error(fields.error()));
}

TEST_F(IsoCodecTest, ParseInvalidLengthPrefix) {
    auto fields = codec_->parse("0200" "4000000000000000" "1A4111111111");
    ASSERT_FALSE(fields.has_value());
    EXPECT_EQ(iso_error::invalid_length_prefix, fields.error());
}

TEST_F(IsoCodecTest, ParseFieldWithoutSchemaEntry) {
    // Field 5 is not part of the sample schema
    auto fields = codec_->parse("0200" "0800000000000000" "000000000100");
    ASSERT_FALSE(fields.has_value());
    EXPECT_EQ(iso_error::missing_field_config, fields.error());
}

TEST_F(IsoCodecTest, ParseWithoutSchema) {
    iso_codec no_schema(nullptr);
    EXPECT_FALSE(no_schema.has_schema());

    auto fields = no_schema.parse(samples::AUTH_REQUEST);
    ASSERT_FALSE(fields.has_value());
    EXPECT_EQ(iso_error::schema_not_loaded, fields.error());

    auto composed = no_schema.compose({{0, "0200"}});
    ASSERT_FALSE(composed.has_value());
    EXPECT_EQ(iso_error::schema_not_loaded, composed.error());
}

TEST_F(IsoCodecTest, ParseLllvarField) {
    auto fields = codec_->parse("0100" "0000000000010000" "005hello");
    ASSERT_TRUE(fields.has_value());
    EXPECT_EQ("hello", fields->at(48));
}

TEST_F(IsoCodecTest, UnsupportedLengthType) {
    auto rules = sample_rules();
    rules[4].len_type = length_type::unsupported;
    rules[4].len_type_name = "bcd";
    auto schema = field_schema::from_rules(rules);
    ASSERT_TRUE(schema.has_value());
    iso_codec codec(std::make_shared<const field_schema>(std::move(*schema)));

    auto parsed = codec.parse("0200" "1000000000000000" "000000000100");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(iso_error::unsupported_length_type, parsed.error());

    auto composed = codec.compose({{0, "0200"}, {4, "100"}});
    ASSERT_FALSE(composed.has_value());
    EXPECT_EQ(iso_error::unsupported_length_type, composed.error());
}

// =============================================================================
// Codec Compose Tests
// =============================================================================

TEST_F(IsoCodecTest, ComposeAuthorizationRequest) {
    auto out = codec_->compose(
        {{0, "0200"}, {2, "4111111111111111"}, {3, "0"}});
    ASSERT_TRUE(out.has_value()) << to_string(out.error());

    EXPECT_EQ(
        "0200"
        "6000000000000000"
        "16"
        "4111111111111111"
        "000000",
        *out);
}

TEST_F(IsoCodecTest, ComposeAddsSecondaryBitmapForHighFields) {
    auto out = codec_->compose({{0, "0800"}, {11, "000001"}, {70, "301"}});
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(samples::ECHO_REQUEST, *out);
}

TEST_F(IsoCodecTest, ComposeIgnoresSuppliedBitmap) {
    auto out = codec_->compose(
        {{0, "0200"}, {1, "FFFFFFFFFFFFFFFF"}, {3, "000000"}});
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ("0200" "2000000000000000" "000000", *out);
}

TEST_F(IsoCodecTest, ComposeRoundTripsParsedMessage) {
    for (auto sample : {samples::AUTH_REQUEST, samples::ECHO_REQUEST}) {
        auto fields = codec_->parse(sample);
        ASSERT_TRUE(fields.has_value());

        auto out = codec_->compose(*fields);
        ASSERT_TRUE(out.has_value());
        EXPECT_EQ(sample, *out);
    }
}

TEST_F(IsoCodecTest, ComposeEmptyMessage) {
    auto out = codec_->compose({});
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(iso_error::empty_message, out.error());
    EXPECT_TRUE(is_encode_error(out.error()));
}

TEST_F(IsoCodecTest, ComposeWithoutMti) {
    auto out = codec_->compose({{3, "000000"}});
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(iso_error::missing_mti, out.error());
}

TEST_F(IsoCodecTest, ComposeFieldWithoutSchemaEntry) {
    auto out = codec_->compose({{0, "0200"}, {5, "1"}});
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(iso_error::missing_field_config, out.error());
}

TEST_F(IsoCodecTest, ComposeVariableLengthOverflow) {
    auto llvar = codec_->compose({{0, "0200"}, {2, std::string(100, '4')}});
    ASSERT_FALSE(llvar.has_value());
    EXPECT_EQ(iso_error::length_overflow, llvar.error());

    auto lllvar = codec_->compose({{0, "0200"}, {48, std::string(1000, 'x')}});
    ASSERT_FALSE(lllvar.has_value());
    EXPECT_EQ(iso_error::length_overflow, lllvar.error());
}

TEST_F(IsoCodecTest, ComposeParsesMaximumVariableLengths) {
    const std::string pan(99, '4');
    const std::string private_data(999, 'x');

    auto out = codec_->compose({{0, "0100"}, {2, pan}, {48, private_data}});
    ASSERT_TRUE(out.has_value()) << to_string(out.error());
    EXPECT_EQ("0100" "4000000000010000" "99" + pan + "999" + private_data, *out);

    auto fields = codec_->parse(*out);
    ASSERT_TRUE(fields.has_value()) << to_string(fields.error());
    EXPECT_EQ(pan, fields->at(2));
    EXPECT_EQ(private_data, fields->at(48));
}

TEST_F(IsoCodecTest, SecondaryBitmapRoundTripsWithSparseFields) {
    auto out = codec_->compose({{0, "0200"}, {3, "000000"}, {70, "301"}});
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ("0200" "A000000000000000" "0400000000000000" "000000" "301", *out);

    auto fields = codec_->parse(*out);
    ASSERT_TRUE(fields.has_value()) << to_string(fields.error());
    EXPECT_EQ("000000", fields->at(3));
    EXPECT_EQ("301", fields->at(70));
}

TEST_F(IsoCodecTest, ComposeVariableLengthPrefixes) {
    auto out = codec_->compose({{0, "0100"}, {2, "4"}, {48, "hello"}});
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ("0100" "4000000000010000" "014" "005hello", *out);
}

TEST_F(IsoCodecTest, ComposePadsFixedFields) {
    auto out = codec_->compose({{0, "0200"}, {4, "100"}, {41, "T1"}});
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ("0200" "1000000000800000" "000000000100" "T1      ", *out);
}

// =============================================================================
// Padding Tests
// =============================================================================

TEST_F(IsoCodecTest, PadNumericValueLeftWithZeros) {
    field_rule rule{"n", "Amount", length_type::fixed, "fixed", 12};
    EXPECT_EQ("000000000100", iso_codec::pad_value("100", rule));
    EXPECT_EQ("000000000000", iso_codec::pad_value("", rule));
}

TEST_F(IsoCodecTest, PadAlphanumericValueRightWithSpaces) {
    field_rule rule{"an", "Terminal", length_type::fixed, "fixed", 8};
    EXPECT_EQ("T1      ", iso_codec::pad_value("T1", rule));
}

TEST_F(IsoCodecTest, PadTruncatesLongValues) {
    field_rule numeric{"n", "Processing Code", length_type::fixed, "fixed", 6};
    EXPECT_EQ("123456", iso_codec::pad_value("12345678", numeric));

    field_rule text{"ans", "Terminal", length_type::fixed, "fixed", 4};
    EXPECT_EQ("TERM", iso_codec::pad_value("TERMINAL", text));
    EXPECT_EQ("TERM", iso_codec::pad_value("TERM", text));
}

// =============================================================================
// iso_message Tests
// =============================================================================

class IsoMessageTest : public ::testing::Test {
protected:
    std::shared_ptr<const field_schema> schema_ = sample_schema();
};

TEST_F(IsoMessageTest, FieldAccessors) {
    iso_message message(schema_);
    EXPECT_TRUE(message.empty());
    EXPECT_EQ("", message.get_field(2));
    EXPECT_FALSE(message.has_field(2));

    message.set_mti("0200");
    EXPECT_TRUE(message.set_field(2, "4111111111111111"));
    EXPECT_TRUE(message.set_field(4, 1500));

    EXPECT_EQ("0200", message.mti());
    EXPECT_EQ("4111111111111111", message.get_field(2));
    EXPECT_EQ("1500", message.get_field(4));
    EXPECT_EQ(3u, message.field_count());

    EXPECT_TRUE(message.remove_field(4));
    EXPECT_FALSE(message.remove_field(4));
    EXPECT_FALSE(message.has_field(4));
}

TEST_F(IsoMessageTest, SetFieldOutOfRange) {
    iso_message message(schema_);
    EXPECT_FALSE(message.set_field(-1, "x"));
    EXPECT_FALSE(message.set_field(129, "x"));
    EXPECT_TRUE(message.empty());
}

TEST_F(IsoMessageTest, ComposeEndToEndExample) {
    iso_message message(schema_);
    message.set_mti("0200");
    message.set_field(2, "4111111111111111");
    message.set_field(3, "0");

    auto out = message.compose();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ("0200" "6000000000000000" "16" "4111111111111111" "000000", *out);
}

TEST_F(IsoMessageTest, ParseReplacesFields) {
    iso_message message(schema_);
    message.set_field(39, "05");

    ASSERT_TRUE(message.parse(samples::AUTH_REQUEST).has_value());

    EXPECT_FALSE(message.has_field(39));
    EXPECT_EQ("0200", message.mti());
    EXPECT_EQ("6000000000000000", message.get_field(1));
}

TEST_F(IsoMessageTest, FailedParseKeepsFields) {
    iso_message message(schema_);
    message.set_mti("0800");

    auto result = message.parse("0200" "60000000");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(iso_error::truncated_message, result.error());

    EXPECT_EQ(1u, message.field_count());
    EXPECT_EQ("0800", message.mti());
}

TEST_F(IsoMessageTest, RespondInPlace) {
    iso_message message(schema_);
    ASSERT_TRUE(message.parse(samples::AUTH_REQUEST).has_value());

    message.set_mti("0210");
    message.set_field(39, "00");

    auto out = message.compose();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ("0210" "6000000002000000" "164111111111111111" "000000" "00", *out);
}

TEST_F(IsoMessageTest, PrettyPrint) {
    iso_message message(schema_);
    ASSERT_TRUE(message.parse(samples::AUTH_REQUEST).has_value());

    EXPECT_EQ(
        "[000][0200]\n"
        "[001][6000000000000000]\n"
        "[002][4111111111111111]\n"
        "[003][000000]\n",
        message.pretty_print());
}

TEST_F(IsoMessageTest, ClearRemovesAllFields) {
    iso_message message(schema_);
    ASSERT_TRUE(message.parse(samples::AUTH_REQUEST).has_value());

    message.clear();
    EXPECT_TRUE(message.empty());

    auto out = message.compose();
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(iso_error::empty_message, out.error());
}

}  // namespace iso8583::gateway::codec::test
