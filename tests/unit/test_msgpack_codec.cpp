#include <gtest/gtest.h>
#include "mpjson/msgpack_codec.hpp"
#include "mpjson/transport.hpp"
#include "mpjson/error.hpp"
#include <cstdint>
#include <limits>
#include <string>

using namespace mpjson;

namespace {

std::string encode_to_hex(const Value& v) {
    return encode_hex(MsgpackCodec::encode(v));
}

Value decode_from_hex(const std::string& hex, const DecodeOptions& opts = {}) {
    return MsgpackCodec::decode(decode_hex(hex), opts);
}

std::string decode_error(const std::string& hex, const DecodeOptions& opts = {}) {
    try {
        (void)decode_from_hex(hex, opts);
    } catch (const MsgpackDecodeError& e) {
        return e.what();
    }
    return {};
}

} // namespace

// ---- Encode tests ----

TEST(MsgpackEncode, ReferenceObject) {
    Value v = Value::parse(R"({"name":"Alice","age":30,"city":"Wonderland"})");
    EXPECT_EQ(encode_to_hex(v),
              "83a36167651ea463697479aa576f6e6465726c616e64a46e616d65a5416c696365");
}

TEST(MsgpackEncode, Scalars) {
    EXPECT_EQ(encode_to_hex(Value(nullptr)), "c0");
    EXPECT_EQ(encode_to_hex(Value(false)), "c2");
    EXPECT_EQ(encode_to_hex(Value(true)), "c3");
    EXPECT_EQ(encode_to_hex(Value(1.5)), "cb3ff8000000000000");
    EXPECT_EQ(encode_to_hex(Value(-2.25)), "cbc002000000000000");
}

TEST(MsgpackEncode, UnsignedWidths) {
    EXPECT_EQ(encode_to_hex(Value(0)), "00");
    EXPECT_EQ(encode_to_hex(Value(127)), "7f");
    EXPECT_EQ(encode_to_hex(Value(128)), "cc80");
    EXPECT_EQ(encode_to_hex(Value(255)), "ccff");
    EXPECT_EQ(encode_to_hex(Value(256)), "cd0100");
    EXPECT_EQ(encode_to_hex(Value(65535)), "cdffff");
    EXPECT_EQ(encode_to_hex(Value(65536)), "ce00010000");
    EXPECT_EQ(encode_to_hex(Value(std::uint64_t{4294967296ULL})), "cf0000000100000000");
    EXPECT_EQ(encode_to_hex(Value(std::numeric_limits<std::uint64_t>::max())), "cfffffffffffffffff");
}

TEST(MsgpackEncode, SignedWidths) {
    EXPECT_EQ(encode_to_hex(Value(-1)), "ff");
    EXPECT_EQ(encode_to_hex(Value(-32)), "e0");
    EXPECT_EQ(encode_to_hex(Value(-33)), "d0df");
    EXPECT_EQ(encode_to_hex(Value(-128)), "d080");
    EXPECT_EQ(encode_to_hex(Value(-129)), "d1ff7f");
    EXPECT_EQ(encode_to_hex(Value(-32768)), "d18000");
    EXPECT_EQ(encode_to_hex(Value(-32769)), "d2ffff7fff");
    EXPECT_EQ(encode_to_hex(Value(std::numeric_limits<std::int64_t>::min())), "d38000000000000000");
}

TEST(MsgpackEncode, StringWidths) {
    EXPECT_EQ(encode_to_hex(Value("")), "a0");
    EXPECT_EQ(encode_to_hex(Value(std::string(31, 'x'))).substr(0, 2), "bf");
    EXPECT_EQ(encode_to_hex(Value(std::string(32, 'x'))).substr(0, 4), "d920");
    EXPECT_EQ(encode_to_hex(Value(std::string(256, 'x'))).substr(0, 6), "da0100");
    EXPECT_EQ(encode_to_hex(Value(std::string(65536, 'x'))).substr(0, 10), "db00010000");
}

TEST(MsgpackEncode, StringLengthCountsBytes) {
    // "é" is two UTF-8 bytes
    EXPECT_EQ(encode_to_hex(Value("\xc3\xa9")), "a2c3a9");
}

TEST(MsgpackEncode, ContainerWidths) {
    EXPECT_EQ(encode_to_hex(Value::array()), "90");
    EXPECT_EQ(encode_to_hex(Value::object()), "80");
    EXPECT_EQ(encode_to_hex(Value::array({1, 2, 3})), "93010203");

    Value arr16 = Value::array();
    for (int i = 0; i < 16; ++i) arr16.push_back(0);
    EXPECT_EQ(encode_to_hex(arr16).substr(0, 6), "dc0010");

    Value map16 = Value::object();
    for (int i = 0; i < 16; ++i) map16["k" + std::to_string(i)] = i;
    EXPECT_EQ(encode_to_hex(map16).substr(0, 6), "de0010");
}

TEST(MsgpackEncode, BinaryValueFails) {
    EXPECT_THROW((void)MsgpackCodec::encode(Value::binary({1, 2})), MsgpackEncodeError);
}

// ---- Decode tests ----

TEST(MsgpackDecode, ReferenceObject) {
    Value v = decode_from_hex("83a36167651ea463697479aa576f6e6465726c616e64a46e616d65a5416c696365");
    EXPECT_EQ(v, Value::parse(R"({"name":"Alice","age":30,"city":"Wonderland"})"));
}

TEST(MsgpackDecode, Scalars) {
    EXPECT_TRUE(decode_from_hex("c0").is_null());
    EXPECT_EQ(decode_from_hex("c2"), false);
    EXPECT_EQ(decode_from_hex("c3"), true);
    EXPECT_EQ(decode_from_hex("7f"), 127);
    EXPECT_EQ(decode_from_hex("e0"), -32);
    EXPECT_EQ(decode_from_hex("d0df"), -33);
    EXPECT_EQ(decode_from_hex("d18000"), -32768);
    EXPECT_EQ(decode_from_hex("d2ffff7fff"), -32769);
    EXPECT_EQ(decode_from_hex("d38000000000000000"), std::numeric_limits<std::int64_t>::min());
    EXPECT_EQ(decode_from_hex("ccff"), 255);
    EXPECT_EQ(decode_from_hex("cdffff"), 65535);
    EXPECT_EQ(decode_from_hex("ce00010000"), 65536);
    EXPECT_EQ(decode_from_hex("cfffffffffffffffff"), std::numeric_limits<std::uint64_t>::max());
}

TEST(MsgpackDecode, Floats) {
    Value f64 = decode_from_hex("cb3ff8000000000000");
    ASSERT_TRUE(f64.is_number_float());
    EXPECT_DOUBLE_EQ(f64.get<double>(), 1.5);

    Value f32 = decode_from_hex("ca3fc00000");
    ASSERT_TRUE(f32.is_number_float());
    EXPECT_DOUBLE_EQ(f32.get<double>(), 1.5);
}

TEST(MsgpackDecode, Strings) {
    EXPECT_EQ(decode_from_hex("a0"), "");
    EXPECT_EQ(decode_from_hex("d903616263"), "abc");
    EXPECT_EQ(decode_from_hex("da0003616263"), "abc");
    EXPECT_EQ(decode_from_hex("db00000003616263"), "abc");
}

TEST(MsgpackDecode, WideContainers) {
    EXPECT_EQ(decode_from_hex("dc00020102"), Value::array({1, 2}));
    EXPECT_EQ(decode_from_hex("dd000000020102"), Value::array({1, 2}));
    EXPECT_EQ(decode_from_hex("de0001a16101"), Value::parse(R"({"a":1})"));
    EXPECT_EQ(decode_from_hex("df00000001a16101"), Value::parse(R"({"a":1})"));
}

TEST(MsgpackDecode, DuplicateKeysKeepLast) {
    EXPECT_EQ(decode_from_hex("82a16101a16102"), Value::parse(R"({"a":2})"));
}

TEST(MsgpackDecode, TrailingBytesIgnored) {
    Bytes bytes = decode_hex("c3c0c0");
    DecodeResult r = MsgpackCodec::decode_prefix(bytes.data(), bytes.size());
    EXPECT_EQ(r.value, true);
    EXPECT_EQ(r.consumed, 1u);
    EXPECT_EQ(MsgpackCodec::decode(bytes), true);
}

TEST(MsgpackDecode, EmptyInputFails) {
    EXPECT_EQ(decode_error(""), "unexpected end of input at offset 0");
}

TEST(MsgpackDecode, TruncatedFails) {
    EXPECT_EQ(decode_error("cd01"), "unexpected end of input at offset 1");
    // Second element starts but its payload is cut short
    EXPECT_EQ(decode_error("92c3cd01"), "unexpected end of input at offset 3");
    EXPECT_EQ(decode_error("a5416c"),
              "declared length 5 at offset 0 exceeds remaining input of 2 bytes");
}

TEST(MsgpackDecode, OversizedCountFails) {
    EXPECT_EQ(decode_error("92c3"),
              "declared 2 elements at offset 0 exceeds remaining input of 1 bytes");
    EXPECT_EQ(decode_error("82a16101"),
              "declared 2 entries at offset 0 exceeds remaining input of 3 bytes");
    EXPECT_NE(decode_error("ddffffffff").find("declared 4294967295 elements"), std::string::npos);
    EXPECT_NE(decode_error("dfffffffff").find("declared 4294967295 entries"), std::string::npos);
}

TEST(MsgpackDecode, ReservedTagFails) {
    EXPECT_EQ(decode_error("c1"), "unrecognized type tag 0xc1 at offset 0");
    EXPECT_EQ(decode_error("91c1"), "unrecognized type tag 0xc1 at offset 1");
}

TEST(MsgpackDecode, ErrorCarriesOffset) {
    try {
        (void)decode_from_hex("9201c1");
        FAIL() << "expected MsgpackDecodeError";
    } catch (const MsgpackDecodeError& e) {
        EXPECT_EQ(e.offset, 2u);
    }
}

TEST(MsgpackDecode, ExtensionTypesRejected) {
    EXPECT_EQ(decode_error("d40501"), "extension type 5 at offset 0 is not supported");
    EXPECT_EQ(decode_error("c701ff00"), "extension type -1 at offset 0 is not supported");
    EXPECT_EQ(decode_error("d8"), "unexpected end of input at offset 1");
}

TEST(MsgpackDecode, InvalidUtf8Fails) {
    EXPECT_EQ(decode_error("a1ff"), "invalid UTF-8 in string at offset 0");
}

TEST(MsgpackDecode, DepthLimit) {
    DecodeOptions opts;
    opts.max_depth = 2;
    EXPECT_EQ(decode_from_hex("9190", opts), Value::array({Value::array()}));
    EXPECT_EQ(decode_error("919190", opts), "nesting depth exceeds limit of 2 at offset 2");
}

// ---- Binary policy ----

TEST(MsgpackBinary, RejectedByDefault) {
    EXPECT_EQ(decode_error("c4020102"), "binary data (bin8) at offset 0 is not representable in JSON");
    EXPECT_EQ(decode_error("c50000"), "binary data (bin16) at offset 0 is not representable in JSON");
}

TEST(MsgpackBinary, Base64String) {
    DecodeOptions opts;
    opts.binary = BinaryPolicy::Base64String;
    EXPECT_EQ(decode_from_hex("c4020102", opts), "AQI=");
    EXPECT_EQ(decode_from_hex("81a162c400", opts), Value::parse(R"({"b":""})"));
}

TEST(MsgpackBinary, ByteArray) {
    DecodeOptions opts;
    opts.binary = BinaryPolicy::ByteArray;
    EXPECT_EQ(decode_from_hex("c60000000301ff80", opts), Value::array({1, 255, 128}));
}

TEST(MsgpackBinary, TruncatedPayloadFails) {
    DecodeOptions opts;
    opts.binary = BinaryPolicy::ByteArray;
    EXPECT_EQ(decode_error("c40301", opts),
              "declared length 3 at offset 0 exceeds remaining input of 1 bytes");
}

// ---- Key policy ----

TEST(MsgpackKeys, NonStringRejectedByDefault) {
    EXPECT_EQ(decode_error("810102"), "map key at offset 1 is unsigned integer, expected string");
    EXPECT_EQ(decode_error("81c001"), "map key at offset 1 is null, expected string");
}

TEST(MsgpackKeys, Stringify) {
    DecodeOptions opts;
    opts.keys = KeyPolicy::Stringify;
    EXPECT_EQ(decode_from_hex("830102c30392010204", opts),
              Value::parse(R"({"1":2,"true":3,"[1,2]":4})"));
}

TEST(MsgpackKeys, PolicyNames) {
    EXPECT_EQ(key_policy_from_string("stringify"), KeyPolicy::Stringify);
    EXPECT_EQ(binary_policy_from_string("bytes"), BinaryPolicy::ByteArray);
    EXPECT_EQ(binary_policy_to_string(BinaryPolicy::Base64String), "base64");
    EXPECT_THROW(key_policy_from_string("drop"), std::invalid_argument);
    EXPECT_THROW(binary_policy_from_string(""), std::invalid_argument);
}

// ---- Round trip ----

TEST(MsgpackRoundTrip, NestedDocument) {
    Value v = Value::parse(R"({
        "person": {"name": "Bob", "age": 25, "address": {"street": "123 Elm Street", "zip": "12345"}},
        "hobbies": ["reading", "gaming", "hiking"],
        "is_student": false,
        "scores": [-1, 0, 300, 70000, 5000000000, -5000000000, 0.125],
        "nothing": null
    })");
    EXPECT_EQ(MsgpackCodec::decode(MsgpackCodec::encode(v)), v);
}

TEST(MsgpackRoundTrip, FloatStaysFloat) {
    Value v = MsgpackCodec::decode(MsgpackCodec::encode(Value(2.0)));
    EXPECT_TRUE(v.is_number_float());
}
