#include "mpjson/converter.hpp"
#include "mpjson/json_codec.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace mpjson {

namespace {

ConversionResult fail(ErrorKind kind, const char* stage, const std::exception& e) {
    std::string message = std::string(stage) + e.what();
    spdlog::debug("conversion failed ({}): {}", error_kind_to_string(kind), message);
    return ConversionResult::failure(kind, std::move(message));
}

} // anonymous namespace

ConversionResult ConversionResult::success(std::string text) {
    ConversionResult r;
    r.value = std::move(text);
    return r;
}

ConversionResult ConversionResult::failure(ErrorKind kind, std::string message) {
    ConversionResult r;
    r.error = ConversionError{kind, std::move(message)};
    return r;
}

Converter::Converter() : Converter(Options{}) {}

Converter::Converter(Options opts) : opts_(std::move(opts)) {}

ConversionResult Converter::json_to_messagepack(std::string_view json) const {
    Value value;
    try {
        value = JsonCodec::parse(json);
    } catch (const JsonParseError& e) {
        return fail(ErrorKind::JsonParse, "Failed to parse JSON: ", e);
    }

    Bytes packed;
    try {
        packed = MsgpackCodec::encode(value);
    } catch (const MsgpackEncodeError& e) {
        return fail(ErrorKind::MessagePackEncode, "Failed to serialize to MessagePack: ", e);
    }

    spdlog::trace("json_to_messagepack: {} bytes of JSON -> {} bytes of MessagePack",
                  json.size(), packed.size());
    return ConversionResult::success(encode_text(packed, opts_.output_encoding));
}

ConversionResult Converter::messagepack_to_json(std::string_view encoded) const {
    DecodedText decoded;
    try {
        decoded = decode_text(encoded);
    } catch (const TransportDecodeError& e) {
        return fail(ErrorKind::TransportDecode,
                    decide_encoding(encoded) == Encoding::Hex ? "Failed to decode Hex: "
                                                              : "Failed to decode Base64: ",
                    e);
    }
    const Bytes& packed = decoded.bytes;

    Value value;
    try {
        value = MsgpackCodec::decode(packed, opts_.decode);
    } catch (const MsgpackDecodeError& e) {
        return fail(ErrorKind::MessagePackDecode, "Failed to deserialize MessagePack: ", e);
    }

    std::string json;
    try {
        json = JsonCodec::serialize_pretty(value, opts_.indent);
    } catch (const JsonSerializeError& e) {
        return fail(ErrorKind::JsonSerialize, "Failed to serialize to JSON: ", e);
    }

    spdlog::trace("messagepack_to_json: {} input as {} bytes of MessagePack -> {} bytes of JSON",
                  encoding_to_string(decoded.encoding), packed.size(), json.size());
    return ConversionResult::success(std::move(json));
}

ConversionResult convert_json_to_messagepack(std::string_view json) {
    return Converter{}.json_to_messagepack(json);
}

ConversionResult convert_messagepack_to_json(std::string_view input) {
    return Converter{}.messagepack_to_json(input);
}

} // namespace mpjson
