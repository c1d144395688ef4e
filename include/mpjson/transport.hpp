#pragma once
#include "value.hpp"
#include "error.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace mpjson {

/// Text alphabet carrying raw MessagePack bytes.
enum class Encoding {
    Hex,
    Base64
};

std::string encoding_to_string(Encoding encoding);
Encoding encoding_from_string(const std::string& s);

// ---- Encoding ----

/// Standard base64 (RFC 4648), padded, no line breaks.
std::string encode_base64(const std::uint8_t* data, std::size_t len);
std::string encode_base64(const Bytes& bytes);

/// Lowercase hexadecimal, two digits per byte.
std::string encode_hex(const Bytes& bytes);

std::string encode_text(const Bytes& bytes, Encoding encoding);

// ---- Detection ----

/// True when every character is a hex digit (either case). True for "".
bool is_hex(std::string_view text);

/// Hex when `is_hex(text)`, Base64 otherwise. A base64 payload made only of
/// hex-digit characters is classified as hex; callers must not rely on this
/// heuristic for short or digit-only input.
Encoding decide_encoding(std::string_view text);

// ---- Decoding ----

/// Throws TransportDecodeError on odd length or a non-hex character.
Bytes decode_hex(std::string_view text);

/// Strict decoding: no whitespace, canonical padding, zero trailing bits.
/// Throws TransportDecodeError.
Bytes decode_base64(std::string_view text);

struct DecodedText {
    Encoding encoding = Encoding::Hex;
    Bytes bytes;
};

/// Classify with decide_encoding() and decode accordingly.
/// Throws TransportDecodeError.
DecodedText decode_text(std::string_view text);

} // namespace mpjson
