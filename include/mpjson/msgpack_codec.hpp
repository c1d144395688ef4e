#pragma once
#include "value.hpp"
#include "error.hpp"
#include "version.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace mpjson {

/// What to do with MessagePack bin8/bin16/bin32 payloads.
enum class BinaryPolicy {
    Reject,         // fail with MsgpackDecodeError
    Base64String,   // string holding the base64 of the payload
    ByteArray       // array of unsigned integers 0..255
};

/// What to do with map keys that are not strings.
enum class KeyPolicy {
    Reject,         // fail with MsgpackDecodeError
    Stringify       // use the key's compact JSON text
};

std::string binary_policy_to_string(BinaryPolicy policy);
BinaryPolicy binary_policy_from_string(const std::string& s);
std::string key_policy_to_string(KeyPolicy policy);
KeyPolicy key_policy_from_string(const std::string& s);

struct DecodeOptions {
    BinaryPolicy binary = BinaryPolicy::Reject;
    KeyPolicy keys = KeyPolicy::Reject;
    std::size_t max_depth = DEFAULT_MAX_DEPTH;
};

struct DecodeResult {
    Value value;
    std::size_t consumed = 0;
};

class MsgpackCodec {
public:
    /// Encode with the smallest integer/length forms; floats are always float64.
    /// Throws MsgpackEncodeError for binary/discarded values or oversized
    /// strings and containers.
    [[nodiscard]] static Bytes encode(const Value& v);

    /// Decode the first value in the buffer. Trailing bytes are ignored.
    /// Throws MsgpackDecodeError on truncated or invalid input, extension
    /// types, and (per `opts`) binary payloads or non-string map keys.
    [[nodiscard]] static Value decode(const std::uint8_t* data, std::size_t size,
                                      const DecodeOptions& opts = {});
    [[nodiscard]] static Value decode(const Bytes& bytes, const DecodeOptions& opts = {});

    /// Like decode(), also reporting how many bytes the first value occupied.
    [[nodiscard]] static DecodeResult decode_prefix(const std::uint8_t* data, std::size_t size,
                                                    const DecodeOptions& opts = {});
};

} // namespace mpjson
