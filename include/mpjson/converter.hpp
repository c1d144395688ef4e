#pragma once
#include "error.hpp"
#include "msgpack_codec.hpp"
#include "transport.hpp"
#include "version.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace mpjson {

/// Outcome of one conversion: exactly one of `value` and `error` is set.
struct ConversionResult {
    std::optional<std::string> value;
    std::optional<ConversionError> error;

    bool ok() const { return value.has_value(); }

    static ConversionResult success(std::string text);
    static ConversionResult failure(ErrorKind kind, std::string message);

    bool operator==(const ConversionResult& o) const {
        return value == o.value && error == o.error;
    }
};

class Converter {
public:
    struct Options {
        Encoding output_encoding = Encoding::Base64;
        int indent = DEFAULT_INDENT;
        DecodeOptions decode;
    };

    Converter();
    explicit Converter(Options opts);

    /// JSON text -> MessagePack -> base64 (or hex, per options).
    /// Errors: "Failed to parse JSON: ...", "Failed to serialize to MessagePack: ...".
    [[nodiscard]] ConversionResult json_to_messagepack(std::string_view json) const;

    /// Hex or base64 text (auto-detected) -> MessagePack -> pretty JSON.
    /// Errors: "Failed to decode Hex: ...", "Failed to decode Base64: ...",
    /// "Failed to deserialize MessagePack: ...", "Failed to serialize to JSON: ...".
    [[nodiscard]] ConversionResult messagepack_to_json(std::string_view encoded) const;

    const Options& options() const { return opts_; }

private:
    Options opts_;
};

/// Convert with default options. Safe to call from any thread.
[[nodiscard]] ConversionResult convert_json_to_messagepack(std::string_view json);
[[nodiscard]] ConversionResult convert_messagepack_to_json(std::string_view input);

} // namespace mpjson
