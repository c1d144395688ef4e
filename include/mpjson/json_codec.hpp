#pragma once
#include "value.hpp"
#include "error.hpp"
#include "version.hpp"
#include <string>
#include <string_view>

namespace mpjson {

class JsonCodec {
public:
    /// Parse a complete JSON document (any top-level value).
    /// Throws JsonParseError on malformed input, trailing content or empty input.
    /// Duplicate object keys keep the last occurrence.
    [[nodiscard]] static Value parse(std::string_view text);

    /// Serialize with `indent` spaces per level; negative means single line.
    /// UTF-8 is written verbatim. Throws JsonSerializeError on invalid UTF-8
    /// or on values that have no JSON form.
    [[nodiscard]] static std::string serialize_pretty(const Value& v, int indent = DEFAULT_INDENT);

    /// Single-line serialization.
    [[nodiscard]] static std::string serialize_compact(const Value& v);
};

} // namespace mpjson
