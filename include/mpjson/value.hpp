#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace mpjson {

/// The pivot representation shared by both codecs. A closed tagged union over
/// null, boolean, integer, unsigned, float, string, array and object.
/// Objects keep their members in ascending key order.
using Value = nlohmann::json;

using Bytes = std::vector<std::uint8_t>;

/// Human-readable name of a value's variant ("string", "object", ...).
std::string_view kind_name(const Value& v);

/// True for integer and unsigned numbers, false for floats and non-numbers.
inline bool is_integral(const Value& v) {
    return v.is_number_integer();
}

/// Checks that every node of `v` is one of the JSON variants. Values tagged
/// binary or discarded have no JSON or MessagePack rendering in this library.
bool is_json_representable(const Value& v);

/// Maximum container nesting of `v`; scalars have depth 0.
std::size_t nesting_depth(const Value& v);

} // namespace mpjson
