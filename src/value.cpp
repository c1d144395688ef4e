#include "mpjson/value.hpp"
#include <algorithm>

namespace mpjson {

std::string_view kind_name(const Value& v) {
    switch (v.type()) {
        case Value::value_t::null:            return "null";
        case Value::value_t::boolean:         return "boolean";
        case Value::value_t::number_integer:  return "integer";
        case Value::value_t::number_unsigned: return "unsigned integer";
        case Value::value_t::number_float:    return "float";
        case Value::value_t::string:          return "string";
        case Value::value_t::array:           return "array";
        case Value::value_t::object:          return "object";
        case Value::value_t::binary:          return "binary";
        case Value::value_t::discarded:       return "discarded";
        default:                              return "unknown";
    }
}

bool is_json_representable(const Value& v) {
    switch (v.type()) {
        case Value::value_t::binary:
        case Value::value_t::discarded:
            return false;
        case Value::value_t::array:
            return std::all_of(v.begin(), v.end(),
                               [](const Value& item) { return is_json_representable(item); });
        case Value::value_t::object:
            for (const auto& item : v.items()) {
                if (!is_json_representable(item.value())) return false;
            }
            return true;
        default:
            return true;
    }
}

std::size_t nesting_depth(const Value& v) {
    if (!v.is_structured()) return 0;
    std::size_t deepest = 0;
    for (const auto& child : v) {
        deepest = std::max(deepest, nesting_depth(child));
    }
    return deepest + 1;
}

} // namespace mpjson
