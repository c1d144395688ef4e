#include "mpjson/json_codec.hpp"
#include <simdjson.h>
#include <cstdint>
#include <string>
#include <string_view>

namespace mpjson {

namespace {

// Convert a validated simdjson DOM element into a Value recursively
Value element_to_value(simdjson::dom::element el) {
    switch (el.type()) {
        case simdjson::dom::element_type::OBJECT: {
            Value obj = Value::object();
            for (auto field : el.get_object().value()) {
                // operator[] overwrites, so a repeated key keeps its last value
                obj[std::string(field.key)] = element_to_value(field.value);
            }
            return obj;
        }
        case simdjson::dom::element_type::ARRAY: {
            Value arr = Value::array();
            for (simdjson::dom::element child : el.get_array().value()) {
                arr.push_back(element_to_value(child));
            }
            return arr;
        }
        case simdjson::dom::element_type::STRING:
            return Value(std::string(el.get_string().value()));
        case simdjson::dom::element_type::INT64:
            return Value(el.get_int64().value());
        case simdjson::dom::element_type::UINT64:
            return Value(el.get_uint64().value());
        case simdjson::dom::element_type::DOUBLE:
            return Value(el.get_double().value());
        case simdjson::dom::element_type::BOOL:
            return Value(el.get_bool().value());
        case simdjson::dom::element_type::NULL_VALUE:
            return Value(nullptr);
        default:
            throw JsonParseError("Unsupported JSON element");
    }
}

// Integers outside the 64-bit range fall back to the nearest double
template <typename Node>
Value number_to_value(Node& node) {
    std::int64_t i = 0;
    if (node.get_int64().get(i) == simdjson::SUCCESS) {
        return Value(i);
    }
    std::uint64_t u = 0;
    if (node.get_uint64().get(u) == simdjson::SUCCESS) {
        return Value(u);
    }
    double d = 0;
    auto error = node.get_double().get(d);
    if (error) {
        throw JsonParseError(simdjson::error_message(error));
    }
    return Value(d);
}

Value ondemand_to_value(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            Value obj = Value::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = ondemand_to_value(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            Value arr = Value::array();
            for (auto elem : val.get_array()) {
                arr.push_back(ondemand_to_value(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return Value(std::string(sv));
        }
        case simdjson::ondemand::json_type::number:
            return number_to_value(val);
        case simdjson::ondemand::json_type::boolean:
            return Value(bool(val.get_bool()));
        case simdjson::ondemand::json_type::null:
            if (!bool(val.is_null())) {
                throw JsonParseError(simdjson::error_message(simdjson::N_ATOM_ERROR));
            }
            return Value(nullptr);
        default:
            throw JsonParseError("Unsupported JSON element");
    }
}

// Scalar documents cannot be viewed as an ondemand::value, so the root is dispatched here
Value ondemand_document_to_value(simdjson::ondemand::document& doc) {
    switch (doc.type()) {
        case simdjson::ondemand::json_type::object:
        case simdjson::ondemand::json_type::array:
            return ondemand_to_value(doc.get_value().value());
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = doc.get_string();
            return Value(std::string(sv));
        }
        case simdjson::ondemand::json_type::number:
            return number_to_value(doc);
        case simdjson::ondemand::json_type::boolean:
            return Value(bool(doc.get_bool()));
        case simdjson::ondemand::json_type::null:
            if (!bool(doc.is_null())) {
                throw JsonParseError(simdjson::error_message(simdjson::N_ATOM_ERROR));
            }
            return Value(nullptr);
        default:
            throw JsonParseError("Unsupported JSON element");
    }
}

// The DOM parser refuses integers wider than 64 bits, so such documents are
// walked again with the on-demand API
Value parse_ondemand(const simdjson::padded_string& padded) {
    simdjson::ondemand::parser parser;
    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw JsonParseError(simdjson::error_message(error));
    }

    try {
        Value v = ondemand_document_to_value(doc);
        if (!doc.at_end()) {
            throw JsonParseError(simdjson::error_message(simdjson::TRAILING_CONTENT));
        }
        return v;
    } catch (const simdjson::simdjson_error& e) {
        throw JsonParseError(e.what());
    }
}

void ensure_representable(const Value& v) {
    if (!is_json_representable(v)) {
        throw JsonSerializeError("value contains binary or discarded nodes");
    }
}

} // anonymous namespace

Value JsonCodec::parse(std::string_view text) {
    if (text.empty()) {
        throw JsonParseError("Empty input");
    }

    // The DOM parser validates the whole document, including trailing content
    simdjson::dom::parser parser;
    simdjson::padded_string padded(text.data(), text.size());

    simdjson::dom::element doc;
    auto error = parser.parse(padded).get(doc);
    if (error == simdjson::BIGINT_ERROR || error == simdjson::NUMBER_ERROR) {
        return parse_ondemand(padded);
    }
    if (error) {
        throw JsonParseError(simdjson::error_message(error));
    }

    try {
        return element_to_value(doc);
    } catch (const simdjson::simdjson_error& e) {
        throw JsonParseError(std::string("JSON conversion error: ") + e.what());
    }
}

std::string JsonCodec::serialize_pretty(const Value& v, int indent) {
    ensure_representable(v);
    try {
        return v.dump(indent, ' ', false, Value::error_handler_t::strict);
    } catch (const Value::type_error& e) {
        throw JsonSerializeError(e.what());
    }
}

std::string JsonCodec::serialize_compact(const Value& v) {
    return serialize_pretty(v, -1);
}

} // namespace mpjson
