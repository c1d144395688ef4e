#include "mpjson/error.hpp"

namespace mpjson {

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::JsonParse:         return "JsonParseError";
        case ErrorKind::MessagePackEncode: return "MessagePackEncodeError";
        case ErrorKind::MessagePackDecode: return "MessagePackDecodeError";
        case ErrorKind::TransportDecode:   return "TransportDecodeError";
        case ErrorKind::JsonSerialize:     return "JsonSerializeError";
        default:                           return "Error";
    }
}

} // namespace mpjson
