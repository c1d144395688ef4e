#pragma once
#include <stdexcept>
#include <string>

namespace mpjson {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class JsonParseError : public Error {
public:
    using Error::Error;
};

class JsonSerializeError : public Error {
public:
    using Error::Error;
};

class MsgpackEncodeError : public Error {
public:
    using Error::Error;
};

class MsgpackDecodeError : public Error {
public:
    std::size_t offset;
    MsgpackDecodeError(std::size_t offset, const std::string& msg)
        : Error(msg), offset(offset) {}
};

class TransportDecodeError : public Error {
public:
    using Error::Error;
};

/// Stage at which a conversion failed.
enum class ErrorKind {
    JsonParse,
    MessagePackEncode,
    MessagePackDecode,
    TransportDecode,
    JsonSerialize
};

struct ConversionError {
    ErrorKind kind;
    std::string message;

    bool operator==(const ConversionError& o) const {
        return kind == o.kind && message == o.message;
    }
};

std::string error_kind_to_string(ErrorKind kind);

} // namespace mpjson
