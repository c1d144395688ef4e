#include "mpjson/msgpack_codec.hpp"
#include "mpjson/transport.hpp"
#include <simdjson.h>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace mpjson {

namespace {

constexpr std::uint64_t kMaxLength = std::numeric_limits<std::uint32_t>::max();

// ---- Encoding ----

class Encoder {
public:
    explicit Encoder(Bytes& out) : out_(out) {}

    void write(const Value& v) {
        switch (v.type()) {
            case Value::value_t::null:
                put(0xc0);
                break;
            case Value::value_t::boolean:
                put(v.get<bool>() ? 0xc3 : 0xc2);
                break;
            case Value::value_t::number_unsigned:
                write_unsigned(v.get<std::uint64_t>());
                break;
            case Value::value_t::number_integer: {
                auto i = v.get<std::int64_t>();
                if (i >= 0) {
                    write_unsigned(static_cast<std::uint64_t>(i));
                } else {
                    write_negative(i);
                }
                break;
            }
            case Value::value_t::number_float: {
                double d = v.get<double>();
                std::uint64_t bits;
                std::memcpy(&bits, &d, sizeof(bits));
                put(0xcb);
                put_be(bits, 8);
                break;
            }
            case Value::value_t::string:
                write_string(v.get_ref<const std::string&>());
                break;
            case Value::value_t::array:
                write_header(v.size(), 0x90, 0xdc, 0xdd, "array");
                for (const auto& item : v) {
                    write(item);
                }
                break;
            case Value::value_t::object:
                write_header(v.size(), 0x80, 0xde, 0xdf, "map");
                for (auto it = v.begin(); it != v.end(); ++it) {
                    write_string(it.key());
                    write(it.value());
                }
                break;
            default:
                throw MsgpackEncodeError("cannot encode " + std::string(kind_name(v)) + " value");
        }
    }

private:
    void put(std::uint8_t b) { out_.push_back(b); }

    void put_be(std::uint64_t v, int nbytes) {
        for (int k = nbytes - 1; k >= 0; --k) {
            out_.push_back(static_cast<std::uint8_t>((v >> (8 * k)) & 0xFFu));
        }
    }

    void write_unsigned(std::uint64_t v) {
        if (v <= 0x7f) {
            put(static_cast<std::uint8_t>(v));
        } else if (v <= 0xff) {
            put(0xcc);
            put_be(v, 1);
        } else if (v <= 0xffff) {
            put(0xcd);
            put_be(v, 2);
        } else if (v <= 0xffffffffu) {
            put(0xce);
            put_be(v, 4);
        } else {
            put(0xcf);
            put_be(v, 8);
        }
    }

    void write_negative(std::int64_t v) {
        auto bits = static_cast<std::uint64_t>(v);
        if (v >= -32) {
            put(static_cast<std::uint8_t>(bits & 0xFFu));
        } else if (v >= std::numeric_limits<std::int8_t>::min()) {
            put(0xd0);
            put_be(bits, 1);
        } else if (v >= std::numeric_limits<std::int16_t>::min()) {
            put(0xd1);
            put_be(bits, 2);
        } else if (v >= std::numeric_limits<std::int32_t>::min()) {
            put(0xd2);
            put_be(bits, 4);
        } else {
            put(0xd3);
            put_be(bits, 8);
        }
    }

    void write_string(const std::string& s) {
        const std::size_t n = s.size();
        if (n <= 31) {
            put(static_cast<std::uint8_t>(0xa0 | n));
        } else if (n <= 0xff) {
            put(0xd9);
            put_be(n, 1);
        } else if (n <= 0xffff) {
            put(0xda);
            put_be(n, 2);
        } else if (n <= kMaxLength) {
            put(0xdb);
            put_be(n, 4);
        } else {
            throw MsgpackEncodeError("string of " + std::to_string(n) + " bytes is too long");
        }
        out_.insert(out_.end(), s.begin(), s.end());
    }

    void write_header(std::size_t n, std::uint8_t fix, std::uint8_t tag16, std::uint8_t tag32,
                      const char* what) {
        if (n <= 15) {
            put(static_cast<std::uint8_t>(fix | n));
        } else if (n <= 0xffff) {
            put(tag16);
            put_be(n, 2);
        } else if (n <= kMaxLength) {
            put(tag32);
            put_be(n, 4);
        } else {
            throw MsgpackEncodeError(std::string(what) + " of " + std::to_string(n) +
                                     " elements is too long");
        }
    }

    Bytes& out_;
};

// ---- Decoding ----

class Decoder {
public:
    Decoder(const std::uint8_t* data, std::size_t size, const DecodeOptions& opts)
        : data_(data), size_(size), opts_(opts) {}

    std::size_t position() const { return pos_; }

    Value read_value(std::size_t depth) {
        const std::size_t at = pos_;
        const std::uint8_t tag = read_u8();

        if (tag <= 0x7f) return Value(static_cast<std::uint64_t>(tag));
        if (tag >= 0xe0) return Value(static_cast<std::int64_t>(static_cast<std::int8_t>(tag)));
        if ((tag & 0xf0) == 0x80) return read_map(tag & 0x0f, depth, at);
        if ((tag & 0xf0) == 0x90) return read_array(tag & 0x0f, depth, at);
        if ((tag & 0xe0) == 0xa0) return read_string(tag & 0x1f, at);

        switch (tag) {
            case 0xc0: return Value(nullptr);
            case 0xc2: return Value(false);
            case 0xc3: return Value(true);

            case 0xc4: return read_binary(read_be(1), at, "bin8");
            case 0xc5: return read_binary(read_be(2), at, "bin16");
            case 0xc6: return read_binary(read_be(4), at, "bin32");

            case 0xc7: skip_length(1); reject_extension(at);
            case 0xc8: skip_length(2); reject_extension(at);
            case 0xc9: skip_length(4); reject_extension(at);
            case 0xd4: case 0xd5: case 0xd6: case 0xd7: case 0xd8:
                reject_extension(at);

            case 0xca: {
                auto bits = static_cast<std::uint32_t>(read_be(4));
                float f;
                std::memcpy(&f, &bits, sizeof(f));
                return Value(static_cast<double>(f));
            }
            case 0xcb: {
                std::uint64_t bits = read_be(8);
                double d;
                std::memcpy(&d, &bits, sizeof(d));
                return Value(d);
            }

            case 0xcc: return Value(read_be(1));
            case 0xcd: return Value(read_be(2));
            case 0xce: return Value(read_be(4));
            case 0xcf: return Value(read_be(8));

            case 0xd0: return Value(static_cast<std::int64_t>(static_cast<std::int8_t>(read_be(1))));
            case 0xd1: return Value(static_cast<std::int64_t>(static_cast<std::int16_t>(read_be(2))));
            case 0xd2: return Value(static_cast<std::int64_t>(static_cast<std::int32_t>(read_be(4))));
            case 0xd3: return Value(static_cast<std::int64_t>(read_be(8)));

            case 0xd9: return read_string(read_be(1), at);
            case 0xda: return read_string(read_be(2), at);
            case 0xdb: return read_string(read_be(4), at);

            case 0xdc: return read_array(read_be(2), depth, at);
            case 0xdd: return read_array(read_be(4), depth, at);
            case 0xde: return read_map(read_be(2), depth, at);
            case 0xdf: return read_map(read_be(4), depth, at);

            default:
                throw MsgpackDecodeError(at, "unrecognized type tag " + hex_byte(tag) +
                                                 " at offset " + std::to_string(at));
        }
    }

private:
    static std::string hex_byte(std::uint8_t b) {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out = "0x";
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
        return out;
    }

    void need(std::size_t n) {
        if (n > size_ - pos_) {
            throw MsgpackDecodeError(pos_, "unexpected end of input at offset " + std::to_string(pos_));
        }
    }

    // Declared payload lengths are checked against what is left before any
    // allocation happens
    void need_payload(std::uint64_t len, std::size_t at) {
        if (len > size_ - pos_) {
            throw MsgpackDecodeError(at, "declared length " + std::to_string(len) + " at offset " +
                                             std::to_string(at) + " exceeds remaining input of " +
                                             std::to_string(size_ - pos_) + " bytes");
        }
    }

    // Each array element takes at least one byte, each map entry at least two
    void need_elements(std::uint64_t count, std::uint64_t min_bytes, const char* noun,
                       std::size_t at) {
        if (count * min_bytes > size_ - pos_) {
            throw MsgpackDecodeError(at, "declared " + std::to_string(count) + " " + noun +
                                             " at offset " + std::to_string(at) +
                                             " exceeds remaining input of " +
                                             std::to_string(size_ - pos_) + " bytes");
        }
    }

    std::uint8_t read_u8() {
        need(1);
        return data_[pos_++];
    }

    std::uint64_t read_be(int nbytes) {
        need(static_cast<std::size_t>(nbytes));
        std::uint64_t v = 0;
        for (int k = 0; k < nbytes; ++k) {
            v = (v << 8) | data_[pos_++];
        }
        return v;
    }

    void skip_length(int nbytes) { read_be(nbytes); }

    [[noreturn]] void reject_extension(std::size_t at) {
        auto type = static_cast<std::int8_t>(read_u8());
        throw MsgpackDecodeError(at, "extension type " + std::to_string(type) + " at offset " +
                                         std::to_string(at) + " is not supported");
    }

    void enter(std::size_t depth, std::size_t at) {
        if (depth >= opts_.max_depth) {
            throw MsgpackDecodeError(at, "nesting depth exceeds limit of " +
                                             std::to_string(opts_.max_depth) + " at offset " +
                                             std::to_string(at));
        }
    }

    Value read_string(std::uint64_t len, std::size_t at) {
        need_payload(len, at);
        const char* begin = reinterpret_cast<const char*>(data_ + pos_);
        if (!simdjson::validate_utf8(begin, static_cast<std::size_t>(len))) {
            throw MsgpackDecodeError(at, "invalid UTF-8 in string at offset " + std::to_string(at));
        }
        pos_ += static_cast<std::size_t>(len);
        return Value(std::string(begin, static_cast<std::size_t>(len)));
    }

    Value read_binary(std::uint64_t len, std::size_t at, const char* name) {
        switch (opts_.binary) {
            case BinaryPolicy::Base64String: {
                need_payload(len, at);
                std::string text = encode_base64(data_ + pos_, static_cast<std::size_t>(len));
                pos_ += static_cast<std::size_t>(len);
                return Value(std::move(text));
            }
            case BinaryPolicy::ByteArray: {
                need_payload(len, at);
                Value arr = Value::array();
                for (std::uint64_t i = 0; i < len; ++i) {
                    arr.push_back(static_cast<std::uint64_t>(data_[pos_++]));
                }
                return arr;
            }
            case BinaryPolicy::Reject:
            default:
                throw MsgpackDecodeError(at, "binary data (" + std::string(name) + ") at offset " +
                                                 std::to_string(at) + " is not representable in JSON");
        }
    }

    Value read_array(std::uint64_t count, std::size_t depth, std::size_t at) {
        enter(depth, at);
        need_elements(count, 1, "elements", at);
        Value arr = Value::array();
        for (std::uint64_t i = 0; i < count; ++i) {
            arr.push_back(read_value(depth + 1));
        }
        return arr;
    }

    Value read_map(std::uint64_t count, std::size_t depth, std::size_t at) {
        enter(depth, at);
        need_elements(count, 2, "entries", at);
        Value obj = Value::object();
        for (std::uint64_t i = 0; i < count; ++i) {
            const std::size_t key_at = pos_;
            Value key = read_value(depth + 1);
            std::string name = key_to_string(std::move(key), key_at);
            obj[name] = read_value(depth + 1);
        }
        return obj;
    }

    std::string key_to_string(Value key, std::size_t at) {
        if (key.is_string()) {
            return key.get<std::string>();
        }
        if (opts_.keys == KeyPolicy::Stringify) {
            return key.dump();
        }
        throw MsgpackDecodeError(at, "map key at offset " + std::to_string(at) + " is " +
                                         std::string(kind_name(key)) + ", expected string");
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_ = 0;
    const DecodeOptions& opts_;
};

} // anonymous namespace

std::string binary_policy_to_string(BinaryPolicy policy) {
    switch (policy) {
        case BinaryPolicy::Reject:       return "reject";
        case BinaryPolicy::Base64String: return "base64";
        case BinaryPolicy::ByteArray:    return "bytes";
        default:                         return "reject";
    }
}

BinaryPolicy binary_policy_from_string(const std::string& s) {
    if (s == "reject") return BinaryPolicy::Reject;
    if (s == "base64") return BinaryPolicy::Base64String;
    if (s == "bytes")  return BinaryPolicy::ByteArray;
    throw std::invalid_argument("Unknown binary policy: " + s);
}

std::string key_policy_to_string(KeyPolicy policy) {
    switch (policy) {
        case KeyPolicy::Reject:    return "reject";
        case KeyPolicy::Stringify: return "stringify";
        default:                   return "reject";
    }
}

KeyPolicy key_policy_from_string(const std::string& s) {
    if (s == "reject")    return KeyPolicy::Reject;
    if (s == "stringify") return KeyPolicy::Stringify;
    throw std::invalid_argument("Unknown key policy: " + s);
}

Bytes MsgpackCodec::encode(const Value& v) {
    Bytes out;
    Encoder encoder(out);
    encoder.write(v);
    return out;
}

Value MsgpackCodec::decode(const std::uint8_t* data, std::size_t size, const DecodeOptions& opts) {
    return decode_prefix(data, size, opts).value;
}

Value MsgpackCodec::decode(const Bytes& bytes, const DecodeOptions& opts) {
    return decode(bytes.data(), bytes.size(), opts);
}

DecodeResult MsgpackCodec::decode_prefix(const std::uint8_t* data, std::size_t size,
                                         const DecodeOptions& opts) {
    Decoder decoder(data, size, opts);
    DecodeResult result;
    result.value = decoder.read_value(0);
    result.consumed = decoder.position();
    return result;
}

} // namespace mpjson
