#include "mpjson/transport.hpp"
#include <array>
#include <stdexcept>

namespace mpjson {

namespace {

constexpr std::uint8_t kInvalid = 0xFF;
constexpr char kBase64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr char kHexDigits[] = "0123456789abcdef";

std::array<std::uint8_t, 256> make_base64_table() {
    std::array<std::uint8_t, 256> t{};
    t.fill(kInvalid);
    for (int i = 0; i < 64; ++i) {
        t[static_cast<unsigned char>(kBase64Alphabet[i])] = static_cast<std::uint8_t>(i);
    }
    return t;
}

const std::array<std::uint8_t, 256> kBase64Table = make_base64_table();

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string describe_byte(unsigned char c) {
    std::string out = "invalid byte " + std::to_string(static_cast<int>(c));
    if (c >= 0x20 && c < 0x7f) {
        out += " ('";
        out += static_cast<char>(c);
        out += "')";
    }
    return out;
}

} // anonymous namespace

std::string encoding_to_string(Encoding encoding) {
    switch (encoding) {
        case Encoding::Hex:    return "hex";
        case Encoding::Base64: return "base64";
        default:               return "base64";
    }
}

Encoding encoding_from_string(const std::string& s) {
    if (s == "hex")    return Encoding::Hex;
    if (s == "base64") return Encoding::Base64;
    throw std::invalid_argument("Unknown encoding: " + s);
}

std::string encode_base64(const std::uint8_t* data, std::size_t len) {
    if (data == nullptr || len == 0) {
        return {};
    }

    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        const std::uint32_t x = (static_cast<std::uint32_t>(data[i]) << 16) |
                                (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(kBase64Alphabet[(x >> 18) & 0x3Fu]);
        out.push_back(kBase64Alphabet[(x >> 12) & 0x3Fu]);
        out.push_back(kBase64Alphabet[(x >> 6) & 0x3Fu]);
        out.push_back(kBase64Alphabet[x & 0x3Fu]);
    }

    const std::size_t rem = len - i;
    if (rem == 1) {
        const std::uint32_t x = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(kBase64Alphabet[(x >> 18) & 0x3Fu]);
        out.push_back(kBase64Alphabet[(x >> 12) & 0x3Fu]);
        out += "==";
    } else if (rem == 2) {
        const std::uint32_t x = (static_cast<std::uint32_t>(data[i]) << 16) |
                                (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out.push_back(kBase64Alphabet[(x >> 18) & 0x3Fu]);
        out.push_back(kBase64Alphabet[(x >> 12) & 0x3Fu]);
        out.push_back(kBase64Alphabet[(x >> 6) & 0x3Fu]);
        out.push_back('=');
    }
    return out;
}

std::string encode_base64(const Bytes& bytes) {
    return encode_base64(bytes.data(), bytes.size());
}

std::string encode_hex(const Bytes& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0F]);
    }
    return out;
}

std::string encode_text(const Bytes& bytes, Encoding encoding) {
    return encoding == Encoding::Hex ? encode_hex(bytes) : encode_base64(bytes);
}

bool is_hex(std::string_view text) {
    for (char c : text) {
        if (hex_value(c) < 0) return false;
    }
    return true;
}

Encoding decide_encoding(std::string_view text) {
    return is_hex(text) ? Encoding::Hex : Encoding::Base64;
}

Bytes decode_hex(std::string_view text) {
    if (text.size() % 2 != 0) {
        throw TransportDecodeError("odd number of digits");
    }
    Bytes out;
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            std::size_t pos = hi < 0 ? i : i + 1;
            throw TransportDecodeError("invalid character '" + std::string(1, text[pos]) +
                                       "' at position " + std::to_string(pos));
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

Bytes decode_base64(std::string_view text) {
    // Alphabet errors are reported before length errors so the message points
    // at the offending character
    std::size_t padding = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        auto c = static_cast<unsigned char>(text[i]);
        if (c == '=') {
            ++padding;
            continue;
        }
        if (kBase64Table[c] == kInvalid || padding > 0) {
            throw TransportDecodeError(describe_byte(c) + " at offset " + std::to_string(i));
        }
    }
    if (text.size() % 4 != 0) {
        throw TransportDecodeError("invalid length " + std::to_string(text.size()) +
                                   ", expected a multiple of 4");
    }
    if (padding > 2) {
        throw TransportDecodeError("invalid padding");
    }

    Bytes out;
    out.reserve((text.size() / 4) * 3);
    for (std::size_t i = 0; i < text.size(); i += 4) {
        const bool last = i + 4 == text.size();
        const std::size_t pad = last ? padding : 0;

        std::uint32_t x = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            std::uint8_t v = k < 4 - pad ? kBase64Table[static_cast<unsigned char>(text[i + k])] : 0;
            x = (x << 6) | v;
        }

        // Leftover bits of the final symbol must be zero in canonical encoding
        if ((pad == 1 && (x & 0xFFu) != 0) || (pad == 2 && (x & 0xFFFFu) != 0)) {
            throw TransportDecodeError("invalid last symbol at offset " +
                                       std::to_string(i + 3 - pad));
        }

        out.push_back(static_cast<std::uint8_t>((x >> 16) & 0xFFu));
        if (pad < 2) out.push_back(static_cast<std::uint8_t>((x >> 8) & 0xFFu));
        if (pad < 1) out.push_back(static_cast<std::uint8_t>(x & 0xFFu));
    }
    return out;
}

DecodedText decode_text(std::string_view text) {
    Encoding encoding = decide_encoding(text);
    if (encoding == Encoding::Hex) {
        return DecodedText{encoding, decode_hex(text)};
    }
    return DecodedText{encoding, decode_base64(text)};
}

} // namespace mpjson
