#pragma once
#include <cstddef>
#include <string_view>

namespace mpjson {

constexpr std::string_view LIBRARY_VERSION = "0.1.0";

/// Indentation used by the default JSON output.
constexpr int DEFAULT_INDENT = 2;

/// Nesting limit applied when decoding MessagePack.
constexpr std::size_t DEFAULT_MAX_DEPTH = 1024;

} // namespace mpjson
