#pragma once

/// Umbrella header for the mpjson JSON <-> MessagePack library.

#include "version.hpp"
#include "error.hpp"
#include "value.hpp"
#include "json_codec.hpp"
#include "msgpack_codec.hpp"
#include "transport.hpp"
#include "converter.hpp"
