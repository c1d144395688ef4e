#include <benchmark/benchmark.h>
#include "mpjson/json_codec.hpp"
#include "mpjson/msgpack_codec.hpp"
#include "mpjson/transport.hpp"
#include <string>

using namespace mpjson;

static const std::string kSmallDocument =
    R"({"name":"Alice","age":30,"city":"Wonderland"})";

// Generate a document with N records
static std::string make_large_document(int n) {
    Value records = Value::array();
    for (int i = 0; i < n; ++i) {
        records.push_back({
            {"id", i},
            {"name", "record_" + std::to_string(i)},
            {"score", i * 0.5},
            {"active", i % 2 == 0},
            {"tags", {"alpha", "beta", "gamma"}}
        });
    }
    return Value{{"records", records}}.dump();
}

static const std::string kLargeDocument = make_large_document(1000);

// ---- JSON ----

static void BM_JsonParseSmall(benchmark::State& state) {
    for (auto _ : state) {
        auto v = JsonCodec::parse(kSmallDocument);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() * kSmallDocument.size());
}
BENCHMARK(BM_JsonParseSmall);

static void BM_JsonParseLarge(benchmark::State& state) {
    for (auto _ : state) {
        auto v = JsonCodec::parse(kLargeDocument);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() * kLargeDocument.size());
}
BENCHMARK(BM_JsonParseLarge);

static void BM_JsonSerializePretty(benchmark::State& state) {
    Value v = JsonCodec::parse(kLargeDocument);
    for (auto _ : state) {
        auto s = JsonCodec::serialize_pretty(v);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_JsonSerializePretty);

// ---- MessagePack ----

static void BM_MsgpackEncodeLarge(benchmark::State& state) {
    Value v = JsonCodec::parse(kLargeDocument);
    for (auto _ : state) {
        auto bytes = MsgpackCodec::encode(v);
        benchmark::DoNotOptimize(bytes);
    }
}
BENCHMARK(BM_MsgpackEncodeLarge);

static void BM_MsgpackDecodeLarge(benchmark::State& state) {
    Bytes bytes = MsgpackCodec::encode(JsonCodec::parse(kLargeDocument));
    for (auto _ : state) {
        auto v = MsgpackCodec::decode(bytes);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() * bytes.size());
}
BENCHMARK(BM_MsgpackDecodeLarge);

// ---- Transport ----

static void BM_Base64Decode(benchmark::State& state) {
    std::string text = encode_base64(MsgpackCodec::encode(JsonCodec::parse(kLargeDocument)));
    for (auto _ : state) {
        auto bytes = decode_base64(text);
        benchmark::DoNotOptimize(bytes);
    }
    state.SetBytesProcessed(state.iterations() * text.size());
}
BENCHMARK(BM_Base64Decode);

static void BM_HexDecode(benchmark::State& state) {
    std::string text = encode_hex(MsgpackCodec::encode(JsonCodec::parse(kLargeDocument)));
    for (auto _ : state) {
        auto bytes = decode_hex(text);
        benchmark::DoNotOptimize(bytes);
    }
    state.SetBytesProcessed(state.iterations() * text.size());
}
BENCHMARK(BM_HexDecode);
