#include <benchmark/benchmark.h>
#include "mpjson/converter.hpp"
#include <string>

using namespace mpjson;

static const std::string kDocument =
    R"({"person":{"name":"Bob","age":25,"address":{"street":"123 Elm Street","city":"Somewhere","zip":"12345"}},"hobbies":["reading","gaming","hiking"],"is_student":false})";

static void BM_JsonToMessagePack(benchmark::State& state) {
    Converter converter;
    for (auto _ : state) {
        auto r = converter.json_to_messagepack(kDocument);
        benchmark::DoNotOptimize(r);
    }
    state.SetBytesProcessed(state.iterations() * kDocument.size());
}
BENCHMARK(BM_JsonToMessagePack);

static void BM_MessagePackToJson(benchmark::State& state) {
    Converter converter;
    std::string encoded = *converter.json_to_messagepack(kDocument).value;
    for (auto _ : state) {
        auto r = converter.messagepack_to_json(encoded);
        benchmark::DoNotOptimize(r);
    }
    state.SetBytesProcessed(state.iterations() * encoded.size());
}
BENCHMARK(BM_MessagePackToJson);

static void BM_RoundTrip(benchmark::State& state) {
    for (auto _ : state) {
        auto packed = convert_json_to_messagepack(kDocument);
        auto json = convert_messagepack_to_json(*packed.value);
        benchmark::DoNotOptimize(json);
    }
}
BENCHMARK(BM_RoundTrip);

static void BM_InvalidInput(benchmark::State& state) {
    for (auto _ : state) {
        auto r = convert_messagepack_to_json("invalid_base64_string");
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_InvalidInput);
