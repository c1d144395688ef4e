#include <gtest/gtest.h>
#include "mpjson/converter.hpp"
#include "mpjson/json_codec.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace mpjson;

TEST(Concurrency, IndependentCallsFromManyThreads) {
    const std::string good = R"({"name":"Alice","age":30,"city":"Wonderland"})";
    const std::string bad_json = R"({"name":"Alice","age":30,"city":Wonderland})";
    const std::string expected_pretty =
        "{\n  \"age\": 30,\n  \"city\": \"Wonderland\",\n  \"name\": \"Alice\"\n}";

    Converter shared;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 200; ++i) {
                if ((i + t) % 3 == 0) {
                    auto r = shared.json_to_messagepack(bad_json);
                    if (r.ok() || r.error->kind != ErrorKind::JsonParse) ++failures;
                    continue;
                }
                auto packed = shared.json_to_messagepack(good);
                if (!packed.ok()) { ++failures; continue; }
                auto json = convert_messagepack_to_json(*packed.value);
                if (!json.ok() || *json.value != expected_pretty) ++failures;
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(failures.load(), 0);
}

TEST(Concurrency, FailureDoesNotAffectLaterCalls) {
    auto bad = convert_messagepack_to_json("invalid_base64_string");
    ASSERT_FALSE(bad.ok());
    auto good = convert_messagepack_to_json("gA==");
    ASSERT_TRUE(good.ok());
    EXPECT_EQ(*good.value, "{}");
    EXPECT_FALSE(good.error.has_value());
}
