#include <catch2/catch.hpp>
#include <cuuid/uuid.hpp>
#include <chrono>
#include <random>
#include <vector>

using namespace cuuid;

static std::vector<Bytes> random_payloads(size_t n) {
    std::mt19937_64 gen(99);
    std::vector<Bytes> out(n);
    for (auto& b : out) {
        for (auto& x : b) x = static_cast<uint8_t>(gen());
    }
    return out;
}

TEST_CASE("codec perf: 100K encode+decode under 500ms", "[crockford][bench]") {
    auto payloads = random_payloads(100000);

    auto start = std::chrono::high_resolution_clock::now();
    size_t mismatches = 0;
    for (const auto& b : payloads) {
        auto r = crockford::decode(crockford::encode(b));
        if (r.is_err() || r.value() != b) ++mismatches;
    }
    auto end = std::chrono::high_resolution_clock::now();

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Values: " << payloads.size());
    INFO("Time: " << ms << " ms");

    REQUIRE(mismatches == 0);
    REQUIRE(ms < 500);
}

TEST_CASE("generator perf: 10K v7 values under 1s", "[uuid][bench]") {
    auto start = std::chrono::high_resolution_clock::now();
    std::vector<Uuid> ids;
    ids.reserve(10000);
    for (int i = 0; i < 10000; ++i) {
        ids.push_back(Uuid::generate_ordered());
    }
    auto end = std::chrono::high_resolution_clock::now();

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Time: " << ms << " ms");
    REQUIRE(ids.size() == 10000);
    REQUIRE(ms < 1000);
}
