#include <catch2/catch.hpp>
#include <quid/generator.hpp>
#include <quid/uuid.hpp>
#include <chrono>
#include <memory>
#include <string>

using namespace quid;

template<typename F>
static long long time_ms(int iterations, F&& fn) {
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; ++i) {
        fn(i);
    }
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
}

TEST_CASE("uuid perf: 100K v1 with fixed node under 2s", "[uuid][bench]") {
    ClockSeq seq(0);
    Generator gen(std::make_shared<FixedNodeProvider>(
        Node::from_bytes({0x02, 0, 0, 0, 0, 0x01})), seq);

    bool all_ok = true;
    auto ms = time_ms(100000, [&](int) {
        all_ok = gen.v1().is_ok() && all_ok;
    });

    INFO("Time: " << ms << " ms");
    REQUIRE(all_ok);
    REQUIRE(ms < 2000);
}

TEST_CASE("uuid perf: 100K v3 and 100K v5 under 3s", "[uuid][bench]") {
    size_t total = 0;
    auto ms = time_ms(100000, [&](int i) {
        std::string name = "host-" + std::to_string(i) + ".example.com";
        total += Uuid::v3(name, ns::DNS).bytes[0];
        total += Uuid::v5(name, ns::DNS).bytes[0];
    });

    INFO("Time: " << ms << " ms, checksum " << total);
    REQUIRE(ms < 3000);
}

TEST_CASE("uuid perf: 100K format + is_valid under 2s", "[uuid][bench]") {
    Uuid u = Uuid::v5("any", ns::X500);
    int valid = 0;
    auto ms = time_ms(100000, [&](int i) {
        Case c = (i % 2 == 0) ? Case::Lower : Case::Upper;
        if (Uuid::is_valid(u.to_string(c))) ++valid;
    });

    INFO("Time: " << ms << " ms");
    REQUIRE(valid == 100000);
    REQUIRE(ms < 2000);
}
