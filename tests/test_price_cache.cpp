#include <catch2/catch_test_macros.hpp>
#include "minerhub/price_cache.hpp"
#include <atomic>
#include <thread>

using namespace minerhub;
using namespace std::chrono_literals;

namespace {

PriceSample sample_at(double value, std::chrono::system_clock::time_point when) {
    PriceSample sample;
    sample.value = value;
    sample.observed_at = when;
    return sample;
}

} // namespace

TEST_CASE("Latest price per zone", "[cache]") {
    PriceCache cache;
    const auto now = std::chrono::system_clock::now();

    REQUIRE_FALSE(cache.get("SE3").has_value());

    REQUIRE(cache.put("SE3", sample_at(0.80, now)));
    REQUIRE(cache.put("SE4", sample_at(1.10, now)));

    auto se3 = cache.get("SE3");
    REQUIRE(se3.has_value());
    REQUIRE(se3->zone == "SE3");
    REQUIRE(se3->value == 0.80);
    REQUIRE(cache.get("SE4")->value == 1.10);
    REQUIRE(cache.zones() == std::vector<std::string>{"SE3", "SE4"});

    SECTION("newer samples replace older ones") {
        REQUIRE(cache.put("SE3", sample_at(0.70, now + 1h)));
        REQUIRE(cache.get("SE3")->value == 0.70);
    }

    SECTION("older samples are rejected") {
        REQUIRE_FALSE(cache.put("SE3", sample_at(0.10, now - 1s)));
        REQUIRE(cache.get("SE3")->value == 0.80);
    }

    SECTION("same timestamp is accepted") {
        REQUIRE(cache.put("SE3", sample_at(0.85, now)));
        REQUIRE(cache.get("SE3")->value == 0.85);
    }
}

TEST_CASE("Stale marking", "[cache][stale]") {
    PriceCache cache;
    const auto now = std::chrono::system_clock::now();

    REQUIRE_FALSE(cache.mark_stale("SE1"));

    cache.put("SE1", sample_at(0.40, now));
    REQUIRE(cache.mark_stale("SE1"));
    REQUIRE_FALSE(cache.mark_stale("SE1"));

    auto stale = cache.get("SE1");
    REQUIRE(stale->stale);
    REQUIRE(stale->value == 0.40);

    // A fresh sample clears the flag
    cache.put("SE1", sample_at(0.45, now + 1min));
    REQUIRE_FALSE(cache.get("SE1")->stale);
}

TEST_CASE("Listener sees accepted updates and stale transitions", "[cache]") {
    PriceCache cache;
    const auto now = std::chrono::system_clock::now();
    std::vector<PriceSample> seen;
    cache.set_listener([&](const PriceSample& sample) { seen.push_back(sample); });

    cache.put("SE2", sample_at(0.30, now));
    cache.put("SE2", sample_at(0.10, now - 1h));
    cache.mark_stale("SE2");
    cache.mark_stale("SE2");

    REQUIRE(seen.size() == 2);
    REQUIRE(seen[0].zone == "SE2");
    REQUIRE_FALSE(seen[0].stale);
    REQUIRE(seen[1].stale);

    cache.set_listener(nullptr);
    cache.put("SE2", sample_at(0.20, now + 1h));
    REQUIRE(seen.size() == 2);
}

TEST_CASE("Readers never see a half-written sample", "[cache][threads]") {
    PriceCache cache;
    const auto start = std::chrono::system_clock::now();
    cache.put("SE3", sample_at(0.0, start));

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    // Writer keeps value and timestamp in lockstep: value == seconds offset
    std::thread writer([&] {
        for (int i = 1; i <= 5000; ++i) {
            cache.put("SE3", sample_at(static_cast<double>(i), start + std::chrono::seconds(i)));
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            while (!done) {
                auto sample = cache.get("SE3");
                if (!sample) continue;
                const auto offset = std::chrono::duration_cast<std::chrono::seconds>(
                    sample->observed_at - start).count();
                if (static_cast<double>(offset) != sample->value) {
                    ++torn;
                }
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }
    REQUIRE(torn == 0);
    REQUIRE(cache.get("SE3")->value == 5000.0);
}
