#include <catch2/catch_test_macros.hpp>
#include "minerhub/price_poller.hpp"
#include "fakes/fake_price_feed.hpp"
#include "fakes/memory_log_sink.hpp"

using namespace minerhub;
using minerhub::testing::FakePriceFeed;
using minerhub::testing::MemoryLogSink;
using namespace std::chrono_literals;

namespace {

PollingConfig make_config() {
    PollingConfig config;
    config.interval_seconds = 60;
    config.max_consecutive_failures = 3;
    config.backoff_initial_seconds = 5;
    config.backoff_max_seconds = 20;
    return config;
}

struct PollerRig {
    FakePriceFeed feed;
    PriceCache cache;
    std::shared_ptr<MemoryLogSink> log = std::make_shared<MemoryLogSink>();
    PricePoller poller{feed, cache, make_config(), log};
};

} // namespace

TEST_CASE("Successful fetch updates the cache", "[poller]") {
    PollerRig rig;
    rig.feed.push_price("SE3", 0.953);

    REQUIRE(rig.poller.poll_zone("SE3") == 60s);

    auto sample = rig.cache.get("SE3");
    REQUIRE(sample.has_value());
    REQUIRE(sample->value == 0.953);
    REQUIRE_FALSE(sample->stale);
    REQUIRE(rig.poller.consecutive_failures("SE3") == 0);
    REQUIRE(rig.log->contains("Price SE3: 0.953 SEK/kWh"));
}

TEST_CASE("Failures back off exponentially up to the cap", "[poller][backoff]") {
    PollerRig rig;

    REQUIRE(rig.poller.poll_zone("SE3") == 5s);
    REQUIRE(rig.poller.poll_zone("SE3") == 10s);
    REQUIRE(rig.poller.poll_zone("SE3") == 20s);
    REQUIRE(rig.poller.poll_zone("SE3") == 20s);
    REQUIRE(rig.poller.consecutive_failures("SE3") == 4);
    REQUIRE(rig.log->contains("failed (2 in a row): network"));

    rig.feed.push_price("SE3", 0.40);
    REQUIRE(rig.poller.poll_zone("SE3") == 60s);
    REQUIRE(rig.poller.consecutive_failures("SE3") == 0);
    REQUIRE(rig.log->contains("(feed recovered)"));

    // Backoff restarts from the initial delay
    REQUIRE(rig.poller.poll_zone("SE3") == 5s);
}

TEST_CASE("Price goes stale after too many failures", "[poller][stale]") {
    PollerRig rig;
    rig.feed.push_price("SE3", 0.50);
    rig.poller.poll_zone("SE3");

    std::vector<PriceSample> notified;
    rig.cache.set_listener([&](const PriceSample& sample) { notified.push_back(sample); });

    rig.feed.push_failure("SE3", FeedError::Timeout);
    rig.feed.push_failure("SE3", FeedError::HttpStatus);
    rig.poller.poll_zone("SE3");
    rig.poller.poll_zone("SE3");
    REQUIRE_FALSE(rig.cache.get("SE3")->stale);

    rig.poller.poll_zone("SE3");
    REQUIRE(rig.cache.get("SE3")->stale);
    REQUIRE(rig.cache.get("SE3")->value == 0.50);
    REQUIRE(notified.size() == 1);
    REQUIRE(notified.front().stale);
    REQUIRE(rig.log->count_containing("is stale after 3 consecutive failures") == 1);

    // Staying stale does not notify again
    rig.poller.poll_zone("SE3");
    REQUIRE(notified.size() == 1);

    rig.feed.push_price("SE3", 0.45);
    rig.poller.poll_zone("SE3");
    REQUIRE_FALSE(rig.cache.get("SE3")->stale);
    REQUIRE(notified.size() == 2);
}

TEST_CASE("Zones back off independently", "[poller]") {
    PollerRig rig;
    rig.feed.push_failure("SE1");
    rig.feed.push_price("SE4", 1.10);

    REQUIRE(rig.poller.poll_zone("SE1") == 5s);
    REQUIRE(rig.poller.poll_zone("SE4") == 60s);
    REQUIRE(rig.poller.consecutive_failures("SE1") == 1);
    REQUIRE(rig.poller.consecutive_failures("SE4") == 0);
}

TEST_CASE("Out-of-order samples are dropped", "[poller]") {
    PollerRig rig;
    const auto now = std::chrono::system_clock::now();
    rig.feed.push_price("SE3", 0.70, now);
    rig.feed.push_price("SE3", 0.10, now - 1h);

    rig.poller.poll_zone("SE3");
    rig.poller.poll_zone("SE3");
    REQUIRE(rig.cache.get("SE3")->value == 0.70);
    REQUIRE(rig.log->contains("Ignoring out-of-order price sample for SE3"));
}

TEST_CASE("Cancelled fetch is not a failure", "[poller]") {
    PollerRig rig;
    rig.feed.push_failure("SE3", FeedError::Cancelled);
    REQUIRE(rig.poller.poll_zone("SE3") == 0s);
    REQUIRE(rig.poller.consecutive_failures("SE3") == 0);
}

TEST_CASE("Poll loops start, follow zone changes and stop promptly", "[poller][threads]") {
    PollerRig rig;
    rig.feed.set_repeat_last(true);
    rig.feed.push_price("SE3", 0.30);
    rig.feed.push_price("SE2", 0.20);

    rig.poller.set_zones({"SE3"});
    rig.poller.start();
    REQUIRE(rig.poller.is_running());
    REQUIRE(rig.log->wait_for("Price SE3: 0.300"));
    REQUIRE_FALSE(rig.cache.get("SE2").has_value());

    rig.poller.set_zones({"SE3", "SE2"});
    REQUIRE(rig.log->wait_for("Price SE2: 0.200"));

    // Loops sleep for the 60 s interval; stop must not wait for it
    const auto before = std::chrono::steady_clock::now();
    rig.poller.stop();
    REQUIRE(std::chrono::steady_clock::now() - before < 5s);
    REQUIRE_FALSE(rig.poller.is_running());
    REQUIRE(rig.feed.cancel_count() == 1);

    const int fetches = rig.feed.fetch_count();
    std::this_thread::sleep_for(50ms);
    REQUIRE(rig.feed.fetch_count() == fetches);
}
