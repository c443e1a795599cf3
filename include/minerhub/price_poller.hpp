#pragma once

#include "minerhub/config_manager.hpp"
#include "minerhub/log_sink.hpp"
#include "minerhub/price_cache.hpp"
#include "minerhub/price_feed.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace minerhub {

// Keeps the cache fresh for every zone in use. One loop (thread) per zone;
// a failing zone backs off on its own without delaying the others.
class PricePoller {
public:
    PricePoller(PriceFeed& feed, PriceCache& cache, const PollingConfig& config,
                std::shared_ptr<LogSink> log);
    ~PricePoller();

    PricePoller(const PricePoller&) = delete;
    PricePoller& operator=(const PricePoller&) = delete;

    // Starts or stops zone loops so exactly `zones` are polled
    void set_zones(const std::set<std::string>& zones);

    void start();
    void stop();
    bool is_running() const { return running_; }

    void update_config(const PollingConfig& config);

    // One fetch attempt for `zone`; returns the delay before the next attempt
    std::chrono::seconds poll_zone(const std::string& zone);

    int consecutive_failures(const std::string& zone) const;

private:
    struct ZoneState {
        int consecutive_failures = 0;
    };

    struct ZoneLoop {
        std::thread thread;
        bool stop_requested = false;
    };

    std::chrono::seconds backoff_for(int failures) const;
    void zone_loop(const std::string& zone);
    void start_loop(const std::string& zone);
    void stop_loop_locked(std::unique_lock<std::mutex>& lock, const std::string& zone);

    PriceFeed& feed_;
    PriceCache& cache_;
    std::shared_ptr<LogSink> log_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    PollingConfig config_;
    std::set<std::string> zones_;
    std::map<std::string, ZoneState> states_;
    std::map<std::string, std::unique_ptr<ZoneLoop>> loops_;
    std::atomic<bool> running_{false};
};

} // namespace minerhub
