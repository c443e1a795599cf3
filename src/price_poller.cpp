#include "minerhub/price_poller.hpp"
#include <iomanip>
#include <sstream>

namespace minerhub {

PricePoller::PricePoller(PriceFeed& feed, PriceCache& cache, const PollingConfig& config,
                         std::shared_ptr<LogSink> log)
    : feed_(feed)
    , cache_(cache)
    , log_(std::move(log))
    , config_(config)
{
}

PricePoller::~PricePoller() {
    stop();
}

void PricePoller::update_config(const PollingConfig& config) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = config;
    }
    wake_.notify_all();
}

void PricePoller::set_zones(const std::set<std::string>& zones) {
    std::unique_lock<std::mutex> lock(mutex_);
    std::set<std::string> removed;
    for (const auto& zone : zones_) {
        if (zones.count(zone) == 0) removed.insert(zone);
    }
    std::set<std::string> added;
    for (const auto& zone : zones) {
        if (zones_.count(zone) == 0) added.insert(zone);
    }
    zones_ = zones;

    if (!running_) {
        return;
    }
    for (const auto& zone : removed) {
        stop_loop_locked(lock, zone);
    }
    for (const auto& zone : added) {
        start_loop(zone);
    }
}

void PricePoller::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    for (const auto& zone : zones_) {
        start_loop(zone);
    }
}

void PricePoller::stop() {
    std::map<std::string, std::unique_ptr<ZoneLoop>> loops;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        for (auto& entry : loops_) {
            entry.second->stop_requested = true;
        }
        loops.swap(loops_);
    }
    wake_.notify_all();
    feed_.cancel();

    for (auto& entry : loops) {
        if (entry.second->thread.joinable()) {
            entry.second->thread.join();
        }
    }
}

// Caller holds mutex_
void PricePoller::start_loop(const std::string& zone) {
    auto loop = std::make_unique<ZoneLoop>();
    loop->thread = std::thread(&PricePoller::zone_loop, this, zone);
    loops_[zone] = std::move(loop);
}

void PricePoller::stop_loop_locked(std::unique_lock<std::mutex>& lock, const std::string& zone) {
    auto it = loops_.find(zone);
    if (it == loops_.end()) {
        return;
    }
    std::unique_ptr<ZoneLoop> loop = std::move(it->second);
    loops_.erase(it);
    loop->stop_requested = true;

    lock.unlock();
    wake_.notify_all();
    if (loop->thread.joinable()) {
        loop->thread.join();
    }
    lock.lock();
}

std::chrono::seconds PricePoller::backoff_for(int failures) const {
    long long delay = config_.backoff_initial_seconds;
    for (int i = 1; i < failures && delay < config_.backoff_max_seconds; ++i) {
        delay *= 2;
    }
    if (delay > config_.backoff_max_seconds) {
        delay = config_.backoff_max_seconds;
    }
    return std::chrono::seconds(delay);
}

int PricePoller::consecutive_failures(const std::string& zone) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(zone);
    return it == states_.end() ? 0 : it->second.consecutive_failures;
}

std::chrono::seconds PricePoller::poll_zone(const std::string& zone) {
    FetchResult result = feed_.fetch(zone);

    std::unique_lock<std::mutex> lock(mutex_);
    auto& state = states_[zone];

    if (result.error == FeedError::Cancelled) {
        return std::chrono::seconds(0);
    }

    if (result.ok()) {
        const bool recovered = state.consecutive_failures > 0;
        state.consecutive_failures = 0;
        const std::chrono::seconds interval(config_.interval_seconds);
        lock.unlock();

        PriceSample sample;
        sample.zone = zone;
        sample.value = result.quote->value;
        sample.observed_at = result.quote->observed_at;
        sample.stale = false;

        if (!cache_.put(zone, sample)) {
            log_->write(make_log_line("", LogLevel::Warning,
                "Ignoring out-of-order price sample for " + zone));
            return interval;
        }

        std::ostringstream oss;
        oss << "Price " << zone << ": " << std::fixed << std::setprecision(3)
            << sample.value << " SEK/kWh";
        if (recovered) {
            oss << " (feed recovered)";
        }
        log_->write(make_log_line("", LogLevel::Info, oss.str()));
        return interval;
    }

    const int failures = ++state.consecutive_failures;
    const std::chrono::seconds delay = backoff_for(failures);
    const bool exhausted = failures >= config_.max_consecutive_failures;
    const int limit = config_.max_consecutive_failures;
    lock.unlock();

    std::ostringstream oss;
    oss << "Price fetch for " << zone << " failed (" << failures << " in a row): "
        << to_string(result.error);
    if (!result.message.empty()) {
        oss << ": " << result.message;
    }
    oss << "; retrying in " << delay.count() << "s";
    log_->write(make_log_line("", LogLevel::Warning, oss.str()));

    if (exhausted && cache_.mark_stale(zone)) {
        log_->write(make_log_line("", LogLevel::Error,
            "Price for " + zone + " is stale after " + std::to_string(limit) + " consecutive failures"));
    }
    return delay;
}

void PricePoller::zone_loop(const std::string& zone) {
    ZoneLoop* self = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = loops_.find(zone);
        if (it == loops_.end()) {
            return;
        }
        self = it->second.get();
    }

    DebugLogger::log("poller: loop started for ", zone);
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (self->stop_requested || !running_) break;
        }

        const auto delay = poll_zone(zone);

        std::unique_lock<std::mutex> lock(mutex_);
        if (wake_.wait_for(lock, delay, [&] { return self->stop_requested || !running_; })) {
            break;
        }
    }
    DebugLogger::log("poller: loop stopped for ", zone);
}

} // namespace minerhub
