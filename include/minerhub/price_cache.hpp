#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace minerhub {

struct PriceSample {
    std::string zone;
    double value = 0.0;                                   // SEK per kWh
    std::chrono::system_clock::time_point observed_at;
    bool stale = false;
};

// Latest known price per zone. Any number of readers; samples are immutable
// and swapped in whole, so a reader never sees a half-written sample.
class PriceCache {
public:
    using Listener = std::function<void(const PriceSample&)>;

    std::optional<PriceSample> get(const std::string& zone) const;

    // Rejects a sample older than the one already cached
    bool put(const std::string& zone, PriceSample sample);

    // Returns false when the zone has no sample yet or is already stale
    bool mark_stale(const std::string& zone);

    std::vector<std::string> zones() const;

    // Called after every accepted put and every stale transition
    void set_listener(Listener listener);

private:
    void notify(const PriceSample& sample) const;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<const PriceSample>> samples_;

    mutable std::mutex listener_mutex_;
    Listener listener_;
};

} // namespace minerhub
