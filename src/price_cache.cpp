#include "minerhub/price_cache.hpp"
#include <mutex>

namespace minerhub {

std::optional<PriceSample> PriceCache::get(const std::string& zone) const {
    std::shared_ptr<const PriceSample> sample;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = samples_.find(zone);
        if (it == samples_.end()) {
            return std::nullopt;
        }
        sample = it->second;
    }
    return *sample;
}

bool PriceCache::put(const std::string& zone, PriceSample sample) {
    sample.zone = zone;
    auto replacement = std::make_shared<const PriceSample>(std::move(sample));
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = samples_.find(zone);
        if (it != samples_.end() && replacement->observed_at < it->second->observed_at) {
            return false;
        }
        samples_[zone] = replacement;
    }
    notify(*replacement);
    return true;
}

bool PriceCache::mark_stale(const std::string& zone) {
    std::shared_ptr<const PriceSample> replacement;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = samples_.find(zone);
        if (it == samples_.end() || it->second->stale) {
            return false;
        }
        PriceSample copy = *it->second;
        copy.stale = true;
        replacement = std::make_shared<const PriceSample>(std::move(copy));
        it->second = replacement;
    }
    notify(*replacement);
    return true;
}

std::vector<std::string> PriceCache::zones() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& entry : samples_) {
        result.push_back(entry.first);
    }
    return result;
}

void PriceCache::set_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void PriceCache::notify(const PriceSample& sample) const {
    Listener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(sample);
    }
}

} // namespace minerhub
