#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace minerhub {

struct PriceQuote {
    double value = 0.0;                                   // SEK per kWh
    std::chrono::system_clock::time_point observed_at;
};

enum class FeedError {
    None,
    Network,
    Timeout,
    HttpStatus,
    RateLimited,
    Malformed,
    NoCurrentPrice,
    Cancelled
};

const char* to_string(FeedError error);

struct FetchResult {
    std::optional<PriceQuote> quote;
    FeedError error = FeedError::None;
    std::string message;

    bool ok() const { return quote.has_value(); }

    static FetchResult success(const PriceQuote& quote);
    static FetchResult failure(FeedError error, const std::string& message);
};

// Source of the current price for a zone. No retries: the poller owns that.
class PriceFeed {
public:
    virtual ~PriceFeed() = default;

    virtual FetchResult fetch(const std::string& zone) = 0;

    // Aborts an in-flight fetch from another thread; used on shutdown
    virtual void cancel() = 0;
};

// Finds the entry covering `now` in an elprisetjustnu.se price document:
// [{"SEK_per_kWh": 0.25, "EUR_per_kWh": 0.02, "EXR": 11.4,
//   "time_start": "2024-05-01T00:00:00+02:00", "time_end": "..."}, ...]
FetchResult parse_price_document(const std::string& body,
                                 std::chrono::system_clock::time_point now);

// Parses "YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM)"
std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& text);

// "/api/v1/prices/2024/05-01_SE3.json" for the local date of `now`
std::string price_document_path(const std::string& zone,
                                std::chrono::system_clock::time_point now);

struct ElprisFeedOptions {
    std::string host = "www.elprisetjustnu.se";
    std::string port = "443";
    std::chrono::seconds timeout{10};
};

// HTTPS client for elprisetjustnu.se (Boost.Beast over Asio SSL).
// One request per fetch, bounded by options.timeout. Safe to call from
// several poll loops at once.
class ElprisPriceFeed : public PriceFeed {
public:
    explicit ElprisPriceFeed(ElprisFeedOptions options = {});
    ~ElprisPriceFeed() override;

    FetchResult fetch(const std::string& zone) override;
    void cancel() override;

private:
    struct ActiveRequest;

    ElprisFeedOptions options_;
    std::mutex mutex_;
    std::vector<std::shared_ptr<ActiveRequest>> active_;
};

} // namespace minerhub
