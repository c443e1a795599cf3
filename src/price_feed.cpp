#include "minerhub/price_feed.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace minerhub {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
long long days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<long long>(era) * 146097 + static_cast<long long>(doe) - 719468;
}

} // namespace

const char* to_string(FeedError error) {
    switch (error) {
        case FeedError::None:           return "none";
        case FeedError::Network:        return "network error";
        case FeedError::Timeout:        return "timeout";
        case FeedError::HttpStatus:     return "unexpected HTTP status";
        case FeedError::RateLimited:    return "rate limited";
        case FeedError::Malformed:      return "malformed response";
        case FeedError::NoCurrentPrice: return "no price for the current hour";
        case FeedError::Cancelled:      return "cancelled";
    }
    return "unknown";
}

FetchResult FetchResult::success(const PriceQuote& quote) {
    FetchResult result;
    result.quote = quote;
    return result;
}

FetchResult FetchResult::failure(FeedError error, const std::string& message) {
    FetchResult result;
    result.error = error;
    result.message = message;
    return result;
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
    }

    long offset_seconds = 0;
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int offset_hours = 0, offset_minutes = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &offset_hours, &offset_minutes) != 2) {
            return std::nullopt;
        }
        offset_seconds = offset_hours * 3600L + offset_minutes * 60L;
        if (text[pos] == '-') {
            offset_seconds = -offset_seconds;
        }
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    long long seconds = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400LL
                      + hour * 3600LL + minute * 60LL + second - offset_seconds;
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

std::string price_document_path(const std::string& zone,
                                std::chrono::system_clock::time_point now) {
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    localtime_r(&time_t, &tm);

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "/api/v1/prices/%04d/%02d-%02d_",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    return std::string(buffer) + zone + ".json";
}

FetchResult parse_price_document(const std::string& body,
                                 std::chrono::system_clock::time_point now) {
    auto document = nlohmann::json::parse(body, nullptr, false);
    if (document.is_discarded()) {
        return FetchResult::failure(FeedError::Malformed, "response is not valid JSON");
    }
    if (!document.is_array()) {
        return FetchResult::failure(FeedError::Malformed, "expected a JSON array of hourly prices");
    }

    for (const auto& entry : document) {
        if (!entry.is_object()) continue;

        auto price = entry.find("SEK_per_kWh");
        auto start_it = entry.find("time_start");
        auto end_it = entry.find("time_end");
        if (price == entry.end() || start_it == entry.end() || end_it == entry.end()) continue;
        if (!price->is_number() || !start_it->is_string() || !end_it->is_string()) continue;

        auto start = parse_iso8601(start_it->get<std::string>());
        auto end = parse_iso8601(end_it->get<std::string>());
        if (!start || !end) continue;

        if (*start <= now && now < *end) {
            PriceQuote quote;
            quote.value = price->get<double>();
            quote.observed_at = now;
            return FetchResult::success(quote);
        }
    }

    return FetchResult::failure(FeedError::NoCurrentPrice, "no entry covers the current time");
}

} // namespace minerhub
