#include "minerhub/price_feed.hpp"
#include "minerhub/log_sink.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <algorithm>
#include <atomic>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace minerhub {

struct ElprisPriceFeed::ActiveRequest {
    net::io_context ioc;
    std::atomic<bool> cancelled{false};
};

ElprisPriceFeed::ElprisPriceFeed(ElprisFeedOptions options)
    : options_(std::move(options))
{
}

ElprisPriceFeed::~ElprisPriceFeed() {
    cancel();
}

void ElprisPriceFeed::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& request : active_) {
        request->cancelled = true;
        request->ioc.stop();
    }
}

FetchResult ElprisPriceFeed::fetch(const std::string& zone) {
    const auto now = std::chrono::system_clock::now();
    const std::string target = price_document_path(zone, now);
    const std::string& host = options_.host;

    auto request = std::make_shared<ActiveRequest>();

    ssl::context ctx{ssl::context::tlsv12_client};
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver{request->ioc};
    beast::ssl_stream<beast::tcp_stream> stream{request->ioc, ctx};

    // SNI
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        return FetchResult::failure(FeedError::Network, "SSL_set_tlsext_host_name: " + ec.message());
    }
    stream.set_verify_callback(ssl::host_name_verification(host));

    http::request<http::string_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "minerhub/1.0");
    req.set(http::field::accept, "application/json");

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::error_code failure_ec;
    std::string failed_step;
    bool done = false;

    auto fail = [&](beast::error_code ec, const char* step) {
        failure_ec = ec;
        failed_step = step;
        done = true;
    };

    DebugLogger::log("feed: GET https://", host, target);

    resolver.async_resolve(host, options_.port,
        [&](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) return fail(ec, "resolve");
            beast::get_lowest_layer(stream).async_connect(results,
                [&](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                    if (ec) return fail(ec, "connect");
                    stream.async_handshake(ssl::stream_base::client,
                        [&](beast::error_code ec) {
                            if (ec) return fail(ec, "handshake");
                            http::async_write(stream, req,
                                [&](beast::error_code ec, std::size_t) {
                                    if (ec) return fail(ec, "write");
                                    http::async_read(stream, buffer, res,
                                        [&](beast::error_code ec, std::size_t) {
                                            if (ec) return fail(ec, "read");
                                            done = true;
                                        });
                                });
                        });
                });
        });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.push_back(request);
    }
    request->ioc.run_for(options_.timeout);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(std::remove(active_.begin(), active_.end(), request), active_.end());
    }

    if (request->cancelled) {
        return FetchResult::failure(FeedError::Cancelled, "request cancelled");
    }
    if (!done) {
        return FetchResult::failure(FeedError::Timeout,
            "no response from " + host + " within " + std::to_string(options_.timeout.count()) + "s");
    }
    if (failure_ec) {
        return FetchResult::failure(FeedError::Network, failed_step + ": " + failure_ec.message());
    }
    if (res.result() == http::status::too_many_requests) {
        return FetchResult::failure(FeedError::RateLimited, "HTTP 429 from " + host);
    }
    if (res.result() != http::status::ok) {
        return FetchResult::failure(FeedError::HttpStatus,
            "HTTP " + std::to_string(res.result_int()) + " for " + target);
    }

    return parse_price_document(res.body(), now);
}

} // namespace minerhub
