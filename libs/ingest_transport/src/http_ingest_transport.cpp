// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "bulkingest/http_ingest_transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <glog/logging.h>

#include <algorithm>
#include <cctype>
#include <type_traits>

namespace bulkingest {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

template <class Stream>
struct is_tls_stream : std::false_type {};

template <class NextLayer>
struct is_tls_stream<beast::ssl_stream<NextLayer>> : std::true_type {};

bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

/// Run resolve, connect, [handshake,] write and read on `ioc` until done.
/// Every stage shares one deadline. `stage` names the step that failed.
template <class Stream>
beast::error_code exchange(net::io_context& ioc, Stream& stream, const HttpUrl& url,
                           Request& req, Response& res, std::chrono::milliseconds timeout,
                           const char*& stage) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    tcp::resolver resolver(ioc);
    net::steady_timer resolve_timer(ioc);
    beast::flat_buffer buffer;
    beast::error_code ec;
    bool resolve_timed_out = false;

    auto read_response = [&]() {
        stage = "read";
        http::async_read(stream, buffer, res, [&](beast::error_code read_ec, std::size_t) {
            ec = read_ec;
            if constexpr (is_tls_stream<Stream>::value) {
                if (!ec) {
                    stream.async_shutdown([](beast::error_code shutdown_ec) {
                        // Servers commonly close without close_notify
                        if (shutdown_ec) {
                            VLOG(2) << "TLS shutdown: " << shutdown_ec.message();
                        }
                    });
                }
            }
        });
    };

    auto write_request = [&]() {
        stage = "write";
        http::async_write(stream, req, [&](beast::error_code write_ec, std::size_t) {
            if (write_ec) {
                ec = write_ec;
                return;
            }
            read_response();
        });
    };

    auto on_connected = [&]() {
        if constexpr (is_tls_stream<Stream>::value) {
            stage = "handshake";
            stream.async_handshake(ssl::stream_base::client, [&](beast::error_code handshake_ec) {
                if (handshake_ec) {
                    ec = handshake_ec;
                    return;
                }
                write_request();
            });
        } else {
            write_request();
        }
    };

    // The stream deadline does not cover name resolution
    resolve_timer.expires_at(deadline);
    resolve_timer.async_wait([&](beast::error_code timer_ec) {
        if (!timer_ec) {
            resolve_timed_out = true;
            resolver.cancel();
        }
    });

    resolver.async_resolve(
        url.host, url.port,
        [&](beast::error_code resolve_ec, tcp::resolver::results_type results) {
            resolve_timer.cancel();
            if (resolve_ec) {
                ec = resolve_timed_out ? beast::error_code(beast::error::timeout) : resolve_ec;
                return;
            }
            stage = "connect";
            auto& lowest = beast::get_lowest_layer(stream);
            lowest.expires_at(deadline);
            lowest.async_connect(results, [&](beast::error_code connect_ec, tcp::endpoint) {
                if (connect_ec) {
                    ec = connect_ec;
                    return;
                }
                on_connected();
            });
        });

    ioc.run();

    if constexpr (!is_tls_stream<Stream>::value) {
        if (!ec) {
            beast::error_code shutdown_ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
            // not_connected is expected when the server closed first
            if (shutdown_ec && shutdown_ec != beast::errc::not_connected) {
                VLOG(2) << "Socket shutdown: " << shutdown_ec.message();
            }
        }
    }

    return ec;
}

}  // namespace

std::optional<HttpUrl> parse_http_url(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }

    std::string scheme = url.substr(0, scheme_end);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    HttpUrl result;
    if (scheme == "https") {
        result.tls = true;
    } else if (scheme != "http") {
        return std::nullopt;
    }

    std::string rest = url.substr(scheme_end + 3);
    size_t target_pos = rest.find_first_of("/?");
    std::string authority = rest.substr(0, target_pos);

    if (target_pos == std::string::npos) {
        result.target = "/";
    } else if (rest[target_pos] == '?') {
        result.target = "/" + rest.substr(target_pos);
    } else {
        result.target = rest.substr(target_pos);
    }

    if (authority.empty() || authority.find('@') != std::string::npos) {
        return std::nullopt;
    }

    std::string port;
    if (authority.front() == '[') {
        // IPv6 literal: [addr] or [addr]:port
        size_t close = authority.find(']');
        if (close == std::string::npos || close == 1) {
            return std::nullopt;
        }
        result.host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                return std::nullopt;
            }
            port = tail.substr(1);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon == std::string::npos) {
            result.host = authority;
        } else {
            result.host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
    }

    if (result.host.empty()) {
        return std::nullopt;
    }
    if (port.empty()) {
        port = result.tls ? "443" : "80";
    } else if (!all_digits(port) || port.size() > 5 || std::stoul(port) > 65535) {
        return std::nullopt;
    }

    result.port = port;
    result.host_header = authority;
    return result;
}

HttpIngestTransport::HttpIngestTransport(const HttpIngestTransportConfig& config)
    : config_(config), ssl_ctx_(ssl::context::tls_client) {
    beast::error_code ec;
    if (config_.verify_peer) {
        ssl_ctx_.set_verify_mode(ssl::verify_peer, ec);
        if (!ec) {
            if (config_.ca_file.empty()) {
                ssl_ctx_.set_default_verify_paths(ec);
            } else {
                ssl_ctx_.load_verify_file(config_.ca_file, ec);
            }
        }
    } else {
        LOG(WARNING) << "TLS certificate verification disabled";
        ssl_ctx_.set_verify_mode(ssl::verify_none, ec);
    }

    if (ec) {
        throw TransportError("TLS setup failed" +
                             (config_.ca_file.empty() ? "" : " (" + config_.ca_file + ")") +
                             ": " + ec.message());
    }
}

TransportResponse HttpIngestTransport::post(const std::string& url, const std::string& body) {
    auto parsed = parse_http_url(url);
    if (!parsed) {
        record_failure();
        throw TransportError("Unsupported endpoint URL: " + url);
    }

    Request req{http::verb::post, parsed->target, 11};
    req.set(http::field::host, parsed->host_header);
    req.set(http::field::user_agent, config_.user_agent);
    req.set(http::field::content_type, config_.content_type);
    req.set(http::field::connection, "close");
    req.body() = body;
    req.prepare_payload();

    net::io_context ioc;
    Response res;
    beast::error_code ec;
    const char* stage = "resolve";

    if (parsed->tls) {
        beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), parsed->host.c_str())) {
            record_failure();
            throw TransportError("Failed to set TLS server name " + parsed->host);
        }
        if (config_.verify_peer) {
            stream.set_verify_callback(ssl::host_name_verification(parsed->host));
        }
        ec = exchange(ioc, stream, *parsed, req, res, config_.timeout, stage);
    } else {
        beast::tcp_stream stream(ioc);
        ec = exchange(ioc, stream, *parsed, req, res, config_.timeout, stage);
    }

    if (ec) {
        record_failure();
        throw TransportError(std::string(stage) + " " + parsed->host + ":" + parsed->port +
                             " failed: " + ec.message());
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.requests_sent++;
        stats_.bytes_sent += body.size();
        stats_.last_send_timestamp_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    VLOG(2) << "POST " << (parsed->tls ? "https " : "") << parsed->target << " ("
            << body.size() << " bytes) -> " << res.result_int();

    TransportResponse response;
    response.status_code = static_cast<int>(res.result_int());
    response.body = std::move(res.body());
    return response;
}

TransportStats HttpIngestTransport::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void HttpIngestTransport::record_failure() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.requests_failed++;
}

}  // namespace bulkingest
