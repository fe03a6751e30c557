// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file http_transport_test.cpp
/// @brief HTTP transport tests against a loopback server

#include "bulkingest/http_ingest_transport.hpp"
#include "http_test_server.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

namespace bulkingest {
namespace {

// =============================================================================
// URL parsing
// =============================================================================

TEST(ParseHttpUrlTest, HostPortAndPath) {
    auto url = parse_http_url("http://127.0.0.1:9000/write");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "127.0.0.1");
    EXPECT_EQ(url->port, "9000");
    EXPECT_EQ(url->target, "/write");
    EXPECT_EQ(url->host_header, "127.0.0.1:9000");
}

TEST(ParseHttpUrlTest, QueryIsPartOfTarget) {
    auto url = parse_http_url("http://db.local:8181/api/v3/write_lp?db=sensors&precision=auto");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "db.local");
    EXPECT_EQ(url->port, "8181");
    EXPECT_EQ(url->target, "/api/v3/write_lp?db=sensors&precision=auto");
}

TEST(ParseHttpUrlTest, DefaultPortAndRootTarget) {
    auto url = parse_http_url("HTTP://example.com");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "example.com");
    EXPECT_EQ(url->port, "80");
    EXPECT_EQ(url->target, "/");
}

TEST(ParseHttpUrlTest, Ipv6Literal) {
    auto url = parse_http_url("http://[::1]:9000/write");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "::1");
    EXPECT_EQ(url->port, "9000");
    EXPECT_EQ(url->host_header, "[::1]:9000");
}

TEST(ParseHttpUrlTest, HttpsDefaultsToPort443) {
    auto url = parse_http_url("HTTPS://db.example.com/write");
    ASSERT_TRUE(url.has_value());
    EXPECT_TRUE(url->tls);
    EXPECT_EQ(url->host, "db.example.com");
    EXPECT_EQ(url->port, "443");
    EXPECT_EQ(url->target, "/write");
}

TEST(ParseHttpUrlTest, HttpsExplicitPort) {
    auto url = parse_http_url("https://127.0.0.1:9000/api/v3/write_lp?db=sensors");
    ASSERT_TRUE(url.has_value());
    EXPECT_TRUE(url->tls);
    EXPECT_EQ(url->port, "9000");
    EXPECT_EQ(url->target, "/api/v3/write_lp?db=sensors");
    EXPECT_FALSE(parse_http_url("http://127.0.0.1:9000/write")->tls);
}

TEST(ParseHttpUrlTest, RejectsUnsupported) {
    EXPECT_FALSE(parse_http_url("ftp://example.com/write").has_value());
    EXPECT_FALSE(parse_http_url("httpx://example.com/write").has_value());
    EXPECT_FALSE(parse_http_url("https://").has_value());
    EXPECT_FALSE(parse_http_url("example.com:9000/write").has_value());
    EXPECT_FALSE(parse_http_url("http://").has_value());
    EXPECT_FALSE(parse_http_url("http://:9000/write").has_value());
    EXPECT_FALSE(parse_http_url("http://host:port/write").has_value());
    EXPECT_FALSE(parse_http_url("http://host:70000/write").has_value());
    EXPECT_FALSE(parse_http_url("http://user:pw@host/write").has_value());
}

// =============================================================================
// HttpIngestTransport
// =============================================================================

class HttpIngestTransportTest : public ::testing::Test {
protected:
    void SetUp() override { server_.start(); }
    void TearDown() override { server_.stop(); }

    test::LoopbackHttpServer server_;
};

TEST_F(HttpIngestTransportTest, PostsBodyAndReturnsStatus) {
    HttpIngestTransport transport;

    auto response = transport.post(server_.base_url() + "/write", "cpu value=1\ncpu value=2\n");

    EXPECT_EQ(response.status_code, 204);
    EXPECT_TRUE(response.ok());

    auto requests = server_.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "POST");
    EXPECT_EQ(requests[0].target, "/write");
    EXPECT_EQ(requests[0].content_type, "text/plain; charset=utf-8");
    EXPECT_EQ(requests[0].body, "cpu value=1\ncpu value=2\n");

    auto stats = transport.stats();
    EXPECT_EQ(stats.requests_sent, 1u);
    EXPECT_EQ(stats.requests_failed, 0u);
    EXPECT_EQ(stats.bytes_sent, 24u);
    EXPECT_GT(stats.last_send_timestamp_ns, 0);
}

TEST_F(HttpIngestTransportTest, ErrorStatusIsAResponseNotAnException) {
    server_.set_response(400, "invalid field format");
    HttpIngestTransport transport;

    auto response = transport.post(server_.base_url() + "/write", "garbage\n");

    EXPECT_EQ(response.status_code, 400);
    EXPECT_FALSE(response.ok());
    EXPECT_EQ(response.body, "invalid field format");
    EXPECT_EQ(transport.stats().requests_sent, 1u);
}

TEST_F(HttpIngestTransportTest, QueryStringReachesServer) {
    HttpIngestTransport transport;

    transport.post(server_.base_url() + "/api/v3/write_lp?db=sensors&precision=auto", "m v=1\n");

    auto requests = server_.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].target, "/api/v3/write_lp?db=sensors&precision=auto");
}

TEST_F(HttpIngestTransportTest, TimeoutRaisesTransportError) {
    server_.set_delay(std::chrono::milliseconds(500));
    HttpIngestTransportConfig config;
    config.timeout = std::chrono::milliseconds(100);
    HttpIngestTransport transport(config);

    EXPECT_THROW(transport.post(server_.base_url() + "/write", "m v=1\n"), TransportError);
    EXPECT_EQ(transport.stats().requests_failed, 1u);
}

TEST(HttpIngestTransportErrorTest, ConnectionRefusedRaisesTransportError) {
    HttpIngestTransport transport;
    std::string url = "http://127.0.0.1:" +
                      std::to_string(test::LoopbackHttpServer::unused_port()) + "/write";

    EXPECT_THROW(transport.post(url, "m v=1\n"), TransportError);
    EXPECT_EQ(transport.stats().requests_sent, 0u);
    EXPECT_EQ(transport.stats().requests_failed, 1u);
}

TEST_F(HttpIngestTransportTest, HttpsToPlainServerFailsHandshake) {
    HttpIngestTransport transport;
    std::string url = "https://127.0.0.1:" + std::to_string(server_.port()) + "/write";

    try {
        transport.post(url, "m v=1\n");
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("handshake ", 0), 0u) << e.what();
    }
    EXPECT_TRUE(server_.requests().empty());
    EXPECT_EQ(transport.stats().requests_failed, 1u);
}

TEST(HttpIngestTransportErrorTest, UnsupportedUrlRaisesTransportError) {
    HttpIngestTransport transport;

    EXPECT_THROW(transport.post("ftp://127.0.0.1/write", "m v=1\n"), TransportError);
    EXPECT_EQ(transport.stats().requests_failed, 1u);
}

TEST(HttpIngestTransportErrorTest, UnresolvableHostFailsAtResolve) {
    HttpIngestTransportConfig config;
    config.timeout = std::chrono::milliseconds(200);
    HttpIngestTransport transport(config);

    try {
        transport.post("http://bulk-ingest.invalid:9000/write", "m v=1\n");
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("resolve ", 0), 0u) << e.what();
    }
    EXPECT_EQ(transport.stats().requests_failed, 1u);
}

TEST(HttpIngestTransportErrorTest, MissingCaFileRejectedAtConstruction) {
    HttpIngestTransportConfig config;
    config.ca_file = "/nonexistent/ca.pem";

    EXPECT_THROW(HttpIngestTransport transport(config), TransportError);
}

TEST(HttpIngestTransportErrorTest, CaFileIgnoredWithoutVerification) {
    HttpIngestTransportConfig config;
    config.verify_peer = false;
    config.ca_file = "/nonexistent/ca.pem";

    EXPECT_NO_THROW(HttpIngestTransport transport(config));
}

}  // namespace
}  // namespace bulkingest
