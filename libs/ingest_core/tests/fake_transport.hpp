// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file fake_transport.hpp
 * @brief In-memory IngestTransport recording every request
 */

#pragma once

#include "bulkingest/ingest_transport.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace bulkingest::test {

struct PostedRequest {
    std::string url;
    std::string body;
};

/// Thread-safe fake. By default every request succeeds with HTTP 204.
/// A responder may return a different response or throw.
class FakeTransport : public IngestTransport {
public:
    using Responder = std::function<TransportResponse(const std::string& body)>;

    void set_responder(Responder responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    void set_delay(std::chrono::milliseconds delay) { delay_ms_ = delay.count(); }

    TransportResponse post(const std::string& url, const std::string& body) override {
        int now = ++in_flight_;
        int seen = max_in_flight_.load();
        while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
        }

        if (delay_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_.load()));
        }

        Responder responder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back({url, body});
            responder = responder_;
        }

        try {
            TransportResponse response = responder ? responder(body) : TransportResponse{204, ""};
            --in_flight_;
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.requests_sent++;
            stats_.bytes_sent += body.size();
            return response;
        } catch (...) {
            --in_flight_;
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.requests_failed++;
            throw;
        }
    }

    TransportStats stats() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    std::string name() const override { return "fake"; }

    std::vector<PostedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    int max_in_flight() const { return max_in_flight_.load(); }

private:
    mutable std::mutex mutex_;
    Responder responder_;
    std::vector<PostedRequest> requests_;
    TransportStats stats_;
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};
    std::atomic<long long> delay_ms_{0};
};

}  // namespace bulkingest::test
