// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "bulkingest/worker_pool.hpp"
#include "bulkingest/ingest_errors.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <thread>

namespace bulkingest::ingest {

WorkerPool::WorkerPool(size_t workers)
    : workers_(workers) {
    if (workers_ == 0) {
        throw ConfigurationError("Worker count must be at least 1");
    }
}

std::vector<SendResult> WorkerPool::run(const std::vector<Chunk>& chunks, const ChunkTask& task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pending_.clear();
        for (size_t i = 0; i < chunks.size(); ++i) {
            pending_.push_back(i);
        }
    }
    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        results_.clear();
        results_.reserve(chunks.size());
    }

    size_t thread_count = std::min(workers_, chunks.size());
    VLOG(1) << "Dispatching " << chunks.size() << " chunks on " << thread_count << " workers";

    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        try {
            threads.push_back(spawn([this, i, &chunks, &task]() { worker_loop(i, chunks, task); }));
        } catch (const std::exception& e) {
            if (threads.empty()) {
                LOG(ERROR) << "Failed to start any worker: " << e.what();
                throw;
            }
            LOG(WARNING) << "Started " << threads.size() << " of " << thread_count
                         << " workers: " << e.what();
            break;
        }
    }

    for (auto& thread : threads) {
        thread.join();
    }

    std::lock_guard<std::mutex> lock(results_mutex_);
    return std::move(results_);
}

std::thread WorkerPool::spawn(std::function<void()> body) {
    return std::thread(std::move(body));
}

void WorkerPool::worker_loop(size_t worker_id, const std::vector<Chunk>& chunks,
                             const ChunkTask& task) {
    size_t processed = 0;

    while (true) {
        size_t index;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (pending_.empty()) {
                break;
            }
            index = pending_.front();
            pending_.pop_front();
        }

        const Chunk& chunk = chunks[index];
        SendResult result;
        try {
            result = task(chunk);
        } catch (const std::exception& e) {
            LOG(ERROR) << "Worker " << worker_id << ": chunk " << chunk.sequence
                       << " task failed: " << e.what();
            result = SendResult{};
            result.sequence = chunk.sequence;
            result.rows = chunk.size();
            result.status = SendStatus::TRANSPORT_ERROR;
            result.error = e.what();
        } catch (...) {
            LOG(ERROR) << "Worker " << worker_id << ": chunk " << chunk.sequence
                       << " task failed with a non-standard exception";
            result = SendResult{};
            result.sequence = chunk.sequence;
            result.rows = chunk.size();
            result.status = SendStatus::TRANSPORT_ERROR;
            result.error = "unknown error";
        }

        {
            std::lock_guard<std::mutex> lock(results_mutex_);
            results_.push_back(std::move(result));
        }
        processed++;
    }

    VLOG(1) << "Worker " << worker_id << " drained queue after " << processed << " chunks";
}

}  // namespace bulkingest::ingest
