// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file worker_pool.hpp
/// @brief Bounded-concurrency dispatch of chunk sends
///
/// WorkerPool runs a task over every chunk with at most `workers` tasks
/// in flight. Workers pull the next pending chunk from a shared queue,
/// so slow requests do not hold back the rest. run() returns only after
/// every worker has drained the queue and been joined.

#include "bulkingest/chunk_sender.hpp"
#include "bulkingest/chunker.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace bulkingest::ingest {

/// Work executed for each chunk
using ChunkTask = std::function<SendResult(const Chunk&)>;

class WorkerPool {
public:
    /// @throws ConfigurationError if workers == 0
    explicit WorkerPool(size_t workers);
    virtual ~WorkerPool() = default;

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Execute task once per chunk
    /// If only some worker threads can be started, the chunks are shared
    /// among those that did start.
    /// @return One result per chunk, in completion order. A task that
    ///         throws yields a TRANSPORT_ERROR result for its chunk.
    /// @throws std::system_error if no worker thread can be started
    std::vector<SendResult> run(const std::vector<Chunk>& chunks, const ChunkTask& task);

    size_t workers() const { return workers_; }

protected:
    /// Start one worker thread
    virtual std::thread spawn(std::function<void()> body);

private:
    void worker_loop(size_t worker_id, const std::vector<Chunk>& chunks, const ChunkTask& task);

    size_t workers_;

    std::mutex queue_mutex_;
    std::deque<size_t> pending_;

    std::mutex results_mutex_;
    std::vector<SendResult> results_;
};

}  // namespace bulkingest::ingest
