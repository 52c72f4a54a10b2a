/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include "config.h"

namespace chunklog {
namespace storage {

// Checkpoint: durability boundary of the log.
//
// A checkpoint holds two positions: the last written (tentative) position
// and the last flushed (durable) one. Readers only ever trust read().
//
// CONCURRENCY CONTRACT:
// - write(), read() and read_non_flushed() are lock-free and never block
// - flush() publishes the tentative value and wakes every waiter
// - wait_for_flush() may miss a flush that happened before it was entered;
//   callers must re-check read() after it returns, whatever it returned
class Checkpoint {
public:
    virtual ~Checkpoint() = default;

    virtual const std::string& name() const = 0;

    // Set the tentative position (last writer wins)
    virtual void write(int64_t checkpoint) = 0;

    // Durable position, upper bound for readers
    virtual int64_t read() const = 0;

    // Tentative position, bookkeeping only
    virtual int64_t read_non_flushed() const = 0;

    virtual void flush() = 0;

    // Returns true if woken by a flush, false on timeout
    virtual bool wait_for_flush(std::chrono::milliseconds timeout) = 0;

    // Persisted variants sync to stable storage here
    virtual void close() = 0;
};

class InMemoryCheckpoint final : public Checkpoint {
public:
    InMemoryCheckpoint();
    explicit InMemoryCheckpoint(int64_t initial_value);
    explicit InMemoryCheckpoint(const std::string& name,
                                int64_t initial_value = checkpoint::kDefaultInitialValue);

    InMemoryCheckpoint(const InMemoryCheckpoint&) = delete;
    InMemoryCheckpoint& operator=(const InMemoryCheckpoint&) = delete;

    const std::string& name() const override { return name_; }

    void write(int64_t checkpoint) override {
        last_.store(checkpoint, std::memory_order_release);
    }

    int64_t read() const override {
        return last_flushed_.load(std::memory_order_acquire);
    }

    int64_t read_non_flushed() const override {
        return last_.load(std::memory_order_acquire);
    }

    void flush() override;
    bool wait_for_flush(std::chrono::milliseconds timeout) override;
    void close() override {}

    // Number of flushes that actually published a new value
    uint64_t flush_count() const {
        return flush_generation_.load(std::memory_order_relaxed);
    }

private:
    static std::string generate_name();

    const std::string name_;
    std::atomic<int64_t> last_;
    std::atomic<int64_t> last_flushed_;

    std::mutex flush_mu_;
    std::condition_variable flush_cv_;
    std::atomic<uint64_t> flush_generation_{0};  // Bumped under flush_mu_
};

} // namespace storage
} // namespace chunklog
