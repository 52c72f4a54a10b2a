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
#include <cstdint>
#include <string>
#include <functional>
#include <atomic>
#include <mutex>
#include <vector>

namespace chunklog {
namespace storage {

// Metric types
enum class MetricType {
    Counter
};

// Base metric interface
class Metric {
public:
    virtual ~Metric() = default;
    virtual MetricType type() const = 0;
    virtual std::string name() const = 0;
    virtual void reset() = 0;
};

// Counter - monotonically increasing value
class Counter : public Metric {
public:
    explicit Counter(const std::string& name) : name_(name), value_(0) {}

    MetricType type() const override { return MetricType::Counter; }
    std::string name() const override { return name_; }
    void reset() override { value_.store(0); }

    void increment(uint64_t delta = 1) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    uint64_t value() const {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::string name_;
    std::atomic<uint64_t> value_;
};

// Registry of metrics belonging to one log. Does not own the metrics;
// they must outlive the collector or be unregistered first.
class MetricsCollector {
public:
    MetricsCollector() = default;
    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    void register_counter(Counter& counter);
    void unregister_counter(const Counter& counter);

    using ExportFunc = std::function<void(const std::string& name,
                                          MetricType type,
                                          const std::string& value)>;
    void export_metrics(ExportFunc func) const;

    void reset_all();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<Counter*> counters_;
};

// Chunk read accounting for one log. Injected into SequentialReader so that
// independent logs in one process keep separate counts.
class ReadStats {
public:
    ReadStats()
        : cached_reads("chunk_reads_cached"),
          uncached_reads("chunk_reads_uncached"),
          transient_retries("chunk_reads_transient_retries") {}

    void count(bool is_cached) {
        if (is_cached)
            cached_reads.increment();
        else
            uncached_reads.increment();
    }

    uint64_t total() const { return cached_reads.value() + uncached_reads.value(); }

    void register_with(MetricsCollector& collector);
    void unregister_from(MetricsCollector& collector);

    Counter cached_reads;
    Counter uncached_reads;
    Counter transient_retries;
};

} // namespace storage
} // namespace chunklog
