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

#include <gtest/gtest.h>
#include <map>
#include <thread>
#include <vector>
#include "storage/metrics.h"

using namespace chunklog::storage;

class MetricsTest : public ::testing::Test {
protected:
    static std::map<std::string, std::string> snapshot(const MetricsCollector& collector) {
        std::map<std::string, std::string> out;
        collector.export_metrics([&](const std::string& name, MetricType type, const std::string& value) {
            EXPECT_EQ(type, MetricType::Counter);
            out[name] = value;
        });
        return out;
    }
};

TEST_F(MetricsTest, CounterBasics) {
    Counter counter("test_counter");

    EXPECT_EQ(counter.value(), 0u);
    EXPECT_EQ(counter.name(), "test_counter");
    EXPECT_EQ(counter.type(), MetricType::Counter);

    counter.increment();
    EXPECT_EQ(counter.value(), 1u);

    counter.increment(10);
    EXPECT_EQ(counter.value(), 11u);

    counter.reset();
    EXPECT_EQ(counter.value(), 0u);
}

TEST_F(MetricsTest, CounterConcurrentIncrements) {
    Counter counter("concurrent");
    const int num_threads = 8;
    const int per_thread = 10000;

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([&] {
            for (int j = 0; j < per_thread; j++) {
                counter.increment();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(counter.value(), static_cast<uint64_t>(num_threads * per_thread));
}

TEST_F(MetricsTest, CollectorExportAndReset) {
    MetricsCollector collector;
    Counter a("a");
    Counter b("b");
    collector.register_counter(a);
    collector.register_counter(b);
    collector.register_counter(a);  // already registered
    EXPECT_EQ(collector.size(), 2u);

    a.increment(3);
    b.increment(7);
    auto values = snapshot(collector);
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values["a"], "3");
    EXPECT_EQ(values["b"], "7");

    collector.reset_all();
    EXPECT_EQ(a.value(), 0u);
    EXPECT_EQ(b.value(), 0u);

    collector.unregister_counter(a);
    EXPECT_EQ(collector.size(), 1u);
    values = snapshot(collector);
    EXPECT_EQ(values.count("a"), 0u);
    EXPECT_EQ(values.count("b"), 1u);

    // Unknown counters are ignored
    Counter stranger("stranger");
    collector.unregister_counter(stranger);
    EXPECT_EQ(collector.size(), 1u);
}

TEST_F(MetricsTest, ReadStatsCounting) {
    ReadStats stats;
    EXPECT_EQ(stats.cached_reads.name(), "chunk_reads_cached");
    EXPECT_EQ(stats.uncached_reads.name(), "chunk_reads_uncached");
    EXPECT_EQ(stats.transient_retries.name(), "chunk_reads_transient_retries");

    stats.count(true);
    stats.count(true);
    stats.count(false);
    EXPECT_EQ(stats.cached_reads.value(), 2u);
    EXPECT_EQ(stats.uncached_reads.value(), 1u);
    EXPECT_EQ(stats.total(), 3u);
    EXPECT_EQ(stats.transient_retries.value(), 0u);
}

TEST_F(MetricsTest, ReadStatsRegistration) {
    MetricsCollector collector;
    ReadStats stats;
    stats.register_with(collector);
    EXPECT_EQ(collector.size(), 3u);

    stats.count(false);
    stats.transient_retries.increment();
    auto values = snapshot(collector);
    EXPECT_EQ(values["chunk_reads_cached"], "0");
    EXPECT_EQ(values["chunk_reads_uncached"], "1");
    EXPECT_EQ(values["chunk_reads_transient_retries"], "1");

    stats.unregister_from(collector);
    EXPECT_EQ(collector.size(), 0u);
}

TEST_F(MetricsTest, SeparateStatsStayIndependent) {
    ReadStats first;
    ReadStats second;
    first.count(true);
    EXPECT_EQ(first.total(), 1u);
    EXPECT_EQ(second.total(), 0u);
}
