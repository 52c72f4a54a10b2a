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

#include "metrics.h"
#include <algorithm>

namespace chunklog {
namespace storage {

void MetricsCollector::register_counter(Counter& counter) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(counters_.begin(), counters_.end(), &counter) == counters_.end()) {
        counters_.push_back(&counter);
    }
}

void MetricsCollector::unregister_counter(const Counter& counter) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.erase(std::remove(counters_.begin(), counters_.end(), &counter), counters_.end());
}

void MetricsCollector::export_metrics(ExportFunc func) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto* counter : counters_) {
        func(counter->name(), MetricType::Counter, std::to_string(counter->value()));
    }
}

void MetricsCollector::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto* counter : counters_) {
        counter->reset();
    }
}

size_t MetricsCollector::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_.size();
}

void ReadStats::register_with(MetricsCollector& collector) {
    collector.register_counter(cached_reads);
    collector.register_counter(uncached_reads);
    collector.register_counter(transient_retries);
}

void ReadStats::unregister_from(MetricsCollector& collector) {
    collector.unregister_counter(cached_reads);
    collector.unregister_counter(uncached_reads);
    collector.unregister_counter(transient_retries);
}

} // namespace storage
} // namespace chunklog
