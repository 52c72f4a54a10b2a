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

#include "checkpoint.h"
#include "../util/log.h"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace chunklog {
namespace storage {

InMemoryCheckpoint::InMemoryCheckpoint()
    : InMemoryCheckpoint(generate_name(), checkpoint::kDefaultInitialValue) {}

InMemoryCheckpoint::InMemoryCheckpoint(int64_t initial_value)
    : InMemoryCheckpoint(generate_name(), initial_value) {}

InMemoryCheckpoint::InMemoryCheckpoint(const std::string& name, int64_t initial_value)
    : name_(name), last_(initial_value), last_flushed_(initial_value) {}

std::string InMemoryCheckpoint::generate_name() {
    static thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

void InMemoryCheckpoint::flush() {
    int64_t last = last_.load(std::memory_order_acquire);
    if (last == last_flushed_.load(std::memory_order_acquire)) {
        return;
    }

    last_flushed_.store(last, std::memory_order_release);

    {
        std::lock_guard<std::mutex> lk(flush_mu_);
        flush_generation_.fetch_add(1, std::memory_order_relaxed);
    }
    flush_cv_.notify_all();

    trace() << "checkpoint " << name_ << " flushed at " << last;
}

bool InMemoryCheckpoint::wait_for_flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(flush_mu_);
    // Only flushes after this point count; an earlier one is not replayed
    const uint64_t seen = flush_generation_.load(std::memory_order_relaxed);
    return flush_cv_.wait_for(lk, timeout, [&] {
        return flush_generation_.load(std::memory_order_relaxed) != seen;
    });
}

} // namespace storage
} // namespace chunklog
