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
#include <atomic>
#include <memory>
#include <chrono>
#include <set>
#include <thread>
#include <vector>
#include "storage/checkpoint.h"

using namespace chunklog::storage;
using namespace std::chrono_literals;

class CheckpointTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(CheckpointTest, WriteIsNotVisibleUntilFlush) {
    InMemoryCheckpoint chk;

    EXPECT_EQ(chk.read(), 0);
    chk.write(100);
    EXPECT_EQ(chk.read(), 0);
    EXPECT_EQ(chk.read_non_flushed(), 100);

    chk.flush();
    EXPECT_EQ(chk.read(), 100);
    EXPECT_EQ(chk.read_non_flushed(), 100);
}

TEST_F(CheckpointTest, InitialValueSetsBothPositions) {
    InMemoryCheckpoint chk("writer", 4096);
    EXPECT_EQ(chk.name(), "writer");
    EXPECT_EQ(chk.read(), 4096);
    EXPECT_EQ(chk.read_non_flushed(), 4096);

    InMemoryCheckpoint unnamed(77);
    EXPECT_EQ(unnamed.read(), 77);
    EXPECT_FALSE(unnamed.name().empty());
}

TEST_F(CheckpointTest, GeneratedNamesAreUnique) {
    std::set<std::string> names;
    for (int i = 0; i < 100; i++) {
        InMemoryCheckpoint chk;
        names.insert(chk.name());
    }
    EXPECT_EQ(names.size(), 100u);
}

TEST_F(CheckpointTest, WriteIsLastWriterWins) {
    InMemoryCheckpoint chk;
    chk.write(500);
    chk.write(200);
    EXPECT_EQ(chk.read_non_flushed(), 200);
    chk.flush();
    EXPECT_EQ(chk.read(), 200);
}

TEST_F(CheckpointTest, FlushWithoutNewWriteIsNoOp) {
    InMemoryCheckpoint chk;
    chk.flush();
    EXPECT_EQ(chk.flush_count(), 0u);

    chk.write(10);
    chk.flush();
    EXPECT_EQ(chk.flush_count(), 1u);

    chk.flush();
    chk.flush();
    EXPECT_EQ(chk.flush_count(), 1u);
    EXPECT_EQ(chk.read(), 10);
}

TEST_F(CheckpointTest, DurablePositionIsMonotonic) {
    InMemoryCheckpoint chk;
    int64_t last = chk.read();
    for (int64_t pos = 0; pos < 10000; pos += 37) {
        chk.write(pos);
        if (pos % 3 == 0) chk.flush();
        EXPECT_GE(chk.read(), last);
        EXPECT_LE(chk.read(), chk.read_non_flushed());
        last = chk.read();
    }
}

TEST_F(CheckpointTest, WaitTimesOutWithoutFlush) {
    InMemoryCheckpoint chk;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(chk.wait_for_flush(50ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 45ms);
}

TEST_F(CheckpointTest, NoOpFlushDoesNotWakeWaiter) {
    InMemoryCheckpoint chk(5);
    std::atomic<bool> woke{true};

    std::thread waiter([&] { woke = chk.wait_for_flush(300ms); });
    std::this_thread::sleep_for(50ms);
    chk.flush();  // tentative == flushed
    waiter.join();

    EXPECT_FALSE(woke.load());
    EXPECT_EQ(chk.read(), 5);
}

TEST_F(CheckpointTest, FlushWakesAllWaiters) {
    InMemoryCheckpoint chk;
    const int num_waiters = 6;
    std::atomic<int> woken{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < num_waiters; i++) {
        threads.emplace_back([&] {
            if (chk.wait_for_flush(5s)) {
                woken.fetch_add(1);
            }
        });
    }

    // Give every waiter time to block
    std::this_thread::sleep_for(200ms);
    chk.write(1);
    chk.flush();

    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(woken.load(), num_waiters);
    EXPECT_EQ(chk.read(), 1);
}

TEST_F(CheckpointTest, FlushBeforeWaitIsMissed) {
    // A flush that lands before the caller enters wait_for_flush is not
    // queued; callers re-check read() instead.
    InMemoryCheckpoint chk;
    chk.write(64);
    chk.flush();

    EXPECT_FALSE(chk.wait_for_flush(30ms));
    EXPECT_EQ(chk.read(), 64);
}

TEST_F(CheckpointTest, ConcurrentReadersSeeOnlyFlushedValues) {
    InMemoryCheckpoint chk;
    std::atomic<bool> stop{false};
    std::atomic<bool> violation{false};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; i++) {
        readers.emplace_back([&] {
            int64_t last = 0;
            while (!stop.load()) {
                int64_t v = chk.read();
                if (v < last || v % 100 != 0) violation = true;
                last = v;
            }
        });
    }

    for (int64_t pos = 100; pos <= 100000; pos += 100) {
        chk.write(pos + 1);  // never flushed as-is
        chk.write(pos);
        chk.flush();
    }
    stop = true;
    for (auto& t : readers) {
        t.join();
    }

    EXPECT_FALSE(violation.load());
    EXPECT_EQ(chk.read(), 100000);
}

TEST_F(CheckpointTest, CloseThroughBaseInterface) {
    std::unique_ptr<Checkpoint> chk = std::make_unique<InMemoryCheckpoint>("base", 12);
    chk->write(24);
    chk->flush();
    chk->close();
    EXPECT_EQ(chk->read(), 24);
}
