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

#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include <string>
#include "storage/sequential_reader.h"
#include "storage/memory_chunk.h"
#include "storage/test_helpers.h"

using namespace chunklog::storage;
using namespace chunklog::storage::test;
using ::testing::_;
using ::testing::Return;

class MockChunkManager : public ChunkManager {
public:
    MOCK_METHOD(std::shared_ptr<Chunk>, get_chunk_for, (int64_t log_position), (const, override));
};

// Chunk #0 with five 100-byte records, the same layout MemoryChunkManager writes
static std::shared_ptr<MemoryChunk> make_chunk0(bool doomed) {
    auto chunk = std::make_shared<MemoryChunk>(ChunkHeader(0, 0, 1000));
    for (uint8_t i = 0; i < 5; i++) {
        chunk->try_append(payload_for_frame(100, i), nullptr);
    }
    if (doomed) chunk->mark_for_deletion();
    return chunk;
}

class ReaderRetryTest : public ::testing::Test {
protected:
    void SetUp() override {
        good_ = make_chunk0(false);
        doomed_ = make_chunk0(true);
        publish(chk_, 500);
    }

    StorageConfig config(int max_retries) {
        StorageConfig cfg = test_config(1000);
        cfg.max_read_retries = max_retries;
        return cfg;
    }

    MockChunkManager mock_;
    InMemoryCheckpoint chk_{"writer"};
    ReadStats stats_;
    std::shared_ptr<Chunk> good_;
    std::shared_ptr<Chunk> doomed_;
};

TEST_F(ReaderRetryTest, TransientDeletionIsRetried) {
    EXPECT_CALL(mock_, get_chunk_for(0))
        .WillOnce(Return(doomed_))
        .WillOnce(Return(doomed_))
        .WillRepeatedly(Return(good_));

    SequentialReader reader(mock_, chk_, 0, config(reader::kMaxRetries), &stats_);
    SeqReadResult r = reader.try_read_next();
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.record_pre_position, 0);
    EXPECT_EQ(reader.current_position(), 100);
    EXPECT_EQ(stats_.transient_retries.value(), 2u);
    EXPECT_EQ(stats_.total(), 1u);
}

TEST_F(ReaderRetryTest, ForwardGivesUpAfterRetryBound) {
    EXPECT_CALL(mock_, get_chunk_for(_))
        .Times(reader::kMaxRetries + 1)
        .WillRepeatedly(Return(doomed_));

    SequentialReader reader(mock_, chk_, 0, config(reader::kMaxRetries), &stats_);
    try {
        reader.try_read_next();
        FAIL() << "expected ChunkRetriesExhausted";
    } catch (const ChunkRetriesExhausted& e) {
        EXPECT_NE(std::string(e.what()).find("being deleted"), std::string::npos);
    }
    EXPECT_EQ(reader.current_position(), 0);
    EXPECT_EQ(stats_.total(), 0u);
}

TEST_F(ReaderRetryTest, BackwardGivesUpAfterRetryBound) {
    EXPECT_CALL(mock_, get_chunk_for(_))
        .Times(4)
        .WillRepeatedly(Return(doomed_));

    SequentialReader reader(mock_, chk_, 300, config(3), &stats_);
    EXPECT_THROW(reader.try_read_prev(), ChunkRetriesExhausted);
    EXPECT_EQ(reader.current_position(), 300);
}

TEST_F(ReaderRetryTest, ReadAtAndExistsGiveUpAfterRetryBound) {
    EXPECT_CALL(mock_, get_chunk_for(_))
        .WillRepeatedly(Return(doomed_));

    SequentialReader reader(mock_, chk_, 0, config(2), &stats_);
    EXPECT_THROW(reader.try_read_at(150), ChunkRetriesExhausted);
    EXPECT_THROW(reader.exists_at(150), ChunkRetriesExhausted);
    EXPECT_EQ(stats_.transient_retries.value(), 6u);
}

TEST_F(ReaderRetryTest, SucceedsOnLastAllowedAttempt) {
    EXPECT_CALL(mock_, get_chunk_for(_))
        .WillOnce(Return(doomed_))
        .WillOnce(Return(doomed_))
        .WillOnce(Return(doomed_))
        .WillRepeatedly(Return(good_));

    SequentialReader reader(mock_, chk_, 0, config(3), &stats_);
    RecordReadResult r = reader.try_read_at(250);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.record->log_position, 200);
}

TEST_F(ReaderRetryTest, ZeroRetriesFailsOnFirstDeletion) {
    EXPECT_CALL(mock_, get_chunk_for(_))
        .Times(1)
        .WillOnce(Return(doomed_));

    SequentialReader reader(mock_, chk_, 0, config(0), &stats_);
    EXPECT_THROW(reader.exists_at(0), ChunkRetriesExhausted);
}

TEST_F(ReaderRetryTest, BoundaryCheckComesBeforeChunkAccess) {
    EXPECT_CALL(mock_, get_chunk_for(_)).Times(0);

    SequentialReader reader(mock_, chk_, 500, config(reader::kMaxRetries), &stats_);
    EXPECT_FALSE(reader.try_read_next().success);
    EXPECT_FALSE(reader.try_read_at(500).success);
    EXPECT_FALSE(reader.exists_at(900));
}

TEST_F(ReaderRetryTest, ChunkNotCoveringPositionIsRejected) {
    auto other = std::make_shared<MemoryChunk>(ChunkHeader(3, 3, 1000));
    EXPECT_CALL(mock_, get_chunk_for(_)).WillRepeatedly(Return(other));

    SequentialReader reader(mock_, chk_, 0, config(reader::kMaxRetries), &stats_);
    EXPECT_THROW(reader.try_read_next(), std::out_of_range);
}

TEST(ReaderScavengeTest, ReaderFollowsReplacedChunk) {
    MemoryChunkManager mgr(test_config(1000));
    append_records(mgr, 15, 100);
    InMemoryCheckpoint chk;
    publish(chk, mgr.writer_position());

    SequentialReader reader(mgr, chk, 0, test_config(1000));
    for (int i = 0; i < 3; i++) {
        ASSERT_TRUE(reader.try_read_next().success);
    }

    // Swap chunk #0 for an identical copy, as scavenging would, and retire the old one
    auto old_chunk = std::static_pointer_cast<MemoryChunk>(mgr.get_chunk_for(0));
    auto copy = std::make_shared<MemoryChunk>(ChunkHeader(0, 0, 1000), false);
    for (uint8_t i = 0; i < 10; i++) {
        ASSERT_TRUE(copy->try_append(payload_for_frame(100, i), nullptr));
    }
    mgr.replace_chunk(copy);
    old_chunk->mark_for_deletion();

    SeqReadResult r = reader.try_read_next();
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.record_pre_position, 300);
    EXPECT_EQ(r.record->data, payload_for_frame(100, 3));
    EXPECT_EQ(reader.stats().uncached_reads.value(), 1u);
}
