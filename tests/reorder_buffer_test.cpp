#include "webxfer/reorder_buffer.hpp"
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace webxfer;

TEST(ReorderBufferTest, EmitsInIndexOrderWhateverTheArrivalOrder) {
    ReorderBuffer buffer;
    std::vector<std::string> emitted;

    for (std::uint64_t index : {2u, 0u, 3u, 1u}) {
        ASSERT_TRUE(buffer.put(index, "chunk" + std::to_string(index)));
        while (auto data = buffer.tryPop()) {
            emitted.push_back(*data);
        }
    }

    EXPECT_EQ(emitted, (std::vector<std::string>{"chunk0", "chunk1", "chunk2", "chunk3"}));
    EXPECT_EQ(buffer.nextIndex(), 4u);
    EXPECT_EQ(buffer.buffered(), 0u);
}

TEST(ReorderBufferTest, HoldsGapUntilFilled) {
    ReorderBuffer buffer;
    buffer.put(1, "bb");
    buffer.put(2, "ccc");
    EXPECT_FALSE(buffer.ready());
    EXPECT_EQ(buffer.buffered(), 2u);
    EXPECT_EQ(buffer.bufferedBytes(), 5u);

    buffer.put(0, "a");
    EXPECT_TRUE(buffer.ready());
    EXPECT_EQ(buffer.pop(), "a");
    EXPECT_EQ(buffer.pop(), "bb");
    EXPECT_EQ(buffer.bufferedBytes(), 3u);
}

TEST(ReorderBufferTest, RejectsDuplicatesAndEmittedIndexes) {
    ReorderBuffer buffer;
    EXPECT_TRUE(buffer.put(0, "a"));
    EXPECT_FALSE(buffer.put(0, "again"));
    buffer.pop();
    EXPECT_FALSE(buffer.put(0, "late"));
}

TEST(ReorderBufferTest, EmptyChunkIsStillAChunk) {
    ReorderBuffer buffer(5);
    EXPECT_TRUE(buffer.put(5, ""));
    ASSERT_TRUE(buffer.ready());
    EXPECT_EQ(buffer.pop(), "");
    EXPECT_EQ(buffer.nextIndex(), 6u);
}

TEST(ReorderBufferTest, PopWithoutNextChunkThrows) {
    ReorderBuffer buffer;
    buffer.put(1, "x");
    EXPECT_THROW(buffer.pop(), std::logic_error);
    buffer.clear();
    EXPECT_EQ(buffer.buffered(), 0u);
    EXPECT_EQ(buffer.bufferedBytes(), 0u);
}
