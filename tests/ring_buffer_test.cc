// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "hedgelab/support/ring_buffer.hpp"
#include <vector>

namespace hedgelab {
namespace {

TEST(RingBufferTest, StartsEmpty) {
    RingBuffer<double> buf(4);
    EXPECT_TRUE(buf.empty());
    EXPECT_FALSE(buf.full());
    EXPECT_EQ(buf.size(), 0u);
    EXPECT_EQ(buf.capacity(), 4u);
    EXPECT_TRUE(buf.to_vector().empty());
}

TEST(RingBufferTest, FillsOldestFirst) {
    RingBuffer<double> buf(3);
    buf.push(1.0);
    buf.push(2.0);
    EXPECT_EQ(buf.size(), 2u);
    EXPECT_DOUBLE_EQ(buf[0], 1.0);
    EXPECT_DOUBLE_EQ(buf.back(), 2.0);
}

TEST(RingBufferTest, OverwritesOldestWhenFull) {
    RingBuffer<double> buf(3);
    for (double v : {1.0, 2.0, 3.0, 4.0, 5.0}) {
        buf.push(v);
    }
    EXPECT_TRUE(buf.full());
    EXPECT_EQ(buf.size(), 3u);
    EXPECT_EQ(buf.to_vector(), (std::vector<double>{3.0, 4.0, 5.0}));
    EXPECT_DOUBLE_EQ(buf.back(), 5.0);
}

TEST(RingBufferTest, ClearKeepsCapacity) {
    RingBuffer<double> buf(2);
    buf.push(1.0);
    buf.push(2.0);
    buf.push(3.0);
    buf.clear();
    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.capacity(), 2u);

    buf.push(9.0);
    EXPECT_EQ(buf.to_vector(), (std::vector<double>{9.0}));
}

TEST(RingBufferTest, ZeroCapacityIgnoresPushes) {
    RingBuffer<double> buf(0);
    buf.push(1.0);
    EXPECT_TRUE(buf.empty());
}

}  // namespace
}  // namespace hedgelab
