#include "I_O/forcing_chunks.hpp"  // for calculateSampleChunks, sliceForcing
#include "gtest/gtest.h"            // for Test, EXPECT_EQ, TestInfo...
#include <stdexcept>                // for invalid_argument, out_of_range
#include <vector>                   // for vector

namespace {

PETForcing makeForcing(size_t n) {
    PETForcing f;
    for (size_t i = 0; i < n; ++i) {
        double x = double(i);
        f.air_T.push_back(20. + x);
        f.fuel_T.push_back(19. + x);
        f.RH.push_back(40. + x);
        f.fuel_moist.push_back(50. + x);
        f.Rs.push_back(10. + x);
        f.Ra.push_back(30. + x);
    }
    f.elevation = {300.};
    return f;
}

// Test chunking of the sample axis
TEST(SampleChunksTest, EvenSplit) {
    auto chunks = calculateSampleChunks(12, 4);
    ASSERT_EQ(chunks.size(), 4u);
    for (int r = 0; r < 4; ++r) {
        EXPECT_EQ(chunks[r].start, size_t(3 * r));
        EXPECT_EQ(chunks[r].count, 3u);
    }
}

TEST(SampleChunksTest, RemainderGoesToFirstChunks) {
    auto chunks = calculateSampleChunks(10, 3);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].start, 0u);
    EXPECT_EQ(chunks[0].count, 4u);
    EXPECT_EQ(chunks[1].start, 4u);
    EXPECT_EQ(chunks[1].count, 3u);
    EXPECT_EQ(chunks[2].start, 7u);
    EXPECT_EQ(chunks[2].count, 3u);
}

TEST(SampleChunksTest, CoversAllSamplesContiguously) {
    for (size_t n : {0u, 1u, 5u, 17u, 100u}) {
        for (int k : {1, 2, 3, 8, 33}) {
            auto chunks = calculateSampleChunks(n, k);
            ASSERT_EQ(chunks.size(), size_t(k));
            size_t next = 0;
            for (const auto& c : chunks) {
                EXPECT_EQ(c.start, next) << "n = " << n << ", k = " << k;
                next = c.start + c.count;
            }
            EXPECT_EQ(next, n) << "n = " << n << ", k = " << k;
        }
    }
}

TEST(SampleChunksTest, MoreChunksThanSamples) {
    auto chunks = calculateSampleChunks(2, 4);
    EXPECT_EQ(chunks[0].count, 1u);
    EXPECT_EQ(chunks[1].count, 1u);
    EXPECT_EQ(chunks[2].count, 0u);
    EXPECT_EQ(chunks[3].count, 0u);
}

TEST(SampleChunksTest, NonPositiveChunkCountThrows) {
    EXPECT_THROW(calculateSampleChunks(10, 0), std::invalid_argument);
    EXPECT_THROW(calculateSampleChunks(10, -2), std::invalid_argument);
}

// Test slicing the forcing for one chunk
TEST(SliceForcingTest, CopiesChunkAndKeepsBroadcast) {
    PETForcing f = makeForcing(6);

    PETForcing part = sliceForcing(f, SampleChunk(2, 3));
    ASSERT_EQ(part.air_T.size(), 3u);
    EXPECT_EQ(part.air_T[0], 22.);
    EXPECT_EQ(part.air_T[2], 24.);
    EXPECT_EQ(part.fuel_T[1], 22.);
    EXPECT_EQ(part.RH[0], 42.);
    EXPECT_EQ(part.fuel_moist[2], 54.);
    EXPECT_EQ(part.Rs[1], 13.);
    EXPECT_EQ(part.Ra[2], 34.);

    ASSERT_EQ(part.elevation.size(), 1u);
    EXPECT_EQ(part.elevation[0], 300.);
}

TEST(SliceForcingTest, EmptyChunk) {
    PETForcing f = makeForcing(4);
    PETForcing part = sliceForcing(f, SampleChunk(4, 0));
    EXPECT_TRUE(part.air_T.empty());
    EXPECT_TRUE(part.elevation.empty());
    EXPECT_TRUE(part.Ra.empty());
}

TEST(SliceForcingTest, ChunkPastEndThrows) {
    PETForcing f = makeForcing(4);
    EXPECT_THROW(sliceForcing(f, SampleChunk(2, 3)), std::out_of_range);
    EXPECT_THROW(sliceForcing(f, SampleChunk(5, 0)), std::out_of_range);
}

TEST(SliceForcingTest, ChunksReassembleForcing) {
    PETForcing f = makeForcing(7);
    std::vector<double> air_T;
    for (const auto& c : calculateSampleChunks(7, 3)) {
        PETForcing part = sliceForcing(f, c);
        air_T.insert(air_T.end(), part.air_T.begin(), part.air_T.end());
    }
    EXPECT_EQ(air_T, f.air_T);
}

} // namespace
