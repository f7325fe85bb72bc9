// src/I_O/forcing_chunks.hpp
#pragma once

#include <cstddef>
#include <vector>

#include "forcing.hpp"

// Contiguous range of samples handled by one rank.
// Current logic is simple: divide the sample axis into equal chunks, the first
// (numSamples % numChunks) chunks taking one extra sample.
struct SampleChunk {
    size_t start, count;

    SampleChunk(size_t s = 0, size_t c = 0)
        : start(s), count(c) {}
};

// Split numSamples into numChunks contiguous chunks (some may be empty when
// numChunks > numSamples). Throws std::invalid_argument if numChunks <= 0.
std::vector<SampleChunk> calculateSampleChunks(size_t numSamples, int numChunks);

// Copy the samples of @p chunk out of every forcing array. Length-1
// (broadcast) arrays are kept whole; an empty chunk gives empty arrays.
// Throws std::out_of_range if the chunk runs past the sample count.
PETForcing sliceForcing(const PETForcing& forcing, const SampleChunk& chunk);
