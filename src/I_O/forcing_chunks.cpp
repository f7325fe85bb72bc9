// src/I_O/forcing_chunks.cpp

#include <algorithm>
#include <stdexcept>

#include "forcing_chunks.hpp"
#include "models/pt_array.hpp"

std::vector<SampleChunk> calculateSampleChunks(size_t numSamples, int numChunks) {
    if (numChunks <= 0) {
        throw std::invalid_argument("Number of chunks must be positive");
    }

    std::vector<SampleChunk> chunks(numChunks);

    size_t chunkSize = numSamples / numChunks;
    size_t remainder = numSamples % numChunks;

    for (int r = 0; r < numChunks; ++r) {
        size_t ur = static_cast<size_t>(r);
        chunks[r].start = ur * chunkSize + std::min(ur, remainder);
        chunks[r].count = chunkSize + (ur < remainder ? 1 : 0);
    }

    return chunks;
}

namespace {

std::vector<double> sliceArray(const std::vector<double>& a, const SampleChunk& chunk) {
    if (a.size() == 1) {
        return a;
    }
    auto first = a.begin() + static_cast<std::ptrdiff_t>(chunk.start);
    return std::vector<double>(first, first + static_cast<std::ptrdiff_t>(chunk.count));
}

} // namespace

PETForcing sliceForcing(const PETForcing& forcing, const SampleChunk& chunk) {
    size_t n = PTMethods::sampleCount(forcing);
    if (chunk.start + chunk.count > n) {
        throw std::out_of_range("Requested chunk exceeds available samples");
    }

    PETForcing out;
    if (chunk.count == 0) {
        return out;
    }
    out.air_T      = sliceArray(forcing.air_T, chunk);
    out.fuel_T     = sliceArray(forcing.fuel_T, chunk);
    out.elevation  = sliceArray(forcing.elevation, chunk);
    out.RH         = sliceArray(forcing.RH, chunk);
    out.fuel_moist = sliceArray(forcing.fuel_moist, chunk);
    out.Rs         = sliceArray(forcing.Rs, chunk);
    out.Ra         = sliceArray(forcing.Ra, chunk);
    return out;
}
