#pragma once

#include "chunkvault/compression.hpp"
#include "chunkvault/constants.hpp"

#include <cstdint>
#include <vector>

namespace chunkvault::planner {

struct SizeLimits {
    std::uint64_t max_artifact_size = constants::kDefaultMaxArtifactSize;
    std::uint64_t chunk_size = constants::kDefaultChunkSize;
};

struct ByteRange {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
};

struct Plan {
    bool chunked = false;
    std::vector<ByteRange> ranges;
};

// N <= C: one range covering the input, unchunked.
// N > C: ceil(N / T) ranges of T bytes, the last one holding the remainder.
// Throws ConfigurationError when C or T is zero.
Plan PlanChunks(std::uint64_t total_size, const SizeLimits& limits);

std::uint64_t ChunkCount(std::uint64_t total_size, std::uint64_t chunk_size);

// Largest artifact a plaintext of `plaintext_size` bytes can encode to.
std::uint64_t WorstCaseArtifactSize(std::uint64_t plaintext_size,
                                    compression::Compression algo = compression::Compression::Zlib);

}  // namespace chunkvault::planner
