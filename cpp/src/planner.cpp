#include "chunkvault/planner.hpp"

#include "chunkvault/errors.hpp"

#include <algorithm>
#include <limits>

namespace chunkvault::planner {

std::uint64_t ChunkCount(std::uint64_t total_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw ConfigurationError("Chunk size must be positive");
    }
    return total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
}

Plan PlanChunks(std::uint64_t total_size, const SizeLimits& limits) {
    if (limits.max_artifact_size == 0) {
        throw ConfigurationError("Maximum artifact size must be positive");
    }
    if (limits.chunk_size == 0) {
        throw ConfigurationError("Chunk size must be positive");
    }
    Plan plan;
    if (total_size <= limits.max_artifact_size) {
        plan.ranges.push_back({0, total_size});
        return plan;
    }
    plan.chunked = true;
    std::uint64_t count = ChunkCount(total_size, limits.chunk_size);
    plan.ranges.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t i = 0; i < count; ++i) {
        std::uint64_t offset = i * limits.chunk_size;
        plan.ranges.push_back({offset, std::min(limits.chunk_size, total_size - offset)});
    }
    return plan;
}

std::uint64_t WorstCaseArtifactSize(std::uint64_t plaintext_size, compression::Compression algo) {
    std::uint64_t packed = compression::WorstCaseSize(algo, plaintext_size);
    if (packed > std::numeric_limits<std::uint64_t>::max() - constants::kArtifactOverhead) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return packed + constants::kArtifactOverhead;
}

}  // namespace chunkvault::planner
