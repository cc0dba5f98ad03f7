#pragma once

#include "chunkvault/compression.hpp"
#include "chunkvault/crypto.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace chunkvault::manifest {

struct ChunkRecord {
    std::size_t index = 0;
    std::string location;
    std::uint64_t ciphertext_size = 0;
    std::uint64_t plaintext_size = 0;
    Digest plaintext_hash{};
};

// The whole file lives in one artifact.
struct UnchunkedLayout {
    std::string location;
    std::uint64_t ciphertext_size = 0;
    Digest plaintext_hash{};
};

struct ChunkedLayout {
    std::vector<ChunkRecord> chunks;
};

using Layout = std::variant<UnchunkedLayout, ChunkedLayout>;

struct Manifest {
    std::string original_name;
    std::uint64_t original_size = 0;
    std::uint64_t chunk_size_target = 0;
    std::uint64_t max_artifact_size = 0;
    compression::Compression compression = compression::Compression::Zlib;
    std::string created_at;
    Layout layout = UnchunkedLayout{};

    bool IsChunked() const { return std::holds_alternative<ChunkedLayout>(layout); }
    std::size_t NumChunks() const;

    // Uniform view used by the read path: the unchunked case becomes a single
    // record with index 0 and plaintext_size == original_size.
    std::vector<ChunkRecord> Records() const;
    std::vector<std::string> Locations() const;
};

// Throws StructuralError: empty name, gaps or duplicates in indices, size sum
// mismatch, empty locations.
void Validate(const Manifest& manifest);

std::string ToJson(const Manifest& manifest);
// Records may appear in any order in the text; they come back sorted by index.
// Malformed text, missing fields and failed validation raise StructuralError.
Manifest FromJson(const std::string& text);

std::string UtcTimestamp();

}  // namespace chunkvault::manifest
