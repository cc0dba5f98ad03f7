#pragma once

#include "chunkvault/manifest.hpp"
#include "chunkvault/progress.hpp"
#include "chunkvault/store.hpp"
#include "chunkvault/transform_cache.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace chunkvault::reassembler {

struct ReadOptions {
    std::size_t workers = 0;
    ProgressFn progress;
};

struct ChunkFailure {
    std::size_t index = 0;
    std::string location;
    std::string kind;
    std::string message;
};

struct VerifyReport {
    std::string name;
    std::size_t chunks_checked = 0;
    std::vector<ChunkFailure> failures;

    bool ok() const { return failures.empty(); }
};

// Read path. Chunks may decode on several threads but are always assembled by
// index. Nothing is retried: every failure is terminal for the attempt.
class Reassembler {
public:
    // `cache` may be null; when set it must outlive the reassembler.
    Reassembler(const store::ArtifactStore& artifacts,
                std::string private_key,
                cache::TransformCache* cache = nullptr,
                ReadOptions options = {});

    // Throws StructuralError, StorageError, DecodeError, IntegrityError or
    // SizeViolationError.
    Bytes Reconstruct(const manifest::Manifest& manifest);
    void ReconstructToFile(const manifest::Manifest& manifest, const std::string& path);

    // Decodes every chunk straight from the store and reports each bad one
    // instead of stopping at the first. Structural problems still throw.
    VerifyReport Verify(const manifest::Manifest& manifest);

private:
    Bytes DecodeArtifact(const manifest::ChunkRecord& record) const;
    std::shared_ptr<const Bytes> DecodeVerified(const manifest::ChunkRecord& record);
    void CheckDigest(const manifest::ChunkRecord& record, const Bytes& plaintext);

    const store::ArtifactStore& artifacts_;
    std::string private_key_;
    cache::TransformCache* cache_;
    ReadOptions options_;
};

}  // namespace chunkvault::reassembler
