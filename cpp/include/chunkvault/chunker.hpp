#pragma once

#include "chunkvault/codec.hpp"
#include "chunkvault/manifest.hpp"
#include "chunkvault/planner.hpp"
#include "chunkvault/progress.hpp"
#include "chunkvault/store.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

namespace chunkvault::chunker {

struct WriteOptions {
    planner::SizeLimits limits;
    codec::CodecOptions codec;
    std::size_t workers = 0;
    ProgressFn progress;
    // Polled before each chunk; setting it aborts the write with EncodeError.
    const std::atomic<bool>* cancel = nullptr;
};

// Write path: plan, encode every range, store the artifacts, then publish the
// manifest. The manifest is saved only after every artifact is written, so a
// failed or cancelled attempt leaves at most orphaned artifacts behind.
class Chunker {
public:
    Chunker(store::ArtifactStore& artifacts,
            store::ManifestStore& manifests,
            std::string public_key,
            WriteOptions options = {});

    manifest::Manifest PlanAndEncode(const std::string& name, const Bytes& data);
    // Logical name is the file stem.
    manifest::Manifest PlanAndEncodeFile(const std::string& path);
    // Every regular file directly inside `dir`, in name order.
    std::vector<manifest::Manifest> PlanAndEncodeDirectory(const std::string& dir);

private:
    void CheckCancelled() const;

    store::ArtifactStore& artifacts_;
    store::ManifestStore& manifests_;
    std::string public_key_;
    WriteOptions options_;
};

// "<name>.<attempt>.chunk.<NNN>.cva" for chunked files, "<name>.<attempt>.cva"
// otherwise.
std::string ChunkLocation(const std::string& name, const std::string& attempt, std::size_t index);
std::string SingleLocation(const std::string& name, const std::string& attempt);
std::string NewAttemptId();

struct GcReport {
    std::vector<std::string> removed;
    std::size_t kept = 0;
};

// Removes artifacts no stored manifest references. A manifest that fails to
// load aborts the sweep so its artifacts are never treated as orphans.
GcReport CollectGarbage(store::ArtifactStore& artifacts,
                        const store::ManifestStore& manifests,
                        bool dry_run = false);

}  // namespace chunkvault::chunker
