#include "chunkvault/chunker.hpp"

#include "chunkvault/constants.hpp"
#include "chunkvault/envelope.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/fileio.hpp"
#include "chunkvault/parallel.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <system_error>

namespace chunkvault::chunker {

namespace {

std::string PadIndex(std::size_t index) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%03zu", index);
    return buffer;
}

std::string CeilingMessage(std::size_t index, std::size_t artifact_size, std::uint64_t ceiling) {
    return "Chunk " + std::to_string(index) + " encodes to " + std::to_string(artifact_size)
           + " bytes, above the " + std::to_string(ceiling) + " byte ceiling";
}

}  // namespace

std::string ChunkLocation(const std::string& name, const std::string& attempt, std::size_t index) {
    return name + "." + attempt + ".chunk." + PadIndex(index) + std::string(constants::kArtifactSuffix);
}

std::string SingleLocation(const std::string& name, const std::string& attempt) {
    return name + "." + attempt + std::string(constants::kArtifactSuffix);
}

std::string NewAttemptId() {
    Bytes raw = crypto::RandomBytes(4);
    return crypto::HexEncode(raw.data(), raw.size());
}

Chunker::Chunker(store::ArtifactStore& artifacts,
                 store::ManifestStore& manifests,
                 std::string public_key,
                 WriteOptions options)
    : artifacts_(artifacts),
      manifests_(manifests),
      public_key_(std::move(public_key)),
      options_(std::move(options)) {}

void Chunker::CheckCancelled() const {
    if (options_.cancel && options_.cancel->load()) {
        throw EncodeError("Write cancelled");
    }
}

manifest::Manifest Chunker::PlanAndEncode(const std::string& name, const Bytes& data) {
    store::CheckFlatName(name, "file");
    envelope::CheckPublicKey(public_key_);
    const planner::SizeLimits& limits = options_.limits;
    planner::Plan plan = planner::PlanChunks(data.size(), limits);
    const std::string attempt = NewAttemptId();
    const std::size_t count = plan.ranges.size();

    std::vector<manifest::ChunkRecord> records(count);
    std::mutex progress_mutex;
    std::size_t done = 0;
    std::uint64_t bytes_done = 0;

    parallel::ParallelFor(count, options_.workers, [&](std::size_t i) {
        CheckCancelled();
        const planner::ByteRange& range = plan.ranges[i];
        const std::uint8_t* slice = data.data() + range.offset;
        codec::EncodedChunk encoded =
            codec::Encode(slice, static_cast<std::size_t>(range.length), public_key_, options_.codec);
        if (encoded.artifact.size() > limits.max_artifact_size) {
            throw SizeViolationError(CeilingMessage(i, encoded.artifact.size(), limits.max_artifact_size));
        }
        manifest::ChunkRecord& record = records[i];
        record.index = i;
        record.location = plan.chunked ? ChunkLocation(name, attempt, i) : SingleLocation(name, attempt);
        record.ciphertext_size = encoded.artifact.size();
        record.plaintext_size = range.length;
        record.plaintext_hash = encoded.plaintext_hash;
        artifacts_.Write(record.location, encoded.artifact);

        if (options_.progress) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            ++done;
            bytes_done += range.length;
            options_.progress({"encode", name, done, count, bytes_done, data.size()});
        }
    });
    CheckCancelled();

    manifest::Manifest result;
    result.original_name = name;
    result.original_size = data.size();
    result.chunk_size_target = limits.chunk_size;
    result.max_artifact_size = limits.max_artifact_size;
    result.compression = options_.codec.compression;
    result.created_at = manifest::UtcTimestamp();
    if (plan.chunked) {
        result.layout = manifest::ChunkedLayout{std::move(records)};
    } else {
        manifest::UnchunkedLayout single;
        single.location = records.front().location;
        single.ciphertext_size = records.front().ciphertext_size;
        single.plaintext_hash = records.front().plaintext_hash;
        result.layout = single;
    }
    manifests_.Save(result);
    if (options_.progress) {
        options_.progress({"publish", name, count, count, data.size(), data.size()});
    }
    return result;
}

manifest::Manifest Chunker::PlanAndEncodeFile(const std::string& path) {
    std::filesystem::path source(path);
    return PlanAndEncode(source.stem().string(), fileio::ReadFile(path));
}

std::vector<manifest::Manifest> Chunker::PlanAndEncodeDirectory(const std::string& dir) {
    namespace fs = std::filesystem;
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file()) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw StorageError("Failed to list " + dir + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());
    std::map<std::string, fs::path> stems;
    for (const auto& file : files) {
        auto inserted = stems.emplace(file.stem().string(), file);
        if (!inserted.second) {
            throw StorageError("Files " + inserted.first->second.filename().string() + " and "
                               + file.filename().string() + " would share manifest name '"
                               + inserted.first->first + "'");
        }
    }
    std::vector<manifest::Manifest> out;
    out.reserve(files.size());
    for (const auto& file : files) {
        out.push_back(PlanAndEncodeFile(file.string()));
    }
    return out;
}

GcReport CollectGarbage(store::ArtifactStore& artifacts, const store::ManifestStore& manifests, bool dry_run) {
    std::set<std::string> referenced;
    for (const auto& name : manifests.List()) {
        for (auto& location : manifests.Load(name).Locations()) {
            referenced.insert(std::move(location));
        }
    }
    GcReport report;
    for (const auto& location : artifacts.List()) {
        if (referenced.count(location) != 0) {
            ++report.kept;
            continue;
        }
        if (!dry_run) {
            artifacts.Remove(location);
        }
        report.removed.push_back(location);
    }
    return report;
}

}  // namespace chunkvault::chunker
