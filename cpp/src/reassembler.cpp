#include "chunkvault/reassembler.hpp"

#include "chunkvault/codec.hpp"
#include "chunkvault/envelope.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/fileio.hpp"
#include "chunkvault/parallel.hpp"

#include <limits>
#include <mutex>
#include <optional>

namespace chunkvault::reassembler {

namespace {

std::size_t ToSize(std::uint64_t value, const char* what) {
    if (value > std::numeric_limits<std::size_t>::max()) {
        throw SizeViolationError(std::string(what) + " does not fit in memory on this platform");
    }
    return static_cast<std::size_t>(value);
}

const char* FailureKind(const Error& exc) {
    if (dynamic_cast<const IntegrityError*>(&exc)) {
        return "integrity";
    }
    if (dynamic_cast<const DecodeError*>(&exc)) {
        return "decode";
    }
    if (dynamic_cast<const StorageError*>(&exc)) {
        return "storage";
    }
    if (dynamic_cast<const SizeViolationError*>(&exc)) {
        return "size";
    }
    return "error";
}

}  // namespace

Reassembler::Reassembler(const store::ArtifactStore& artifacts,
                         std::string private_key,
                         cache::TransformCache* cache,
                         ReadOptions options)
    : artifacts_(artifacts), private_key_(std::move(private_key)), cache_(cache), options_(std::move(options)) {}

Bytes Reassembler::DecodeArtifact(const manifest::ChunkRecord& record) const {
    Bytes artifact = artifacts_.Read(record.location);
    if (artifact.size() != record.ciphertext_size) {
        throw DecodeError("Chunk " + std::to_string(record.index) + " artifact is " + std::to_string(artifact.size())
                          + " bytes, manifest records " + std::to_string(record.ciphertext_size));
    }
    return codec::Decode(artifact, private_key_, ToSize(record.plaintext_size, "Chunk"));
}

void Reassembler::CheckDigest(const manifest::ChunkRecord& record, const Bytes& plaintext) {
    Digest actual = crypto::Sha256(plaintext);
    if (actual == record.plaintext_hash) {
        return;
    }
    if (cache_) {
        cache_->Erase(record.location);
    }
    throw IntegrityError(record.index, crypto::HexEncode(record.plaintext_hash), crypto::HexEncode(actual));
}

std::shared_ptr<const Bytes> Reassembler::DecodeVerified(const manifest::ChunkRecord& record) {
    std::shared_ptr<const Bytes> plaintext;
    if (cache_) {
        plaintext = cache_->GetOrDecode(record.location, [&]() { return DecodeArtifact(record); });
    } else {
        plaintext = std::make_shared<const Bytes>(DecodeArtifact(record));
    }
    CheckDigest(record, *plaintext);
    return plaintext;
}

Bytes Reassembler::Reconstruct(const manifest::Manifest& manifest) {
    manifest::Validate(manifest);
    envelope::CheckPrivateKey(private_key_);
    const std::vector<manifest::ChunkRecord> records = manifest.Records();
    const std::size_t count = records.size();

    std::vector<std::shared_ptr<const Bytes>> parts(count);
    std::mutex progress_mutex;
    std::size_t done = 0;
    std::uint64_t bytes_done = 0;
    parallel::ParallelFor(count, options_.workers, [&](std::size_t i) {
        parts[i] = DecodeVerified(records[i]);
        if (options_.progress) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            ++done;
            bytes_done += parts[i]->size();
            options_.progress({"decode", manifest.original_name, done, count, bytes_done, manifest.original_size});
        }
    });

    std::uint64_t total = 0;
    for (const auto& part : parts) {
        total += part->size();
    }
    if (total != manifest.original_size) {
        throw SizeViolationError("Reconstructed " + std::to_string(total) + " bytes, manifest records "
                                 + std::to_string(manifest.original_size));
    }
    Bytes out;
    out.reserve(ToSize(total, "Reconstructed file"));
    for (const auto& part : parts) {
        out.insert(out.end(), part->begin(), part->end());
    }
    return out;
}

void Reassembler::ReconstructToFile(const manifest::Manifest& manifest, const std::string& path) {
    Bytes data = Reconstruct(manifest);
    fileio::WriteFileAtomic(path, data);
}

VerifyReport Reassembler::Verify(const manifest::Manifest& manifest) {
    manifest::Validate(manifest);
    envelope::CheckPrivateKey(private_key_);
    const std::vector<manifest::ChunkRecord> records = manifest.Records();
    const std::size_t count = records.size();

    std::vector<std::optional<ChunkFailure>> results(count);
    std::mutex progress_mutex;
    std::size_t done = 0;
    parallel::ParallelFor(count, options_.workers, [&](std::size_t i) {
        const manifest::ChunkRecord& record = records[i];
        try {
            Bytes plaintext = DecodeArtifact(record);
            CheckDigest(record, plaintext);
        } catch (const Error& exc) {
            if (cache_) {
                cache_->Erase(record.location);
            }
            results[i] = ChunkFailure{record.index, record.location, FailureKind(exc), exc.what()};
        }
        if (options_.progress) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            ++done;
            options_.progress({"verify", manifest.original_name, done, count, 0, 0});
        }
    });

    VerifyReport report;
    report.name = manifest.original_name;
    report.chunks_checked = count;
    for (auto& result : results) {
        if (result) {
            report.failures.push_back(std::move(*result));
        }
    }
    return report;
}

}  // namespace chunkvault::reassembler
