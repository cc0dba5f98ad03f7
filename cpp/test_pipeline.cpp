#include "chunkvault/chunker.hpp"
#include "chunkvault/envelope.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/fileio.hpp"
#include "chunkvault/reassembler.hpp"
#include "chunkvault/store.hpp"
#include "chunkvault/transform_cache.hpp"
#include "test_support.hpp"

#include <atomic>
#include <filesystem>
#include <string>

namespace {

using namespace chunkvault;

constexpr std::uint64_t kMiB = 1024ull * 1024ull;

const envelope::KeyPair& Keys() {
    static const envelope::KeyPair keys = envelope::GenerateKeyPair();
    return keys;
}

// Forwards to a MemoryArtifactStore and counts reads.
class CountingStore : public store::ArtifactStore {
public:
    explicit CountingStore(store::MemoryArtifactStore& inner) : inner_(inner) {}

    void Write(const std::string& location, const Bytes& data) override { inner_.Write(location, data); }
    Bytes Read(const std::string& location) const override {
        ++reads_;
        return inner_.Read(location);
    }
    bool Exists(const std::string& location) const override { return inner_.Exists(location); }
    void Remove(const std::string& location) override { inner_.Remove(location); }
    std::vector<std::string> List() const override { return inner_.List(); }

    int reads() const { return reads_.load(); }

private:
    store::MemoryArtifactStore& inner_;
    mutable std::atomic<int> reads_{0};
};

struct Fixture {
    store::MemoryArtifactStore artifacts;
    store::MemoryManifestStore manifests;

    manifest::Manifest Write(const std::string& name, const Bytes& data, planner::SizeLimits limits,
                             std::size_t workers = 0) {
        chunker::WriteOptions options;
        options.limits = limits;
        options.workers = workers;
        chunker::Chunker chunker(artifacts, manifests, Keys().public_key, options);
        return chunker.PlanAndEncode(name, data);
    }

    Bytes Read(const manifest::Manifest& m, cache::TransformCache* cache = nullptr) {
        reassembler::Reassembler reader(artifacts, Keys().private_key, cache);
        return reader.Reconstruct(m);
    }
};

void RoundTripAcrossSizes() {
    const planner::SizeLimits limits{4096, 1024};
    for (std::size_t size : {std::size_t{0}, std::size_t{1}, std::size_t{1023}, std::size_t{4000},
                             std::size_t{4097}, std::size_t{10 * 1024 + 17}}) {
        Fixture fx;
        Bytes data = test::RandomData(size, static_cast<std::uint32_t>(size) + 1);
        manifest::Manifest m = fx.Write("blob", data, limits);
        CHUNKVAULT_EXPECT_EQ(m.original_size, size);
        CHUNKVAULT_EXPECT_EQ(m.IsChunked(), size > limits.max_artifact_size);
        if (m.IsChunked()) {
            CHUNKVAULT_EXPECT_EQ(m.NumChunks(), (size + 1023) / 1024);
        }
        for (const auto& record : m.Records()) {
            CHUNKVAULT_EXPECT(record.ciphertext_size <= limits.max_artifact_size);
            CHUNKVAULT_EXPECT_EQ(fx.artifacts.Read(record.location).size(), record.ciphertext_size);
        }
        CHUNKVAULT_EXPECT(fx.Read(m) == data);
        CHUNKVAULT_EXPECT(fx.Read(fx.manifests.Load("blob")) == data);
    }
}

void TwentyFiveMiBScenario() {
    Fixture fx;
    Bytes data = test::PatternData(static_cast<std::size_t>(25 * kMiB));
    manifest::Manifest m = fx.Write("scenario", data, {10 * kMiB, 10 * kMiB});
    CHUNKVAULT_EXPECT(m.IsChunked());
    CHUNKVAULT_EXPECT_EQ(m.NumChunks(), 3u);
    std::vector<manifest::ChunkRecord> records = m.Records();
    CHUNKVAULT_EXPECT_EQ(records[0].plaintext_size, 10 * kMiB);
    CHUNKVAULT_EXPECT_EQ(records[1].plaintext_size, 10 * kMiB);
    CHUNKVAULT_EXPECT_EQ(records[2].plaintext_size, 5 * kMiB);
    for (const auto& record : records) {
        CHUNKVAULT_EXPECT(record.ciphertext_size <= 10 * kMiB);
        Bytes plain = codec::Decode(fx.artifacts.Read(record.location), Keys().private_key);
        CHUNKVAULT_EXPECT_EQ(plain.size(), record.plaintext_size);
    }
    Bytes back = fx.Read(m);
    CHUNKVAULT_EXPECT_EQ(back.size(), static_cast<std::size_t>(25 * kMiB));
    CHUNKVAULT_EXPECT(back == data);
}

void EmptyFileIsOneUnchunkedArtifact() {
    Fixture fx;
    manifest::Manifest m = fx.Write("empty", Bytes{}, {});
    CHUNKVAULT_EXPECT(!m.IsChunked());
    CHUNKVAULT_EXPECT_EQ(m.original_size, 0u);
    CHUNKVAULT_EXPECT_EQ(fx.artifacts.List().size(), 1u);
    CHUNKVAULT_EXPECT(fx.Read(m).empty());
}

void OversizedArtifactIsSizeViolation() {
    Fixture fx;
    Bytes data = test::RandomData(500, 21);
    CHUNKVAULT_EXPECT_THROWS(SizeViolationError, fx.Write("tiny", data, {100, 100}));
    CHUNKVAULT_EXPECT(!fx.manifests.Exists("tiny"));
    CHUNKVAULT_EXPECT(fx.artifacts.List().empty());

    // A ceiling below the fixed artifact overhead can never hold anything.
    CHUNKVAULT_EXPECT_THROWS(SizeViolationError, fx.Write("tiny", Bytes{}, {1, 1}));
}

void TamperingIsNeverSilent() {
    Fixture fx;
    Bytes data = test::RandomData(3000, 22);
    manifest::Manifest m = fx.Write("tamper", data, {1200, 1000});
    CHUNKVAULT_EXPECT_EQ(m.NumChunks(), 3u);
    for (const auto& record : m.Records()) {
        for (std::size_t offset : {std::size_t{0}, std::size_t{20}, std::size_t{45},
                                   static_cast<std::size_t>(record.ciphertext_size / 2),
                                   static_cast<std::size_t>(record.ciphertext_size - 1)}) {
            fx.artifacts.Corrupt(record.location, offset);
            bool detected = false;
            try {
                fx.Read(m);
            } catch (const DecodeError&) {
                detected = true;
            } catch (const IntegrityError&) {
                detected = true;
            }
            CHUNKVAULT_EXPECT(detected);
            fx.artifacts.Corrupt(record.location, offset);
        }
    }
    CHUNKVAULT_EXPECT(fx.Read(m) == data);
}

void HashMismatchNamesChunkAndDigests() {
    Fixture fx;
    Bytes data = test::RandomData(3000, 23);
    manifest::Manifest m = fx.Write("digest", data, {1200, 1000});
    auto& chunks = std::get<manifest::ChunkedLayout>(m.layout).chunks;
    Digest recorded = chunks[1].plaintext_hash;
    chunks[1].plaintext_hash[0] ^= 0xFF;
    cache::TransformCache cache;
    try {
        fx.Read(m, &cache);
        CHUNKVAULT_EXPECT(false);
    } catch (const IntegrityError& exc) {
        CHUNKVAULT_EXPECT_EQ(exc.index(), 1u);
        CHUNKVAULT_EXPECT_EQ(exc.expected(), crypto::HexEncode(chunks[1].plaintext_hash));
        CHUNKVAULT_EXPECT_EQ(exc.actual(), crypto::HexEncode(recorded));
    }
    CHUNKVAULT_EXPECT(cache.Find(chunks[1].location) == nullptr);
}

void LengthMismatchIsDecodeError() {
    Fixture fx;
    manifest::Manifest m = fx.Write("length", test::RandomData(300, 24), {});
    std::get<manifest::UnchunkedLayout>(m.layout).ciphertext_size += 1;
    CHUNKVAULT_EXPECT_THROWS(DecodeError, fx.Read(m));
}

void CorruptManifestFailsBeforeDecode() {
    store::MemoryArtifactStore inner;
    CountingStore counting(inner);
    store::MemoryManifestStore manifests;
    chunker::WriteOptions options;
    options.limits = {1200, 1000};
    chunker::Chunker chunker(counting, manifests, Keys().public_key, options);
    manifest::Manifest m = chunker.PlanAndEncode("counted", test::RandomData(3000, 25));

    reassembler::Reassembler reader(counting, Keys().private_key);
    manifest::Manifest duplicated = m;
    std::get<manifest::ChunkedLayout>(duplicated.layout).chunks[2].index = 1;
    CHUNKVAULT_EXPECT_THROWS(StructuralError, reader.Reconstruct(duplicated));
    manifest::Manifest skipped = m;
    std::get<manifest::ChunkedLayout>(skipped.layout).chunks[2].index = 5;
    CHUNKVAULT_EXPECT_THROWS(StructuralError, reader.Reconstruct(skipped));
    CHUNKVAULT_EXPECT_EQ(counting.reads(), 0);

    std::string text = manifests.RawText("counted");
    std::size_t pos = text.find("\"index\": 2");
    text.replace(pos, 10, "\"index\": 0");
    manifests.PutRawText("counted", text);
    CHUNKVAULT_EXPECT_THROWS(StructuralError, manifests.Load("counted"));
    CHUNKVAULT_EXPECT_EQ(counting.reads(), 0);
}

void CacheAvoidsRepeatedDecode() {
    store::MemoryArtifactStore inner;
    CountingStore counting(inner);
    store::MemoryManifestStore manifests;
    chunker::WriteOptions options;
    options.limits = {1200, 1000};
    chunker::Chunker chunker(counting, manifests, Keys().public_key, options);
    Bytes data = test::RandomData(3000, 26);
    manifest::Manifest m = chunker.PlanAndEncode("cached", data);

    cache::TransformCache cache;
    reassembler::Reassembler reader(counting, Keys().private_key, &cache);
    Bytes first = reader.Reconstruct(m);
    int reads_after_first = counting.reads();
    Bytes second = reader.Reconstruct(m);
    CHUNKVAULT_EXPECT(first == data);
    CHUNKVAULT_EXPECT(second == first);
    CHUNKVAULT_EXPECT_EQ(reads_after_first, 3);
    CHUNKVAULT_EXPECT_EQ(counting.reads(), 3);
    CHUNKVAULT_EXPECT_EQ(cache.Stats().hits, 3u);

    cache.Clear();
    CHUNKVAULT_EXPECT(reader.Reconstruct(m) == data);
    CHUNKVAULT_EXPECT_EQ(counting.reads(), 6);
}

void ParallelWorkersKeepIndexOrder() {
    Fixture fx;
    Bytes data = test::RandomData(64 * 1024 + 5, 27);
    manifest::Manifest m = fx.Write("parallel", data, {2048, 1024}, 8);
    CHUNKVAULT_EXPECT_EQ(m.NumChunks(), 65u);
    reassembler::ReadOptions options;
    options.workers = 8;
    std::size_t calls = 0;
    std::size_t last_done = 0;
    bool monotonic = true;
    options.progress = [&](const Progress& progress) {
        ++calls;
        monotonic = monotonic && progress.chunks_done == last_done + 1;
        last_done = progress.chunks_done;
    };
    reassembler::Reassembler reader(fx.artifacts, Keys().private_key, nullptr, options);
    CHUNKVAULT_EXPECT(reader.Reconstruct(m) == data);
    CHUNKVAULT_EXPECT_EQ(calls, 65u);
    CHUNKVAULT_EXPECT(monotonic);
}

void CancelledWriteLeavesNoManifest() {
    Fixture fx;
    std::atomic<bool> cancel{false};
    chunker::WriteOptions options;
    options.limits = {1200, 1000};
    options.workers = 1;
    options.cancel = &cancel;
    options.progress = [&](const Progress& progress) {
        if (progress.chunks_done == 2) {
            cancel.store(true);
        }
    };
    chunker::Chunker chunker(fx.artifacts, fx.manifests, Keys().public_key, options);
    CHUNKVAULT_EXPECT_THROWS(EncodeError, chunker.PlanAndEncode("aborted", test::RandomData(5000, 28)));
    CHUNKVAULT_EXPECT(!fx.manifests.Exists("aborted"));
    CHUNKVAULT_EXPECT_EQ(fx.artifacts.List().size(), 2u);

    chunker::GcReport report = chunker::CollectGarbage(fx.artifacts, fx.manifests);
    CHUNKVAULT_EXPECT_EQ(report.removed.size(), 2u);
    CHUNKVAULT_EXPECT(fx.artifacts.List().empty());
}

void GarbageCollectionKeepsReferencedArtifacts() {
    Fixture fx;
    Bytes data = test::RandomData(3000, 29);
    fx.Write("kept", data, {1200, 1000});
    manifest::Manifest replaced = fx.Write("kept", data, {1200, 1000});
    fx.Write("other", test::RandomData(10, 30), {});
    CHUNKVAULT_EXPECT_EQ(fx.artifacts.List().size(), 7u);

    chunker::GcReport dry = chunker::CollectGarbage(fx.artifacts, fx.manifests, true);
    CHUNKVAULT_EXPECT_EQ(dry.removed.size(), 3u);
    CHUNKVAULT_EXPECT_EQ(fx.artifacts.List().size(), 7u);

    chunker::GcReport report = chunker::CollectGarbage(fx.artifacts, fx.manifests);
    CHUNKVAULT_EXPECT_EQ(report.removed.size(), 3u);
    CHUNKVAULT_EXPECT_EQ(report.kept, 4u);
    CHUNKVAULT_EXPECT(fx.Read(fx.manifests.Load("kept")) == data);
    CHUNKVAULT_EXPECT(fx.Read(replaced) == data);
}

void VerifyReportsEveryBadChunk() {
    Fixture fx;
    Bytes data = test::RandomData(5000, 31);
    manifest::Manifest m = fx.Write("verify", data, {1200, 1000});
    reassembler::Reassembler reader(fx.artifacts, Keys().private_key);
    CHUNKVAULT_EXPECT(reader.Verify(m).ok());

    std::vector<manifest::ChunkRecord> records = m.Records();
    fx.artifacts.Corrupt(records[1].location, 60);
    fx.artifacts.Remove(records[3].location);
    reassembler::VerifyReport report = reader.Verify(m);
    CHUNKVAULT_EXPECT(!report.ok());
    CHUNKVAULT_EXPECT_EQ(report.chunks_checked, 5u);
    CHUNKVAULT_EXPECT_EQ(report.failures.size(), 2u);
    if (report.failures.size() == 2) {
        CHUNKVAULT_EXPECT_EQ(report.failures[0].index, 1u);
        CHUNKVAULT_EXPECT_EQ(report.failures[0].kind, std::string("decode"));
        CHUNKVAULT_EXPECT_EQ(report.failures[1].index, 3u);
        CHUNKVAULT_EXPECT_EQ(report.failures[1].kind, std::string("storage"));
    }
}

void MissingKeysFailUpFront() {
    Fixture fx;
    chunker::Chunker chunker(fx.artifacts, fx.manifests, "", {});
    CHUNKVAULT_EXPECT_THROWS(ConfigurationError, chunker.PlanAndEncode("nokey", Bytes(10, 1)));
    CHUNKVAULT_EXPECT(fx.artifacts.List().empty());

    manifest::Manifest m = fx.Write("haskey", Bytes(10, 1), {});
    reassembler::Reassembler reader(fx.artifacts, "");
    CHUNKVAULT_EXPECT_THROWS(ConfigurationError, reader.Reconstruct(m));
}

void FileStoresRoundTrip() {
    test::TempDir dir("pipeline");
    std::filesystem::path input = dir.path() / "input";
    std::filesystem::create_directories(input);
    Bytes big = test::RandomData(9000, 32);
    Bytes small = test::RandomData(100, 33);
    fileio::WriteFileAtomic((input / "big.bin").string(), big);
    fileio::WriteFileAtomic((input / "small.txt").string(), small);

    std::filesystem::path out = dir.path() / "out";
    store::FileArtifactStore artifacts(out);
    store::FileManifestStore manifests(out);
    chunker::WriteOptions options;
    options.limits = {4096, 2048};
    chunker::Chunker chunker(artifacts, manifests, Keys().public_key, options);
    std::vector<manifest::Manifest> produced = chunker.PlanAndEncodeDirectory(input.string());
    CHUNKVAULT_EXPECT_EQ(produced.size(), 2u);
    CHUNKVAULT_EXPECT(manifests.Exists("big"));
    CHUNKVAULT_EXPECT(manifests.Exists("small"));
    CHUNKVAULT_EXPECT(std::filesystem::exists(out / "big.manifest.json"));
    CHUNKVAULT_EXPECT_EQ(manifests.List().size(), 2u);
    CHUNKVAULT_EXPECT_EQ(artifacts.List().size(), 6u);

    reassembler::Reassembler reader(artifacts, Keys().private_key);
    std::filesystem::path restored = dir.path() / "restored" / "big.bin";
    reader.ReconstructToFile(manifests.Load("big"), restored.string());
    CHUNKVAULT_EXPECT(fileio::ReadFile(restored.string()) == big);
    CHUNKVAULT_EXPECT(reader.Reconstruct(manifests.Load("small")) == small);

    CHUNKVAULT_EXPECT_THROWS(StorageError, artifacts.Read("../escape.cva"));
    CHUNKVAULT_EXPECT_THROWS(StorageError, artifacts.Read("missing.cva"));
}

void SharedStemInDirectoryIsRejected() {
    test::TempDir dir("stems");
    std::filesystem::path input = dir.path() / "input";
    fileio::WriteFileAtomic((input / "a.bin").string(), test::RandomData(500, 34));
    fileio::WriteFileAtomic((input / "a.txt").string(), test::RandomData(600, 35));
    fileio::WriteFileAtomic((input / "b.bin").string(), test::RandomData(700, 36));

    Fixture fx;
    chunker::WriteOptions options;
    options.limits = {1200, 1000};
    chunker::Chunker chunker(fx.artifacts, fx.manifests, Keys().public_key, options);
    CHUNKVAULT_EXPECT_THROWS(StorageError, chunker.PlanAndEncodeDirectory(input.string()));
    CHUNKVAULT_EXPECT(fx.manifests.List().empty());
    CHUNKVAULT_EXPECT(fx.artifacts.List().empty());
}

void AtomicWriteReplacesWithoutLeftovers() {
    test::TempDir dir("atomic");
    std::filesystem::path target = dir.path() / "nested" / "blob.cva";
    fileio::WriteFileAtomic(target.string(), test::RandomData(2000, 37));
    Bytes second = test::RandomData(10, 38);
    fileio::WriteFileAtomic(target.string(), second);
    CHUNKVAULT_EXPECT(fileio::ReadFile(target.string()) == second);

    std::size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(target.parent_path())) {
        CHUNKVAULT_EXPECT_EQ(entry.path().filename().string(), std::string("blob.cva"));
        ++entries;
    }
    CHUNKVAULT_EXPECT_EQ(entries, 1u);

    std::filesystem::path blocked = target / "child.cva";
    CHUNKVAULT_EXPECT_THROWS(StorageError, fileio::WriteFileAtomic(blocked.string(), second));
}

}  // namespace

int main() {
    return chunkvault::test::RunTests("pipeline", {
        {"RoundTripAcrossSizes", RoundTripAcrossSizes},
        {"TwentyFiveMiBScenario", TwentyFiveMiBScenario},
        {"EmptyFileIsOneUnchunkedArtifact", EmptyFileIsOneUnchunkedArtifact},
        {"OversizedArtifactIsSizeViolation", OversizedArtifactIsSizeViolation},
        {"TamperingIsNeverSilent", TamperingIsNeverSilent},
        {"HashMismatchNamesChunkAndDigests", HashMismatchNamesChunkAndDigests},
        {"LengthMismatchIsDecodeError", LengthMismatchIsDecodeError},
        {"CorruptManifestFailsBeforeDecode", CorruptManifestFailsBeforeDecode},
        {"CacheAvoidsRepeatedDecode", CacheAvoidsRepeatedDecode},
        {"ParallelWorkersKeepIndexOrder", ParallelWorkersKeepIndexOrder},
        {"CancelledWriteLeavesNoManifest", CancelledWriteLeavesNoManifest},
        {"GarbageCollectionKeepsReferencedArtifacts", GarbageCollectionKeepsReferencedArtifacts},
        {"VerifyReportsEveryBadChunk", VerifyReportsEveryBadChunk},
        {"MissingKeysFailUpFront", MissingKeysFailUpFront},
        {"FileStoresRoundTrip", FileStoresRoundTrip},
        {"SharedStemInDirectoryIsRejected", SharedStemInDirectoryIsRejected},
        {"AtomicWriteReplacesWithoutLeftovers", AtomicWriteReplacesWithoutLeftovers},
    });
}
