#include "chunkvault/manifest.hpp"

#include "chunkvault/constants.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/json.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <limits>
#include <set>
#include <stdexcept>

namespace chunkvault::manifest {

namespace {

const json::Value& Require(const json::Value& object, std::string_view key) {
    const json::Value* value = object.Find(key);
    if (!value) {
        throw StructuralError("Manifest is missing field '" + std::string(key) + "'");
    }
    return *value;
}

std::uint64_t RequireUnsigned(const json::Value& object, std::string_view key) {
    try {
        return Require(object, key).AsUnsigned();
    } catch (const StructuralError&) {
        throw;
    } catch (const std::exception& exc) {
        throw StructuralError("Manifest field '" + std::string(key) + "': " + exc.what());
    }
}

std::string RequireString(const json::Value& object, std::string_view key) {
    const json::Value& value = Require(object, key);
    if (value.type() != json::Value::Type::String) {
        throw StructuralError("Manifest field '" + std::string(key) + "' must be a string");
    }
    return value.AsString();
}

Digest RequireDigest(const json::Value& object, std::string_view key) {
    std::string hex = RequireString(object, key);
    Digest digest{};
    if (!crypto::HexDecode(hex, digest)) {
        throw StructuralError("Manifest field '" + std::string(key) + "' is not a 64-digit hex digest");
    }
    return digest;
}

ChunkRecord ParseChunk(const json::Value& item) {
    if (item.type() != json::Value::Type::Object) {
        throw StructuralError("Manifest chunk entry must be an object");
    }
    ChunkRecord record;
    std::uint64_t index = RequireUnsigned(item, "index");
    if (index > std::numeric_limits<std::size_t>::max()) {
        throw StructuralError("Manifest chunk index out of range");
    }
    record.index = static_cast<std::size_t>(index);
    record.location = RequireString(item, "path");
    record.ciphertext_size = RequireUnsigned(item, "size");
    record.plaintext_size = RequireUnsigned(item, "plaintextSize");
    record.plaintext_hash = RequireDigest(item, "hash");
    return record;
}

json::Value ChunkToJson(const ChunkRecord& record) {
    json::Value item = json::Value::MakeObject();
    item.Set("index", json::Value::MakeUnsigned(record.index));
    item.Set("path", json::Value::MakeString(record.location));
    item.Set("size", json::Value::MakeUnsigned(record.ciphertext_size));
    item.Set("plaintextSize", json::Value::MakeUnsigned(record.plaintext_size));
    item.Set("hash", json::Value::MakeString(crypto::HexEncode(record.plaintext_hash)));
    return item;
}

// Names and locations are single path components inside a store.
bool IsFlatName(const std::string& name) {
    return !name.empty() && name != "." && name != ".." && name.find_first_of("/\\") == std::string::npos
           && name.find('\0') == std::string::npos;
}

void CheckRecord(const std::string& label, const std::string& location, std::uint64_t ciphertext_size,
                 std::uint64_t ceiling) {
    if (location.empty()) {
        throw StructuralError(label + " has no location");
    }
    if (!IsFlatName(location)) {
        throw StructuralError(label + " has invalid location '" + location + "'");
    }
    if (ceiling != 0 && ciphertext_size > ceiling) {
        throw StructuralError(label + " is " + std::to_string(ciphertext_size) + " bytes, above the "
                              + std::to_string(ceiling) + " byte ceiling");
    }
}

}  // namespace

std::size_t Manifest::NumChunks() const {
    if (const auto* chunked = std::get_if<ChunkedLayout>(&layout)) {
        return chunked->chunks.size();
    }
    return 1;
}

std::vector<ChunkRecord> Manifest::Records() const {
    if (const auto* chunked = std::get_if<ChunkedLayout>(&layout)) {
        return chunked->chunks;
    }
    const auto& single = std::get<UnchunkedLayout>(layout);
    ChunkRecord record;
    record.index = 0;
    record.location = single.location;
    record.ciphertext_size = single.ciphertext_size;
    record.plaintext_size = original_size;
    record.plaintext_hash = single.plaintext_hash;
    return {record};
}

std::vector<std::string> Manifest::Locations() const {
    std::vector<std::string> out;
    for (const auto& record : Records()) {
        out.push_back(record.location);
    }
    return out;
}

void Validate(const Manifest& manifest) {
    if (manifest.original_name.empty()) {
        throw StructuralError("Manifest has no original file name");
    }
    if (!IsFlatName(manifest.original_name)) {
        throw StructuralError("Manifest file name '" + manifest.original_name + "' is not a plain name");
    }
    if (const auto* single = std::get_if<UnchunkedLayout>(&manifest.layout)) {
        CheckRecord("Unchunked artifact", single->location, single->ciphertext_size, manifest.max_artifact_size);
        return;
    }
    const auto& chunks = std::get<ChunkedLayout>(manifest.layout).chunks;
    if (chunks.empty()) {
        throw StructuralError("Chunked manifest lists no chunks");
    }
    std::uint64_t total = 0;
    std::set<std::string> locations;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const ChunkRecord& record = chunks[i];
        if (record.index != i) {
            if (record.index < i) {
                throw StructuralError("Duplicate chunk index " + std::to_string(record.index));
            }
            throw StructuralError("Missing chunk index " + std::to_string(i));
        }
        CheckRecord("Chunk " + std::to_string(i), record.location, record.ciphertext_size,
                    manifest.max_artifact_size);
        if (!locations.insert(record.location).second) {
            throw StructuralError("Chunk " + std::to_string(i) + " reuses location " + record.location);
        }
        if (record.plaintext_size > std::numeric_limits<std::uint64_t>::max() - total) {
            throw StructuralError("Chunk sizes overflow");
        }
        total += record.plaintext_size;
    }
    if (total != manifest.original_size) {
        throw StructuralError("Chunk sizes sum to " + std::to_string(total) + " but original size is "
                              + std::to_string(manifest.original_size));
    }
}

std::string ToJson(const Manifest& manifest) {
    json::Value root = json::Value::MakeObject();
    root.Set("version", json::Value::MakeUnsigned(constants::kManifestVersion));
    root.Set("originalFile", json::Value::MakeString(manifest.original_name));
    root.Set("originalSize", json::Value::MakeUnsigned(manifest.original_size));
    root.Set("numChunks", json::Value::MakeUnsigned(manifest.NumChunks()));
    root.Set("chunkSize", json::Value::MakeUnsigned(manifest.chunk_size_target));
    root.Set("maxArtifactSize", json::Value::MakeUnsigned(manifest.max_artifact_size));
    root.Set("compression", json::Value::MakeString(compression::Name(manifest.compression)));
    root.Set("isChunked", json::Value::MakeBool(manifest.IsChunked()));
    json::Value chunks = json::Value::MakeArray();
    if (const auto* chunked = std::get_if<ChunkedLayout>(&manifest.layout)) {
        for (const auto& record : chunked->chunks) {
            chunks.MutableArray().push_back(ChunkToJson(record));
        }
    } else {
        const auto& single = std::get<UnchunkedLayout>(manifest.layout);
        root.Set("path", json::Value::MakeString(single.location));
        root.Set("size", json::Value::MakeUnsigned(single.ciphertext_size));
        root.Set("plaintextSize", json::Value::MakeUnsigned(manifest.original_size));
        root.Set("hash", json::Value::MakeString(crypto::HexEncode(single.plaintext_hash)));
    }
    root.Set("chunks", std::move(chunks));
    root.Set("createdAt", json::Value::MakeString(manifest.created_at));
    return json::Serialize(root);
}

Manifest FromJson(const std::string& text) {
    json::Value root;
    try {
        root = json::Parse(text);
    } catch (const std::exception& exc) {
        throw StructuralError(std::string("Manifest is not valid JSON: ") + exc.what());
    }
    if (root.type() != json::Value::Type::Object) {
        throw StructuralError("Manifest root must be an object");
    }
    if (const json::Value* version = root.Find("version")) {
        std::uint64_t value = 0;
        try {
            value = version->AsUnsigned();
        } catch (const std::exception& exc) {
            throw StructuralError(std::string("Manifest version: ") + exc.what());
        }
        if (value != constants::kManifestVersion) {
            throw StructuralError("Unsupported manifest version " + std::to_string(value));
        }
    }

    Manifest manifest;
    manifest.original_name = RequireString(root, "originalFile");
    manifest.original_size = RequireUnsigned(root, "originalSize");
    manifest.chunk_size_target = RequireUnsigned(root, "chunkSize");
    if (root.Find("maxArtifactSize")) {
        manifest.max_artifact_size = RequireUnsigned(root, "maxArtifactSize");
    }
    if (root.Find("compression")) {
        std::string name = RequireString(root, "compression");
        if (name == "zlib") {
            manifest.compression = compression::Compression::Zlib;
        } else if (name == "xz") {
            manifest.compression = compression::Compression::Xz;
        } else {
            throw StructuralError("Manifest names unknown compression '" + name + "'");
        }
    }
    if (const json::Value* created = root.Find("createdAt")) {
        if (created->type() == json::Value::Type::String) {
            manifest.created_at = created->AsString();
        }
    }

    const json::Value& chunked_flag = Require(root, "isChunked");
    if (chunked_flag.type() != json::Value::Type::Bool) {
        throw StructuralError("Manifest field 'isChunked' must be a boolean");
    }
    std::uint64_t declared_chunks = RequireUnsigned(root, "numChunks");
    const json::Value* chunk_list = root.Find("chunks");
    if (chunk_list && chunk_list->type() != json::Value::Type::Array) {
        throw StructuralError("Manifest field 'chunks' must be an array");
    }

    if (!chunked_flag.AsBool()) {
        if (chunk_list && !chunk_list->AsArray().empty()) {
            throw StructuralError("Unchunked manifest must not list chunks");
        }
        UnchunkedLayout single;
        single.location = RequireString(root, "path");
        single.ciphertext_size = RequireUnsigned(root, "size");
        single.plaintext_hash = RequireDigest(root, "hash");
        if (root.Find("plaintextSize") && RequireUnsigned(root, "plaintextSize") != manifest.original_size) {
            throw StructuralError("Unchunked manifest plaintext size disagrees with original size");
        }
        manifest.layout = single;
    } else {
        if (!chunk_list) {
            throw StructuralError("Manifest is missing field 'chunks'");
        }
        ChunkedLayout chunked;
        for (const auto& item : chunk_list->AsArray()) {
            chunked.chunks.push_back(ParseChunk(item));
        }
        std::stable_sort(chunked.chunks.begin(), chunked.chunks.end(),
                         [](const ChunkRecord& a, const ChunkRecord& b) { return a.index < b.index; });
        manifest.layout = std::move(chunked);
    }
    if (declared_chunks != manifest.NumChunks()) {
        throw StructuralError("Manifest declares " + std::to_string(declared_chunks) + " chunks but lists "
                              + std::to_string(manifest.NumChunks()));
    }
    Validate(manifest);
    return manifest;
}

std::string UtcTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    char buffer[32];
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) {
        return {};
    }
    return std::string(buffer);
}

}  // namespace chunkvault::manifest
