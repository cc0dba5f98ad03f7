#include "chunkvault/store.hpp"

#include "chunkvault/constants.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/fileio.hpp"

#include <algorithm>
#include <system_error>

namespace chunkvault::store {

namespace fs = std::filesystem;

namespace {

bool EndsWith(const std::string& text, std::string_view suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

manifest::Manifest CheckLoadedName(manifest::Manifest loaded, const std::string& name) {
    if (loaded.original_name != name) {
        throw StructuralError("Manifest stored as '" + name + "' names file '" + loaded.original_name + "'");
    }
    return loaded;
}

}  // namespace

void CheckFlatName(const std::string& name, const char* what) {
    if (name.empty() || name == "." || name == ".."
        || name.find_first_of("/\\") != std::string::npos || name.find('\0') != std::string::npos) {
        throw StorageError(std::string("Invalid ") + what + " name: '" + name + "'");
    }
}

// ---- FileArtifactStore ----

FileArtifactStore::FileArtifactStore(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw StorageError("Failed to create artifact directory " + root_.string() + ": " + ec.message());
    }
}

fs::path FileArtifactStore::Resolve(const std::string& location) const {
    CheckFlatName(location, "artifact");
    return root_ / location;
}

void FileArtifactStore::Write(const std::string& location, const Bytes& data) {
    fileio::WriteFileAtomic(Resolve(location).string(), data);
}

Bytes FileArtifactStore::Read(const std::string& location) const {
    return fileio::ReadFile(Resolve(location).string());
}

bool FileArtifactStore::Exists(const std::string& location) const {
    std::error_code ec;
    bool found = fs::is_regular_file(Resolve(location), ec);
    return found && !ec;
}

void FileArtifactStore::Remove(const std::string& location) {
    std::error_code ec;
    fs::remove(Resolve(location), ec);
    if (ec) {
        throw StorageError("Failed to remove artifact " + location + ": " + ec.message());
    }
}

std::vector<std::string> FileArtifactStore::List() const {
    std::vector<std::string> out;
    std::error_code ec;
    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file()) {
            continue;
        }
        std::string name = it->path().filename().string();
        if (EndsWith(name, constants::kArtifactSuffix)) {
            out.push_back(name);
        }
    }
    if (ec) {
        throw StorageError("Failed to list " + root_.string() + ": " + ec.message());
    }
    std::sort(out.begin(), out.end());
    return out;
}

// ---- MemoryArtifactStore ----

void MemoryArtifactStore::Write(const std::string& location, const Bytes& data) {
    CheckFlatName(location, "artifact");
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[location] = data;
    ++writes_;
}

Bytes MemoryArtifactStore::Read(const std::string& location) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(location);
    if (it == objects_.end()) {
        throw StorageError("Artifact not found: " + location);
    }
    return it->second;
}

bool MemoryArtifactStore::Exists(const std::string& location) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.count(location) != 0;
}

void MemoryArtifactStore::Remove(const std::string& location) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_.erase(location);
}

std::vector<std::string> MemoryArtifactStore::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(objects_.size());
    for (const auto& entry : objects_) {
        out.push_back(entry.first);
    }
    return out;
}

void MemoryArtifactStore::Corrupt(const std::string& location, std::size_t offset, std::uint8_t mask) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(location);
    if (it == objects_.end() || offset >= it->second.size()) {
        throw StorageError("Cannot corrupt " + location + " at offset " + std::to_string(offset));
    }
    it->second[offset] ^= mask;
}

std::size_t MemoryArtifactStore::writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

// ---- FileManifestStore ----

FileManifestStore::FileManifestStore(fs::path dir) : dir_(std::move(dir)) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw StorageError("Failed to create manifest directory " + dir_.string() + ": " + ec.message());
    }
}

fs::path FileManifestStore::PathFor(const std::string& name) const {
    CheckFlatName(name, "manifest");
    return dir_ / (name + std::string(constants::kManifestSuffix));
}

void FileManifestStore::Save(const manifest::Manifest& manifest) {
    manifest::Validate(manifest);
    fileio::WriteFileAtomic(PathFor(manifest.original_name).string(), manifest::ToJson(manifest));
}

manifest::Manifest FileManifestStore::Load(const std::string& name) const {
    return CheckLoadedName(manifest::FromJson(fileio::ReadText(PathFor(name).string())), name);
}

bool FileManifestStore::Exists(const std::string& name) const {
    std::error_code ec;
    bool found = fs::is_regular_file(PathFor(name), ec);
    return found && !ec;
}

std::vector<std::string> FileManifestStore::List() const {
    std::vector<std::string> out;
    std::error_code ec;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file()) {
            continue;
        }
        std::string name = it->path().filename().string();
        if (EndsWith(name, constants::kManifestSuffix)) {
            out.push_back(name.substr(0, name.size() - constants::kManifestSuffix.size()));
        }
    }
    if (ec) {
        throw StorageError("Failed to list " + dir_.string() + ": " + ec.message());
    }
    std::sort(out.begin(), out.end());
    return out;
}

// ---- MemoryManifestStore ----

void MemoryManifestStore::Save(const manifest::Manifest& manifest) {
    manifest::Validate(manifest);
    CheckFlatName(manifest.original_name, "manifest");
    std::string text = manifest::ToJson(manifest);
    std::lock_guard<std::mutex> lock(mutex_);
    documents_[manifest.original_name] = std::move(text);
}

manifest::Manifest MemoryManifestStore::Load(const std::string& name) const {
    return CheckLoadedName(manifest::FromJson(RawText(name)), name);
}

bool MemoryManifestStore::Exists(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return documents_.count(name) != 0;
}

std::vector<std::string> MemoryManifestStore::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& entry : documents_) {
        out.push_back(entry.first);
    }
    return out;
}

std::string MemoryManifestStore::RawText(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(name);
    if (it == documents_.end()) {
        throw StorageError("Manifest not found: " + name);
    }
    return it->second;
}

void MemoryManifestStore::PutRawText(const std::string& name, std::string text) {
    std::lock_guard<std::mutex> lock(mutex_);
    documents_[name] = std::move(text);
}

}  // namespace chunkvault::store
