#pragma once

#include "chunkvault/crypto.hpp"
#include "chunkvault/manifest.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace chunkvault::store {

// location -> bytes. Locations are flat relative names chosen by the chunker.
// Failures raise StorageError.
class ArtifactStore {
public:
    virtual ~ArtifactStore() = default;

    virtual void Write(const std::string& location, const Bytes& data) = 0;
    virtual Bytes Read(const std::string& location) const = 0;
    virtual bool Exists(const std::string& location) const = 0;
    virtual void Remove(const std::string& location) = 0;
    virtual std::vector<std::string> List() const = 0;
};

class ManifestStore {
public:
    virtual ~ManifestStore() = default;

    // Validates before storing; an invalid manifest is never persisted.
    virtual void Save(const manifest::Manifest& manifest) = 0;
    virtual manifest::Manifest Load(const std::string& name) const = 0;
    virtual bool Exists(const std::string& name) const = 0;
    virtual std::vector<std::string> List() const = 0;
};

class FileArtifactStore : public ArtifactStore {
public:
    explicit FileArtifactStore(std::filesystem::path root);

    void Write(const std::string& location, const Bytes& data) override;
    Bytes Read(const std::string& location) const override;
    bool Exists(const std::string& location) const override;
    void Remove(const std::string& location) override;
    std::vector<std::string> List() const override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path Resolve(const std::string& location) const;

    std::filesystem::path root_;
};

class MemoryArtifactStore : public ArtifactStore {
public:
    void Write(const std::string& location, const Bytes& data) override;
    Bytes Read(const std::string& location) const override;
    bool Exists(const std::string& location) const override;
    void Remove(const std::string& location) override;
    std::vector<std::string> List() const override;

    // Test hook: mutate stored bytes in place.
    void Corrupt(const std::string& location, std::size_t offset, std::uint8_t mask = 0x01);
    std::size_t writes() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Bytes> objects_;
    std::size_t writes_ = 0;
};

// Stores "<name>.manifest.json" files in one directory.
class FileManifestStore : public ManifestStore {
public:
    explicit FileManifestStore(std::filesystem::path dir);

    void Save(const manifest::Manifest& manifest) override;
    manifest::Manifest Load(const std::string& name) const override;
    bool Exists(const std::string& name) const override;
    std::vector<std::string> List() const override;

    std::filesystem::path PathFor(const std::string& name) const;

private:
    std::filesystem::path dir_;
};

class MemoryManifestStore : public ManifestStore {
public:
    void Save(const manifest::Manifest& manifest) override;
    manifest::Manifest Load(const std::string& name) const override;
    bool Exists(const std::string& name) const override;
    std::vector<std::string> List() const override;

    // Stored JSON text, for tests that tamper with it.
    std::string RawText(const std::string& name) const;
    void PutRawText(const std::string& name, std::string text);

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> documents_;
};

// Rejects names that are empty, contain path separators, or are "." / "..".
void CheckFlatName(const std::string& name, const char* what);

}  // namespace chunkvault::store
