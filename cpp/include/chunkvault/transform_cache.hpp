#pragma once

#include "chunkvault/crypto.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkvault::cache {

// Bookkeeping hooks driven by TransformCache while it holds its lock.
class EvictionPolicy {
public:
    virtual ~EvictionPolicy() = default;

    virtual void OnInsert(const std::string& key, std::size_t bytes) = 0;
    virtual void OnAccess(const std::string& key) = 0;
    virtual void OnErase(const std::string& key) = 0;
    virtual void OnClear() = 0;
    // Next key to drop while the cache holds `total_bytes`, or nullopt when
    // nothing needs to go.
    virtual std::optional<std::string> Victim(std::size_t total_bytes) = 0;
};

// Keeps everything until Clear() or Erase().
class UnboundedEviction : public EvictionPolicy {
public:
    void OnInsert(const std::string&, std::size_t) override {}
    void OnAccess(const std::string&) override {}
    void OnErase(const std::string&) override {}
    void OnClear() override {}
    std::optional<std::string> Victim(std::size_t) override { return std::nullopt; }
};

// Least-recently-used eviction under a byte budget. An entry larger than the
// budget is handed back to the caller but not retained.
class LruEviction : public EvictionPolicy {
public:
    explicit LruEviction(std::size_t max_bytes);

    void OnInsert(const std::string& key, std::size_t bytes) override;
    void OnAccess(const std::string& key) override;
    void OnErase(const std::string& key) override;
    void OnClear() override;
    std::optional<std::string> Victim(std::size_t total_bytes) override;

    std::size_t max_bytes() const { return max_bytes_; }

private:
    std::size_t max_bytes_;
    std::list<std::string> order_;
    std::unordered_map<std::string, std::list<std::string>::iterator> positions_;
};

struct CacheStats {
    std::size_t entries = 0;
    std::size_t bytes = 0;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::vector<std::string> keys;
};

// Decoded plaintext keyed by artifact location. Safe for concurrent use; the
// lock is not held while decoding, so two readers may decode the same
// location at once. The first value stored wins and later ones are dropped.
class TransformCache {
public:
    using DecodeFn = std::function<Bytes()>;

    TransformCache();
    explicit TransformCache(std::unique_ptr<EvictionPolicy> policy);

    std::shared_ptr<const Bytes> GetOrDecode(const std::string& location, const DecodeFn& decode);
    std::shared_ptr<const Bytes> Find(const std::string& location);
    void Erase(const std::string& location);
    void Clear();
    CacheStats Stats() const;

private:
    void InsertLocked(const std::string& location, std::shared_ptr<const Bytes> value);
    void EraseLocked(const std::string& location);

    mutable std::mutex mutex_;
    std::unique_ptr<EvictionPolicy> policy_;
    std::unordered_map<std::string, std::shared_ptr<const Bytes>> entries_;
    std::size_t bytes_ = 0;
    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;
};

// CHUNKVAULT_CACHE_BYTES semantics: 0 keeps everything.
std::unique_ptr<EvictionPolicy> MakePolicy(std::uint64_t max_bytes);

}  // namespace chunkvault::cache
