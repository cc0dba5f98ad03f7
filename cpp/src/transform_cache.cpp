#include "chunkvault/transform_cache.hpp"

#include <algorithm>
#include <limits>

namespace chunkvault::cache {

LruEviction::LruEviction(std::size_t max_bytes) : max_bytes_(max_bytes) {}

void LruEviction::OnInsert(const std::string& key, std::size_t) {
    OnErase(key);
    order_.push_front(key);
    positions_[key] = order_.begin();
}

void LruEviction::OnAccess(const std::string& key) {
    auto it = positions_.find(key);
    if (it != positions_.end()) {
        order_.splice(order_.begin(), order_, it->second);
    }
}

void LruEviction::OnErase(const std::string& key) {
    auto it = positions_.find(key);
    if (it != positions_.end()) {
        order_.erase(it->second);
        positions_.erase(it);
    }
}

void LruEviction::OnClear() {
    order_.clear();
    positions_.clear();
}

std::optional<std::string> LruEviction::Victim(std::size_t total_bytes) {
    if (total_bytes <= max_bytes_ || order_.empty()) {
        return std::nullopt;
    }
    return order_.back();
}

TransformCache::TransformCache() : TransformCache(std::make_unique<UnboundedEviction>()) {}

TransformCache::TransformCache(std::unique_ptr<EvictionPolicy> policy) : policy_(std::move(policy)) {
    if (!policy_) {
        policy_ = std::make_unique<UnboundedEviction>();
    }
}

std::shared_ptr<const Bytes> TransformCache::GetOrDecode(const std::string& location, const DecodeFn& decode) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(location);
        if (it != entries_.end()) {
            ++hits_;
            policy_->OnAccess(location);
            return it->second;
        }
        ++misses_;
    }

    auto value = std::make_shared<const Bytes>(decode());

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(location);
    if (it != entries_.end()) {
        policy_->OnAccess(location);
        return it->second;
    }
    InsertLocked(location, value);
    return value;
}

std::shared_ptr<const Bytes> TransformCache::Find(const std::string& location) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(location);
    if (it == entries_.end()) {
        return nullptr;
    }
    policy_->OnAccess(location);
    return it->second;
}

void TransformCache::Erase(const std::string& location) {
    std::lock_guard<std::mutex> lock(mutex_);
    EraseLocked(location);
}

void TransformCache::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    bytes_ = 0;
    policy_->OnClear();
}

CacheStats TransformCache::Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.entries = entries_.size();
    stats.bytes = bytes_;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.keys.reserve(entries_.size());
    for (const auto& entry : entries_) {
        stats.keys.push_back(entry.first);
    }
    std::sort(stats.keys.begin(), stats.keys.end());
    return stats;
}

void TransformCache::InsertLocked(const std::string& location, std::shared_ptr<const Bytes> value) {
    bytes_ += value->size();
    policy_->OnInsert(location, value->size());
    entries_.emplace(location, std::move(value));
    while (auto victim = policy_->Victim(bytes_)) {
        if (entries_.count(*victim) == 0) {
            // Policy out of sync with the map; drop its record and carry on.
            policy_->OnErase(*victim);
            continue;
        }
        EraseLocked(*victim);
    }
}

void TransformCache::EraseLocked(const std::string& location) {
    auto it = entries_.find(location);
    if (it == entries_.end()) {
        return;
    }
    bytes_ -= it->second->size();
    entries_.erase(it);
    policy_->OnErase(location);
}

std::unique_ptr<EvictionPolicy> MakePolicy(std::uint64_t max_bytes) {
    if (max_bytes == 0) {
        return std::make_unique<UnboundedEviction>();
    }
    std::size_t budget = max_bytes > std::numeric_limits<std::size_t>::max()
                             ? std::numeric_limits<std::size_t>::max()
                             : static_cast<std::size_t>(max_bytes);
    return std::make_unique<LruEviction>(budget);
}

}  // namespace chunkvault::cache
