#include "dreamgroup/oracle/oracle_cache.hpp"
#include "dreamgroup/error.hpp"

namespace dreamgroup::oracle {

const char* operation_kind_name(OperationKind kind) {
    switch (kind) {
        case OperationKind::NORMALIZE: return "normalize";
        case OperationKind::EQUIVALENCE: return "equivalence";
        case OperationKind::TAXONOMY: return "taxonomy";
    }
    return "unknown";
}

OperationKind parse_operation_kind(const std::string& name) {
    if (name == "normalize") return OperationKind::NORMALIZE;
    if (name == "equivalence") return OperationKind::EQUIVALENCE;
    if (name == "taxonomy") return OperationKind::TAXONOMY;
    throw InvalidArgumentError("Unknown oracle operation kind '" + name + "'", __func__);
}

OracleCache::OracleCache(size_t capacity) : capacity_(capacity) {}

std::string OracleCache::compose(OperationKind kind, std::string_view key) {
    std::string composed;
    composed.reserve(key.size() + 2);
    composed.push_back(static_cast<char>('0' + static_cast<int>(kind)));
    composed.push_back('\x1f');
    composed.append(key);
    return composed;
}

std::string OracleCache::pair_key(std::string_view a, std::string_view b) {
    std::string_view first = a < b ? a : b;
    std::string_view second = a < b ? b : a;
    std::string key;
    key.reserve(first.size() + second.size() + 1);
    key.append(first);
    key.push_back('\x1e');
    key.append(second);
    return key;
}

std::optional<std::string> OracleCache::get(OperationKind kind, std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(compose(kind, key));
    if (it == index_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    // Touch for LRU ordering
    order_.splice(order_.end(), order_, it->second);
    return it->second->value;
}

void OracleCache::put(OperationKind kind, std::string_view key, std::string value) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string composed = compose(kind, key);
    auto it = index_.find(composed);
    if (it != index_.end()) {
        it->second->value = std::move(value);
        order_.splice(order_.end(), order_, it->second);
        return;
    }
    order_.push_back(CacheEntry{kind, std::string(key), std::move(value)});
    index_.emplace(std::move(composed), std::prev(order_.end()));
    evict_if_needed();
}

bool OracleCache::contains(OperationKind kind, std::string_view key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(compose(kind, key)) > 0;
}

void OracleCache::evict_if_needed() {
    if (capacity_ == 0) return;
    while (order_.size() > capacity_) {
        const CacheEntry& oldest = order_.front();
        index_.erase(compose(oldest.kind, oldest.key));
        order_.pop_front();
    }
}

size_t OracleCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

size_t OracleCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

size_t OracleCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

std::vector<CacheEntry> OracleCache::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<CacheEntry>(order_.begin(), order_.end());
}

void OracleCache::restore(const std::vector<CacheEntry>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    order_.clear();
    index_.clear();
    for (const auto& entry : entries) {
        std::string composed = compose(entry.kind, entry.key);
        auto it = index_.find(composed);
        if (it != index_.end()) {
            it->second->value = entry.value;
            order_.splice(order_.end(), order_, it->second);
            continue;
        }
        order_.push_back(entry);
        index_.emplace(std::move(composed), std::prev(order_.end()));
    }
    evict_if_needed();
}

void OracleCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    order_.clear();
    index_.clear();
    hits_ = 0;
    misses_ = 0;
}

} // namespace dreamgroup::oracle
