#pragma once

#include "dreamgroup/oracle/text_oracle.hpp"

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dreamgroup::oracle {

struct CacheEntry {
    OperationKind kind;
    std::string key;
    std::string value;

    bool operator==(const CacheEntry& other) const {
        return kind == other.kind && key == other.key && value == other.value;
    }
};

/**
 * Memoized oracle results keyed by (operation kind, canonicalized input).
 *
 * Capacity 0 keeps every entry for the lifetime of the cache, which is what a batch run wants.
 * A non-zero capacity turns on least-recently-used eviction for long-lived processes.
 */
class OracleCache {
public:
    explicit OracleCache(size_t capacity = 0);

    std::optional<std::string> get(OperationKind kind, std::string_view key);
    void put(OperationKind kind, std::string_view key, std::string value);
    bool contains(OperationKind kind, std::string_view key) const;

    // Canonical key for an unordered pair: (a, b) and (b, a) map to the same string
    static std::string pair_key(std::string_view a, std::string_view b);

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t hits() const;
    size_t misses() const;

    // Snapshot in least- to most-recently-used order, for checkpoints
    std::vector<CacheEntry> entries() const;

    // Replace the contents with a checkpointed snapshot
    void restore(const std::vector<CacheEntry>& entries);

    void clear();

private:
    static std::string compose(OperationKind kind, std::string_view key);
    void evict_if_needed();

    size_t capacity_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    std::list<CacheEntry> order_;
    std::unordered_map<std::string, std::list<CacheEntry>::iterator> index_;
    mutable std::mutex mutex_;
};

} // namespace dreamgroup::oracle
