#pragma once

#include "leaseguard/types.hpp"

#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <unordered_map>

namespace leaseguard {

// Quantized requirement key. Requests with equal fingerprints can reuse a shape.
struct Fingerprint {
    ResourceKind kind{ResourceKind::Generic};
    std::int64_t memory_bucket{0};
    std::int64_t cpu_bucket{0};

    bool operator==(const Fingerprint& other) const {
        return kind == other.kind && memory_bucket == other.memory_bucket &&
               cpu_bucket == other.cpu_bucket;
    }
    bool operator!=(const Fingerprint& other) const { return !(*this == other); }
};

struct FingerprintHash {
    std::size_t operator()(const Fingerprint& f) const noexcept;
};

// Buckets are ceil(value / quantum); absent requirements land in bucket 0
Fingerprint make_fingerprint(const ResourceRequest& request,
                             double memory_quantum, double cpu_quantum);

// Pre-vetted allocation template for one fingerprint
struct LeaseShape {
    Fingerprint fingerprint;
    ResourceRequirements requirements;
    Timestamp created_at{};
    Timestamp last_used{};
    std::uint64_t reuse_count{0};
};

// Shape covering every request in the fingerprint's buckets: present
// requirements are raised to the bucket ceiling, timeout is left to the request
LeaseShape make_shape(const Fingerprint& fingerprint, const ResourceRequirements& requirements,
                      double memory_quantum, double cpu_quantum, Timestamp now);

// LRU cache of lease shapes. Not thread-safe; the pool guards it.
class LeaseCache {
public:
    explicit LeaseCache(std::size_t max_size);

    // Marks the entry most recently used and bumps its reuse count
    std::optional<LeaseShape> get(const Fingerprint& key, Timestamp now);

    // Insert or refresh. Returns true when an older entry was evicted.
    bool put(const LeaseShape& shape, Timestamp now);

    // Refresh recency without counting a reuse (used on release)
    void touch(const Fingerprint& key, Timestamp now);

    bool remove(const Fingerprint& key);

    // Drop shapes idle since before `cutoff`, least recent first, keeping
    // at least `keep_at_least` entries. Returns the number removed.
    std::size_t trim_idle(Timestamp cutoff, std::size_t keep_at_least);

    bool contains(const Fingerprint& key) const;

    void clear();
    std::size_t size() const { return index_.size(); }
    std::size_t max_size() const { return max_size_; }
    bool enabled() const { return max_size_ > 0; }

private:
    using Entries = std::list<LeaseShape>;

    std::size_t max_size_;
    Entries entries_;   // most recent first
    std::unordered_map<Fingerprint, Entries::iterator, FingerprintHash> index_;
};

} // namespace leaseguard
