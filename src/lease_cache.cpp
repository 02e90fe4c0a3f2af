#include "leaseguard/lease_cache.hpp"

#include <cmath>
#include <functional>

namespace leaseguard {

std::size_t FingerprintHash::operator()(const Fingerprint& f) const noexcept {
    std::size_t h = std::hash<int>{}(static_cast<int>(f.kind));
    h ^= std::hash<std::int64_t>{}(f.memory_bucket) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    h ^= std::hash<std::int64_t>{}(f.cpu_bucket) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
}

Fingerprint make_fingerprint(const ResourceRequest& request,
                             double memory_quantum, double cpu_quantum) {
    auto bucket = [](const std::optional<double>& value, double quantum) -> std::int64_t {
        if (!value.has_value()) return 0;
        return static_cast<std::int64_t>(std::ceil(value.value() / quantum));
    };

    Fingerprint f;
    f.kind = request.kind;
    f.memory_bucket = bucket(request.requirements.memory, memory_quantum);
    f.cpu_bucket = bucket(request.requirements.cpu, cpu_quantum);
    return f;
}

LeaseShape make_shape(const Fingerprint& fingerprint, const ResourceRequirements& requirements,
                      double memory_quantum, double cpu_quantum, Timestamp now) {
    LeaseShape shape;
    shape.fingerprint = fingerprint;
    if (requirements.memory.has_value()) {
        shape.requirements.memory = static_cast<double>(fingerprint.memory_bucket) * memory_quantum;
    }
    if (requirements.cpu.has_value()) {
        shape.requirements.cpu = static_cast<double>(fingerprint.cpu_bucket) * cpu_quantum;
    }
    shape.created_at = now;
    shape.last_used = now;
    return shape;
}

LeaseCache::LeaseCache(std::size_t max_size) : max_size_(max_size) {}

std::optional<LeaseShape> LeaseCache::get(const Fingerprint& key, Timestamp now) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }
    entries_.splice(entries_.begin(), entries_, it->second);
    it->second->last_used = now;
    it->second->reuse_count++;
    return *it->second;
}

bool LeaseCache::put(const LeaseShape& shape, Timestamp now) {
    if (max_size_ == 0) {
        return false;
    }

    auto it = index_.find(shape.fingerprint);
    if (it != index_.end()) {
        entries_.splice(entries_.begin(), entries_, it->second);
        it->second->last_used = now;
        return false;
    }

    bool evicted = false;
    if (index_.size() >= max_size_) {
        index_.erase(entries_.back().fingerprint);
        entries_.pop_back();
        evicted = true;
    }

    entries_.push_front(shape);
    entries_.front().last_used = now;
    index_[shape.fingerprint] = entries_.begin();
    return evicted;
}

void LeaseCache::touch(const Fingerprint& key, Timestamp now) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return;
    }
    entries_.splice(entries_.begin(), entries_, it->second);
    it->second->last_used = now;
}

bool LeaseCache::remove(const Fingerprint& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    entries_.erase(it->second);
    index_.erase(it);
    return true;
}

std::size_t LeaseCache::trim_idle(Timestamp cutoff, std::size_t keep_at_least) {
    std::size_t removed = 0;
    while (index_.size() > keep_at_least && !entries_.empty() &&
           entries_.back().last_used < cutoff) {
        index_.erase(entries_.back().fingerprint);
        entries_.pop_back();
        removed++;
    }
    return removed;
}

bool LeaseCache::contains(const Fingerprint& key) const {
    return index_.count(key) > 0;
}

void LeaseCache::clear() {
    entries_.clear();
    index_.clear();
}

} // namespace leaseguard
