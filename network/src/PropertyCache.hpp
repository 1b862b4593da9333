#ifndef KADMOS_NETWORK_PROPERTY_CACHE_HPP
#define KADMOS_NETWORK_PROPERTY_CACHE_HPP

#include <cmath>
#include <cstddef>
#include <functional>
#include <list>
#include <unordered_map>
#include <utility>

namespace kadmos {
namespace network {

// Fixed-precision key of a (pressure, secondary property) pair
struct RoundedKey {
    long long first;
    long long second;

    bool operator==(const RoundedKey& other) const {
        return first == other.first && second == other.second;
    }
};

struct RoundedKeyHash {
    size_t operator()(const RoundedKey& key) const {
        size_t h1 = std::hash<long long>()(key.first);
        size_t h2 = std::hash<long long>()(key.second);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

inline long long roundToKey(double value, double resolution) {
    return std::llround(value / resolution);
}

/**
 * @brief Bounded least-recently-used map from rounded keys to property states
 *
 * Values stored here must be computed from the rounded key itself, never from the
 * unrounded request, so a hit and a miss always return the same result.
 */
template <typename Value>
class PropertyCache {
public:
    explicit PropertyCache(size_t capacity = 8192) : capacity_(capacity > 0 ? capacity : 1) {}

    template <typename Compute>
    Value getOrCompute(const RoundedKey& key, Compute&& compute) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            entries_.splice(entries_.begin(), entries_, it->second);
            ++hits_;
            return it->second->second;
        }

        ++misses_;
        entries_.emplace_front(key, compute());
        index_[key] = entries_.begin();

        if (entries_.size() > capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
        }
        return entries_.front().second;
    }

    void clear() {
        entries_.clear();
        index_.clear();
        hits_ = 0;
        misses_ = 0;
    }

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    size_t hits() const { return hits_; }
    size_t misses() const { return misses_; }

private:
    using Entry = std::pair<RoundedKey, Value>;

    size_t capacity_;
    std::list<Entry> entries_;
    std::unordered_map<RoundedKey, typename std::list<Entry>::iterator, RoundedKeyHash> index_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_PROPERTY_CACHE_HPP
