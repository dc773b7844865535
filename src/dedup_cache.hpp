#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>

namespace session_tail {

// Bounded set of already-emitted record keys.
// When full, the oldest inserted key is evicted first, so a duplicate older
// than `capacity` insertions may pass again.
class dedup_cache {
public:
    explicit dedup_cache(std::size_t capacity = 100000);

    // true if key was new (caller may emit); false if already seen.
    bool try_mark_seen(const std::string& key);

    bool contains(const std::string& key) const;

    std::size_t size() const;
    std::size_t capacity() const { return m_capacity; }
    uint64_t evictions() const;

    void clear();

private:
    const std::size_t m_capacity;

    mutable std::mutex m_mutex;
    std::unordered_set<std::string> m_keys;
    std::deque<std::string> m_order;  // insertion order, oldest at front
    uint64_t m_evictions = 0;
};

} // namespace session_tail
