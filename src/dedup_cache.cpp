#include "dedup_cache.hpp"

namespace session_tail {

dedup_cache::dedup_cache(std::size_t capacity)
    : m_capacity(capacity > 0 ? capacity : 1)
{
    m_keys.reserve(m_capacity + 1);
}

bool dedup_cache::try_mark_seen(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_keys.insert(key).second) return false;
    m_order.push_back(key);

    while (m_order.size() > m_capacity) {
        m_keys.erase(m_order.front());
        m_order.pop_front();
        ++m_evictions;
    }
    return true;
}

bool dedup_cache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_keys.count(key) > 0;
}

std::size_t dedup_cache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_keys.size();
}

uint64_t dedup_cache::evictions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_evictions;
}

void dedup_cache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_keys.clear();
    m_order.clear();
}

} // namespace session_tail
