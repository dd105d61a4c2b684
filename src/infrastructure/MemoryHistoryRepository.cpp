#include "infrastructure/MemoryHistoryRepository.hpp"
#include <algorithm>

namespace decodedesk::infrastructure {

using domain::HistoryEntry;

MemoryHistoryRepository::MemoryHistoryRepository(std::size_t maxEntries)
    : m_maxEntries(maxEntries) {}

void MemoryHistoryRepository::append(const HistoryEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.push_back(entry);
    trimLocked();
}

std::vector<HistoryEntry> MemoryHistoryRepository::listRecent(std::size_t limit) const {
    std::vector<HistoryEntry> result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        result.assign(m_entries.rbegin(), m_entries.rend());
    }
    // Stable: equal timestamps keep reverse insertion order.
    std::stable_sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.createdAt > b.createdAt;
    });
    if (result.size() > limit) result.resize(limit);
    return result;
}

std::size_t MemoryHistoryRepository::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

std::vector<HistoryEntry> MemoryHistoryRepository::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries;
}

void MemoryHistoryRepository::reset(std::vector<HistoryEntry> entries) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries = std::move(entries);
    trimLocked();
}

void MemoryHistoryRepository::trimLocked() {
    if (m_maxEntries == 0 || m_entries.size() <= m_maxEntries) return;
    m_entries.erase(m_entries.begin(), m_entries.begin() + (m_entries.size() - m_maxEntries));
}

} // namespace decodedesk::infrastructure
