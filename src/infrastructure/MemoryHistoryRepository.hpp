/**
 * @file MemoryHistoryRepository.hpp
 * @brief In-process history store.
 */

#pragma once

#include <mutex>
#include <vector>
#include "domain/HistoryRepository.hpp"

namespace decodedesk::infrastructure {

class MemoryHistoryRepository : public domain::HistoryRepository {
public:
    /** @param maxEntries Oldest entries beyond this count are dropped; 0 keeps everything. */
    explicit MemoryHistoryRepository(std::size_t maxEntries = 0);

    void append(const domain::HistoryEntry& entry) override;
    std::vector<domain::HistoryEntry> listRecent(std::size_t limit) const override;
    std::size_t size() const override;

    /** @brief All entries in insertion order. */
    std::vector<domain::HistoryEntry> snapshot() const;

    /** @brief Replaces the contents, e.g. after loading from disk. */
    void reset(std::vector<domain::HistoryEntry> entries);

private:
    void trimLocked();

    std::size_t m_maxEntries;
    std::vector<domain::HistoryEntry> m_entries;
    mutable std::mutex m_mutex;
};

} // namespace decodedesk::infrastructure
