/**
 * @file FileHistoryRepository.hpp
 * @brief History store persisted as an NDJSON file.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include "domain/HistoryRepository.hpp"
#include "infrastructure/MemoryHistoryRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace decodedesk::infrastructure {

/**
 * @class FileHistoryRepository
 * @brief Keeps entries in memory and mirrors them to disk, one JSON object per line.
 *
 * Every append queues a full rewrite of the file on the PersistenceService, so the
 * file on disk always holds a complete, consistent snapshot.
 */
class FileHistoryRepository : public domain::HistoryRepository {
public:
    FileHistoryRepository(std::string filePath,
                          std::shared_ptr<PersistenceService> persistence,
                          std::size_t maxEntries = 0);

    /**
     * @brief Loads existing entries. Malformed lines are skipped.
     * @return false if the history directory cannot be created or the file cannot be read.
     */
    bool load();

    void append(const domain::HistoryEntry& entry) override;
    std::vector<domain::HistoryEntry> listRecent(std::size_t limit) const override;
    std::size_t size() const override;

    const std::string& filePath() const { return m_filePath; }

private:
    std::string m_filePath;
    std::shared_ptr<PersistenceService> m_persistence;
    MemoryHistoryRepository m_index;
    std::mutex m_writeMutex; // Keeps snapshot order equal to queue order.
};

} // namespace decodedesk::infrastructure
