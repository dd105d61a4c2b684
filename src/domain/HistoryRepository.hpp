/**
 * @file HistoryRepository.hpp
 * @brief Interface for storing and listing past decode results.
 */

#pragma once

#include <cstddef>
#include <vector>
#include "domain/HistoryEntry.hpp"

namespace decodedesk::domain {

/**
 * @class HistoryRepository
 * @brief Abstract store of history entries. Implementations must be safe to call
 * from several request threads at once.
 */
class HistoryRepository {
public:
    virtual ~HistoryRepository() = default;

    /** @brief Stores a new entry. */
    virtual void append(const HistoryEntry& entry) = 0;

    /**
     * @brief Returns up to @p limit entries, newest first.
     * Entries with equal timestamps come back in reverse insertion order.
     */
    virtual std::vector<HistoryEntry> listRecent(std::size_t limit) const = 0;

    virtual std::size_t size() const = 0;
};

} // namespace decodedesk::domain
