/**
 * @file HistoryEntry.hpp
 * @brief Record of one successful decode, kept by the history repository.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include "domain/EncodingKind.hpp"

namespace decodedesk::domain {

struct HistoryEntry {
    std::string id;
    std::string originalText;
    std::string decodedText;
    EncodingKind resolvedKind = EncodingKind::Caesar;
    std::size_t originalLength = 0; ///< Code points.
    std::size_t decodedLength = 0;  ///< Code points.
    std::chrono::system_clock::time_point createdAt;
};

} // namespace decodedesk::domain
