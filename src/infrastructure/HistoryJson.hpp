/**
 * @file HistoryJson.hpp
 * @brief JSON mapping of history entries, shared by the history file and the HTTP API.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/HistoryEntry.hpp"

namespace decodedesk::infrastructure {

/** @brief "2026-10-17T09:52:03.120Z" */
std::string FormatIso8601(std::chrono::system_clock::time_point tp);

/** @brief API shape: createdAt as an ISO-8601 string. */
nlohmann::json HistoryEntryToApiJson(const domain::HistoryEntry& entry);

/** @brief Storage shape: createdAt as epoch milliseconds under "ts". */
nlohmann::json HistoryEntryToStoredJson(const domain::HistoryEntry& entry);

/** @brief Parses the storage shape. Returns nullopt on missing fields or an unknown kind. */
std::optional<domain::HistoryEntry> HistoryEntryFromStoredJson(const nlohmann::json& j);

} // namespace decodedesk::infrastructure
