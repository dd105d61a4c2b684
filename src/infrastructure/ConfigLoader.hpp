/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving server configuration (settings.json).
 *
 * Every key is optional; missing or malformed values fall back to the defaults below.
 */

#pragma once

#include <cstddef>
#include <string>

namespace decodedesk::infrastructure {

/**
 * @struct AppConfig
 * @brief Runtime settings of the DecodeDesk server.
 */
struct AppConfig {
    std::string host = "0.0.0.0";
    int port = 5000;
    std::string historyBackend = "file";   ///< "memory" or "file".
    std::string historyFile;               ///< Empty means PathUtils::GetDefaultHistoryFile().
    std::size_t maxHistoryEntries = 1000;  ///< 0 keeps everything.
    std::size_t defaultHistoryLimit = 10;
    std::size_t maxUploadBytes = 10 * 1024 * 1024;
    std::string locale = "en";             ///< "en" or "ar".
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @param path Path to settings.json. A missing file yields the defaults.
     * @return The loaded configuration; invalid entries are logged and defaulted.
     */
    static AppConfig Load(const std::string& path);

    /**
     * @brief Writes the configuration as pretty-printed JSON.
     * @return False if the file could not be written.
     */
    static bool Save(const std::string& path, const AppConfig& config);
};

} // namespace decodedesk::infrastructure
