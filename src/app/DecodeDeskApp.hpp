/**
 * @file DecodeDeskApp.hpp
 * @brief Main application class for the DecodeDesk server.
 */

#pragma once

#include <memory>
#include <string>
#include "infrastructure/ConfigLoader.hpp"

namespace decodedesk::domain { class HistoryRepository; }
namespace decodedesk::infrastructure { class PersistenceService; }

namespace decodedesk::app {

/**
 * @class DecodeDeskApp
 * @brief Orchestrates configuration, history storage and the HTTP server lifecycle.
 */
class DecodeDeskApp {
public:
    /**
     * @param configPath settings.json to load; empty uses PathUtils::GetDefaultConfigFile().
     */
    explicit DecodeDeskApp(std::string configPath = {});

    /**
     * @brief Serves until SIGINT or SIGTERM.
     * @return Exit code (0 for success).
     */
    int Run();

private:
    /**
     * @brief Loads configuration and builds the history repository.
     * @return True if initialization succeeded.
     */
    bool Init();

    /** @brief Flushes pending history writes. */
    void Shutdown();

    std::string m_configPath;
    infrastructure::AppConfig m_config;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence; ///< Only set for the file backend.
    std::shared_ptr<domain::HistoryRepository> m_history;
};

} // namespace decodedesk::app
