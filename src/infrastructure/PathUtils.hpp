// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace decodedesk::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_CONFIG_HOME/DecodeDesk/settings.json */
    static std::filesystem::path GetDefaultConfigFile();

    /** @brief $XDG_DATA_HOME/DecodeDesk/history.ndjson (directory is created). */
    static std::filesystem::path GetDefaultHistoryFile();
};

} // namespace decodedesk::infrastructure
