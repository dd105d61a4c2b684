/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace decodedesk::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void ReadKey(const json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring invalid '" << key << "': " << e.what() << std::endl;
    }
}

}

AppConfig ConfigLoader::Load(const std::string& path) {
    AppConfig config;
    if (!std::filesystem::exists(path)) {
        std::cout << "[ConfigLoader] No settings at " << path << ", using defaults." << std::endl;
        return config;
    }

    json j;
    try {
        std::ifstream f(path);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
        return config;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] " << path << " is not a JSON object, using defaults." << std::endl;
        return config;
    }

    ReadKey(j, "host", config.host);
    ReadKey(j, "port", config.port);
    ReadKey(j, "history_backend", config.historyBackend);
    ReadKey(j, "history_file", config.historyFile);
    ReadKey(j, "max_history_entries", config.maxHistoryEntries);
    ReadKey(j, "default_history_limit", config.defaultHistoryLimit);
    ReadKey(j, "max_upload_bytes", config.maxUploadBytes);
    ReadKey(j, "locale", config.locale);

    if (config.port <= 0 || config.port > 65535) {
        std::cerr << "[ConfigLoader] Port " << config.port << " out of range, using 5000." << std::endl;
        config.port = 5000;
    }
    if (config.historyBackend != "memory" && config.historyBackend != "file") {
        std::cerr << "[ConfigLoader] Unknown history_backend '" << config.historyBackend
                  << "', using file." << std::endl;
        config.historyBackend = "file";
    }
    if (config.locale != "en" && config.locale != "ar") {
        std::cerr << "[ConfigLoader] Unknown locale '" << config.locale << "', using en." << std::endl;
        config.locale = "en";
    }
    return config;
}

bool ConfigLoader::Save(const std::string& path, const AppConfig& config) {
    json j = {
        {"host", config.host},
        {"port", config.port},
        {"history_backend", config.historyBackend},
        {"history_file", config.historyFile},
        {"max_history_entries", config.maxHistoryEntries},
        {"default_history_limit", config.defaultHistoryLimit},
        {"max_upload_bytes", config.maxUploadBytes},
        {"locale", config.locale}
    };

    try {
        std::filesystem::path p(path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
        std::ofstream f(p);
        if (!f.is_open()) {
            std::cerr << "[ConfigLoader] Cannot open " << path << " for writing." << std::endl;
            return false;
        }
        f << j.dump(4);
        return static_cast<bool>(f);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace decodedesk::infrastructure
