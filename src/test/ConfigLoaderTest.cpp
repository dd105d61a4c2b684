#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"

using namespace decodedesk::infrastructure;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    std::string testRoot = "test_config_root";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    // Missing file -> defaults
    AppConfig defaults = ConfigLoader::Load(testRoot + "/missing.json");
    assert(defaults.port == 5000);
    assert(defaults.host == "0.0.0.0");
    assert(defaults.historyBackend == "file");
    assert(defaults.maxUploadBytes == 10u * 1024u * 1024u);
    assert(defaults.defaultHistoryLimit == 10);
    assert(defaults.locale == "en");

    // Valid keys are read, invalid ones fall back individually.
    {
        std::ofstream f(testRoot + "/settings.json");
        f << R"({"port": 8081, "history_backend": "memory", "locale": "ar",
                 "max_upload_bytes": 2048, "default_history_limit": "many",
                 "history_file": "/tmp/h.ndjson"})";
    }
    AppConfig cfg = ConfigLoader::Load(testRoot + "/settings.json");
    assert(cfg.port == 8081);
    assert(cfg.historyBackend == "memory");
    assert(cfg.locale == "ar");
    assert(cfg.maxUploadBytes == 2048);
    assert(cfg.defaultHistoryLimit == 10);
    assert(cfg.historyFile == "/tmp/h.ndjson");

    // Out-of-range values are corrected.
    {
        std::ofstream f(testRoot + "/bad.json");
        f << R"({"port": 70000, "history_backend": "redis", "locale": "fr"})";
    }
    AppConfig bad = ConfigLoader::Load(testRoot + "/bad.json");
    assert(bad.port == 5000);
    assert(bad.historyBackend == "file");
    assert(bad.locale == "en");

    // Corrupt JSON -> defaults
    {
        std::ofstream f(testRoot + "/corrupt.json");
        f << "{ port: ";
    }
    assert(ConfigLoader::Load(testRoot + "/corrupt.json").port == 5000);

    // Save then load returns the same values.
    cfg.port = 9090;
    assert(ConfigLoader::Save(testRoot + "/nested/saved.json", cfg));
    AppConfig saved = ConfigLoader::Load(testRoot + "/nested/saved.json");
    assert(saved.port == 9090);
    assert(saved.locale == "ar");
    assert(saved.historyBackend == "memory");

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
