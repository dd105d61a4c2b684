#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <iostream>

namespace decodedesk::infrastructure {

namespace fs = std::filesystem;

namespace {
constexpr const char* kAppDirName = "DecodeDesk";

fs::path XdgOrHome(const char* xdgVar, const fs::path& homeSuffix) {
    const char* xdg = std::getenv(xdgVar);
    if (xdg && *xdg) {
        return fs::path(xdg);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeSuffix;
    }
    return fs::current_path(); // Fallback
}
}

fs::path PathUtils::GetDataHome() {
    return XdgOrHome("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return XdgOrHome("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetDefaultConfigFile() {
    return GetConfigHome() / kAppDirName / "settings.json";
}

fs::path PathUtils::GetDefaultHistoryFile() {
    fs::path base = GetDataHome() / kAppDirName;
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        std::cerr << "[PathUtils] Could not create " << base << ": " << ec.message() << std::endl;
    }
    return base / "history.ndjson";
}

} // namespace decodedesk::infrastructure
