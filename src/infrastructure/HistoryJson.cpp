#include "infrastructure/HistoryJson.hpp"
#include <cstdio>
#include <ctime>

namespace decodedesk::infrastructure {

using json = nlohmann::json;
using namespace decodedesk::domain;

std::string FormatIso8601(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        --seconds;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
    return buf;
}

json HistoryEntryToApiJson(const HistoryEntry& entry) {
    return {
        {"id", entry.id},
        {"originalText", entry.originalText},
        {"decodedText", entry.decodedText},
        {"encryptionType", KindToString(entry.resolvedKind)},
        {"originalLength", entry.originalLength},
        {"decodedLength", entry.decodedLength},
        {"createdAt", FormatIso8601(entry.createdAt)}
    };
}

json HistoryEntryToStoredJson(const HistoryEntry& entry) {
    json j = HistoryEntryToApiJson(entry);
    j.erase("createdAt");
    j["ts"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.createdAt.time_since_epoch()).count();
    return j;
}

std::optional<HistoryEntry> HistoryEntryFromStoredJson(const json& j) {
    try {
        auto kind = KindFromString(j.at("encryptionType").get<std::string>());
        if (!kind) return std::nullopt;

        HistoryEntry entry;
        entry.id = j.at("id").get<std::string>();
        entry.originalText = j.at("originalText").get<std::string>();
        entry.decodedText = j.at("decodedText").get<std::string>();
        entry.resolvedKind = *kind;
        entry.originalLength = j.at("originalLength").get<std::size_t>();
        entry.decodedLength = j.at("decodedLength").get<std::size_t>();
        entry.createdAt = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(j.value("ts", 0LL)));
        return entry;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

} // namespace decodedesk::infrastructure
