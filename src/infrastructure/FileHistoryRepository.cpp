/**
 * @file FileHistoryRepository.cpp
 * @brief Implementation of FileHistoryRepository.
 */

#include "infrastructure/FileHistoryRepository.hpp"
#include "infrastructure/HistoryJson.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace decodedesk::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

FileHistoryRepository::FileHistoryRepository(std::string filePath,
                                             std::shared_ptr<PersistenceService> persistence,
                                             std::size_t maxEntries)
    : m_filePath(std::move(filePath)), m_persistence(std::move(persistence)), m_index(maxEntries) {}

bool FileHistoryRepository::load() {
    std::vector<domain::HistoryEntry> entries;
    std::error_code ec;
    fs::path parent = fs::path(m_filePath).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            std::cerr << "[FileHistoryRepository] Cannot create " << parent << ": " << ec.message() << std::endl;
            return false;
        }
    }

    if (!fs::exists(m_filePath, ec)) {
        m_index.reset(std::move(entries));
        return true;
    }

    std::ifstream inFile(m_filePath);
    if (!inFile) {
        std::cerr << "[FileHistoryRepository] Cannot open " << m_filePath << std::endl;
        return false;
    }

    std::string line;
    int lineNo = 0;
    int skipped = 0;
    while (std::getline(inFile, line)) {
        ++lineNo;
        if (line.empty()) continue;
        try {
            auto entry = HistoryEntryFromStoredJson(json::parse(line));
            if (entry) {
                entries.push_back(std::move(*entry));
                continue;
            }
        } catch (const json::parse_error& e) {
            std::cerr << "[FileHistoryRepository] Line " << lineNo << ": " << e.what() << std::endl;
        }
        ++skipped;
    }

    std::cout << "[FileHistoryRepository] Loaded " << entries.size() << " entries from " << m_filePath;
    if (skipped > 0) std::cout << " (" << skipped << " malformed lines skipped)";
    std::cout << std::endl;
    m_index.reset(std::move(entries));
    return true;
}

void FileHistoryRepository::append(const domain::HistoryEntry& entry) {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    m_index.append(entry);

    std::stringstream content;
    for (const auto& e : m_index.snapshot()) {
        content << HistoryEntryToStoredJson(e).dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    }
    m_persistence->saveTextAsync(m_filePath, content.str());
}

std::vector<domain::HistoryEntry> FileHistoryRepository::listRecent(std::size_t limit) const {
    return m_index.listRecent(limit);
}

std::size_t FileHistoryRepository::size() const {
    return m_index.size();
}

} // namespace decodedesk::infrastructure
