#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "infrastructure/FileHistoryRepository.hpp"
#include "infrastructure/MemoryHistoryRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace decodedesk::domain;
using namespace decodedesk::infrastructure;

namespace {

HistoryEntry makeEntry(const std::string& id, std::chrono::system_clock::time_point at) {
    HistoryEntry e;
    e.id = id;
    e.originalText = "Uryyb " + id;
    e.decodedText = "Hello " + id;
    e.resolvedKind = EncodingKind::Rot13;
    e.originalLength = e.originalText.size();
    e.decodedLength = e.decodedText.size();
    e.createdAt = at;
    return e;
}

void testMemoryOrdering() {
    MemoryHistoryRepository repo(3);
    auto t0 = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'700'000'000'000LL));

    repo.append(makeEntry("a", t0));
    repo.append(makeEntry("b", t0 + std::chrono::seconds(2)));
    repo.append(makeEntry("c", t0 + std::chrono::seconds(1)));
    repo.append(makeEntry("d", t0 + std::chrono::seconds(2))); // same instant as "b"

    // Capacity 3 drops the oldest inserted entry.
    assert(repo.size() == 3);
    auto recent = repo.listRecent(10);
    assert(recent.size() == 3);
    assert(recent[0].id == "d");
    assert(recent[1].id == "b");
    assert(recent[2].id == "c");

    assert(repo.listRecent(1).size() == 1);
    assert(repo.listRecent(0).empty());
    std::cout << "  memory ordering ok" << std::endl;
}

void testFileRoundTrip(const std::string& root) {
    const std::string path = root + "/history.ndjson";
    auto t0 = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'700'000'000'123LL));

    {
        auto persistence = std::make_shared<PersistenceService>();
        FileHistoryRepository repo(path, persistence);
        assert(repo.load());
        assert(repo.size() == 0);

        repo.append(makeEntry("first", t0));
        auto arabic = makeEntry("second", t0 + std::chrono::milliseconds(5));
        arabic.decodedText = "\xD9\x85\xD8\xB1\xD8\xAD\xD8\xA8\xD8\xA7";
        arabic.resolvedKind = EncodingKind::Base64;
        repo.append(arabic);
        persistence->flush();
        assert(persistence->failedWrites() == 0);
    }

    // Append a malformed line by hand; reload must skip it.
    {
        std::ofstream out(path, std::ios::app);
        out << "{not json}\n";
        out << "{\"id\":\"x\",\"encryptionType\":\"morse\"}\n";
    }

    auto persistence = std::make_shared<PersistenceService>();
    FileHistoryRepository reloaded(path, persistence);
    assert(reloaded.load());
    assert(reloaded.size() == 2);

    auto recent = reloaded.listRecent(10);
    assert(recent[0].id == "second");
    assert(recent[0].resolvedKind == EncodingKind::Base64);
    assert(recent[0].decodedText == "\xD9\x85\xD8\xB1\xD8\xAD\xD8\xA8\xD8\xA7");
    assert(recent[1].id == "first");
    assert(recent[1].createdAt == t0);
    assert(recent[1].originalLength == std::string("Uryyb first").size());
    std::cout << "  file round trip ok" << std::endl;
}

void testConcurrentAppends(const std::string& root) {
    const std::string path = root + "/concurrent.ndjson";
    const int kThreads = 8;
    const int kPerThread = 25;

    auto persistence = std::make_shared<PersistenceService>();
    auto repo = std::make_shared<FileHistoryRepository>(path, persistence);
    assert(repo->load());

    std::vector<std::thread> threads;
    std::atomic<int> appended{0};
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                repo->append(makeEntry(std::to_string(t) + "-" + std::to_string(i),
                                       std::chrono::system_clock::now()));
                appended++;
            }
        });
    }
    for (auto& th : threads) th.join();
    persistence->flush();

    assert(appended == kThreads * kPerThread);
    assert(repo->size() == static_cast<std::size_t>(kThreads * kPerThread));

    // The last write on disk must hold every entry.
    auto verifyPersistence = std::make_shared<PersistenceService>();
    FileHistoryRepository reloaded(path, verifyPersistence);
    assert(reloaded.load());
    assert(reloaded.size() == static_cast<std::size_t>(kThreads * kPerThread));
    std::cout << "  concurrent appends ok" << std::endl;
}

void testUnusableLocation(const std::string& root) {
    // A regular file where the history directory should be.
    const std::string blocker = root + "/blocker";
    {
        std::ofstream out(blocker);
        out << "not a directory";
    }
    auto persistence = std::make_shared<PersistenceService>();
    FileHistoryRepository repo(blocker + "/history.ndjson", persistence);
    assert(!repo.load());
    assert(repo.filePath() == blocker + "/history.ndjson");

    // A missing file in a creatable directory is an empty history.
    FileHistoryRepository fresh(root + "/nested/dir/history.ndjson", persistence);
    assert(fresh.load());
    assert(fresh.size() == 0);
    assert(std::filesystem::is_directory(root + "/nested/dir"));
    std::cout << "  unusable location ok" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting HistoryRepository Test..." << std::endl;

    std::string testRoot = "test_history_root";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    testMemoryOrdering();
    testFileRoundTrip(testRoot);
    testConcurrentAppends(testRoot);
    testUnusableLocation(testRoot);

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] HistoryRepository Test." << std::endl;
    return 0;
}
