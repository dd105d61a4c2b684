/**
 * @file DecodeDeskApp.cpp
 * @brief Implementation of the DecodeDeskApp class.
 */
#include "app/DecodeDeskApp.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <pthread.h>
#include <thread>
#include <unistd.h>

#include "application/DecodeService.hpp"
#include "infrastructure/FileHistoryRepository.hpp"
#include "infrastructure/HttpServer.hpp"
#include "infrastructure/MemoryHistoryRepository.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace decodedesk::app {

using namespace decodedesk::infrastructure;

DecodeDeskApp::DecodeDeskApp(std::string configPath)
    : m_configPath(std::move(configPath)) {}

bool DecodeDeskApp::Init() {
    if (m_configPath.empty()) {
        m_configPath = PathUtils::GetDefaultConfigFile().string();
    }
    m_config = ConfigLoader::Load(m_configPath);

    if (m_config.historyBackend == "memory") {
        m_history = std::make_shared<MemoryHistoryRepository>(m_config.maxHistoryEntries);
        std::cout << "[DecodeDeskApp] History kept in memory." << std::endl;
        return true;
    }

    std::string historyFile = m_config.historyFile.empty()
        ? PathUtils::GetDefaultHistoryFile().string()
        : m_config.historyFile;
    m_persistence = std::make_shared<PersistenceService>();
    auto fileRepo = std::make_shared<FileHistoryRepository>(historyFile, m_persistence, m_config.maxHistoryEntries);
    if (!fileRepo->load()) {
        std::cerr << "[DecodeDeskApp] Cannot use history file " << fileRepo->filePath() << std::endl;
        return false;
    }
    m_history = fileRepo;
    std::cout << "[DecodeDeskApp] History file: " << fileRepo->filePath() << std::endl;
    return true;
}

int DecodeDeskApp::Run() {
    // Block termination signals before any thread starts so only sigwait sees them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    if (!Init()) {
        return 1;
    }

    application::DecodeServiceLimits limits;
    limits.maxUploadBytes = m_config.maxUploadBytes;
    limits.defaultHistoryLimit = m_config.defaultHistoryLimit;
    auto service = std::make_shared<application::DecodeService>(m_history, limits);

    HttpServer server(service, m_config.locale, m_config.maxUploadBytes);
    std::atomic<bool> listenOk{true};
    std::thread serverThread([&]() {
        listenOk = server.listen(m_config.host, m_config.port);
        if (!listenOk) {
            // Wake the main thread so the process exits instead of waiting forever.
            kill(getpid(), SIGTERM);
        }
    });

    int received = 0;
    sigwait(&signals, &received);
    if (listenOk) {
        std::cout << "[DecodeDeskApp] Signal " << received << " received, shutting down." << std::endl;
    }

    // A signal can arrive before listen() has started; stop() would be a no-op then.
    while (listenOk && !server.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    server.stop();
    serverThread.join();
    Shutdown();
    return listenOk ? 0 : 1;
}

void DecodeDeskApp::Shutdown() {
    if (m_persistence) {
        m_persistence->stop();
        if (m_persistence->failedWrites() > 0) {
            std::cerr << "[DecodeDeskApp] " << m_persistence->failedWrites()
                      << " history writes failed during this run." << std::endl;
        }
    }
}

} // namespace decodedesk::app
