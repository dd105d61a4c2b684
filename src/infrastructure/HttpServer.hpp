/**
 * @file HttpServer.hpp
 * @brief REST boundary of DecodeDesk on top of cpp-httplib.
 *
 * Routes:
 *  - POST /api/decrypt       JSON { text, encryptionType, caesarShift }
 *  - POST /api/decrypt-file  multipart { file, encryptionType, caesarShift }
 *  - GET  /api/sessions      ?limit=N, newest first
 */

#pragma once

#include <memory>
#include <string>
#include "application/DecodeService.hpp"

namespace httplib {
class Server;
}

namespace decodedesk::infrastructure {

class HttpServer {
public:
    /**
     * @param service Decode service shared with the rest of the app.
     * @param locale Language of user-facing error messages.
     * @param maxUploadBytes Largest file the service accepts; the HTTP payload limit is derived from it.
     */
    HttpServer(std::shared_ptr<application::DecodeService> service,
               std::string locale,
               std::size_t maxUploadBytes);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /** @brief Binds and serves until stop() is called. Returns false if binding failed. */
    bool listen(const std::string& host, int port);

    /** @brief Binds to a free port and returns it, or -1. Serve with listenAfterBind(). */
    int bindToAnyPort(const std::string& host);

    /** @brief Serves on the socket from bindToAnyPort(). Blocks until stop(). */
    bool listenAfterBind();

    void stop();
    bool isRunning() const;

    /** @brief Blocks until the server is accepting connections. */
    void waitUntilReady() const;

private:
    void registerRoutes();

    std::shared_ptr<application::DecodeService> m_service;
    std::string m_locale;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace decodedesk::infrastructure
