/**
 * @file HttpServer.cpp
 * @brief Implementation of HttpServer.
 */

#include "infrastructure/HttpServer.hpp"
#include "infrastructure/HistoryJson.hpp"
#include "infrastructure/MessageCatalog.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <climits>
#include <functional>
#include <iostream>
#include <thread>

namespace decodedesk::infrastructure {

using json = nlohmann::json;
using application::DecodeReport;
using application::DecodeService;
using domain::ErrorKind;

namespace {

constexpr std::size_t kMultipartOverheadBytes = 1024 * 1024;

void SendJson(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void SendError(httplib::Response& res, int status, const std::string& message) {
    SendJson(res, status, {{"success", false}, {"error", message}});
}

void SendReport(httplib::Response& res, const DecodeReport& report, const std::string& locale,
                const std::string& fileName = {}) {
    if (!report.outcome.ok()) {
        SendError(res, 400, MessageCatalog::FailureMessage(report.outcome.failure(), locale));
        return;
    }

    const auto& success = report.outcome.success();
    json body = {
        {"success", true},
        {"decoded", success.decodedText},
        {"detectedType", domain::KindToString(success.resolvedKind)},
        {"detectedLabel", MessageCatalog::KindLabel(success.resolvedKind, locale)},
        {"originalLength", report.originalLength},
        {"decodedLength", report.decodedLength},
        {"sessionId", report.sessionId}
    };
    if (!fileName.empty()) {
        body["fileName"] = fileName;
    }
    SendJson(res, 200, body);
}

// Reads "caesarShift" from a JSON body. Absent or null means no shift.
bool ReadJsonShift(const json& body, std::optional<int>& shift) {
    if (!body.contains("caesarShift") || body["caesarShift"].is_null()) return true;
    const auto& v = body["caesarShift"];
    if (!v.is_number_integer()) return false;
    auto n = v.get<long long>();
    if (n < INT_MIN || n > INT_MAX) return false;
    shift = static_cast<int>(n);
    return true;
}

using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;

// Any exception escaping a route becomes a logged 500 with a localized message.
Handler Guarded(const char* route, std::string locale, Handler handler) {
    return [route, locale = std::move(locale), handler = std::move(handler)](
               const httplib::Request& req, httplib::Response& res) {
        try {
            handler(req, res);
        } catch (const std::exception& e) {
            std::cerr << "[HttpServer] Unhandled error on " << route << ": " << e.what() << std::endl;
            SendError(res, 500, MessageCatalog::InternalError(locale));
        }
    };
}

std::string FormField(const httplib::Request& req, const char* name) {
    if (req.has_file(name)) return req.get_file_value(name).content;
    if (req.has_param(name)) return req.get_param_value(name);
    return {};
}

} // namespace

HttpServer::HttpServer(std::shared_ptr<DecodeService> service, std::string locale, std::size_t maxUploadBytes)
    : m_service(std::move(service)),
      m_locale(MessageCatalog::IsSupportedLocale(locale) ? std::move(locale) : "en"),
      m_server(std::make_unique<httplib::Server>()) {
    m_server->set_payload_max_length(maxUploadBytes + kMultipartOverheadBytes);

    // httplib rejects oversized bodies before routing; keep the JSON envelope for them.
    httplib::Server::Handler errorHandler = [this, maxUploadBytes](const httplib::Request&, httplib::Response& res) {
        if (res.status != 413) return;
        auto report = DecodeService::Rejected(ErrorKind::FileRejected,
            "request exceeds " + std::to_string(maxUploadBytes) + " bytes");
        SendError(res, 413, MessageCatalog::FailureMessage(report.outcome.failure(), m_locale));
    };
    m_server->set_error_handler(errorHandler);

    registerRoutes();
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::registerRoutes() {
    m_server->Post("/api/decrypt", Guarded("/api/decrypt", m_locale, [this](const httplib::Request& req, httplib::Response& res) {
        json body;
        try {
            body = json::parse(req.body);
        } catch (const json::parse_error& e) {
            std::cerr << "[HttpServer] Invalid JSON body: " << e.what() << std::endl;
            SendReport(res, DecodeService::Rejected(ErrorKind::Validation, "body is not valid JSON"), m_locale);
            return;
        }

        if (!body.is_object() || !body.contains("text") || !body["text"].is_string()) {
            SendReport(res, DecodeService::Rejected(ErrorKind::Validation, "text must be a string"), m_locale);
            return;
        }
        std::string mode = domain::kAutoMode;
        if (body.contains("encryptionType") && !body["encryptionType"].is_null()) {
            if (!body["encryptionType"].is_string()) {
                SendReport(res, DecodeService::Rejected(ErrorKind::Validation, "encryptionType must be a string"), m_locale);
                return;
            }
            mode = body["encryptionType"].get<std::string>();
        }
        std::optional<int> shift;
        if (!ReadJsonShift(body, shift)) {
            SendReport(res, DecodeService::Rejected(ErrorKind::Validation, "caesarShift must be an integer"), m_locale);
            return;
        }

        SendReport(res, m_service->decodeText(body["text"].get<std::string>(), mode, shift), m_locale);
    }));

    m_server->Post("/api/decrypt-file", Guarded("/api/decrypt-file", m_locale, [this](const httplib::Request& req, httplib::Response& res) {
        if (!req.is_multipart_form_data() || !req.has_file("file")) {
            SendReport(res, DecodeService::Rejected(ErrorKind::Validation, "no file uploaded"), m_locale);
            return;
        }
        const auto file = req.get_file_value("file");

        std::string mode = FormField(req, "encryptionType");
        if (mode.empty()) mode = domain::kAutoMode;

        std::optional<int> shift;
        const std::string shiftField = FormField(req, "caesarShift");
        if (!shiftField.empty()) {
            shift = DecodeService::ParseIntegerLiteral(shiftField);
            if (!shift) {
                SendReport(res, DecodeService::Rejected(ErrorKind::Validation, "caesarShift must be an integer"), m_locale);
                return;
            }
        }

        application::UploadedFile upload{file.filename, file.content};
        SendReport(res, m_service->decodeFile(upload, mode, shift), m_locale, file.filename);
    }));

    m_server->Get("/api/sessions", Guarded("/api/sessions", m_locale, [this](const httplib::Request& req, httplib::Response& res) {
        std::optional<std::size_t> limit;
        if (req.has_param("limit")) {
            auto parsed = DecodeService::ParseIntegerLiteral(req.get_param_value("limit"));
            if (!parsed || *parsed < 0) {
                SendReport(res, DecodeService::Rejected(ErrorKind::Validation, "limit must be a non-negative integer"), m_locale);
                return;
            }
            limit = static_cast<std::size_t>(*parsed);
        }

        json sessions = json::array();
        for (const auto& entry : m_service->recentHistory(limit)) {
            sessions.push_back(HistoryEntryToApiJson(entry));
        }
        SendJson(res, 200, {{"success", true}, {"sessions", sessions}});
    }));

    m_server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cout << "[HttpServer] " << req.method << " " << req.path << " -> " << res.status << std::endl;
    });
}

bool HttpServer::listen(const std::string& host, int port) {
    std::cout << "[HttpServer] Listening on " << host << ":" << port << std::endl;
    if (!m_server->listen(host, port)) {
        std::cerr << "[HttpServer] Could not bind " << host << ":" << port << std::endl;
        return false;
    }
    return true;
}

int HttpServer::bindToAnyPort(const std::string& host) {
    int port = m_server->bind_to_any_port(host);
    if (port < 0) {
        std::cerr << "[HttpServer] Could not bind any port on " << host << std::endl;
    }
    return port;
}

bool HttpServer::listenAfterBind() {
    return m_server->listen_after_bind();
}

void HttpServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

bool HttpServer::isRunning() const {
    return m_server && m_server->is_running();
}

void HttpServer::waitUntilReady() const {
    while (!m_server->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

} // namespace decodedesk::infrastructure
