/**
 * @file DecodeService.cpp
 * @brief Implementation of DecodeService.
 */

#include "application/DecodeService.hpp"
#include "domain/DecoderDispatch.hpp"
#include "domain/Utf8.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <climits>
#include <iostream>
#include <random>

namespace decodedesk::application {

using namespace decodedesk::domain;

namespace {

// RFC 4122 version 4 identifier.
std::string GenerateUUID() {
    static const char hex[] = "0123456789abcdef";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> nibble(0, 15);

    std::string s;
    s.reserve(36);
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) s += '-';
        int v = nibble(rng);
        if (i == 12) v = 4;
        if (i == 16) v = 8 | (v & 0x3);
        s += hex[v];
    }
    return s;
}

std::string LowerExtension(const std::string& filename) {
    auto dot = filename.find_last_of('.');
    if (dot == std::string::npos) return {};
    std::string ext = filename.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

DecodeService::DecodeService(std::shared_ptr<HistoryRepository> history, DecodeServiceLimits limits)
    : m_history(std::move(history)), m_limits(limits) {}

const std::vector<std::string>& DecodeService::AllowedExtensions() {
    static const std::vector<std::string> extensions = {".txt", ".log", ".dat"};
    return extensions;
}

DecodeReport DecodeService::Rejected(ErrorKind kind, const std::string& message) {
    return DecodeReport{DecodeOutcome::Failure(kind, message)};
}

std::optional<int> DecodeService::ParseIntegerLiteral(const std::string& literal) {
    if (literal.empty()) return std::nullopt;
    std::size_t i = 0;
    bool negative = false;
    if (literal[0] == '-' || literal[0] == '+') {
        negative = literal[0] == '-';
        i = 1;
    }
    if (i == literal.size()) return std::nullopt;

    long long value = 0;
    for (; i < literal.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(literal[i]))) return std::nullopt;
        value = value * 10 + (literal[i] - '0');
        if (value > static_cast<long long>(INT_MAX) + 1) return std::nullopt;
    }
    if (negative) value = -value;
    if (value > INT_MAX || value < INT_MIN) return std::nullopt;
    return static_cast<int>(value);
}

DecodeReport DecodeService::decodeText(const std::string& text, const std::string& mode, std::optional<int> shift) {
    if (text.empty()) {
        return Rejected(ErrorKind::Validation, "text is required");
    }
    if (!utf8::IsValid(text)) {
        return Rejected(ErrorKind::Validation, "text is not valid UTF-8");
    }

    std::optional<EncodingKind> kind;
    if (mode != kAutoMode) {
        kind = KindFromString(mode);
        if (!kind) {
            return Rejected(ErrorKind::Validation, "unrecognized encoding mode '" + mode + "'");
        }
    }

    DecodeRequest request{text, kind, shift};
    DecodeReport report{DecoderDispatch::Decode(request)};
    report.originalLength = utf8::CodePointCount(text);

    if (!report.outcome.ok()) {
        const auto& failure = report.outcome.failure();
        std::cerr << "[DecodeService] " << ErrorKindToString(failure.kind);
        if (failure.encoding) std::cerr << " (" << KindToString(*failure.encoding) << ")";
        std::cerr << ": " << failure.message << std::endl;
        return report;
    }

    const auto& success = report.outcome.success();
    report.decodedLength = utf8::CodePointCount(success.decodedText);
    report.sessionId = recordHistory(text, success, report.originalLength, report.decodedLength);
    return report;
}

DecodeReport DecodeService::decodeFile(const UploadedFile& file, const std::string& mode, std::optional<int> shift) {
    const auto& allowed = AllowedExtensions();
    const std::string ext = LowerExtension(file.filename);
    if (std::find(allowed.begin(), allowed.end(), ext) == allowed.end()) {
        std::cerr << "[DecodeService] Rejected file with extension '" << ext << "': " << file.filename << std::endl;
        return Rejected(ErrorKind::FileRejected, "unsupported file type '" + file.filename + "'");
    }
    if (file.content.size() > m_limits.maxUploadBytes) {
        std::cerr << "[DecodeService] Rejected oversize file " << file.filename
                  << " (" << file.content.size() << " bytes)" << std::endl;
        return Rejected(ErrorKind::FileRejected,
            "file exceeds " + std::to_string(m_limits.maxUploadBytes) + " bytes");
    }

    return decodeText(utf8::Sanitize(file.content), mode, shift);
}

std::vector<HistoryEntry> DecodeService::recentHistory(std::optional<std::size_t> limit) const {
    return m_history->listRecent(limit.value_or(m_limits.defaultHistoryLimit));
}

std::string DecodeService::recordHistory(const std::string& original, const DecodeSuccess& success,
                                         std::size_t originalLength, std::size_t decodedLength) {
    HistoryEntry entry;
    entry.id = GenerateUUID();
    entry.originalText = original;
    entry.decodedText = success.decodedText;
    entry.resolvedKind = success.resolvedKind;
    entry.originalLength = originalLength;
    entry.decodedLength = decodedLength;
    entry.createdAt = std::chrono::system_clock::now();

    m_history->append(entry);
    return entry.id;
}

} // namespace decodedesk::application
