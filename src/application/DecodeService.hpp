/**
 * @file DecodeService.hpp
 * @brief Application service for decode requests: validation, decoding and history.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/DecodeOutcome.hpp"
#include "domain/HistoryRepository.hpp"

namespace decodedesk::application {

/**
 * @struct UploadedFile
 * @brief A file received by the boundary layer, still as raw bytes.
 */
struct UploadedFile {
    std::string filename;
    std::string content;
};

/**
 * @struct DecodeReport
 * @brief Outcome of a decode plus the bookkeeping the boundary reports back.
 */
struct DecodeReport {
    domain::DecodeOutcome outcome;
    std::size_t originalLength = 0; ///< Code points of the submitted text.
    std::size_t decodedLength = 0;  ///< Code points of the decoded text.
    std::string sessionId;          ///< History entry id, empty on failure.
};

struct DecodeServiceLimits {
    std::size_t maxUploadBytes = 10 * 1024 * 1024;
    std::size_t defaultHistoryLimit = 10;
};

/**
 * @class DecodeService
 * @brief Validates requests, runs the engine and records successful decodes.
 *
 * Thread-safe as long as the repository is; the engine itself holds no state.
 */
class DecodeService {
public:
    DecodeService(std::shared_ptr<domain::HistoryRepository> history, DecodeServiceLimits limits = {});

    /**
     * @brief Decodes submitted text.
     * @param text Non-empty UTF-8 text.
     * @param mode "auto" or one of the encoding literals.
     * @param shift Caesar shift, ignored for other kinds.
     */
    DecodeReport decodeText(const std::string& text, const std::string& mode, std::optional<int> shift);

    /** @brief Checks extension and size, reads the bytes as UTF-8 and decodes them as text. */
    DecodeReport decodeFile(const UploadedFile& file, const std::string& mode, std::optional<int> shift);

    /** @brief Newest-first history. Uses the configured default when no limit is given. */
    std::vector<domain::HistoryEntry> recentHistory(std::optional<std::size_t> limit = std::nullopt) const;

    /** @brief Extensions accepted by decodeFile, lower case with the dot. */
    static const std::vector<std::string>& AllowedExtensions();

    /** @brief Parses a decimal integer literal (optional sign). Returns nullopt if it is not one. */
    static std::optional<int> ParseIntegerLiteral(const std::string& literal);

    static DecodeReport Rejected(domain::ErrorKind kind, const std::string& message);

private:
    std::string recordHistory(const std::string& original, const domain::DecodeSuccess& success,
                              std::size_t originalLength, std::size_t decodedLength);

    std::shared_ptr<domain::HistoryRepository> m_history;
    DecodeServiceLimits m_limits;
};

} // namespace decodedesk::application
