/**
 * @file DecodeOutcome.hpp
 * @brief Request and result types exchanged with the decode engine.
 */

#pragma once

#include <optional>
#include <string>
#include <variant>
#include "domain/EncodingKind.hpp"

namespace decodedesk::domain {

/**
 * @enum ErrorKind
 * @brief Failure taxonomy. None of these are fatal to the process.
 */
enum class ErrorKind {
    Validation,      ///< Malformed request shape, rejected before the engine runs.
    Decode,          ///< A decoder could not interpret its input.
    UnsupportedKind, ///< Encoding outside the fixed enumeration.
    FileRejected     ///< Disallowed extension or oversize upload.
};

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::Decode: return "DecodeError";
        case ErrorKind::UnsupportedKind: return "UnsupportedKindError";
        case ErrorKind::FileRejected: return "FileRejectedError";
    }
    return "UnknownError";
}

/**
 * @struct DecodeRequest
 * @brief Text plus requested mode. An empty kind means auto-detect.
 */
struct DecodeRequest {
    std::string text;
    std::optional<EncodingKind> kind;
    std::optional<int> shift; ///< Only read when the resolved kind is Caesar.
};

struct DecodeSuccess {
    std::string decodedText;
    EncodingKind resolvedKind;
};

struct DecodeFailure {
    ErrorKind kind;
    std::optional<EncodingKind> encoding; ///< Set for ErrorKind::Decode.
    std::string message;                  ///< Technical description, meant for logs.
};

/**
 * @class DecodeOutcome
 * @brief Tagged union of success and failure. Exactly one side holds.
 */
class DecodeOutcome {
public:
    static DecodeOutcome Success(std::string decodedText, EncodingKind resolvedKind) {
        return DecodeOutcome(DecodeSuccess{std::move(decodedText), resolvedKind});
    }

    static DecodeOutcome Failure(ErrorKind kind, std::string message,
                                 std::optional<EncodingKind> encoding = std::nullopt) {
        return DecodeOutcome(DecodeFailure{kind, encoding, std::move(message)});
    }

    static DecodeOutcome DecodeError(EncodingKind encoding, std::string message) {
        return Failure(ErrorKind::Decode, std::move(message), encoding);
    }

    bool ok() const { return std::holds_alternative<DecodeSuccess>(m_value); }

    const DecodeSuccess& success() const { return std::get<DecodeSuccess>(m_value); }
    const DecodeFailure& failure() const { return std::get<DecodeFailure>(m_value); }

private:
    explicit DecodeOutcome(DecodeSuccess s) : m_value(std::move(s)) {}
    explicit DecodeOutcome(DecodeFailure f) : m_value(std::move(f)) {}

    std::variant<DecodeSuccess, DecodeFailure> m_value;
};

} // namespace decodedesk::domain
