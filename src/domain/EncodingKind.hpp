/**
 * @file EncodingKind.hpp
 * @brief Value Object enumerating the classical text encodings the engine understands.
 */

#pragma once

#include <optional>
#include <string>

namespace decodedesk::domain {

/**
 * @enum EncodingKind
 * @brief Closed set of encodings a request can resolve to.
 *
 * "auto" is not a kind: an auto-detect request carries an empty optional instead.
 */
enum class EncodingKind {
    Decimal,    ///< Backslash-separated decimal character codes, e.g. "\72\105".
    Hex,        ///< Pairs of hexadecimal digits, one byte per pair.
    Base64,     ///< Standard alphabet with '=' padding, UTF-8 payload.
    Caesar,     ///< Letters shifted by a fixed amount.
    Rot13,      ///< Caesar with shift 13.
    Url         ///< Percent-encoding.
};

/** @brief Wire literal used by the HTTP API and the history file. */
inline std::string KindToString(EncodingKind kind) {
    switch (kind) {
        case EncodingKind::Decimal: return "decimal";
        case EncodingKind::Hex: return "hex";
        case EncodingKind::Base64: return "base64";
        case EncodingKind::Caesar: return "caesar";
        case EncodingKind::Rot13: return "rot13";
        case EncodingKind::Url: return "url";
    }
    return "unknown";
}

/** @brief Parses a wire literal. Returns nullopt for anything outside the six kinds (including "auto"). */
inline std::optional<EncodingKind> KindFromString(const std::string& s) {
    if (s == "decimal") return EncodingKind::Decimal;
    if (s == "hex") return EncodingKind::Hex;
    if (s == "base64") return EncodingKind::Base64;
    if (s == "caesar") return EncodingKind::Caesar;
    if (s == "rot13") return EncodingKind::Rot13;
    if (s == "url") return EncodingKind::Url;
    return std::nullopt;
}

inline constexpr const char* kAutoMode = "auto";

} // namespace decodedesk::domain
