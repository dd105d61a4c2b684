#pragma once

#include <string>
#include "domain/EncodingKind.hpp"

namespace decodedesk::domain {

/**
 * @brief Guesses the encoding of unlabeled text.
 * Stateless. Runs an ordered list of structural checks; the first match wins,
 * and text matching nothing is treated as Caesar-shifted prose.
 */
class EncodingClassifier {
public:
    /**
     * @brief Classifies raw text. Never fails.
     * Order: Decimal, Hex, Base64, Url, then Caesar as fallback.
     */
    static EncodingKind Classify(const std::string& text);

    static bool LooksDecimal(const std::string& text);
    static bool LooksHex(const std::string& text);
    static bool LooksBase64(const std::string& text);
    static bool LooksUrl(const std::string& text);
};

} // namespace decodedesk::domain
