/**
 * @file MessageCatalog.hpp
 * @brief User-facing messages and encoding labels, per locale.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/DecodeOutcome.hpp"

namespace decodedesk::infrastructure {

class MessageCatalog {
public:
    /** @brief Locales with a translation. Anything else falls back to "en". */
    static bool IsSupportedLocale(const std::string& locale);

    /** @brief Short message shown to the user for a failure. */
    static std::string FailureMessage(const domain::DecodeFailure& failure, const std::string& locale);

    /** @brief Human-readable name of an encoding kind. */
    static std::string KindLabel(domain::EncodingKind kind, const std::string& locale);

    /** @brief Message for an unexpected server-side error. */
    static std::string InternalError(const std::string& locale);
};

} // namespace decodedesk::infrastructure
