#pragma once

#include <optional>
#include "domain/DecodeOutcome.hpp"

namespace decodedesk::domain {

/**
 * @brief Routes a request to the decoder for its kind.
 * Auto requests are classified first; the outcome records the kind actually used.
 */
class DecoderDispatch {
public:
    static DecodeOutcome Decode(const std::string& text,
                                std::optional<EncodingKind> kind,
                                std::optional<int> shift = std::nullopt);

    static DecodeOutcome Decode(const DecodeRequest& request) {
        return Decode(request.text, request.kind, request.shift);
    }
};

} // namespace decodedesk::domain
