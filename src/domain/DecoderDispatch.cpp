#include "domain/DecoderDispatch.hpp"
#include "domain/EncodingClassifier.hpp"
#include "domain/TextDecoders.hpp"

namespace decodedesk::domain {

DecodeOutcome DecoderDispatch::Decode(const std::string& text,
                                      std::optional<EncodingKind> kind,
                                      std::optional<int> shift) {
    const EncodingKind resolved = kind ? *kind : EncodingClassifier::Classify(text);

    switch (resolved) {
        case EncodingKind::Decimal: return decoders::DecodeDecimal(text);
        case EncodingKind::Hex: return decoders::DecodeHex(text);
        case EncodingKind::Base64: return decoders::DecodeBase64(text);
        case EncodingKind::Caesar:
            return DecodeOutcome::Success(
                decoders::DecodeCaesar(text, shift.value_or(decoders::kDefaultCaesarShift)),
                EncodingKind::Caesar);
        case EncodingKind::Rot13:
            return DecodeOutcome::Success(decoders::DecodeRot13(text), EncodingKind::Rot13);
        case EncodingKind::Url: return decoders::DecodeUrl(text);
    }

    return DecodeOutcome::Failure(ErrorKind::UnsupportedKind,
        "unsupported encoding kind " + std::to_string(static_cast<int>(resolved)));
}

} // namespace decodedesk::domain
