#include "infrastructure/MessageCatalog.hpp"

namespace decodedesk::infrastructure {

using namespace decodedesk::domain;

namespace {

std::string DecodeFailureText(EncodingKind kind, bool arabic) {
    switch (kind) {
    case EncodingKind::Decimal:
        return arabic ? "فشل في فك التشفير العشري" : "Could not decode decimal character codes";
    case EncodingKind::Hex:
        return arabic ? "فشل في فك التشفير السادس عشر" : "Could not decode hexadecimal text";
    case EncodingKind::Base64:
        return arabic ? "فشل في فك تشفير Base64" : "Could not decode Base64 text";
    case EncodingKind::Url:
        return arabic ? "فشل في فك تشفير URL" : "Could not decode URL-encoded text";
    case EncodingKind::Caesar:
    case EncodingKind::Rot13:
        break;
    }
    return arabic ? "حدث خطأ في فك التشفير" : "Decoding failed";
}

}

bool MessageCatalog::IsSupportedLocale(const std::string& locale) {
    return locale == "en" || locale == "ar";
}

std::string MessageCatalog::FailureMessage(const DecodeFailure& failure, const std::string& locale) {
    const bool arabic = locale == "ar";
    switch (failure.kind) {
    case ErrorKind::Decode: {
        std::string text = failure.encoding ? DecodeFailureText(*failure.encoding, arabic)
                                            : DecodeFailureText(EncodingKind::Caesar, arabic);
        return failure.message.empty() ? text : text + ": " + failure.message;
    }
    case ErrorKind::UnsupportedKind:
        return arabic ? "نوع التشفير غير مدعوم" : "Unsupported encoding type";
    case ErrorKind::FileRejected:
        return (arabic ? "نوع الملف غير مدعوم. يرجى استخدام ملفات .txt, .log, أو .dat"
                       : "File rejected. Use .txt, .log or .dat files up to the size limit")
               + std::string(": ") + failure.message;
    case ErrorKind::Validation:
        return (arabic ? "طلب غير صالح" : "Invalid request") + std::string(": ") + failure.message;
    }
    return InternalError(locale);
}

std::string MessageCatalog::KindLabel(EncodingKind kind, const std::string& locale) {
    const bool arabic = locale == "ar";
    switch (kind) {
    case EncodingKind::Decimal: return arabic ? "تشفير عشري" : "Decimal";
    case EncodingKind::Hex: return arabic ? "تشفير سادس عشر" : "Hexadecimal";
    case EncodingKind::Base64: return "Base64";
    case EncodingKind::Caesar: return arabic ? "تشفير قيصر" : "Caesar cipher";
    case EncodingKind::Rot13: return "ROT13";
    case EncodingKind::Url: return arabic ? "تشفير URL" : "URL encoding";
    }
    return KindToString(kind);
}

std::string MessageCatalog::InternalError(const std::string& locale) {
    return locale == "ar" ? "حدث خطأ في الخادم" : "Internal server error";
}

} // namespace decodedesk::infrastructure
