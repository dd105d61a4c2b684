#include "domain/EncodingClassifier.hpp"
#include "domain/TextDecoders.hpp"

namespace decodedesk::domain {

namespace {
    bool IsDigit(char c) { return c >= '0' && c <= '9'; }

    bool IsAlnum(char c) {
        return IsDigit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    bool IsBase64Char(char c) { return IsAlnum(c) || c == '+' || c == '/'; }

    bool IsUrlChar(char c) {
        return IsAlnum(c) || c == '%' || c == '-' || c == '_' || c == '.' || c == '~';
    }
}

bool EncodingClassifier::LooksDecimal(const std::string& text) {
    // Backslashes are optional: a bare digit run also counts.
    bool sawDigit = false;
    for (char c : text) {
        if (c == '\\') continue;
        if (!IsDigit(c)) return false;
        sawDigit = true;
    }
    return sawDigit;
}

bool EncodingClassifier::LooksHex(const std::string& text) {
    std::size_t digits = 0;
    for (char c : text) {
        if (decoders::IsAsciiSpace(c)) continue;
        if (decoders::HexValue(c) < 0) return false;
        ++digits;
    }
    return digits > 0 && digits % 2 == 0;
}

bool EncodingClassifier::LooksBase64(const std::string& text) {
    if (text.empty() || text.size() % 4 != 0) return false;

    std::size_t body = 0;
    while (body < text.size() && IsBase64Char(text[body])) ++body;
    if (body == 0) return false;
    for (std::size_t i = body; i < text.size(); ++i) {
        if (text[i] != '=') return false;
    }
    return true;
}

bool EncodingClassifier::LooksUrl(const std::string& text) {
    if (text.find('%') == std::string::npos) return false;
    for (char c : text) {
        if (!IsUrlChar(c)) return false;
    }
    return true;
}

EncodingKind EncodingClassifier::Classify(const std::string& text) {
    if (LooksDecimal(text)) return EncodingKind::Decimal;
    if (LooksHex(text)) return EncodingKind::Hex;
    if (LooksBase64(text)) return EncodingKind::Base64;
    if (LooksUrl(text)) return EncodingKind::Url;
    return EncodingKind::Caesar;
}

} // namespace decodedesk::domain
