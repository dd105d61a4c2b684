/**
 * @file TextDecoders.cpp
 * @brief Implementation of the per-encoding decoders.
 */

#include "domain/TextDecoders.hpp"
#include "domain/Utf8.hpp"

#include <cstdint>
#include <vector>

namespace decodedesk::domain::decoders {

namespace {

int Base64Value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

bool IsHighSurrogate(uint32_t u) { return u >= 0xD800 && u <= 0xDBFF; }
bool IsLowSurrogate(uint32_t u) { return u >= 0xDC00 && u <= 0xDFFF; }

char ShiftLetter(char c, int back) {
    char base;
    if (c >= 'a' && c <= 'z') base = 'a';
    else if (c >= 'A' && c <= 'Z') base = 'A';
    else return c;
    return static_cast<char>(base + (c - base - back + 26) % 26);
}

} // namespace

bool IsAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

DecodeOutcome DecodeDecimal(const std::string& text) {
    std::vector<uint32_t> units;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t end = text.find('\\', pos);
        if (end == std::string::npos) end = text.size();
        std::string fragment = text.substr(pos, end - pos);
        pos = end + 1;
        if (fragment.empty()) continue;

        uint32_t value = 0;
        for (char c : fragment) {
            if (c < '0' || c > '9') {
                return DecodeOutcome::DecodeError(EncodingKind::Decimal,
                    "fragment '" + fragment + "' is not a non-negative integer");
            }
            // Codes wrap to a single UTF-16 unit, so "65601" is 'A'.
            value = (value * 10 + static_cast<uint32_t>(c - '0')) % 0x10000;
        }
        units.push_back(value);
    }

    if (units.empty()) {
        return DecodeOutcome::DecodeError(EncodingKind::Decimal, "no character codes found");
    }

    std::string out;
    for (std::size_t i = 0; i < units.size(); ++i) {
        uint32_t u = units[i];
        if (IsHighSurrogate(u) && i + 1 < units.size() && IsLowSurrogate(units[i + 1])) {
            uint32_t cp = 0x10000 + ((u - 0xD800) << 10) + (units[i + 1] - 0xDC00);
            utf8::Append(out, cp);
            ++i;
        } else if (IsHighSurrogate(u) || IsLowSurrogate(u)) {
            return DecodeOutcome::DecodeError(EncodingKind::Decimal,
                "unpaired surrogate code " + std::to_string(u));
        } else {
            utf8::Append(out, u);
        }
    }
    return DecodeOutcome::Success(std::move(out), EncodingKind::Decimal);
}

DecodeOutcome DecodeHex(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());
    for (char c : text) {
        if (!IsAsciiSpace(c)) clean.push_back(c);
    }
    if (clean.size() % 2 != 0) {
        return DecodeOutcome::DecodeError(EncodingKind::Hex,
            "odd number of hex digits (" + std::to_string(clean.size()) + ")");
    }

    std::string out;
    out.reserve(clean.size() / 2);
    for (std::size_t i = 0; i < clean.size(); i += 2) {
        int hi = HexValue(clean[i]);
        int lo = HexValue(clean[i + 1]);
        if (hi < 0 || lo < 0) {
            return DecodeOutcome::DecodeError(EncodingKind::Hex,
                "invalid hex pair '" + clean.substr(i, 2) + "' at offset " + std::to_string(i));
        }
        utf8::Append(out, static_cast<uint32_t>(hi * 16 + lo));
    }
    return DecodeOutcome::Success(std::move(out), EncodingKind::Hex);
}

DecodeOutcome DecodeBase64(const std::string& text) {
    if (text.empty() || text.size() % 4 != 0) {
        return DecodeOutcome::DecodeError(EncodingKind::Base64,
            "length " + std::to_string(text.size()) + " is not a multiple of 4");
    }

    std::size_t padding = 0;
    while (padding < text.size() && text[text.size() - 1 - padding] == '=') ++padding;
    if (padding > 2) {
        return DecodeOutcome::DecodeError(EncodingKind::Base64, "too much '=' padding");
    }

    std::string bytes;
    bytes.reserve(text.size() / 4 * 3);
    uint32_t buffer = 0;
    int bits = 0;
    const std::size_t body = text.size() - padding;
    for (std::size_t i = 0; i < body; ++i) {
        int v = Base64Value(text[i]);
        if (v < 0) {
            return DecodeOutcome::DecodeError(EncodingKind::Base64,
                std::string("invalid character '") + text[i] + "' at offset " + std::to_string(i));
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            bytes.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }

    if (!utf8::IsValid(bytes)) {
        return DecodeOutcome::DecodeError(EncodingKind::Base64, "decoded bytes are not valid UTF-8");
    }
    return DecodeOutcome::Success(std::move(bytes), EncodingKind::Base64);
}

DecodeOutcome DecodeUrl(const std::string& text) {
    std::string bytes;
    bytes.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            bytes.push_back(text[i]);
            continue;
        }
        if (i + 2 >= text.size()) {
            return DecodeOutcome::DecodeError(EncodingKind::Url,
                "truncated percent sequence at offset " + std::to_string(i));
        }
        int hi = HexValue(text[i + 1]);
        int lo = HexValue(text[i + 2]);
        if (hi < 0 || lo < 0) {
            return DecodeOutcome::DecodeError(EncodingKind::Url,
                "malformed percent sequence '" + text.substr(i, 3) + "' at offset " + std::to_string(i));
        }
        bytes.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }

    if (!utf8::IsValid(bytes)) {
        return DecodeOutcome::DecodeError(EncodingKind::Url, "decoded bytes are not valid UTF-8");
    }
    return DecodeOutcome::Success(std::move(bytes), EncodingKind::Url);
}

std::string DecodeCaesar(const std::string& text, int shift) {
    const int back = ((shift % 26) + 26) % 26;
    std::string out = text;
    // Only ASCII letters move; UTF-8 continuation bytes are never in that range.
    for (char& c : out) {
        c = ShiftLetter(c, back);
    }
    return out;
}

std::string DecodeRot13(const std::string& text) {
    return DecodeCaesar(text, kRot13Shift);
}

} // namespace decodedesk::domain::decoders
