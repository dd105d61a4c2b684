#include <cassert>
#include <iostream>
#include <string>

#include "domain/EncodingClassifier.hpp"

using namespace decodedesk::domain;

int main() {
    std::cout << "[Test] Starting EncodingClassifier Test..." << std::endl;

    // One sample per rule
    assert(EncodingClassifier::Classify("\\72\\101\\108\\108\\111") == EncodingKind::Decimal);
    assert(EncodingClassifier::Classify("48656c6c6f") == EncodingKind::Hex);
    assert(EncodingClassifier::Classify("SGVsbG8=") == EncodingKind::Base64);
    assert(EncodingClassifier::Classify("Hello%20World") == EncodingKind::Url);
    assert(EncodingClassifier::Classify("Khoor") == EncodingKind::Caesar);
    assert(EncodingClassifier::Classify("Uryyb, jbeyq!") == EncodingKind::Caesar);

    // Rule order: bare digits are decimal even though they are also valid hex and base64.
    assert(EncodingClassifier::Classify("12345678") == EncodingKind::Decimal);
    assert(EncodingClassifier::LooksHex("12345678"));
    assert(EncodingClassifier::LooksBase64("12345678"));

    // Hex ignores whitespace but needs an even digit count.
    assert(EncodingClassifier::Classify("48 65 6c 6c 6f") == EncodingKind::Hex);
    assert(!EncodingClassifier::LooksHex("48656c6c6"));
    assert(!EncodingClassifier::LooksHex("   "));

    // "abcd" is even-length hex, so hex wins over base64.
    assert(EncodingClassifier::Classify("abcd") == EncodingKind::Hex);
    assert(EncodingClassifier::Classify("QUJD") == EncodingKind::Base64);

    // Base64 padding only at the end, length multiple of 4.
    assert(!EncodingClassifier::LooksBase64("SGV=sbG8"));
    assert(!EncodingClassifier::LooksBase64("SGVsbG8"));
    assert(!EncodingClassifier::LooksBase64("===="));

    // Url needs a '%' and only unreserved characters.
    assert(!EncodingClassifier::LooksUrl("Hello-World"));
    assert(!EncodingClassifier::LooksUrl("Hello%20World!"));
    assert(EncodingClassifier::Classify("a+b%2Bc") == EncodingKind::Caesar);

    // Backslashes alone are not decimal.
    assert(!EncodingClassifier::LooksDecimal("\\\\"));
    assert(EncodingClassifier::Classify("") == EncodingKind::Caesar);

    // Determinism
    const std::string sample = "V2hhdCBpcyB0aGlz";
    const EncodingKind first = EncodingClassifier::Classify(sample);
    for (int i = 0; i < 100; ++i) {
        assert(EncodingClassifier::Classify(sample) == first);
    }

    std::cout << "[PASS] EncodingClassifier Test." << std::endl;
    return 0;
}
