/**
 * @file TextDecoders.hpp
 * @brief Per-encoding decoders. All are pure functions of their arguments.
 */

#pragma once

#include <string>
#include "domain/DecodeOutcome.hpp"

namespace decodedesk::domain::decoders {

constexpr int kDefaultCaesarShift = 3;
constexpr int kRot13Shift = 13;

bool IsAsciiSpace(char c);

/** @brief Value of a hex digit, or -1. */
int HexValue(char c);

/**
 * @brief "\72\101" -> "He".
 * Each fragment is one UTF-16 code unit; adjacent surrogate halves are joined.
 */
DecodeOutcome DecodeDecimal(const std::string& text);

/**
 * @brief "4869" -> "Hi". Whitespace is ignored, each byte maps to the code point of
 * the same value. Odd digit counts are rejected, never truncated.
 */
DecodeOutcome DecodeHex(const std::string& text);

/** @brief Standard alphabet, padding required, payload must be UTF-8. */
DecodeOutcome DecodeBase64(const std::string& text);

/** @brief Percent-decoding. '+' is left as is. */
DecodeOutcome DecodeUrl(const std::string& text);

/** @brief Shifts letters back by @p shift (any integer), wrapping within each case. */
std::string DecodeCaesar(const std::string& text, int shift = kDefaultCaesarShift);

std::string DecodeRot13(const std::string& text);

} // namespace decodedesk::domain::decoders
