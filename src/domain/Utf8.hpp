/**
 * @file Utf8.hpp
 * @brief Small UTF-8 helpers shared by the decoders and the service layer.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace decodedesk::domain::utf8 {

/** @brief True if the bytes form well-formed UTF-8 (no overlongs, no surrogates). */
bool IsValid(const std::string& bytes);

/** @brief Appends a Unicode scalar value. Caller guarantees cp <= 0x10FFFF and not a surrogate. */
void Append(std::string& out, uint32_t cp);

/**
 * @brief Number of code points in valid UTF-8 text.
 * This is the length unit used everywhere lengths are reported.
 */
std::size_t CodePointCount(const std::string& text);

/** @brief Decodes lossily: every malformed sequence becomes U+FFFD. */
std::string Sanitize(const std::string& bytes);

} // namespace decodedesk::domain::utf8
