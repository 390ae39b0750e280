/**
 * @file    bit_codec.hpp
 * @brief   Zero-width marker bit codec
 * @license MIT
 *
 * @details
 * Hides a byte payload inside text as a run of two zero-width characters:
 *   ZERO = U+200B ZERO WIDTH SPACE
 *   ONE  = U+200C ZERO WIDTH NON-JOINER
 *
 * Each byte is written MSB first, so "A" (0x41) becomes
 *   ZERO ONE ZERO ZERO ZERO ZERO ZERO ONE
 *
 * Text is UTF-8 throughout. The codec is a plain value with no state beyond
 * its two constant symbols; create as many as you like.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dmt {

using Payload = std::vector<std::uint8_t>;

// One element per bit, each 0 or 1
using BitVector = std::vector<std::uint8_t>;

class BitCodec {
public:
    // UTF-8 encodings of the two marker symbols
    static constexpr std::string_view kZero = "\xE2\x80\x8B";
    static constexpr std::string_view kOne  = "\xE2\x80\x8C";

    /**
     * Encode a payload as marker symbols (8 per byte, MSB first)
     *
     * @param payload  Bytes to hide (may be empty)
     * @return         UTF-8 string made only of ZERO/ONE symbols
     */
    std::string encode(const Payload& payload) const;

    /**
     * Decode every marker symbol found in text
     *
     * Non-marker characters are skipped, not treated as separators.
     * A trailing group of fewer than 8 bits is dropped.
     *
     * @param text  Arbitrary UTF-8 text or markup
     * @return      Decoded bytes, empty if no markers are present
     */
    Payload decode(std::string_view text) const;

    /**
     * Number of marker symbols in text
     */
    std::size_t marker_count(std::string_view text) const;
};

/**
 * Unpack bytes to bits, MSB first
 */
BitVector payload_to_bits(const Payload& payload);

/**
 * Pack bits to bytes, MSB first; a trailing group of fewer than 8 bits is dropped
 */
Payload bits_to_payload(const BitVector& bits);

/**
 * Convert UTF-8 text to a payload, one byte per code point
 *
 * Only code points 0-255 fit the 8-bit-per-character scheme.
 * @throws ValidationError on a code point >= 256 or malformed UTF-8
 */
Payload payload_from_text(std::string_view utf8);

/**
 * Convert a payload back to UTF-8, reading each byte as a code point 0-255
 */
std::string text_from_payload(const Payload& payload);

/**
 * Fraction of payload bytes that are printable characters
 *
 * There is no integrity field in an image mark, so a wrong bit length at
 * extraction yields garbage silently. Callers can use this to flag it.
 * Returns 0.0 for an empty payload.
 */
double plausibility_ratio(const Payload& payload) noexcept;

}  // namespace dmt
