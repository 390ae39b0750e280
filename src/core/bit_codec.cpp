/**
 * @file    bit_codec.cpp
 * @brief   Zero-width marker bit codec implementation
 * @license MIT
 */

#include "core/bit_codec.hpp"
#include "core/errors.hpp"

#include <fmt/format.h>

namespace dmt {

namespace {

enum class Marker { None, Zero, One };

// Match a marker symbol at byte offset pos.
// UTF-8 lead bytes never appear as continuation bytes, so a byte-level
// match cannot start in the middle of another character.
Marker marker_at(std::string_view text, std::size_t pos) noexcept {
    if (text.compare(pos, BitCodec::kZero.size(), BitCodec::kZero) == 0) {
        return Marker::Zero;
    }
    if (text.compare(pos, BitCodec::kOne.size(), BitCodec::kOne) == 0) {
        return Marker::One;
    }
    return Marker::None;
}

}  // namespace

std::string BitCodec::encode(const Payload& payload) const {
    std::string out;
    out.reserve(payload.size() * 8 * kZero.size());

    for (std::uint8_t byte : payload) {
        for (int i = 7; i >= 0; --i) {
            out.append(((byte >> i) & 1) ? kOne : kZero);
        }
    }
    return out;
}

Payload BitCodec::decode(std::string_view text) const {
    Payload out;
    std::uint8_t current = 0;
    int bits = 0;

    std::size_t pos = 0;
    while (pos < text.size()) {
        Marker m = marker_at(text, pos);
        if (m == Marker::None) {
            ++pos;
            continue;
        }
        pos += kZero.size();

        current = static_cast<std::uint8_t>((current << 1) | (m == Marker::One ? 1 : 0));
        if (++bits == 8) {
            out.push_back(current);
            current = 0;
            bits = 0;
        }
    }
    // Incomplete trailing group (bits > 0) is discarded
    return out;
}

std::size_t BitCodec::marker_count(std::string_view text) const {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (marker_at(text, pos) != Marker::None) {
            ++count;
            pos += kZero.size();
        } else {
            ++pos;
        }
    }
    return count;
}

BitVector payload_to_bits(const Payload& payload) {
    BitVector bits;
    bits.reserve(payload.size() * 8);
    for (std::uint8_t byte : payload) {
        for (int i = 7; i >= 0; --i) {
            bits.push_back((byte >> i) & 1);
        }
    }
    return bits;
}

Payload bits_to_payload(const BitVector& bits) {
    Payload out;
    out.reserve(bits.size() / 8);
    for (std::size_t i = 0; i + 8 <= bits.size(); i += 8) {
        std::uint8_t byte = 0;
        for (std::size_t b = 0; b < 8; ++b) {
            byte = static_cast<std::uint8_t>((byte << 1) | (bits[i + b] & 1));
        }
        out.push_back(byte);
    }
    return out;
}

Payload payload_from_text(std::string_view utf8) {
    Payload out;
    out.reserve(utf8.size());

    for (std::size_t i = 0; i < utf8.size(); ++i) {
        auto lead = static_cast<std::uint8_t>(utf8[i]);
        if (lead < 0x80) {
            out.push_back(lead);
            continue;
        }
        // 0xC2/0xC3 + one continuation byte covers U+0080..U+00FF
        if (lead == 0xC2 || lead == 0xC3) {
            if (i + 1 >= utf8.size()) {
                throw ValidationError("payload text: truncated UTF-8 sequence");
            }
            auto cont = static_cast<std::uint8_t>(utf8[i + 1]);
            if ((cont & 0xC0) != 0x80) {
                throw ValidationError(fmt::format(
                    "payload text: malformed UTF-8 at byte {}", i));
            }
            out.push_back(static_cast<std::uint8_t>(((lead & 0x1F) << 6) | (cont & 0x3F)));
            ++i;
            continue;
        }
        if (lead >= 0xC4 && lead <= 0xF4) {
            throw ValidationError(fmt::format(
                "payload text: character at byte {} is outside U+0000-U+00FF "
                "and cannot be carried one byte per character", i));
        }
        throw ValidationError(fmt::format(
            "payload text: malformed UTF-8 at byte {}", i));
    }
    return out;
}

std::string text_from_payload(const Payload& payload) {
    std::string out;
    out.reserve(payload.size() * 2);
    for (std::uint8_t byte : payload) {
        if (byte < 0x80) {
            out.push_back(static_cast<char>(byte));
        } else {
            out.push_back(static_cast<char>(0xC0 | (byte >> 6)));
            out.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
        }
    }
    return out;
}

double plausibility_ratio(const Payload& payload) noexcept {
    if (payload.empty()) return 0.0;

    std::size_t printable = 0;
    for (std::uint8_t byte : payload) {
        if ((byte >= 0x20 && byte < 0x7F) || byte >= 0xA0 ||
            byte == '\t' || byte == '\n' || byte == '\r') {
            ++printable;
        }
    }
    return static_cast<double>(printable) / static_cast<double>(payload.size());
}

}  // namespace dmt
