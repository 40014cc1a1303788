#pragma once

/// @file hex.hpp
/// @brief Hexadecimal digest parsing and encoding
///
/// parse_hexdigest() turns "60ad8d..." into raw bytes, to_hex() goes the
/// other way. Both digit cases are accepted on input; output is lowercase.

#include "../error.hpp"

#include <array>
#include <cstdint>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace humanhash::hash {

namespace detail {

/// Value of a single hex digit, or -1 if @p c is not one
constexpr int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace detail

/// Parse a hexadecimal digest into bytes
/// @param hexdigest Even number of hex digits, two per byte
/// @return hexdigest.size() / 2 bytes, in order
/// @throws invalid_digest_error on odd length or a non-hex character
inline std::vector<uint8_t> parse_hexdigest(std::string_view hexdigest) {
    if (hexdigest.size() % 2 != 0) {
        throw invalid_digest_error("hex digest has odd length (" +
                                   std::to_string(hexdigest.size()) + ")");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hexdigest.size() / 2);
    for (size_t i = 0; i < hexdigest.size(); i += 2) {
        int hi = detail::hex_value(hexdigest[i]);
        int lo = detail::hex_value(hexdigest[i + 1]);
        if (hi < 0 || lo < 0) {
            size_t bad = hi < 0 ? i : i + 1;
            throw invalid_digest_error("invalid hex character '" +
                                       std::string(1, hexdigest[bad]) +
                                       "' at offset " + std::to_string(bad));
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

/// Convert raw bytes to lowercase hexadecimal string
inline std::string to_hex(std::span<const uint8_t> data) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        result += hex_chars[(byte >> 4) & 0x0F];
        result += hex_chars[byte & 0x0F];
    }
    return result;
}

/// Convert any fixed-size digest array to hexadecimal string
template<size_t N>
inline std::string to_hex(const std::array<uint8_t, N>& digest) {
    return to_hex(std::span<const uint8_t>(digest.data(), N));
}

} // namespace humanhash::hash
