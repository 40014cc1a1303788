#pragma once

/// @file compress.hpp
/// @brief Lossy XOR folding of a digest down to a fixed number of bytes
///
/// The input is cut into @c target contiguous segments of equal size, in
/// order. Bytes left over by the integer division all go to the last
/// segment. Each output byte is the XOR of its segment.
///
/// Example: 11 bytes folded to 4 gives segments of 2, 2, 2 and 5 bytes.
/// The uneven last segment is part of the output contract; changing the
/// distribution changes every humanized name ever produced.

#include "../error.hpp"

#include <cstdint>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace humanhash::hash {

/// XOR of all bytes in a segment (0 for an empty one)
inline uint8_t xor_checksum(std::span<const uint8_t> segment) noexcept {
    uint8_t sum = 0;
    for (uint8_t byte : segment) {
        sum ^= byte;
    }
    return sum;
}

/// Fold @p input down to exactly @p target bytes
/// @throws std::invalid_argument if target is zero
/// @throws insufficient_input_error if target exceeds input.size()
inline std::vector<uint8_t> compress(std::span<const uint8_t> input, size_t target) {
    if (target == 0) {
        throw std::invalid_argument("compression target must be at least 1");
    }
    const size_t length = input.size();
    if (target > length) {
        throw insufficient_input_error(
            "fewer input bytes than requested output (" + std::to_string(length) +
            " < " + std::to_string(target) + ")");
    }

    const size_t seg_size = length / target;
    std::vector<uint8_t> out;
    out.reserve(target);
    for (size_t i = 0; i + 1 < target; ++i) {
        out.push_back(xor_checksum(input.subspan(i * seg_size, seg_size)));
    }
    // Last segment absorbs the remainder
    out.push_back(xor_checksum(input.subspan((target - 1) * seg_size)));
    return out;
}

} // namespace humanhash::hash
