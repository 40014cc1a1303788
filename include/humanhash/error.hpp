#pragma once

/// @file error.hpp
/// @brief Exception types thrown by humanhash
///
/// Every failure is reported synchronously by throwing one of these types.
/// Nothing is retried, truncated or padded on the caller's behalf.

#include <stdexcept>

namespace humanhash {

/// Base class for all humanhash errors
class error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Wordlist does not hold exactly 256 entries, or could not be read
class invalid_wordlist_error : public error {
public:
    using error::error;
};

/// Hex digest has an odd length or contains a non-hex character
class invalid_digest_error : public error {
public:
    using error::error;
};

/// More output words were requested than the digest has bytes
class insufficient_input_error : public error {
public:
    using error::error;
};

} // namespace humanhash
