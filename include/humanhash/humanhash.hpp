#pragma once

/// humanhash - Main Header
///
/// Version: 1.0.0
///
/// Human-readable representations of hex digests. Include this file to get
/// the hasher, the default wordlist, digest parsing and logging.

// Version information
#define HUMANHASH_VERSION_MAJOR 1
#define HUMANHASH_VERSION_MINOR 0
#define HUMANHASH_VERSION_PATCH 0

// Errors
#include "error.hpp"

// Digest handling
#include "hash/hex.hpp"
#include "hash/compress.hpp"

// Vocabulary and UUID source
#include "wordlist.hpp"
#include "uuid.hpp"

// Hasher and default-instance shortcuts
#include "hasher.hpp"

// Logging
#include "log/logger.hpp"
#include "log/macros.hpp"

#include <tuple>

/// Root namespace for the humanhash library
namespace humanhash {

/// Get library version string
inline const char* version() noexcept {
    return "1.0.0";
}

/// Get library version as tuple
inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(HUMANHASH_VERSION_MAJOR, HUMANHASH_VERSION_MINOR, HUMANHASH_VERSION_PATCH);
}

} // namespace humanhash

/// Quick Start Example:
///
/// ```cpp
/// #include <humanhash/humanhash.hpp>
///
/// int main() {
///     std::cout << humanhash::humanize("60ad8d0d871b6095808297") << std::endl;
///
///     auto [human, digest] = humanhash::uuid({.words = 3, .separator = "_"});
///     std::cout << human << " (" << digest << ")" << std::endl;
/// }
/// ```
