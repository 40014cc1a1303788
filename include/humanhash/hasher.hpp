#pragma once

/// @file hasher.hpp
/// @brief Turns hex digests into short, pronounceable word sequences
///
/// A digest is parsed into bytes, folded down to the requested number of
/// words (see hash::compress) and every folded byte is looked up in a
/// 256-entry wordlist:
///
///     humanhash::humanize("60ad8d0d871b6095808297")
///     // -> "silicon-valley-apple-function-web"
///
/// Words of the default list may contain '-' themselves, so pick another
/// separator if the output has to be split again.

#include "error.hpp"
#include "wordlist.hpp"
#include "uuid.hpp"
#include "hash/compress.hpp"
#include "hash/hex.hpp"
#include "log/macros.hpp"

#include <cstdint>
#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace humanhash {

/// Options shared by humanize() and uuid()
struct humanize_options {
    size_t words = 4;             ///< Number of output words, 1..digest bytes
    std::string separator = "-";  ///< Placed between consecutive words
};

/// Result of hasher::uuid()
struct uuid_result {
    std::string human;   ///< Humanized representation
    std::string digest;  ///< Bare 32-digit hex digest of the UUID
};

/// Immutable wordlist plus the operations that map digests through it
///
/// Never modified after construction; one instance may be shared freely
/// between threads.
class hasher {
public:
    /// Hasher using the built-in wordlist
    hasher() : words_(builtin()) {}

    /// Hasher using a caller supplied wordlist
    /// @throws invalid_wordlist_error unless words.size() == 256
    explicit hasher(wordlist words) : words_(checked(std::move(words))) {}

    // Copies share the same list. No assignment: a hasher keeps its
    // wordlist for its whole lifetime, and a move falls back to the copy.
    hasher(const hasher&) = default;
    hasher& operator=(const hasher&) = delete;

    const wordlist& words() const noexcept { return *words_; }

    /// Word for a single byte value
    const std::string& word(uint8_t byte) const noexcept { return (*words_)[byte]; }

    /// Humanize a hex digest
    /// @throws invalid_digest_error if the digest is not valid hex
    /// @throws insufficient_input_error if opts.words exceeds the digest bytes
    /// @throws std::invalid_argument if opts.words is zero
    std::string humanize(std::string_view hexdigest, const humanize_options& opts = {}) const {
        auto bytes = hash::parse_hexdigest(hexdigest);
        auto compressed = compress(bytes, opts.words);
        HUMANHASH_LOG_DEBUG("humanize: {} digest bytes folded to {}",
                            bytes.size(), hash::to_hex(compressed));
        return join(compressed, opts.separator);
    }

    std::string humanize(std::string_view hexdigest, size_t words,
                         std::string_view separator = "-") const {
        return humanize(hexdigest, humanize_options{words, std::string(separator)});
    }

    /// Fold a byte sequence down to @p target bytes, see hash::compress()
    static std::vector<uint8_t> compress(std::span<const uint8_t> input, size_t target) {
        return hash::compress(input, target);
    }

    /// Generate a fresh UUID and humanize it
    /// @param opts Forwarded unchanged to humanize()
    /// @param source Supplies the UUID in canonical form
    uuid_result uuid(const humanize_options& opts = {},
                     const uuid_source& source = random_uuid) const {
        auto digest = uuid_to_hexdigest(source());
        auto human = humanize(digest, opts);
        return uuid_result{std::move(human), std::move(digest)};
    }

private:
    static std::shared_ptr<const wordlist> builtin() {
        static const std::shared_ptr<const wordlist> words = std::make_shared<wordlist>(default_wordlist());
        return words;
    }

    static std::shared_ptr<const wordlist> checked(wordlist words) {
        if (words.size() != wordlist_size) {
            throw invalid_wordlist_error(
                "wordlist must have exactly 256 items, got " + std::to_string(words.size()));
        }
        return std::make_shared<wordlist>(std::move(words));
    }

    std::string join(const std::vector<uint8_t>& compressed, std::string_view separator) const {
        std::string out;
        for (size_t i = 0; i < compressed.size(); ++i) {
            if (i != 0) out += separator;
            out += (*words_)[compressed[i]];
        }
        return out;
    }

    std::shared_ptr<const wordlist> words_;  // never null
};

/// Process-wide hasher over the built-in wordlist, created on first use
inline const hasher& default_hasher() {
    static const hasher inst;
    return inst;
}

/// humanize() on the default hasher
inline std::string humanize(std::string_view hexdigest, const humanize_options& opts = {}) {
    return default_hasher().humanize(hexdigest, opts);
}

inline std::string humanize(std::string_view hexdigest, size_t words,
                            std::string_view separator = "-") {
    return default_hasher().humanize(hexdigest, words, separator);
}

/// uuid() on the default hasher
inline uuid_result uuid(const humanize_options& opts = {},
                        const uuid_source& source = random_uuid) {
    return default_hasher().uuid(opts, source);
}

} // namespace humanhash
