#include <humanhash/humanhash.hpp>
#include <iostream>

using namespace humanhash;

int main() {
    // Enable debug logging
    log::logger::instance().set_level(log::level::debug);

    std::cout << "=== humanhash " << version() << " ===" << std::endl;

    // Default hasher, default options
    const char* digest = "60ad8d0d871b6095808297";
    std::cout << digest << " -> " << humanize(digest) << std::endl;

    // Fewer words, different separator
    std::cout << digest << " -> " << humanize(digest, 2, "_") << std::endl;

    // A fresh UUID, with the digest kept for exact lookup later
    auto result = uuid({.words = 3, .separator = " "});
    std::cout << result.digest << " -> " << result.human << std::endl;

    // Custom wordlist: byte values spelled out
    wordlist numbers;
    for (int i = 0; i < 256; ++i) {
        numbers.push_back("n" + std::to_string(i));
    }
    hasher numeric(numbers);
    std::cout << digest << " -> " << numeric.humanize(digest) << std::endl;

    try {
        humanize(digest, 12);
    } catch (const insufficient_input_error& e) {
        HUMANHASH_LOG_WARNING("Expected failure: {}", e.what());
    }

    return 0;
}
