/// @file humanhash_cli.cpp
/// @brief Command line front end for humanhash
///
/// Prints the humanized form of each digest given on the command line, or
/// of each line read from stdin when no digest is given.
///
/// Usage: ./humanhash [options] [digest...]
///   -w, --words N        Number of words (default 4)
///   -s, --separator S    Word separator (default "-")
///   -u, --uuid           Generate a random UUID and print "<words> <digest>"
///   -f, --wordlist FILE  Use a wordlist file (256 words, one per line)
///   -v, --verbose        Debug logging
///   -q, --quiet          Only log errors
///   -h, --help           Show help
///
/// HUMANHASH_LOG_LEVEL=debug|info|warn|error sets the initial log level.
/// Exit status: 0 on success, 1 if any digest failed, 2 on usage errors.

#include <humanhash/humanhash.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

using namespace humanhash;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] [digest...]\n"
              << "Options:\n"
              << "  -w, --words N        Number of words (default 4)\n"
              << "  -s, --separator S    Word separator (default \"-\")\n"
              << "  -u, --uuid           Generate a random UUID and humanize it\n"
              << "  -f, --wordlist FILE  Use a wordlist file (256 words, one per line)\n"
              << "  -v, --verbose        Debug logging\n"
              << "  -q, --quiet          Only log errors\n"
              << "  -h, --help           Show this help\n"
              << "Reads digests from stdin, one per line, when none are given.\n";
}

/// Parse a positive word count, nullopt if malformed
std::optional<size_t> parse_words(const std::string& arg) {
    if (arg.empty()) return std::nullopt;
    size_t value = 0;
    for (char c : arg) {
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + static_cast<size_t>(c - '0');
        if (value > 1024) return std::nullopt;
    }
    if (value == 0) return std::nullopt;
    return value;
}

/// Humanize one digest, logging failures. Returns false on error.
bool humanize_one(const hasher& h, const std::string& digest, const humanize_options& opts) {
    try {
        std::cout << h.humanize(digest, opts) << "\n";
        return true;
    } catch (const humanhash::error& e) {
        HUMANHASH_LOG_ERROR("'{}': {}", digest, e.what());
    } catch (const std::invalid_argument& e) {
        HUMANHASH_LOG_ERROR("'{}': {}", digest, e.what());
    }
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    auto& logger = log::logger::instance();
    logger.set_color(::isatty(STDERR_FILENO) != 0);
    if (const char* env = std::getenv("HUMANHASH_LOG_LEVEL")) {
        if (auto lvl = log::level_from_string(env)) {
            logger.set_level(*lvl);
        } else {
            HUMANHASH_LOG_WARNING("Ignoring unknown HUMANHASH_LOG_LEVEL '{}'", env);
        }
    }

    humanize_options opts;
    std::optional<std::string> wordlist_path;
    bool gen_uuid = false;
    std::vector<std::string> digests;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-w" || arg == "--words") && i + 1 < argc) {
            auto words = parse_words(argv[++i]);
            if (!words) {
                HUMANHASH_LOG_ERROR("Invalid word count: {}", argv[i]);
                return 2;
            }
            opts.words = *words;
        } else if ((arg == "-s" || arg == "--separator") && i + 1 < argc) {
            opts.separator = argv[++i];
        } else if ((arg == "-f" || arg == "--wordlist") && i + 1 < argc) {
            wordlist_path = argv[++i];
        } else if (arg == "-u" || arg == "--uuid") {
            gen_uuid = true;
        } else if (arg == "-v" || arg == "--verbose") {
            logger.set_level(log::level::debug);
        } else if (arg == "-q" || arg == "--quiet") {
            logger.set_level(log::level::error);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            HUMANHASH_LOG_ERROR("Unknown or incomplete option: {}", arg);
            print_usage(argv[0]);
            return 2;
        } else {
            digests.push_back(std::move(arg));
        }
    }

    std::optional<hasher> custom;
    if (wordlist_path) {
        try {
            custom.emplace(wordlist_from_file(*wordlist_path));
        } catch (const invalid_wordlist_error& e) {
            HUMANHASH_LOG_ERROR("{}: {}", *wordlist_path, e.what());
            return 2;
        }
        HUMANHASH_LOG_DEBUG("Loaded wordlist from {}", *wordlist_path);
    }
    const hasher& h = custom ? *custom : default_hasher();

    if (gen_uuid) {
        try {
            auto result = h.uuid(opts);
            std::cout << result.human << " " << result.digest << "\n";
            return 0;
        } catch (const humanhash::error& e) {
            HUMANHASH_LOG_ERROR("uuid: {}", e.what());
        } catch (const std::invalid_argument& e) {
            HUMANHASH_LOG_ERROR("uuid: {}", e.what());
        }
        return 1;
    }

    bool ok = true;
    if (digests.empty()) {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;
            ok = humanize_one(h, line, opts) && ok;
        }
    } else {
        for (const auto& digest : digests) {
            ok = humanize_one(h, digest, opts) && ok;
        }
    }

    return ok ? 0 : 1;
}
