#include <catch2/catch.hpp>
#include <humanhash/hasher.hpp>
#include "../test_main.cpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

using namespace humanhash;
using namespace humanhash::test;

namespace {
const char* digest = "60ad8d0d871b6095808297";
}

TEST_CASE("humanize with default wordlist", "[hasher]") {
    SECTION("default options") {
        REQUIRE(humanize(digest) == "silicon-valley-apple-function-web");
        REQUIRE(default_hasher().humanize(digest) == "silicon-valley-apple-function-web");
    }

    SECTION("custom separator") {
        REQUIRE(humanize(digest, 4, "_") == "silicon-valley_apple_function_web");
        REQUIRE(humanize(digest, humanize_options{4, " "}) == "silicon-valley apple function web");
        REQUIRE(humanize(digest, humanize_options{.separator = "_"}) ==
                "silicon-valley_apple_function_web");
    }

    SECTION("word count") {
        REQUIRE(humanize(digest, 1) == "eclipse");
        REQUIRE(humanize(digest, 2, "_") == "ansible_adobe-photoshop");
        REQUIRE(humanize(digest, 3, "_") == "foundation_perl_web");
    }

    SECTION("uppercase digest gives the same words") {
        REQUIRE(humanize("60AD8D0D871B6095808297") == humanize(digest));
    }

    SECTION("32 digit digest") {
        REQUIRE(humanize("7528880a986c40e78c38115e640da2a1") ==
                "css-android-studio-advocacy-html5");
    }
}

TEST_CASE("humanize with custom wordlist", "[hasher]") {
    hasher h(numbered_wordlist());

    SECTION("bytes map by index") {
        REQUIRE(h.humanize(digest) == "w205-w128-w156-w96");
    }

    SECTION("every word count yields that many words from the list") {
        const auto& words = h.words();
        for (size_t n = 1; n <= 11; ++n) {
            auto parts = split(h.humanize(digest, n), "-");
            REQUIRE(parts.size() == n);
            for (const auto& p : parts) {
                REQUIRE(std::find(words.begin(), words.end(), p) != words.end());
            }
        }
    }

    SECTION("multi-character separator") {
        REQUIRE(h.humanize(digest, 2, " :: ") == "w202 :: w123");
    }

    SECTION("deterministic") {
        auto first = h.humanize(digest, 5, ".");
        for (int i = 0; i < 10; ++i) {
            REQUIRE(h.humanize(digest, 5, ".") == first);
        }
    }
}

TEST_CASE("humanize error propagation", "[hasher]") {
    SECTION("more words than digest bytes") {
        REQUIRE_THROWS_AS(humanize(digest, 12), insufficient_input_error);
        REQUIRE_THROWS_AS(humanize("abcd", 3), insufficient_input_error);
        REQUIRE_THROWS_AS(humanize(""), insufficient_input_error);
    }

    SECTION("malformed digest") {
        REQUIRE_THROWS_AS(humanize("60ad8d0d871b609580829"), invalid_digest_error);
        REQUIRE_THROWS_AS(humanize("not a digest"), invalid_digest_error);
    }

    SECTION("zero words") {
        REQUIRE_THROWS_AS(humanize(digest, 0), std::invalid_argument);
    }
}

TEST_CASE("default hasher is shared and thread safe", "[hasher]") {
    REQUIRE(&default_hasher() == &default_hasher());

    const int num_threads = 8;
    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&mismatches]() {
            for (int j = 0; j < 100; ++j) {
                if (humanize(digest) != "silicon-valley-apple-function-web") {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(mismatches.load() == 0);
}

TEST_CASE("independent hashers do not affect each other", "[hasher]") {
    hasher a(numbered_wordlist(256, "a"));
    hasher b(numbered_wordlist(256, "b"));

    REQUIRE(a.humanize(digest) == "a205-a128-a156-a96");
    REQUIRE(b.humanize(digest) == "b205-b128-b156-b96");
    REQUIRE(humanize(digest) == "silicon-valley-apple-function-web");
}

TEST_CASE("hasher keeps its wordlist for its whole lifetime", "[hasher]") {
    STATIC_REQUIRE(std::is_copy_constructible_v<hasher>);
    STATIC_REQUIRE_FALSE(std::is_copy_assignable_v<hasher>);
    STATIC_REQUIRE_FALSE(std::is_move_assignable_v<hasher>);

    hasher original(numbered_wordlist());

    SECTION("copies produce identical output and share the list") {
        hasher copy(original);
        REQUIRE(copy.humanize(digest) == original.humanize(digest));
        REQUIRE(&copy.words() == &original.words());
    }

    SECTION("moved-from hasher still works") {
        hasher moved(std::move(original));
        REQUIRE(moved.humanize(digest) == "w205-w128-w156-w96");
        REQUIRE(original.words().size() == wordlist_size);
        REQUIRE(original.humanize(digest) == "w205-w128-w156-w96");
    }

    SECTION("default constructed hashers share the built-in list") {
        hasher a;
        hasher b;
        REQUIRE(&a.words() == &b.words());
        REQUIRE(a.words() == default_wordlist());
    }
}
