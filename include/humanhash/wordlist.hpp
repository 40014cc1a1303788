#pragma once

/// @file wordlist.hpp
/// @brief The 256-word vocabulary that compressed bytes are mapped through
///
/// Byte value N selects entry N. Output is only reproducible between two
/// parties that use the same words in the same order, so the built-in list
/// must never be reordered or edited.

#include "error.hpp"

#include <array>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace humanhash {

/// Number of entries every wordlist must have (one per byte value)
constexpr size_t wordlist_size = 256;

/// Ordered vocabulary, index == byte value
using wordlist = std::vector<std::string>;

namespace detail {

inline constexpr std::array<std::string_view, wordlist_size> default_words = {
    /*   0 */ "nlp", "nosql", "photoshop", "saas", "xcode", "sqlserver", "hadoop", "data-scientist",
    /*   8 */ "mysql", "ninja", "openstack", "visual-studio", "code-review", "integrity", "mobile-app", "developer",
    /*  16 */ "xml", "native-app", "apache-cordova", "candidate", "mumbai", "analytics", "flash", "cdns",
    /*  24 */ "celery", "usability", "equity", "localizations", "junit", "css3", "activities", "meteor",
    /*  32 */ "iit-bombay", "python", "evaluate", "rake", "postgis", "psd", "functional", "appstore",
    /*  40 */ "background", "jenkins", "web-sockets", "excellent-negotiating", "mocha", "java-script", "ie9", "storyboard",
    /*  48 */ "open-source", "data-mining", "make", "rabbitmq", "server", "digital-media", "scalable-architecture", "team",
    /*  56 */ "mapkit", "security", "cms", "rack", "detailed-job", "crm", "front-end", "javascript-engineers",
    /*  64 */ "foundation", "adobe", "rockstar", "dilbert", "android-sdks", "twitter", "startup", "job-requirements",
    /*  72 */ "iim-calcutta", "layouts", "growth", "design", "kickass", "reviewer", "team-player", "postgres",
    /*  80 */ "social-networks", "expert", "phonegap", "android-studio", "redis", "angular-js", "version", "seo-",
    /*  88 */ "cakephp", "full-stack", "backend", "jasmin", "core", "hibernate", "java-programming", "business",
    /*  96 */ "web", "internship", "aws", "javascript", "jasmine", "iconic", "web-developer", "tdd",
    /* 104 */ "ajax", "china", "html5", "ubuntu", "apache", "strong", "graphic-designer", "laravel",
    /* 112 */ "pune", "web-servcies", "postgresql", "constraint", "php-developer", "industry", "experience", "keen",
    /* 120 */ "joomla", "mvc", "elasticsearch", "adobe-photoshop", "sass", "ionic", "new-delhi", "vacation-policy",
    /* 128 */ "apple", "social-media", "devops", "cocoa", "unix", "api", "linux", "sounds",
    /* 136 */ "ios-developer", "engineer", "iim-bangalore", "git", "java", "codeigniter", "free", "software-developer",
    /* 144 */ "nosql-db", "perl", "json", "wordpress", "iphone", "criteria", "widgets", "mks",
    /* 152 */ "lean-practices", "energy", "big-data-analytics", "define", "function", "iit", "newsletters", "company",
    /* 160 */ "memory", "j2ee", "rspec", "ec2", "iit-delhi", "grunt", "ruby", "sdk",
    /* 168 */ "jquery", "project-manager", "analyze", "illustrator", "tomcat", "embedded", "web-app", "rest-api",
    /* 176 */ "work", "eclipse", "objective-c", "senior-architect", "lead", "lucene", "frameworks", "compensation",
    /* 184 */ "open-gl", "stock-options", "jquery-mobile", "nashik", "android-apis", "restful", "requirejs", "user-interface",
    /* 192 */ "sqlite", "documentation", "mongo", "springmvc", "big-data", "india", "sales", "linkedin",
    /* 200 */ "koramangala", "iit-kanpur", "ansible", "expertise", "angularjs", "silicon-valley", "technology", "html-designer",
    /* 208 */ "ipad-developer", "adwords", "webgl", "firmware", "vagrant", "indiranagar", "phonegap-developer", "ceo",
    /* 216 */ "html", "esops", "machine-learning", "online", "performance", "android", "pandas", "css",
    /* 224 */ "karma", "node", "gurgaon", "bonus", "mongodb", "senior-ux", "ios", "scalability",
    /* 232 */ "mouth", "plan", "sql", "services", "tech-lead", "php", "data", "svn",
    /* 240 */ "paas", "designers", "github", "technical-lead", "algorithm", "database", "url", "bootstrap",
    /* 248 */ "san-francisco", "django", "client", "advocacy", "databases", "coordinate", "frontend-developers", "mac-os",
};

static_assert(!default_words.back().empty(), "default wordlist must have 256 entries");

inline std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

} // namespace detail

/// Built-in wordlist, constructed once on first use
inline const wordlist& default_wordlist() {
    static const wordlist words(detail::default_words.begin(), detail::default_words.end());
    return words;
}

/// Read a wordlist, one word per line
///
/// Surrounding whitespace is trimmed; blank lines and lines starting with
/// '#' are skipped. The entry count is not checked here, the hasher does
/// that on construction.
inline wordlist wordlist_from_stream(std::istream& in) {
    wordlist words;
    words.reserve(wordlist_size);
    std::string line;
    while (std::getline(in, line)) {
        auto word = detail::trim(line);
        if (word.empty() || word.front() == '#') continue;
        words.emplace_back(word);
    }
    if (in.bad()) {
        throw invalid_wordlist_error("error while reading wordlist");
    }
    return words;
}

/// Read a wordlist from a file, see wordlist_from_stream()
/// @throws invalid_wordlist_error if the file cannot be opened
inline wordlist wordlist_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw invalid_wordlist_error("cannot open wordlist file: " + path);
    }
    return wordlist_from_stream(in);
}

} // namespace humanhash
