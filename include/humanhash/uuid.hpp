#pragma once

/// @file uuid.hpp
/// @brief Random UUID source backed by libuuid

#include <uuid/uuid.h>

#include <cstddef>
#include <functional>
#include <string>

namespace humanhash {

/// Produces a UUID in canonical form ("xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx")
///
/// Injected into hasher::uuid() so tests can supply fixed values. Thread
/// safety is up to the source; random_uuid() is safe to call concurrently.
using uuid_source = std::function<std::string()>;

/// Length of an unparsed UUID including the terminating NUL
constexpr size_t uuid_unparsed_size = 37;

/// Generate a random (version 4) UUID
inline std::string random_uuid() {
    uuid_t raw;
    ::uuid_generate_random(raw);
    char out[uuid_unparsed_size];
    ::uuid_unparse_lower(raw, out);
    return std::string(out);
}

/// Strip the '-' separators from a canonical UUID, leaving bare hex
inline std::string uuid_to_hexdigest(const std::string& canonical) {
    std::string digest;
    digest.reserve(canonical.size());
    for (char c : canonical) {
        if (c != '-') digest += c;
    }
    return digest;
}

} // namespace humanhash
