#pragma once

/// @file macros.hpp
/// @brief Logging macros that record the call site
///
///     HUMANHASH_LOG_INFO("loaded {} words from {}", n, path);
///
/// HUMANHASH_LOG_DEBUG expands to nothing unless HUMANHASH_DEBUG is defined,
/// so its arguments are not evaluated in normal builds.

#include "logger.hpp"

#define HUMANHASH_LOG_AT(lvl, fmt, ...) \
    ::humanhash::log::logger::instance().log( \
        (lvl), __FILE__, __LINE__, fmt __VA_OPT__(,) __VA_ARGS__)

#ifdef HUMANHASH_DEBUG
    #define HUMANHASH_LOG_DEBUG(fmt, ...) \
        HUMANHASH_LOG_AT(::humanhash::log::level::debug, fmt __VA_OPT__(,) __VA_ARGS__)
#else
    #define HUMANHASH_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define HUMANHASH_LOG_INFO(fmt, ...) \
    HUMANHASH_LOG_AT(::humanhash::log::level::info, fmt __VA_OPT__(,) __VA_ARGS__)

#define HUMANHASH_LOG_WARNING(fmt, ...) \
    HUMANHASH_LOG_AT(::humanhash::log::level::warning, fmt __VA_OPT__(,) __VA_ARGS__)

#define HUMANHASH_LOG_ERROR(fmt, ...) \
    HUMANHASH_LOG_AT(::humanhash::log::level::error, fmt __VA_OPT__(,) __VA_ARGS__)
