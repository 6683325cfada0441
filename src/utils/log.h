/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace binstruct::log {
enum class Level : int {
    Debug = 0,
    Info = 1,
    Error = 2,
};

// Messages below the threshold are dropped. Defaults to Info.
void set_level(Level level);
Level level();
bool enabled(Level level);

void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace binstruct::log

#define BINSTRUCT_LOG_DEBUG(fmt, ...)                                  \
    do {                                                               \
        if (::binstruct::log::enabled(::binstruct::log::Level::Debug)) \
            ::binstruct::log::debug(fmt, ##__VA_ARGS__);               \
    } while (0)
#define BINSTRUCT_LOG_INFO(fmt, ...) ::binstruct::log::info(fmt, ##__VA_ARGS__)
#define BINSTRUCT_LOG_ERROR(fmt, ...) ::binstruct::log::error(fmt, ##__VA_ARGS__)
