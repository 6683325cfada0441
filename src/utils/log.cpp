/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "log.h"

#include <cstdio>

namespace binstruct::log {
namespace {
Level g_level = Level::Info;

void vprint(FILE* f, Level lvl, const char* prefix, const char* fmt, va_list args) {
    if (!enabled(lvl)) {
        return;
    }
    std::fputs(prefix, f);
    std::vfprintf(f, fmt, args);
    std::fputc('\n', f);
    std::fflush(f);
}
}  // namespace

void set_level(Level lvl) {
    g_level = lvl;
}

Level level() {
    return g_level;
}

bool enabled(Level lvl) {
    return static_cast<int>(lvl) >= static_cast<int>(g_level);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stdout, Level::Debug, "[DEBUG] ", fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stdout, Level::Info, "", fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stderr, Level::Error, "[ERROR] ", fmt, args);
    va_end(args);
}
}  // namespace binstruct::log
