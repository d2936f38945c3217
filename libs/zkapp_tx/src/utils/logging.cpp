/*
 * Bullet Ledger
 * Copyright (C) 2025 Joshua Olson
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "logging.h"
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <vector>

static std::atomic<int> log_level{LOG_INFO};

static const char* level_tag(LogLevel level) {
    switch (level) {
        case LOG_DEBUG: return "DEBUG";
        case LOG_INFO:  return "INFO";
        case LOG_WARN:  return "WARN";
        case LOG_ERROR: return "ERROR";
        default:        return "";
    }
}

void set_log_level(LogLevel level) {
    log_level.store(level);
}

LogLevel get_log_level() {
    return static_cast<LogLevel>(log_level.load());
}

std::string vformat_msg(const char* fmt, va_list args) {
    va_list sizing;
    va_copy(sizing, args);
    int len = vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    if (len < 0) return std::string("bad log format: ") + fmt;

    std::vector<char> line(static_cast<size_t>(len) + 1);
    vsnprintf(line.data(), line.size(), fmt, args);
    return std::string(line.data(), static_cast<size_t>(len));
}

std::string format_msg(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string line = vformat_msg(fmt, args);
    va_end(args);
    return line;
}

void log_msg(LogLevel level, const char* fmt, ...) {
    if (level < log_level.load() || level >= LOG_OFF) return;

    va_list args;
    va_start(args, fmt);
    std::string line = vformat_msg(fmt, args);
    va_end(args);

    fprintf(stderr, "[zkapp] %-5s %s\n", level_tag(level), line.c_str());
}
