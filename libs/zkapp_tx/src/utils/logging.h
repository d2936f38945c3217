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

#pragma once
#include <cstdarg>
#include <string>

enum LogLevel {
    LOG_DEBUG = 0,
    LOG_INFO  = 1,
    LOG_WARN  = 2,
    LOG_ERROR = 3,
    LOG_OFF   = 4,
};

void set_log_level(LogLevel level);
LogLevel get_log_level();

// printf-style, one line per call, written to stderr
void log_msg(LogLevel level, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));

// full printf expansion, no length limit
std::string format_msg(const char* fmt, ...)
    __attribute__((format(printf, 1, 2)));
std::string vformat_msg(const char* fmt, va_list args);
