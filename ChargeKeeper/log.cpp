// ChargeKeeper — battery charge threshold and force-discharge controller
//
// Copyright (c) 2025 Mikhailzrick
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License version 2
// as published by the Free Software Foundation.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License v2
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include "log.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace chargekeeper {

static LogLevel g_level = LogLevel::INFO;

void set_log_level(LogLevel level) { g_level = level; }

static void vlog(LogLevel level, const char* tag, const char* fmt, va_list ap) {
    if (static_cast<int>(level) > static_cast<int>(g_level)) return;
    std::fprintf(stderr, "chargekeeper: %s: ", tag);
    std::vfprintf(stderr, fmt, ap);
    std::fprintf(stderr, "\n");
}

void log_error(const char* fmt, ...) {
    va_list ap; va_start(ap, fmt); vlog(LogLevel::ERROR, "Error", fmt, ap); va_end(ap);
}

void log_warn(const char* fmt, ...) {
    va_list ap; va_start(ap, fmt); vlog(LogLevel::WARN, "Warning", fmt, ap); va_end(ap);
}

void log_info(const char* fmt, ...) {
    va_list ap; va_start(ap, fmt); vlog(LogLevel::INFO, "Info", fmt, ap); va_end(ap);
}

void log_debug(const char* fmt, ...) {
    va_list ap; va_start(ap, fmt); vlog(LogLevel::DEBUG, "Debug", fmt, ap); va_end(ap);
}

void die(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    std::fprintf(stderr, "chargekeeper: Error: ");
    std::vfprintf(stderr, fmt, ap);
    std::fprintf(stderr, "\n");
    va_end(ap);
    std::exit(1);
}

} // namespace chargekeeper
