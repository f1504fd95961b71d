/**
 * Copyright (c) 2026, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file log_level.hh
 */

#ifndef logline_log_level_hh
#define logline_log_level_hh

#include <array>

#include <stddef.h>
#include <sys/types.h>

/**
 * The severity of a log line.
 */
enum log_level_t : int {
    LEVEL_UNKNOWN,
    LEVEL_TRACE,
    LEVEL_DEBUG,
    LEVEL_INFO,
    LEVEL_WARNING,
    LEVEL_ERROR,
    LEVEL_FATAL,

    LEVEL__MAX,
};

extern const std::array<const char*, LEVEL__MAX> level_names;

/**
 * Convert a level name, like "warn", "ERR", or "W", to its level.  The
 * comparison is case-insensitive and the whole string must match.
 *
 * @param levelstr The name of the level.
 * @param len The length of the name or -1 if it is NUL-terminated.
 * @return The level or LEVEL_UNKNOWN if the name was not recognized.
 */
log_level_t string2level(const char* levelstr, ssize_t len = -1);

/**
 * Find the first word in a line that names a level.  Words are delimited by
 * characters other than letters, digits, and underscores, so "ERROR:" and
 * "[warn]" match while "ERRORS" and "info_log" do not.  Single-letter
 * abbreviations are not considered.
 *
 * @return The level or LEVEL_UNKNOWN if no word names one.
 */
log_level_t detect_level(const char* line, size_t len);

#endif
