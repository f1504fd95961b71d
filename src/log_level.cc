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
 * @file log_level.cc
 */

#include "log_level.hh"

#include <ctype.h>
#include <string.h>
#include <strings.h>

const std::array<const char*, LEVEL__MAX> level_names = {
    "unknown",
    "trace",
    "debug",
    "info",
    "warning",
    "error",
    "fatal",
};

namespace {

const struct {
    const char* la_name;
    log_level_t la_level;
} LEVEL_ALIASES[] = {
    {"trace", LEVEL_TRACE},
    {"trc", LEVEL_TRACE},
    {"debug", LEVEL_DEBUG},
    {"dbg", LEVEL_DEBUG},
    {"info", LEVEL_INFO},
    {"inf", LEVEL_INFO},
    {"warn", LEVEL_WARNING},
    {"warning", LEVEL_WARNING},
    {"wrn", LEVEL_WARNING},
    {"error", LEVEL_ERROR},
    {"err", LEVEL_ERROR},
    {"fatal", LEVEL_FATAL},
    {"critical", LEVEL_FATAL},
    {"crit", LEVEL_FATAL},
};

constexpr size_t MAX_LEVEL_NAME_LEN = 8;

bool
is_word_char(unsigned char ch)
{
    return isalnum(ch) || ch == '_' || ch >= 0x80;
}

log_level_t
word2level(const char* word, size_t len)
{
    if (len < 3 || len > MAX_LEVEL_NAME_LEN) {
        return LEVEL_UNKNOWN;
    }

    for (const auto& alias : LEVEL_ALIASES) {
        if (strlen(alias.la_name) == len
            && strncasecmp(alias.la_name, word, len) == 0)
        {
            return alias.la_level;
        }
    }

    return LEVEL_UNKNOWN;
}

}  // namespace

log_level_t
string2level(const char* levelstr, ssize_t len)
{
    if (len == -1) {
        len = strlen(levelstr);
    }
    if (len == 1) {
        switch (toupper(levelstr[0])) {
            case 'T':
                return LEVEL_TRACE;
            case 'D':
                return LEVEL_DEBUG;
            case 'I':
                return LEVEL_INFO;
            case 'W':
                return LEVEL_WARNING;
            case 'E':
                return LEVEL_ERROR;
            case 'F':
                return LEVEL_FATAL;
            default:
                return LEVEL_UNKNOWN;
        }
    }

    return word2level(levelstr, len);
}

log_level_t
detect_level(const char* line, size_t len)
{
    const auto* uline = reinterpret_cast<const unsigned char*>(line);
    size_t index = 0;

    while (index < len) {
        if (!is_word_char(uline[index])) {
            index += 1;
            continue;
        }

        auto word_start = index;
        while (index < len && is_word_char(uline[index])) {
            index += 1;
        }

        auto retval = word2level(&line[word_start], index - word_start);
        if (retval != LEVEL_UNKNOWN) {
            return retval;
        }
    }

    return LEVEL_UNKNOWN;
}
