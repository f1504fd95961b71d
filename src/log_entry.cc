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
 * @file log_entry.cc
 */

#include <utility>

#include "log_entry.hh"

#include <ctype.h>
#include <time.h>

namespace logline {

namespace {

struct time_fields {
    int tf_year{1970};
    int tf_month{1};
    int tf_day{1};
    int tf_hour{0};
    int tf_minute{0};
    int tf_second{0};
    int tf_millis{0};
};

bool
read_digits(const char* str, size_t len, size_t& off, size_t count, int& out)
{
    if (off + count > len) {
        return false;
    }

    out = 0;
    for (size_t lpc = 0; lpc < count; lpc++) {
        auto ch = (unsigned char) str[off + lpc];

        if (!isdigit(ch)) {
            return false;
        }
        out = out * 10 + (ch - '0');
    }
    off += count;

    return true;
}

bool
read_char(const char* str, size_t len, size_t& off, const char* accepted)
{
    if (off >= len) {
        return false;
    }
    for (; *accepted; accepted++) {
        if (str[off] == *accepted) {
            off += 1;
            return true;
        }
    }

    return false;
}

bool
read_time(const char* str, size_t len, size_t& off, time_fields& tf)
{
    if (!read_digits(str, len, off, 2, tf.tf_hour)
        || !read_char(str, len, off, ":")
        || !read_digits(str, len, off, 2, tf.tf_minute)
        || !read_char(str, len, off, ":")
        || !read_digits(str, len, off, 2, tf.tf_second))
    {
        return false;
    }

    auto frac_off = off;
    if (read_char(str, len, frac_off, ".")
        && read_digits(str, len, frac_off, 3, tf.tf_millis))
    {
        off = frac_off;
    }

    return true;
}

bool
read_date_time(const char* str,
               size_t len,
               size_t off,
               char date_sep,
               const char* time_seps,
               time_fields& tf)
{
    const char sep_str[] = {date_sep, '\0'};

    return read_digits(str, len, off, 4, tf.tf_year)
        && read_char(str, len, off, sep_str)
        && read_digits(str, len, off, 2, tf.tf_month)
        && read_char(str, len, off, sep_str)
        && read_digits(str, len, off, 2, tf.tf_day)
        && read_char(str, len, off, time_seps) && read_time(str, len, off, tf);
}

bool
is_leap_year(int year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

std::optional<timestamp_t>
to_timestamp(const time_fields& tf)
{
    static const int DAYS_IN_MONTH[]
        = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

    if (tf.tf_month < 1 || tf.tf_month > 12 || tf.tf_day < 1) {
        return std::nullopt;
    }

    auto max_day = DAYS_IN_MONTH[tf.tf_month - 1];
    if (tf.tf_month == 2 && is_leap_year(tf.tf_year)) {
        max_day += 1;
    }
    if (tf.tf_day > max_day || tf.tf_hour > 23 || tf.tf_minute > 59
        || tf.tf_second > 59)
    {
        return std::nullopt;
    }

    struct tm tm = {};

    tm.tm_year = tf.tf_year - 1900;
    tm.tm_mon = tf.tf_month - 1;
    tm.tm_mday = tf.tf_day;
    tm.tm_hour = tf.tf_hour;
    tm.tm_min = tf.tf_minute;
    tm.tm_sec = tf.tf_second;
    tm.tm_isdst = -1;

    auto secs = mktime(&tm);

    return std::chrono::system_clock::from_time_t(secs)
        + std::chrono::milliseconds(tf.tf_millis);
}

using matcher_t = bool (*)(const char*, size_t, size_t, time_fields&);

bool
match_iso8601(const char* str, size_t len, size_t off, time_fields& tf)
{
    return read_date_time(str, len, off, '-', "T ", tf);
}

bool
match_slashed(const char* str, size_t len, size_t off, time_fields& tf)
{
    return read_date_time(str, len, off, '/', " ", tf);
}

bool
match_time_only(const char* str, size_t len, size_t off, time_fields& tf)
{
    return read_time(str, len, off, tf);
}

const matcher_t MATCHERS[] = {
    match_iso8601,
    match_slashed,
    match_time_only,
};

}  // namespace

log_entry
log_entry::create(size_t line_number,
                  std::string content,
                  file_off_t byte_offset)
{
    log_entry retval;

    retval.le_line_number = line_number;
    retval.le_level = detect_level(content.data(), content.size());
    retval.le_timestamp = detect_timestamp(content.data(), content.size());
    retval.le_byte_offset = byte_offset;
    retval.le_content = std::move(content);

    return retval;
}

std::optional<timestamp_t>
detect_timestamp(const char* line, size_t len)
{
    for (const auto matcher : MATCHERS) {
        for (size_t off = 0; off < len; off++) {
            time_fields tf;

            if (matcher(line, len, off, tf)) {
                auto retval = to_timestamp(tf);
                if (retval) {
                    return retval;
                }
                // only the first match of each format is considered
                break;
            }
        }
    }

    return std::nullopt;
}

}  // namespace logline
