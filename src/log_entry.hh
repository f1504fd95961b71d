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
 * @file log_entry.hh
 */

#ifndef logline_log_entry_hh
#define logline_log_entry_hh

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <stddef.h>

#include "base/file_range.hh"
#include "log_level.hh"

namespace logline {

using timestamp_t = std::chrono::system_clock::time_point;

/**
 * A decoded line from a log file.  Everything except the bookmark flag is
 * fixed once the entry is created.
 */
struct log_entry {
    /** The 1-based position of the line in the file. */
    size_t le_line_number{0};
    std::string le_content;
    /** LEVEL_UNKNOWN if no level could be found in the content. */
    log_level_t le_level{LEVEL_UNKNOWN};
    std::optional<timestamp_t> le_timestamp;
    bool le_bookmarked{false};
    /** The offset in the file of the first byte of the line. */
    file_off_t le_byte_offset{0};

    /**
     * Create an entry and detect its level and timestamp from the content.
     */
    static log_entry create(size_t line_number,
                            std::string content,
                            file_off_t byte_offset);

    bool has_level() const { return this->le_level != LEVEL_UNKNOWN; }
};

using entry_list = std::vector<log_entry>;

/**
 * Find the first timestamp in a line.  The formats are tried in order:
 *
 *   YYYY-MM-DDTHH:MM:SS[.mmm] (or a space instead of the 'T')
 *   YYYY/MM/DD HH:MM:SS
 *   HH:MM:SS[.mmm], which is placed on 1970-01-01
 *
 * The first match of a format is used, and if it is not a valid date and
 * time, the next format is tried.  Times are in the local time zone.
 */
std::optional<timestamp_t> detect_timestamp(const char* line, size_t len);

}  // namespace logline

#endif
