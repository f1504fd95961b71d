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
 * @file line_scanner.hh
 */

#ifndef logline_line_scanner_hh
#define logline_line_scanner_hh

#include <functional>
#include <optional>
#include <string>

#include <stddef.h>

#include "base/auto_fd.hh"
#include "base/file_range.hh"
#include "base/result.h"
#include "text_encoding.hh"

namespace logline {

/**
 * The newline code unit for an encoding.  For the UTF-16 encodings the unit
 * is two bytes wide and only counts when it starts at an even file offset.
 */
class line_delimiter {
public:
    explicit line_delimiter(text_encoding enc);

    size_t width() const { return this->ld_width; }

    /**
     * @param buf The buffer to search.
     * @param len The number of bytes in the buffer.
     * @param buf_offset The file offset of the first byte in the buffer.
     * @param from The index in the buffer to start searching at.
     * @return The index of the first delimiter at or after `from`.
     */
    std::optional<size_t> find_next(const char* buf,
                                    size_t len,
                                    file_off_t buf_offset,
                                    size_t from) const;

    /**
     * @return The index of the last delimiter that ends at or before `end`.
     */
    std::optional<size_t> find_prev(const char* buf,
                                    size_t end,
                                    file_off_t buf_offset) const;

    /** @return True if the data ends with a complete delimiter. */
    bool ends_with(const char* buf, size_t len, file_off_t buf_offset) const;

private:
    bool is_match(const char* buf, size_t index, file_off_t buf_offset) const;

    size_t ld_width;
    char ld_bytes[2];
};

struct backward_scan_result {
    /** The offset of the first line found. */
    file_off_t bsr_start_offset{0};
    /** The number of lines between the start offset and the anchor. */
    size_t bsr_line_count{0};
};

/**
 * Find the start of the line that is `max_lines` lines before the given
 * anchor by reading backward from the anchor in blocks.  The anchor is
 * expected to be the start of a line or the end of the file.  A line ending
 * exactly at the anchor is the last line counted and a line without a
 * trailing delimiter at the anchor still counts as one line.  If the start
 * of the file is reached first, the result starts at zero with fewer lines.
 */
Result<backward_scan_result, std::string> scan_backward(
    const auto_fd& fd,
    file_off_t anchor,
    size_t max_lines,
    size_t chunk_size,
    const line_delimiter& delim);

struct raw_line {
    /** The extent of the line in the file, including its delimiter. */
    file_range rl_range;
    /** The bytes of the line, or only a prefix of them if truncated. */
    std::string rl_data;
    bool rl_truncated{false};
    /** False for a last line that has no delimiter. */
    bool rl_has_delimiter{false};
};

/** Return false from the callback to stop scanning after that line. */
using line_callback = std::function<bool(raw_line&& line)>;

/**
 * Split a range of a file into lines and pass each one to the callback.  The
 * last line in the range does not need a delimiter.  At most `max_retained`
 * bytes of each line are kept in memory.
 *
 * @return The offset just past the last byte consumed, which is less than
 *   the end of the range if the callback stopped the scan or the file shrank
 *   while it was being read.
 */
Result<file_off_t, std::string> scan_forward(const auto_fd& fd,
                                             file_range range,
                                             size_t block_size,
                                             size_t max_retained,
                                             const line_delimiter& delim,
                                             const line_callback& cb);

/**
 * @return The number of delimiters in the given range of the file.
 */
Result<size_t, std::string> count_delimiters(const auto_fd& fd,
                                             file_range range,
                                             size_t block_size,
                                             const line_delimiter& delim);

}  // namespace logline

#endif
