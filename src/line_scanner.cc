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
 * @file line_scanner.cc
 */

#include <algorithm>
#include <vector>

#include "line_scanner.hh"

#include <string.h>

#include "base/logline_log.hh"
#include "fmt/format.h"

namespace logline {

line_delimiter::line_delimiter(text_encoding enc)
    : ld_width(text_encoding_unit_width(enc)), ld_bytes{'\n', '\0'}
{
    if (enc == text_encoding::utf16be) {
        this->ld_bytes[0] = '\0';
        this->ld_bytes[1] = '\n';
    }
}

bool
line_delimiter::is_match(const char* buf,
                         size_t index,
                         file_off_t buf_offset) const
{
    if (this->ld_width == 1) {
        return buf[index] == this->ld_bytes[0];
    }

    return (buf_offset + index) % 2 == 0 && buf[index] == this->ld_bytes[0]
        && buf[index + 1] == this->ld_bytes[1];
}

std::optional<size_t>
line_delimiter::find_next(const char* buf,
                          size_t len,
                          file_off_t buf_offset,
                          size_t from) const
{
    if (this->ld_width == 1) {
        if (from >= len) {
            return std::nullopt;
        }

        const auto* hit = (const char*) memchr(&buf[from], '\n', len - from);
        if (hit == nullptr) {
            return std::nullopt;
        }
        return hit - buf;
    }

    for (auto index = from; index + 1 < len; index++) {
        if (this->is_match(buf, index, buf_offset)) {
            return index;
        }
    }

    return std::nullopt;
}

std::optional<size_t>
line_delimiter::find_prev(const char* buf,
                          size_t end,
                          file_off_t buf_offset) const
{
    if (end < this->ld_width) {
        return std::nullopt;
    }

    if (this->ld_width == 1) {
        const auto* hit = (const char*) memrchr(buf, '\n', end);
        if (hit == nullptr) {
            return std::nullopt;
        }
        return hit - buf;
    }

    for (auto index = end - this->ld_width + 1; index > 0; index--) {
        if (this->is_match(buf, index - 1, buf_offset)) {
            return index - 1;
        }
    }

    return std::nullopt;
}

bool
line_delimiter::ends_with(const char* buf,
                          size_t len,
                          file_off_t buf_offset) const
{
    return len >= this->ld_width
        && this->is_match(buf, len - this->ld_width, buf_offset);
}

Result<backward_scan_result, std::string>
scan_backward(const auto_fd& fd,
              file_off_t anchor,
              size_t max_lines,
              size_t chunk_size,
              const line_delimiter& delim)
{
    require(anchor >= 0);
    require(chunk_size > 0);

    backward_scan_result retval;
    auto width = (file_off_t) delim.width();

    retval.bsr_start_offset = anchor;
    if (max_lines == 0 || anchor == 0) {
        return Ok(retval);
    }

    auto search_end = anchor;
    if (anchor >= width) {
        char tail[2];
        auto tail_size = TRY(fd.pread_fully(tail, width, anchor - width));

        if ((file_off_t) tail_size == width
            && delim.ends_with(tail, width, anchor - width))
        {
            // the delimiter terminates the last line, it does not start one
            search_end = anchor - width;
        }
    }

    std::vector<char> buffer(chunk_size + delim.width());
    size_t found = 0;
    auto pos = search_end;

    while (pos > 0) {
        file_off_t chunk_start
            = pos > (file_off_t) chunk_size ? pos - chunk_size : 0;

        chunk_start -= chunk_start % width;

        size_t len = pos - chunk_start;
        auto rc = TRY(fd.pread_fully(buffer.data(), len, chunk_start));
        if (rc < len) {
            return Err(fmt::format(
                FMT_STRING("file shrank while scanning backward from {}"),
                anchor));
        }

        auto end = len;
        while (end > 0) {
            auto delim_index
                = delim.find_prev(buffer.data(), end, chunk_start);

            if (!delim_index) {
                break;
            }
            found += 1;
            if (found == max_lines) {
                retval.bsr_start_offset
                    = chunk_start + delim_index.value() + width;
                retval.bsr_line_count = found;
                return Ok(retval);
            }
            end = delim_index.value();
        }
        pos = chunk_start;
    }

    retval.bsr_start_offset = 0;
    retval.bsr_line_count = found + 1;

    return Ok(retval);
}

Result<file_off_t, std::string>
scan_forward(const auto_fd& fd,
             file_range range,
             size_t block_size,
             size_t max_retained,
             const line_delimiter& delim,
             const line_callback& cb)
{
    auto width = delim.width();
    auto block = std::max(width, block_size - block_size % width);
    std::vector<char> buffer(block);
    auto end = range.next_offset();
    auto pos = range.fr_offset;
    raw_line pending;

    pending.rl_range.fr_offset = range.fr_offset;

    auto retain = [&pending, max_retained](const char* data, size_t len) {
        auto room = max_retained > pending.rl_data.size()
            ? max_retained - pending.rl_data.size()
            : 0;

        if (len > room) {
            pending.rl_truncated = true;
            len = room;
        }
        pending.rl_data.append(data, len);
    };

    while (pos < end) {
        auto to_read = std::min((file_off_t) block, end - pos);
        auto rc = TRY(fd.pread_fully(buffer.data(), to_read, pos));

        if (rc == 0) {
            log_warning("file shrank while reading, stopping at offset %lld",
                        (long long) pos);
            break;
        }

        size_t seg_start = 0;
        while (true) {
            auto delim_index
                = delim.find_next(buffer.data(), rc, pos, seg_start);

            if (!delim_index) {
                break;
            }

            auto seg_end = delim_index.value() + width;

            retain(&buffer[seg_start], seg_end - seg_start);
            pending.rl_range.fr_size += seg_end - seg_start;
            pending.rl_has_delimiter = true;

            auto next_offset = pending.rl_range.next_offset();
            if (!cb(std::move(pending))) {
                return Ok(next_offset);
            }
            pending = raw_line{};
            pending.rl_range.fr_offset = next_offset;
            seg_start = seg_end;
        }
        if (seg_start < rc) {
            retain(&buffer[seg_start], rc - seg_start);
            pending.rl_range.fr_size += rc - seg_start;
        }
        pos += rc;
        if (rc < (size_t) to_read) {
            log_warning("file shrank while reading, stopping at offset %lld",
                        (long long) pos);
            break;
        }
    }

    if (!pending.rl_range.empty()) {
        // the result of the last callback does not matter
        cb(std::move(pending));
    }

    return Ok(pos);
}

Result<size_t, std::string>
count_delimiters(const auto_fd& fd,
                 file_range range,
                 size_t block_size,
                 const line_delimiter& delim)
{
    auto width = delim.width();
    auto block = std::max(width, block_size - block_size % width);
    std::vector<char> buffer(block);
    auto end = range.next_offset();
    auto pos = range.fr_offset;
    size_t retval = 0;

    while (pos < end) {
        auto to_read = std::min((file_off_t) block, end - pos);
        auto rc = TRY(fd.pread_fully(buffer.data(), to_read, pos));

        if (rc < (size_t) to_read) {
            return Err(fmt::format(
                FMT_STRING("file shrank while counting lines at offset {}"),
                pos + rc));
        }

        size_t index = 0;
        while (true) {
            auto delim_index = delim.find_next(buffer.data(), rc, pos, index);

            if (!delim_index) {
                break;
            }
            retval += 1;
            index = delim_index.value() + width;
        }
        pos += rc;
    }

    return Ok(retval);
}

}  // namespace logline
