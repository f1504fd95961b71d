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
 * @file log_reader.cc
 */

#include <algorithm>
#include <iterator>
#include <utility>
#include <vector>

#include "log_reader.hh"

#include <errno.h>
#include <fcntl.h>

#include "base/fs_util.hh"
#include "base/logline_log.hh"
#include "fmt/format.h"

namespace logline {

log_reader::log_reader(std::filesystem::path path,
                       const reader_config& cfg,
                       auto_fd fd,
                       struct stat st,
                       line_decoder decoder)
    : lr_path(std::move(path)), lr_config(cfg), lr_fd(std::move(fd)),
      lr_stat(st), lr_decoder(std::move(decoder)),
      lr_delimiter(lr_decoder.get_encoding()), lr_file_size(st.st_size)
{
    this->reset_anchors();
}

Result<log_reader, std::string>
log_reader::open(std::filesystem::path path, const reader_config& cfg)
{
    auto fd = TRY(filesystem::open_file(path, O_RDONLY));
    auto st = TRY(fd.stat());

    if (!S_ISREG(st.st_mode)) {
        return Err(
            fmt::format(FMT_STRING("not a regular file: {}"), path.string()));
    }

    auto enc = TRY(sniff_encoding(fd, cfg));
    auto decoder = TRY(line_decoder::create(enc));

    log_info("opened log file %s (size=%lld; encoding=%s)",
             path.c_str(),
             (long long) st.st_size,
             text_encoding_name(enc));

    return Ok(log_reader(
        std::move(path), cfg, std::move(fd), st, std::move(decoder)));
}

Result<text_encoding, std::string>
log_reader::sniff_encoding(const auto_fd& fd, const reader_config& cfg)
{
    if (cfg.c_encoding) {
        return Ok(cfg.c_encoding.value());
    }

    std::vector<char> sample(cfg.c_encoding_sample_size);
    auto rc = TRY(fd.pread_fully(sample.data(), sample.size(), 0));

    return Ok(detect_text_encoding(sample.data(), rc));
}

Result<struct stat, std::string>
log_reader::stat_path() const
{
    auto stat_res = filesystem::stat_file(this->lr_path);

    if (stat_res.isOk()) {
        return stat_res;
    }

    // The file may have been renamed and not replaced yet, so keep following
    // the one that is open.
    log_debug("%s", stat_res.unwrapErr().c_str());
    return this->lr_fd.stat();
}

Result<void, std::string>
log_reader::reopen()
{
    auto fd = TRY(filesystem::open_file(this->lr_path, O_RDONLY));
    auto st = TRY(fd.stat());

    this->lr_fd = std::move(fd);
    this->lr_stat = st;

    return Ok();
}

Result<void, std::string>
log_reader::reset_encoding()
{
    auto enc = TRY(sniff_encoding(this->lr_fd, this->lr_config));

    if (enc != this->lr_decoder.get_encoding()) {
        log_info("%s: encoding changed from %s to %s",
                 this->lr_path.c_str(),
                 text_encoding_name(this->lr_decoder.get_encoding()),
                 text_encoding_name(enc));
        this->lr_decoder = TRY(line_decoder::create(enc));
        this->lr_delimiter = line_delimiter(enc);
    }

    return Ok();
}

void
log_reader::reset_anchors()
{
    this->lr_anchors.clear();
    this->lr_anchors[0] = 1;
}

void
log_reader::record_anchor(file_off_t offset, size_t line_number)
{
    require(line_number > 0);

    this->lr_anchors[offset] = line_number;
    if (this->lr_anchors.size() > MAX_ANCHORS) {
        // thin out every other anchor, the one for the start of the file
        // stays
        auto iter = std::next(this->lr_anchors.begin());
        while (iter != this->lr_anchors.end()) {
            iter = this->lr_anchors.erase(iter);
            if (iter != this->lr_anchors.end()) {
                ++iter;
            }
        }
    }
}

Result<size_t, std::string>
log_reader::line_number_at(file_off_t offset)
{
    if (offset == this->lr_cursor.rc_byte_offset) {
        return Ok(this->lr_cursor.rc_line_count + 1);
    }

    auto iter = this->lr_anchors.upper_bound(offset);

    ensure(iter != this->lr_anchors.begin());
    --iter;
    if (iter->first == offset) {
        return Ok(iter->second);
    }

    log_debug("counting lines from anchor %lld to %lld",
              (long long) iter->first,
              (long long) offset);

    file_range range;
    range.fr_offset = iter->first;
    range.fr_size = offset - iter->first;

    auto count = TRY(count_delimiters(this->lr_fd,
                                      range,
                                      this->lr_config.c_read_block_size,
                                      this->lr_delimiter));
    auto retval = iter->second + count;

    this->record_anchor(offset, retval);

    return Ok(retval);
}

log_entry
log_reader::to_entry(raw_line&& line, size_t line_number)
{
    auto content = this->lr_decoder.decode(line.rl_data.data(),
                                           line.rl_data.size(),
                                           line.rl_range.fr_offset == 0);
    auto max_len = this->lr_config.c_max_line_length;

    if (line.rl_truncated || content.size() > max_len) {
        size_t total = content.size();

        if (line.rl_truncated) {
            total = line.rl_range.fr_size;
            if (line.rl_has_delimiter) {
                total -= this->lr_delimiter.width();
            }
        }
        auto cut = std::min(max_len, content.size());

        // back up to the start of a character
        while (cut > 0 && cut < content.size()
               && (((unsigned char) content[cut]) & 0xc0) == 0x80)
        {
            cut -= 1;
        }
        content.resize(cut);
        content.append(
            fmt::format(FMT_STRING("... [truncated, {} bytes total]"), total));
    }

    return log_entry::create(
        line_number, std::move(content), line.rl_range.fr_offset);
}

Result<file_off_t, std::string>
log_reader::read_range(file_range range,
                       size_t first_line,
                       entry_list& entries)
{
    auto line_number = first_line;

    return scan_forward(this->lr_fd,
                        range,
                        this->lr_config.c_read_block_size,
                        this->max_retained(),
                        this->lr_delimiter,
                        [this, &line_number, &entries](raw_line&& line) {
                            entries.emplace_back(
                                this->to_entry(std::move(line), line_number));
                            line_number += 1;
                            return true;
                        });
}

Result<tail_result, std::string>
log_reader::read_tail(size_t max_lines)
{
    require(max_lines > 0);

    tail_result retval;
    auto st = TRY(this->lr_fd.stat());
    file_off_t file_size = st.st_size;

    this->lr_file_size = file_size;
    if (file_size == 0) {
        this->lr_cursor = reader_cursor{};
        return Ok(std::move(retval));
    }

    auto scan = TRY(scan_backward(this->lr_fd,
                                  file_size,
                                  max_lines,
                                  this->lr_config.c_scan_chunk_size,
                                  this->lr_delimiter));

    auto first_line = TRY(this->line_number_at(scan.bsr_start_offset));
    file_range range;
    range.fr_offset = scan.bsr_start_offset;
    range.fr_size = file_size - scan.bsr_start_offset;

    auto end_offset = TRY(this->read_range(range, first_line, retval.tr_entries));

    retval.tr_start_offset = scan.bsr_start_offset;
    retval.tr_total_lines = first_line - 1 + retval.tr_entries.size();
    this->lr_cursor.rc_byte_offset = end_offset;
    this->lr_cursor.rc_line_count = retval.tr_total_lines;

    log_info("%s: loaded %zu tail lines starting at offset %lld (total=%zu)",
             this->lr_path.c_str(),
             retval.tr_entries.size(),
             (long long) retval.tr_start_offset,
             retval.tr_total_lines);

    return Ok(std::move(retval));
}

Result<bool, std::string>
log_reader::has_new_content()
{
    auto st = TRY(this->stat_path());

    this->lr_file_size = st.st_size;
    if (this->lr_reset_pending || !filesystem::is_same_file(st, this->lr_stat))
    {
        return Ok(true);
    }

    return Ok(st.st_size != this->lr_cursor.rc_byte_offset);
}

Result<new_lines_result, std::string>
log_reader::read_new_lines()
{
    new_lines_result retval;
    auto path_st = TRY(this->stat_path());

    if (!filesystem::is_same_file(path_st, this->lr_stat)) {
        log_info("%s: file was replaced, reopening", this->lr_path.c_str());
        this->lr_reset_pending = true;
        TRY(this->reopen());
    } else {
        this->lr_stat = TRY(this->lr_fd.stat());
        if (this->lr_stat.st_size < this->lr_cursor.rc_byte_offset) {
            log_info("%s: file was truncated from %lld to %lld bytes",
                     this->lr_path.c_str(),
                     (long long) this->lr_cursor.rc_byte_offset,
                     (long long) this->lr_stat.st_size);
            this->lr_reset_pending = true;
        }
    }

    // The reset is only reported with a successful read, a failure after
    // the rotation was noticed retries it on the next call.
    if (this->lr_reset_pending) {
        this->lr_cursor = reader_cursor{};
        this->reset_anchors();
        TRY(this->reset_encoding());
    }

    file_off_t file_size = this->lr_stat.st_size;

    this->lr_file_size = file_size;
    if (file_size == this->lr_cursor.rc_byte_offset) {
        retval.nlr_rotated = std::exchange(this->lr_reset_pending, false);
        return Ok(std::move(retval));
    }

    file_range range;
    range.fr_offset = this->lr_cursor.rc_byte_offset;
    range.fr_size = file_size - this->lr_cursor.rc_byte_offset;

    auto first_line = this->lr_cursor.rc_line_count + 1;
    auto end_offset
        = TRY(this->read_range(range, first_line, retval.nlr_entries));

    retval.nlr_rotated = std::exchange(this->lr_reset_pending, false);
    this->lr_cursor.rc_byte_offset = end_offset;
    this->lr_cursor.rc_line_count += retval.nlr_entries.size();

    log_debug("%s: read %zu new lines, cursor at %lld",
              this->lr_path.c_str(),
              retval.nlr_entries.size(),
              (long long) end_offset);

    return Ok(std::move(retval));
}

Result<chunk_result, std::string>
log_reader::read_previous_chunk(file_off_t before_offset, size_t max_lines)
{
    chunk_result retval;

    if (before_offset <= 0 || max_lines == 0) {
        return Ok(std::move(retval));
    }
    if (before_offset > this->lr_cursor.rc_byte_offset) {
        // the request was made before the file was rotated
        log_debug("%s: ignoring request for lines before %lld, past %lld",
                  this->lr_path.c_str(),
                  (long long) before_offset,
                  (long long) this->lr_cursor.rc_byte_offset);
        return Ok(std::move(retval));
    }

    auto before_line = TRY(this->line_number_at(before_offset));
    auto scan = TRY(scan_backward(this->lr_fd,
                                  before_offset,
                                  max_lines,
                                  this->lr_config.c_scan_chunk_size,
                                  this->lr_delimiter));

    file_range range;
    range.fr_offset = scan.bsr_start_offset;
    range.fr_size = before_offset - scan.bsr_start_offset;

    require_ge(before_line, scan.bsr_line_count + 1);
    auto first_line = before_line - scan.bsr_line_count;
    TRY(this->read_range(range, first_line, retval.cr_entries));

    retval.cr_new_start_offset = scan.bsr_start_offset;
    this->record_anchor(scan.bsr_start_offset, first_line);

    log_debug("%s: read %zu lines before offset %lld, new start %lld",
              this->lr_path.c_str(),
              retval.cr_entries.size(),
              (long long) before_offset,
              (long long) retval.cr_new_start_offset);

    return Ok(std::move(retval));
}

Result<entry_list, std::string>
log_reader::read_all()
{
    this->lr_cursor = reader_cursor{};

    auto new_lines = TRY(this->read_new_lines());

    return Ok(std::move(new_lines.nlr_entries));
}

void
log_reader::seek_with_line_count(file_off_t offset, size_t line_count)
{
    require(offset >= 0);

    this->lr_cursor.rc_byte_offset = offset;
    this->lr_cursor.rc_line_count = line_count;
    this->record_anchor(offset, line_count + 1);
}

Result<entry_list, std::string>
log_reader::read_line_range(size_t start, size_t end)
{
    entry_list retval;

    if (start == 0 || end < start) {
        return Ok(std::move(retval));
    }

    // Line numbers grow with the offsets, so the closest anchor is the last
    // one that does not come after the start line.
    auto anchor = std::upper_bound(
        this->lr_anchors.begin(),
        this->lr_anchors.end(),
        start,
        [](size_t line_number, const std::pair<const file_off_t, size_t>& lhs) {
            return line_number < lhs.second;
        });
    --anchor;

    auto st = TRY(this->lr_fd.stat());
    file_range range;
    range.fr_offset = anchor->first;
    range.fr_size = st.st_size - anchor->first;
    if (range.fr_size <= 0) {
        return Ok(std::move(retval));
    }

    auto line_number = anchor->second;
    TRY(scan_forward(this->lr_fd,
                     range,
                     this->lr_config.c_read_block_size,
                     this->max_retained(),
                     this->lr_delimiter,
                     [this, &line_number, &retval, start, end](
                         raw_line&& line) {
                         if (line_number >= start) {
                             retval.emplace_back(
                                 this->to_entry(std::move(line), line_number));
                         }
                         line_number += 1;
                         return line_number <= end;
                     }));

    return Ok(std::move(retval));
}

}  // namespace logline
