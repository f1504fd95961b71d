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
 * @file log_reader.hh
 */

#ifndef logline_log_reader_hh
#define logline_log_reader_hh

#include <filesystem>
#include <map>
#include <string>

#include <sys/stat.h>

#include "base/auto_fd.hh"
#include "base/file_range.hh"
#include "base/result.h"
#include "line_scanner.hh"
#include "log_entry.hh"
#include "logline.cfg.hh"
#include "text_encoding.hh"

namespace logline {

/**
 * The position of the incremental reader in the file.
 */
struct reader_cursor {
    /** The offset just past the last byte that was consumed. */
    file_off_t rc_byte_offset{0};
    /** The number of lines that precede the offset. */
    size_t rc_line_count{0};
};

struct tail_result {
    entry_list tr_entries;
    /** The offset of the first line in tr_entries. */
    file_off_t tr_start_offset{0};
    /** The number of lines in the whole file. */
    size_t tr_total_lines{0};
};

struct chunk_result {
    entry_list cr_entries;
    /** The offset of the first line in cr_entries. */
    file_off_t cr_new_start_offset{0};
};

struct new_lines_result {
    /**
     * True if the file was truncated or replaced and the cursor was reset
     * to the start of the file before reading.
     */
    bool nlr_rotated{false};
    entry_list nlr_entries;
};

/**
 * Reads decoded lines from a log file.  The reader keeps a cursor so that
 * it can follow a file as it grows without reading any byte twice.
 */
class log_reader {
public:
    /**
     * Open a file for reading and determine its encoding, either from the
     * configuration or from the leading bytes of the file.
     */
    static Result<log_reader, std::string> open(std::filesystem::path path,
                                                const reader_config& cfg);

    log_reader(log_reader&& other) = default;
    log_reader& operator=(log_reader&& other) = default;

    /**
     * Read the last lines of the file without scanning all of it for lines.
     * The cursor is left at the end of the data that was read.
     *
     * @param max_lines The maximum number of lines to return.
     */
    Result<tail_result, std::string> read_tail(size_t max_lines);

    /**
     * @return True if the file size differs from the cursor offset or the
     *   path now refers to a different file.
     */
    Result<bool, std::string> has_new_content();

    /**
     * Read any lines added to the file since the last read.  If the file
     * shrank below the cursor or was replaced, the cursor is reset and the
     * file is read from the start.
     */
    Result<new_lines_result, std::string> read_new_lines();

    /**
     * Read up to `max_lines` lines that come before the line starting at
     * `before_offset`.  The result is empty only when `before_offset` is
     * zero.
     */
    Result<chunk_result, std::string> read_previous_chunk(
        file_off_t before_offset, size_t max_lines);

    /** Reset the cursor and read the whole file. */
    Result<entry_list, std::string> read_all();

    /**
     * Move the cursor to a known line start.  The next call to
     * read_new_lines() will number its first line `line_count + 1`.
     */
    void seek_with_line_count(file_off_t offset, size_t line_count);

    /**
     * Read the lines numbered `start` through `end`, inclusive, without
     * moving the cursor.
     */
    Result<entry_list, std::string> read_line_range(size_t start, size_t end);

    const std::filesystem::path& get_path() const { return this->lr_path; }

    file_off_t get_offset() const { return this->lr_cursor.rc_byte_offset; }

    size_t get_line_count() const { return this->lr_cursor.rc_line_count; }

    const reader_cursor& get_cursor() const { return this->lr_cursor; }

    bool is_reset_pending() const { return this->lr_reset_pending; }

    size_t get_anchor_count() const { return this->lr_anchors.size(); }

    /** @return The file size observed by the last poll or read. */
    file_size_t get_file_size() const { return this->lr_file_size; }

    text_encoding get_encoding() const
    {
        return this->lr_decoder.get_encoding();
    }

    const char* get_encoding_name() const
    {
        return text_encoding_name(this->get_encoding());
    }

    static constexpr size_t MAX_ANCHORS = 256;

private:
    log_reader(std::filesystem::path path,
               const reader_config& cfg,
               auto_fd fd,
               struct stat st,
               line_decoder decoder);

    static Result<text_encoding, std::string> sniff_encoding(
        const auto_fd& fd, const reader_config& cfg);

    /** Stat the path, falling back to the open descriptor if it is gone. */
    Result<struct stat, std::string> stat_path() const;

    Result<void, std::string> reopen();

    Result<void, std::string> reset_encoding();

    void reset_anchors();

    void record_anchor(file_off_t offset, size_t line_number);

    /** @return The number of the line that starts at the given offset. */
    Result<size_t, std::string> line_number_at(file_off_t offset);

    /**
     * Decode the lines in the range, numbering the first one `first_line`.
     *
     * @return The offset just past the last byte that was read.
     */
    Result<file_off_t, std::string> read_range(file_range range,
                                               size_t first_line,
                                               entry_list& entries);

    log_entry to_entry(raw_line&& line, size_t line_number);

    /**
     * @return The number of raw bytes of a line to keep, which is enough to
     *   fill the maximum decoded length in any of the supported encodings.
     */
    size_t max_retained() const
    {
        return this->lr_config.c_max_line_length * 4 + 4;
    }

    std::filesystem::path lr_path;
    reader_config lr_config;
    auto_fd lr_fd;
    struct stat lr_stat;
    line_decoder lr_decoder;
    line_delimiter lr_delimiter;
    reader_cursor lr_cursor;
    file_size_t lr_file_size{0};
    /** Known line starts, mapping a byte offset to its line number. */
    std::map<file_off_t, size_t> lr_anchors;
    /** Set when a rotation was noticed but not reported yet. */
    bool lr_reset_pending{false};
};

}  // namespace logline

#endif
