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
 * @file log_buffer.hh
 */

#ifndef logline_log_buffer_hh
#define logline_log_buffer_hh

#include <deque>
#include <utility>
#include <vector>

#include <stddef.h>

#include "base/file_range.hh"
#include "log_entry.hh"
#include "logline.cfg.hh"

namespace logline {

/**
 * Tracks how much of the file before the window has been loaded and whether
 * a request for more is outstanding.
 */
struct lazy_load_state {
    /** True if older lines can be paged in from the file. */
    bool lls_enabled{false};
    /** The offset of the first line in the window. */
    file_off_t lls_loaded_start_offset{0};
    size_t lls_first_loaded_line{1};
    /** True if the window reaches back to the first line of the file. */
    bool lls_fully_loaded{true};
    bool lls_loading_in_progress{false};
};

/**
 * A sliding window over the lines of a file.  The window holds a contiguous
 * run of lines, so the line number of every entry is one more than the one
 * before it.
 */
class log_buffer {
public:
    using container_type = std::deque<log_entry>;
    using const_iterator = container_type::const_iterator;

    explicit log_buffer(const buffer_config& cfg = buffer_config{});

    /**
     * Add lines to the end of the window.  If auto-trim is enabled, lines
     * are evicted from the start of the window to keep it at or below the
     * maximum size.
     */
    void append(entry_list&& entries);

    void push_back(log_entry&& entry);

    /**
     * Add lines that precede the window to its start.  The window is allowed
     * to grow to the history cap, and only the newest part of a chunk that
     * would exceed the cap is kept.
     *
     * @return The number of entries that were added.
     */
    size_t prepend(entry_list&& entries);

    /**
     * Empty the window.  Lines appended later continue the numbering and
     * paging back into the cleared lines is disabled.
     */
    void clear();

    /**
     * Empty the window and restart the numbering at one, for when the file
     * has been truncated or replaced.
     */
    void reset();

    /**
     * Replace the window with the initial load from the end of the file.
     *
     * @param entries The lines at the end of the file.
     * @param start_offset The offset of the first line in entries.
     * @param total_lines The number of lines in the whole file.
     */
    void init_with_tail(entry_list&& entries,
                        file_off_t start_offset,
                        size_t total_lines);

    /**
     * Toggle the bookmarks on a group of lines.  If any of the lines is not
     * bookmarked, they are all bookmarked.  Otherwise, the bookmarks are all
     * removed.  Indexes outside of the window are ignored.
     *
     * @return The number of entries that were changed.
     */
    size_t toggle_bookmarks(const std::vector<size_t>& indices);

    /** @return The new bookmark state, or false if the index is invalid. */
    bool toggle_bookmark(size_t index);

    /**
     * Bookmark the lines with the given numbers that are in the window.
     *
     * @return The number of lines that were bookmarked.
     */
    size_t set_bookmarks(const std::vector<size_t>& line_numbers);

    std::vector<std::pair<size_t, const log_entry*>> bookmarked_entries()
        const;

    std::vector<size_t> bookmarked_line_numbers() const;

    /** @return An estimate of the memory used by the entries. */
    size_t memory_usage() const;

    /**
     * @param visible_start_row The index of the first visible row.
     * @return True if a request for older lines should be issued.
     */
    bool should_load_more(size_t visible_start_row) const;

    /** Note that a request for older lines has been issued. */
    void mark_loading() { this->lb_lazy.lls_loading_in_progress = true; }

    /** Note that the request for older lines failed and may be retried. */
    void cancel_loading() { this->lb_lazy.lls_loading_in_progress = false; }

    /** Note that there are no lines before the window. */
    void mark_fully_loaded();

    size_t size() const { return this->lb_entries.size(); }

    bool empty() const { return this->lb_entries.empty(); }

    const log_entry& at(size_t index) const
    {
        return this->lb_entries.at(index);
    }

    const log_entry& operator[](size_t index) const
    {
        return this->lb_entries[index];
    }

    /** @return The entry with the given line number or nullptr. */
    const log_entry* by_line_number(size_t line_number) const;

    /**
     * @return The entries with indexes in [start, end), clamped to the
     *   window.
     */
    std::pair<const_iterator, const_iterator> range(size_t start,
                                                    size_t end) const;

    const_iterator begin() const { return this->lb_entries.begin(); }

    const_iterator end() const { return this->lb_entries.end(); }

    size_t first_line_number() const { return this->lb_first_line_number; }

    /** @return The number of the last line in the window or zero. */
    size_t last_line_number() const;

    /** @return The number of lines known to be in the file. */
    size_t total_lines() const { return this->lb_total_lines_added; }

    const lazy_load_state& get_lazy_state() const { return this->lb_lazy; }

    size_t chunk_lines() const { return this->lb_config.c_chunk_lines; }

    const buffer_config& get_config() const { return this->lb_config; }

private:
    void follow_head();

    buffer_config lb_config;
    container_type lb_entries;
    size_t lb_total_lines_added{0};
    size_t lb_first_line_number{1};
    lazy_load_state lb_lazy;
};

}  // namespace logline

#endif
