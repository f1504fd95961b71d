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
 * @file log_buffer.cc
 */

#include <algorithm>

#include "log_buffer.hh"

#include "base/logline_log.hh"

namespace logline {

log_buffer::log_buffer(const buffer_config& cfg) : lb_config(cfg) {}

void
log_buffer::follow_head()
{
    if (this->lb_entries.empty()) {
        return;
    }

    const auto& front = this->lb_entries.front();

    this->lb_first_line_number = front.le_line_number;
    this->lb_lazy.lls_loaded_start_offset = front.le_byte_offset;
    this->lb_lazy.lls_first_loaded_line = front.le_line_number;
}

void
log_buffer::push_back(log_entry&& entry)
{
    if (this->lb_entries.empty()) {
        this->lb_first_line_number = entry.le_line_number;
    }

    this->lb_total_lines_added += 1;
    if (this->lb_config.c_auto_trim
        && this->lb_entries.size() >= this->lb_config.c_max_lines)
    {
        this->lb_entries.pop_front();
        this->lb_first_line_number += 1;
        this->lb_lazy.lls_fully_loaded = false;
    }
    this->lb_entries.emplace_back(std::move(entry));
}

void
log_buffer::append(entry_list&& entries)
{
    auto fully_loaded = this->lb_lazy.lls_fully_loaded;

    for (auto& entry : entries) {
        this->push_back(std::move(entry));
    }
    if (this->lb_config.c_auto_trim) {
        // lines evicted while paging through history go past the maximum
        while (this->lb_entries.size() > this->lb_config.c_max_lines) {
            this->lb_entries.pop_front();
            this->lb_lazy.lls_fully_loaded = false;
        }
    }
    if (fully_loaded != this->lb_lazy.lls_fully_loaded) {
        log_debug("evicted lines from the window, now starting at %zu",
                  this->lb_entries.front().le_line_number);
    }
    this->follow_head();
}

size_t
log_buffer::prepend(entry_list&& entries)
{
    this->lb_lazy.lls_loading_in_progress = false;
    if (entries.empty()) {
        return 0;
    }

    if (!this->lb_entries.empty()
        && entries.back().le_line_number + 1 != this->lb_first_line_number)
    {
        log_warning("ignoring lines %zu-%zu that do not precede line %zu",
                    entries.front().le_line_number,
                    entries.back().le_line_number,
                    this->lb_first_line_number);
        return 0;
    }

    auto cap = this->lb_config.history_cap();
    auto room = cap > this->lb_entries.size() ? cap - this->lb_entries.size()
                                              : 0;
    auto skip = entries.size() > room ? entries.size() - room : 0;

    if (skip > 0) {
        log_debug("window is at its history cap, dropping %zu older lines",
                  skip);
    }
    std::for_each(entries.rbegin(),
                  entries.rend() - skip,
                  [this](log_entry& entry) {
                      this->lb_entries.emplace_front(std::move(entry));
                  });
    this->follow_head();

    return entries.size() - skip;
}

void
log_buffer::mark_fully_loaded()
{
    this->lb_lazy.lls_fully_loaded = true;
    this->lb_lazy.lls_loading_in_progress = false;
    this->lb_lazy.lls_loaded_start_offset = 0;
}

void
log_buffer::clear()
{
    this->lb_entries.clear();
    this->lb_first_line_number = this->lb_total_lines_added + 1;
    this->lb_lazy = lazy_load_state{};
}

void
log_buffer::reset()
{
    this->lb_entries.clear();
    this->lb_total_lines_added = 0;
    this->lb_first_line_number = 1;
    this->lb_lazy = lazy_load_state{};
    // older lines are paged in by offset again once the window evicts any
    this->lb_lazy.lls_enabled = true;
}

void
log_buffer::init_with_tail(entry_list&& entries,
                           file_off_t start_offset,
                           size_t total_lines)
{
    size_t skip = 0;

    if (this->lb_config.c_auto_trim
        && entries.size() > this->lb_config.c_max_lines)
    {
        skip = entries.size() - this->lb_config.c_max_lines;
        log_debug("keeping the newest %zu of %zu tail lines",
                  this->lb_config.c_max_lines,
                  entries.size());
        start_offset = entries[skip].le_byte_offset;
    }

    auto loaded_count = entries.size() - skip;

    this->lb_entries.clear();
    this->lb_entries.insert(this->lb_entries.end(),
                            std::make_move_iterator(entries.begin() + skip),
                            std::make_move_iterator(entries.end()));
    this->lb_total_lines_added = total_lines;
    if (this->lb_entries.empty()) {
        this->lb_first_line_number = total_lines + 1;
    } else {
        this->lb_first_line_number = this->lb_entries.front().le_line_number;
    }

    this->lb_lazy.lls_enabled = loaded_count < total_lines;
    this->lb_lazy.lls_loaded_start_offset = start_offset;
    this->lb_lazy.lls_first_loaded_line = this->lb_first_line_number;
    this->lb_lazy.lls_fully_loaded = loaded_count >= total_lines;
    this->lb_lazy.lls_loading_in_progress = false;
}

size_t
log_buffer::toggle_bookmarks(const std::vector<size_t>& indices)
{
    auto all_bookmarked = true;

    for (const auto index : indices) {
        if (index < this->lb_entries.size()
            && !this->lb_entries[index].le_bookmarked)
        {
            all_bookmarked = false;
            break;
        }
    }

    size_t retval = 0;
    for (const auto index : indices) {
        if (index < this->lb_entries.size()) {
            this->lb_entries[index].le_bookmarked = !all_bookmarked;
            retval += 1;
        }
    }

    return retval;
}

bool
log_buffer::toggle_bookmark(size_t index)
{
    if (index >= this->lb_entries.size()) {
        return false;
    }

    auto& entry = this->lb_entries[index];

    entry.le_bookmarked = !entry.le_bookmarked;
    return entry.le_bookmarked;
}

size_t
log_buffer::set_bookmarks(const std::vector<size_t>& line_numbers)
{
    size_t retval = 0;

    for (const auto line_number : line_numbers) {
        if (line_number < this->lb_first_line_number) {
            continue;
        }

        auto index = line_number - this->lb_first_line_number;
        if (index < this->lb_entries.size()) {
            this->lb_entries[index].le_bookmarked = true;
            retval += 1;
        }
    }

    return retval;
}

std::vector<std::pair<size_t, const log_entry*>>
log_buffer::bookmarked_entries() const
{
    std::vector<std::pair<size_t, const log_entry*>> retval;

    for (size_t index = 0; index < this->lb_entries.size(); index++) {
        if (this->lb_entries[index].le_bookmarked) {
            retval.emplace_back(index, &this->lb_entries[index]);
        }
    }

    return retval;
}

std::vector<size_t>
log_buffer::bookmarked_line_numbers() const
{
    std::vector<size_t> retval;

    for (const auto& entry : this->lb_entries) {
        if (entry.le_bookmarked) {
            retval.emplace_back(entry.le_line_number);
        }
    }

    return retval;
}

size_t
log_buffer::memory_usage() const
{
    size_t retval = 0;

    for (const auto& entry : this->lb_entries) {
        retval += sizeof(log_entry) + entry.le_content.size();
    }

    return retval;
}

bool
log_buffer::should_load_more(size_t visible_start_row) const
{
    if (!this->lb_lazy.lls_enabled || this->lb_lazy.lls_fully_loaded
        || this->lb_lazy.lls_loading_in_progress)
    {
        return false;
    }
    if (this->lb_entries.size() >= this->lb_config.history_cap()) {
        return false;
    }

    auto threshold
        = std::clamp(this->lb_entries.size() / 10, (size_t) 100, (size_t) 500);

    return visible_start_row < threshold;
}

const log_entry*
log_buffer::by_line_number(size_t line_number) const
{
    if (line_number < this->lb_first_line_number) {
        return nullptr;
    }

    auto index = line_number - this->lb_first_line_number;
    if (index >= this->lb_entries.size()) {
        return nullptr;
    }

    return &this->lb_entries[index];
}

std::pair<log_buffer::const_iterator, log_buffer::const_iterator>
log_buffer::range(size_t start, size_t end) const
{
    start = std::min(start, this->lb_entries.size());
    end = std::clamp(end, start, this->lb_entries.size());

    return std::make_pair(this->lb_entries.begin() + start,
                          this->lb_entries.begin() + end);
}

size_t
log_buffer::last_line_number() const
{
    if (this->lb_entries.empty()) {
        return 0;
    }

    return this->lb_entries.back().le_line_number;
}

}  // namespace logline
