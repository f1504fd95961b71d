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
 * @file logline.cfg.hh
 */

#ifndef logline_cfg_hh
#define logline_cfg_hh

#include <chrono>
#include <optional>
#include <string>

#include <stddef.h>
#include <stdint.h>

#include "base/result.h"
#include "text_encoding.hh"

namespace logline {

struct reader_config {
    /** The size of the blocks read while scanning backward for lines. */
    size_t c_scan_chunk_size{1024 * 1024};
    /** The size of the blocks read while scanning forward. */
    size_t c_read_block_size{64 * 1024};
    /** Decoded lines longer than this many bytes are truncated. */
    size_t c_max_line_length{10000};
    size_t c_encoding_sample_size{8 * 1024};
    /** Use this encoding instead of guessing from the file contents. */
    std::optional<text_encoding> c_encoding;
};

struct buffer_config {
    size_t c_max_lines{100000};
    bool c_auto_trim{true};
    /** The number of lines requested for each page of history. */
    size_t c_chunk_lines{5000};
    /**
     * While paging back through history, the window may grow to this many
     * times c_max_lines.
     */
    size_t c_history_factor{4};

    size_t history_cap() const
    {
        return this->c_max_lines * this->c_history_factor;
    }
};

struct looper_config {
    size_t c_initial_lines{10000};
    std::chrono::milliseconds c_poll_interval{50};
    std::chrono::milliseconds c_error_backoff{std::chrono::seconds(1)};
    size_t c_command_queue_depth{10};
    size_t c_event_queue_depth{1000};
};

struct config {
    reader_config c_reader;
    buffer_config c_buffer;
    looper_config c_looper;

    Result<void, std::string> validate() const;
};

}  // namespace logline

#endif
