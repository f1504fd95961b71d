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
 * @file logline.cfg.cc
 */

#include "logline.cfg.hh"

#include "fmt/format.h"

namespace logline {

Result<void, std::string>
config::validate() const
{
    if (this->c_reader.c_scan_chunk_size == 0) {
        return Err(std::string("the scan chunk size must be greater than zero"));
    }
    if (this->c_reader.c_read_block_size == 0) {
        return Err(std::string("the read block size must be greater than zero"));
    }
    if (this->c_reader.c_max_line_length == 0) {
        return Err(
            std::string("the maximum line length must be greater than zero"));
    }
    if (this->c_reader.c_encoding_sample_size == 0) {
        return Err(std::string(
            "the encoding sample size must be greater than zero"));
    }
    if (this->c_buffer.c_max_lines == 0) {
        return Err(
            std::string("the maximum number of lines must be greater than zero"));
    }
    if (this->c_buffer.c_chunk_lines == 0) {
        return Err(std::string("the chunk size must be greater than zero"));
    }
    if (this->c_buffer.c_history_factor == 0) {
        return Err(std::string("the history factor must be at least one"));
    }
    if (this->c_looper.c_initial_lines == 0) {
        return Err(std::string(
            "the number of initial lines must be greater than zero"));
    }
    if (this->c_looper.c_poll_interval.count() <= 0) {
        return Err(fmt::format(
            FMT_STRING("the poll interval must be positive, got {}ms"),
            this->c_looper.c_poll_interval.count()));
    }
    if (this->c_looper.c_error_backoff.count() < 0) {
        return Err(fmt::format(
            FMT_STRING("the error backoff cannot be negative, got {}ms"),
            this->c_looper.c_error_backoff.count()));
    }
    if (this->c_looper.c_command_queue_depth == 0
        || this->c_looper.c_event_queue_depth == 0)
    {
        return Err(std::string("the queue depths must be greater than zero"));
    }

    return Ok();
}

}  // namespace logline
