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
 * @file tail_session.hh
 */

#ifndef logline_tail_session_hh
#define logline_tail_session_hh

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "base/result.h"
#include "log_buffer.hh"
#include "logline.cfg.hh"
#include "tail_looper.hh"
#include "text_encoding.hh"

namespace logline {

enum class notification_level {
    info,
    warning,
    error,
};

/** A transient message for the user about the state of the file. */
struct notification {
    notification_level n_level{notification_level::info};
    std::string n_message;
};

/** What changed in the buffer during a call to poll_events(). */
struct poll_summary {
    size_t ps_events{0};
    bool ps_tail_loaded{false};
    size_t ps_appended{0};
    size_t ps_prepended{0};
    bool ps_reset{false};
    bool ps_fully_loaded{false};
    size_t ps_errors{0};

    bool changed() const
    {
        return this->ps_tail_loaded || this->ps_appended > 0
            || this->ps_prepended > 0 || this->ps_reset
            || this->ps_fully_loaded;
    }
};

/**
 * The consumer side of a followed file.  The session owns the buffer that
 * holds the window and the worker that reads the file.  The owner calls
 * poll_events() once per refresh to move whatever the worker produced into
 * the buffer without blocking on any file I/O.
 */
class tail_session {
public:
    explicit tail_session(const config& cfg = config{});

    tail_session(const tail_session&) = delete;
    tail_session& operator=(const tail_session&) = delete;

    ~tail_session();

    /**
     * Start following the given file.  Any file that is already open is
     * closed first.
     */
    Result<void, std::string> open(const std::filesystem::path& path);

    /** Close and reopen the current file. */
    Result<void, std::string> reload();

    /** Stop the worker and forget the file.  The buffer is left as-is. */
    void close();

    bool is_open() const { return this->ts_looper != nullptr; }

    /**
     * Apply every event the worker has produced so far to the buffer.
     */
    poll_summary poll_events();

    /**
     * Ask the worker for the lines before the window, if paging is enabled
     * and no request is already in flight.
     *
     * @return True if the request was sent.
     */
    bool request_previous_chunk();

    /**
     * Issue a request for older lines if the visible rows are close to the
     * top of the window.
     */
    bool maybe_load_more(size_t visible_start_row);

    /** @return The notifications since the last call, oldest first. */
    std::vector<notification> take_notifications();

    const log_buffer& get_buffer() const { return this->ts_buffer; }

    log_buffer& get_buffer() { return this->ts_buffer; }

    const std::optional<std::filesystem::path>& get_path() const
    {
        return this->ts_path;
    }

    /** @return The encoding reported by the worker, once it is known. */
    std::optional<text_encoding> get_encoding() const
    {
        return this->ts_encoding;
    }

    const config& get_config() const { return this->ts_config; }

private:
    void apply_event(event&& evt, poll_summary& summary);

    void notify(notification_level level, std::string msg);

    config ts_config;
    log_buffer ts_buffer;
    std::optional<std::filesystem::path> ts_path;
    std::optional<text_encoding> ts_encoding;
    std::shared_ptr<command_port> ts_commands;
    std::shared_ptr<event_port> ts_events;
    std::unique_ptr<tail_looper> ts_looper;
    std::vector<notification> ts_notifications;
};

}  // namespace logline

#endif
