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
 * @file tail_looper.hh
 */

#ifndef logline_tail_looper_hh
#define logline_tail_looper_hh

#include <chrono>
#include <deque>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "base/file_range.hh"
#include "base/isc.hh"
#include "log_entry.hh"
#include "log_reader.hh"
#include "logline.cfg.hh"
#include "mapbox/variant.hpp"
#include "text_encoding.hh"

namespace logline {

struct cmd_stop {};

struct cmd_load_previous_chunk {
    /** Load the lines that come before the line starting here. */
    file_off_t clpc_offset{0};
    size_t clpc_max_lines{0};
};

using command = mapbox::util::variant<cmd_stop, cmd_load_previous_chunk>;

/** The initial load of the end of the file. */
struct evt_tail_loaded {
    entry_list etl_entries;
    file_off_t etl_start_offset{0};
    size_t etl_total_lines{0};
    text_encoding etl_encoding{text_encoding::utf8};
};

struct evt_new_entries {
    entry_list ene_entries;
};

struct evt_previous_chunk {
    entry_list epc_entries;
    file_off_t epc_new_start_offset{0};
};

/** The file was truncated or replaced and is being read from the start. */
struct evt_file_reset {};

struct evt_error {
    std::string ee_message;
    /** True if the error answers a cmd_load_previous_chunk request. */
    bool ee_chunk_request_failed{false};
};

using event = mapbox::util::variant<evt_tail_loaded,
                                    evt_new_entries,
                                    evt_previous_chunk,
                                    evt_file_reset,
                                    evt_error>;

using command_port = isc::bounded_port<command>;
using event_port = isc::bounded_port<event>;

/**
 * The background worker that follows a single file.  It loads the tail of
 * the file when started, then polls for new lines and services requests for
 * older lines until it is stopped or its command port is closed.
 */
class tail_looper : public isc::service_base {
public:
    tail_looper(std::filesystem::path path,
                const config& cfg,
                std::shared_ptr<command_port> commands,
                std::shared_ptr<event_port> events);

    ~tail_looper() override;

protected:
    void started() override;

    void loop_body() override;

    void wait_for_input(std::chrono::milliseconds timeout) override;

    void wakeup() override;

    void failed(const std::string& msg) override;

    void stopped() override;

    std::chrono::milliseconds compute_timeout() const override;

private:
    void handle_command(command&& cmd);

    void poll_file();

    /**
     * Send an event to the consumer, waiting while the event port is full.
     * The wait is abandoned if the looper is asked to stop.
     *
     * @return True if the event was sent.
     */
    bool send_event(event&& evt);

    void send_error(std::string msg);

    /** Move any commands that have arrived to the pending list. */
    void receive_commands();

    std::filesystem::path tl_path;
    config tl_config;
    std::shared_ptr<command_port> tl_commands;
    std::shared_ptr<event_port> tl_events;
    std::optional<log_reader> tl_reader;
    std::deque<command> tl_pending_commands;
    std::chrono::steady_clock::time_point tl_next_poll;
};

}  // namespace logline

#endif
