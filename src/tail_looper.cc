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
 * @file tail_looper.cc
 */

#include <utility>

#include "tail_looper.hh"

#include "base/logline_log.hh"
#include "fmt/format.h"

namespace logline {

tail_looper::tail_looper(std::filesystem::path path,
                         const config& cfg,
                         std::shared_ptr<command_port> commands,
                         std::shared_ptr<event_port> events)
    : isc::service_base("tail_looper " + path.string()),
      tl_path(std::move(path)), tl_config(cfg),
      tl_commands(std::move(commands)), tl_events(std::move(events))
{
}

tail_looper::~tail_looper()
{
    this->stop();
}

void
tail_looper::started()
{
    auto open_res = log_reader::open(this->tl_path, this->tl_config.c_reader);

    if (open_res.isErr()) {
        log_error("%s: unable to open -- %s",
                  this->tl_path.c_str(),
                  open_res.unwrapErr().c_str());
        this->send_error(open_res.unwrapErr());
        this->s_looping = false;
        return;
    }

    this->tl_reader.emplace(open_res.unwrap());

    auto tail_res
        = this->tl_reader->read_tail(this->tl_config.c_looper.c_initial_lines);
    if (tail_res.isErr()) {
        log_error("%s: unable to read the end of the file -- %s",
                  this->tl_path.c_str(),
                  tail_res.unwrapErr().c_str());
        this->send_error(
            fmt::format(FMT_STRING("unable to read {} -- {}"),
                        this->tl_path.string(),
                        tail_res.unwrapErr()));
        this->s_looping = false;
        return;
    }

    auto tail = tail_res.unwrap();
    evt_tail_loaded etl;

    etl.etl_entries = std::move(tail.tr_entries);
    etl.etl_start_offset = tail.tr_start_offset;
    etl.etl_total_lines = tail.tr_total_lines;
    etl.etl_encoding = this->tl_reader->get_encoding();
    this->send_event(std::move(etl));
    this->tl_next_poll = std::chrono::steady_clock::now();
}

void
tail_looper::receive_commands()
{
    while (true) {
        auto cmd = this->tl_commands->try_recv();

        if (!cmd) {
            break;
        }
        if (cmd->is<cmd_stop>()) {
            this->s_looping = false;
        }
        this->tl_pending_commands.emplace_back(std::move(cmd.value()));
    }

    if (this->tl_commands->is_finished() && this->s_looping) {
        log_info("%s: command port closed, stopping", this->s_name.c_str());
        this->s_looping = false;
    }
}

void
tail_looper::loop_body()
{
    this->receive_commands();
    while (this->s_looping && !this->tl_pending_commands.empty()) {
        auto cmd = std::move(this->tl_pending_commands.front());

        this->tl_pending_commands.pop_front();
        this->handle_command(std::move(cmd));
    }
    if (!this->s_looping) {
        return;
    }

    if (std::chrono::steady_clock::now() >= this->tl_next_poll) {
        this->poll_file();
    }
}

void
tail_looper::handle_command(command&& cmd)
{
    cmd.match(
        [this](const cmd_stop&) {
            log_info("%s: stop requested", this->s_name.c_str());
            this->s_looping = false;
        },
        [this](const cmd_load_previous_chunk& clpc) {
            auto chunk_res = this->tl_reader->read_previous_chunk(
                clpc.clpc_offset, clpc.clpc_max_lines);

            if (chunk_res.isErr()) {
                log_error("%s: unable to load lines before %lld -- %s",
                          this->tl_path.c_str(),
                          (long long) clpc.clpc_offset,
                          chunk_res.unwrapErr().c_str());

                evt_error ee;

                ee.ee_message
                    = fmt::format(FMT_STRING("unable to load earlier lines of "
                                             "{} -- {}"),
                                  this->tl_path.string(),
                                  chunk_res.unwrapErr());
                ee.ee_chunk_request_failed = true;
                this->send_event(std::move(ee));
                return;
            }

            auto chunk = chunk_res.unwrap();
            evt_previous_chunk epc;

            epc.epc_entries = std::move(chunk.cr_entries);
            epc.epc_new_start_offset = chunk.cr_new_start_offset;
            this->send_event(std::move(epc));
        });
}

void
tail_looper::poll_file()
{
    auto now = std::chrono::steady_clock::now();
    auto has_res = this->tl_reader->has_new_content();

    if (has_res.isErr()) {
        log_error("%s: unable to check for new content -- %s",
                  this->tl_path.c_str(),
                  has_res.unwrapErr().c_str());
        this->send_error(has_res.unwrapErr());
        this->tl_next_poll = now + this->tl_config.c_looper.c_error_backoff;
        return;
    }
    if (!has_res.unwrap()) {
        return;
    }

    auto read_res = this->tl_reader->read_new_lines();
    if (read_res.isErr()) {
        log_error("%s: unable to read new lines -- %s",
                  this->tl_path.c_str(),
                  read_res.unwrapErr().c_str());
        this->send_error(read_res.unwrapErr());
        this->tl_next_poll = now + this->tl_config.c_looper.c_error_backoff;
        return;
    }

    auto new_lines = read_res.unwrap();
    if (new_lines.nlr_rotated) {
        log_info("%s: file was rotated", this->tl_path.c_str());
        if (!this->send_event(evt_file_reset{})) {
            return;
        }
    }
    if (!new_lines.nlr_entries.empty()) {
        evt_new_entries ene;

        ene.ene_entries = std::move(new_lines.nlr_entries);
        this->send_event(std::move(ene));
    }
}

bool
tail_looper::send_event(event&& evt)
{
    while (true) {
        auto rc = this->tl_events->send_for(
            std::move(evt), this->tl_config.c_looper.c_poll_interval);

        switch (rc) {
            case isc::send_status::ok:
                return true;
            case isc::send_status::closed:
                log_info("%s: event port closed, stopping",
                         this->s_name.c_str());
                this->s_looping = false;
                return false;
            case isc::send_status::full:
                break;
        }

        this->receive_commands();
        if (!this->s_looping) {
            log_debug("%s: dropping event while stopping",
                      this->s_name.c_str());
            return false;
        }
    }
}

void
tail_looper::send_error(std::string msg)
{
    evt_error ee;

    ee.ee_message = std::move(msg);
    this->send_event(std::move(ee));
}

void
tail_looper::wait_for_input(std::chrono::milliseconds timeout)
{
    auto cmd = this->tl_commands->recv_for(timeout);

    if (cmd) {
        this->tl_pending_commands.emplace_back(std::move(cmd.value()));
    } else if (this->tl_commands->is_finished()) {
        log_info("%s: command port closed, stopping", this->s_name.c_str());
        this->s_looping = false;
    }
}

void
tail_looper::wakeup()
{
    this->tl_commands->close();
}

void
tail_looper::failed(const std::string& msg)
{
    evt_error ee;

    ee.ee_message = fmt::format(
        FMT_STRING("stopped following {} -- {}"), this->tl_path.string(), msg);
    if (this->tl_events->try_send(std::move(ee)) != isc::send_status::ok) {
        log_warning("%s: unable to report failure", this->s_name.c_str());
    }
}

void
tail_looper::stopped()
{
    if (this->tl_reader) {
        log_info("%s: stopped at offset %lld after %zu lines",
                 this->tl_path.c_str(),
                 (long long) this->tl_reader->get_offset(),
                 this->tl_reader->get_line_count());
    }
}

std::chrono::milliseconds
tail_looper::compute_timeout() const
{
    auto now = std::chrono::steady_clock::now();

    if (this->tl_next_poll > now) {
        return std::chrono::ceil<std::chrono::milliseconds>(this->tl_next_poll
                                                            - now);
    }

    return this->tl_config.c_looper.c_poll_interval;
}

}  // namespace logline
