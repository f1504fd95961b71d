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
 * @file tail_session.cc
 */

#include <utility>

#include "tail_session.hh"

#include <fcntl.h>
#include <sys/stat.h>

#include "base/fs_util.hh"
#include "base/logline_log.hh"
#include "fmt/format.h"

namespace logline {

tail_session::tail_session(const config& cfg)
    : ts_config(cfg), ts_buffer(cfg.c_buffer)
{
}

tail_session::~tail_session()
{
    this->close();
}

Result<void, std::string>
tail_session::open(const std::filesystem::path& path)
{
    TRY(this->ts_config.validate());

    auto st = TRY(filesystem::stat_file(path));
    if (!S_ISREG(st.st_mode)) {
        return Err(
            fmt::format(FMT_STRING("not a regular file: {}"), path.string()));
    }
    {
        // make sure the file is readable before handing it to the worker
        auto fd = TRY(filesystem::open_file(path, O_RDONLY));
    }

    this->close();

    log_info("opening session for %s", path.c_str());
    this->ts_buffer = log_buffer(this->ts_config.c_buffer);
    this->ts_notifications.clear();
    this->ts_path = path;
    this->ts_encoding = std::nullopt;
    this->ts_commands = std::make_shared<command_port>(
        this->ts_config.c_looper.c_command_queue_depth);
    this->ts_events = std::make_shared<event_port>(
        this->ts_config.c_looper.c_event_queue_depth);
    this->ts_looper = std::make_unique<tail_looper>(
        path, this->ts_config, this->ts_commands, this->ts_events);
    this->ts_looper->start();

    return Ok();
}

Result<void, std::string>
tail_session::reload()
{
    if (!this->ts_path) {
        return Err(std::string("no file is open"));
    }

    auto path = this->ts_path.value();

    log_info("reloading %s", path.c_str());
    return this->open(path);
}

void
tail_session::close()
{
    if (this->ts_looper == nullptr) {
        return;
    }

    log_info("closing session for %s",
             this->ts_path ? this->ts_path->c_str() : "<none>");
    this->ts_commands->close();
    this->ts_looper->stop();
    this->ts_looper.reset();
    this->ts_commands.reset();
    this->ts_events.reset();
    this->ts_path = std::nullopt;
}

poll_summary
tail_session::poll_events()
{
    poll_summary retval;

    if (this->ts_events == nullptr) {
        return retval;
    }

    while (true) {
        auto evt = this->ts_events->try_recv();

        if (!evt) {
            break;
        }
        retval.ps_events += 1;
        this->apply_event(std::move(evt.value()), retval);
    }

    return retval;
}

void
tail_session::apply_event(event&& evt, poll_summary& summary)
{
    evt.match(
        [this, &summary](evt_tail_loaded& etl) {
            log_debug("tail loaded: %zu lines of %zu",
                      etl.etl_entries.size(),
                      etl.etl_total_lines);
            this->ts_encoding = etl.etl_encoding;
            this->ts_buffer.init_with_tail(std::move(etl.etl_entries),
                                           etl.etl_start_offset,
                                           etl.etl_total_lines);
            summary.ps_tail_loaded = true;
        },
        [this, &summary](evt_new_entries& ene) {
            summary.ps_appended += ene.ene_entries.size();
            this->ts_buffer.append(std::move(ene.ene_entries));
        },
        [this, &summary](evt_previous_chunk& epc) {
            if (!this->ts_buffer.get_lazy_state().lls_loading_in_progress) {
                log_debug("dropping stale chunk of %zu lines",
                          epc.epc_entries.size());
                return;
            }
            if (epc.epc_entries.empty()) {
                log_debug("reached the start of the file");
                this->ts_buffer.mark_fully_loaded();
                summary.ps_fully_loaded = true;
                return;
            }
            summary.ps_prepended
                += this->ts_buffer.prepend(std::move(epc.epc_entries));
        },
        [this, &summary](const evt_file_reset&) {
            this->ts_buffer.reset();
            summary.ps_reset = true;
            this->notify(notification_level::warning,
                         "File was truncated or replaced, reloading from the "
                         "beginning");
        },
        [this, &summary](evt_error& ee) {
            if (ee.ee_chunk_request_failed) {
                this->ts_buffer.cancel_loading();
            }
            summary.ps_errors += 1;
            this->notify(notification_level::error, std::move(ee.ee_message));
        });
}

bool
tail_session::request_previous_chunk()
{
    if (this->ts_commands == nullptr) {
        return false;
    }

    const auto& lazy = this->ts_buffer.get_lazy_state();
    if (!lazy.lls_enabled || lazy.lls_fully_loaded
        || lazy.lls_loading_in_progress)
    {
        return false;
    }

    cmd_load_previous_chunk clpc;

    clpc.clpc_offset = lazy.lls_loaded_start_offset;
    clpc.clpc_max_lines = this->ts_buffer.chunk_lines();

    auto rc = this->ts_commands->try_send(std::move(clpc));
    switch (rc) {
        case isc::send_status::ok:
            this->ts_buffer.mark_loading();
            return true;
        case isc::send_status::full:
            log_debug("command port is full, will request lines later");
            return false;
        case isc::send_status::closed:
            log_warning("unable to request lines, the worker has stopped");
            return false;
    }

    return false;
}

bool
tail_session::maybe_load_more(size_t visible_start_row)
{
    if (!this->ts_buffer.should_load_more(visible_start_row)) {
        return false;
    }

    return this->request_previous_chunk();
}

std::vector<notification>
tail_session::take_notifications()
{
    return std::exchange(this->ts_notifications, {});
}

void
tail_session::notify(notification_level level, std::string msg)
{
    notification n;

    n.n_level = level;
    n.n_message = std::move(msg);
    this->ts_notifications.emplace_back(std::move(n));
}

}  // namespace logline
