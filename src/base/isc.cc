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
 * @file isc.cc
 */

#include "isc.hh"

#include "logline_log.hh"

namespace isc {

void
service_base::start()
{
    require(!this->s_started);

    log_debug("starting service thread for: %s", this->s_name.c_str());
    this->s_looping = true;
    this->s_thread = std::thread(&service_base::run, this);
    this->s_started = true;
}

void
service_base::run()
{
    log_info("BEGIN isc thread: %s", this->s_name.c_str());
    try {
        this->started();
    } catch (const std::exception& e) {
        log_error(
            "%s: started() failed with -- %s", this->s_name.c_str(), e.what());
        this->failed(e.what());
        this->s_looping = false;
    }
    while (this->s_looping) {
        try {
            this->loop_body();
        } catch (const std::exception& e) {
            log_error("%s: loop_body() failed with -- %s",
                      this->s_name.c_str(),
                      e.what());
            this->failed(e.what());
            this->s_looping = false;
            continue;
        }
        if (!this->s_looping) {
            break;
        }

        try {
            this->wait_for_input(this->compute_timeout());
        } catch (const std::exception& e) {
            log_error("%s: wait failed with -- %s",
                      this->s_name.c_str(),
                      e.what());
            this->failed(e.what());
            this->s_looping = false;
        }
    }
    this->stopped();
    log_info("END isc thread: %s", this->s_name.c_str());
}

void
service_base::wait_for_input(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(this->s_wait_mutex);

    this->s_wait_cond.wait_for(
        lock, timeout, [this]() { return !this->s_looping; });
}

void
service_base::wakeup()
{
    std::lock_guard<std::mutex> lock(this->s_wait_mutex);

    this->s_wait_cond.notify_all();
}

void
service_base::stop()
{
    if (this->s_started) {
        log_debug("stopping service thread: %s", this->s_name.c_str());
        this->s_looping = false;
        this->wakeup();
        log_debug("waiting for service thread: %s", this->s_name.c_str());
        this->s_thread.join();
        log_debug("joined service thread: %s", this->s_name.c_str());
        this->s_started = false;
    }
}

}  // namespace isc
