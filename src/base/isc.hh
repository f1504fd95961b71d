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
 * @file isc.hh
 */

#ifndef logline_isc_hh
#define logline_isc_hh

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "safe/safe.h"

namespace isc {

enum class send_status {
    ok,
    full,
    closed,
};

/**
 * A bounded, single-direction FIFO for passing values between two threads.
 * Either side may close the port.  Once closed, sends fail and receivers
 * drain whatever is left before seeing the end of the stream.
 */
template<typename T>
class bounded_port {
public:
    explicit bounded_port(size_t capacity) : bp_capacity(capacity) {}

    bounded_port(const bounded_port&) = delete;
    bounded_port& operator=(const bounded_port&) = delete;

    size_t capacity() const { return this->bp_capacity; }

    send_status try_send(T&& value)
    {
        safe::WriteAccess<safe_port_state, std::unique_lock> state(
            this->bp_state);

        if (state->ps_closed) {
            return send_status::closed;
        }
        if (state->ps_queue.size() >= this->bp_capacity) {
            return send_status::full;
        }
        state->ps_queue.emplace_back(std::move(value));
        this->bp_not_empty.notify_one();

        return send_status::ok;
    }

    /**
     * Send a value, waiting up to the given time for room in the queue.  The
     * value is left untouched if it could not be sent so the caller can try
     * again.
     */
    template<class Rep, class Period>
    send_status send_for(T&& value,
                         const std::chrono::duration<Rep, Period>& rel_time)
    {
        safe::WriteAccess<safe_port_state, std::unique_lock> state(
            this->bp_state);

        this->bp_not_full.wait_for(state.lock, rel_time, [&state, this]() {
            return state->ps_closed
                || state->ps_queue.size() < this->bp_capacity;
        });
        if (state->ps_closed) {
            return send_status::closed;
        }
        if (state->ps_queue.size() >= this->bp_capacity) {
            return send_status::full;
        }
        state->ps_queue.emplace_back(std::move(value));
        this->bp_not_empty.notify_one();

        return send_status::ok;
    }

    std::optional<T> try_recv()
    {
        safe::WriteAccess<safe_port_state, std::unique_lock> state(
            this->bp_state);

        return this->pop(state);
    }

    /**
     * Receive a value, waiting up to the given time for one to arrive.
     * Returns early with nothing if the port is closed and empty.
     */
    template<class Rep, class Period>
    std::optional<T> recv_for(
        const std::chrono::duration<Rep, Period>& rel_time)
    {
        safe::WriteAccess<safe_port_state, std::unique_lock> state(
            this->bp_state);

        if (state->ps_queue.empty() && !state->ps_closed
            && rel_time.count() > 0)
        {
            this->bp_not_empty.wait_for(state.lock, rel_time, [&state]() {
                return state->ps_closed || !state->ps_queue.empty();
            });
        }

        return this->pop(state);
    }

    void close()
    {
        safe::WriteAccess<safe_port_state, std::unique_lock> state(
            this->bp_state);

        state->ps_closed = true;
        this->bp_not_empty.notify_all();
        this->bp_not_full.notify_all();
    }

    bool is_closed() const { return this->bp_state.readAccess()->ps_closed; }

    /** @return True if the port is closed and nothing is left to receive. */
    bool is_finished() const
    {
        auto state = this->bp_state.readAccess();

        return state->ps_closed && state->ps_queue.empty();
    }

    size_t size() const { return this->bp_state.readAccess()->ps_queue.size(); }

private:
    struct port_state {
        std::deque<T> ps_queue;
        bool ps_closed{false};
    };
    using safe_port_state = safe::Safe<port_state>;

    std::optional<T> pop(
        safe::WriteAccess<safe_port_state, std::unique_lock>& state)
    {
        if (state->ps_queue.empty()) {
            return std::nullopt;
        }

        std::optional<T> retval{std::move(state->ps_queue.front())};

        state->ps_queue.pop_front();
        this->bp_not_full.notify_one();

        return retval;
    }

    const size_t bp_capacity;
    std::condition_variable bp_not_empty;
    std::condition_variable bp_not_full;
    safe_port_state bp_state;
};

/**
 * Base class for a service that runs a loop in its own thread.  Subclasses
 * provide the loop body and the way the thread idles between iterations.
 */
class service_base {
public:
    explicit service_base(std::string name) : s_name(std::move(name)) {}

    virtual ~service_base() = default;

    service_base(const service_base&) = delete;
    service_base& operator=(const service_base&) = delete;

    bool is_looping() const { return this->s_looping; }

    const std::string& get_name() const { return this->s_name; }

    void start();

    /**
     * Ask the loop to finish, wake the thread, and wait for it to exit.
     */
    void stop();

protected:
    virtual void run();

    /** Called once on the service thread before the first iteration. */
    virtual void started() {}

    virtual void loop_body() {}

    /**
     * Idle between iterations for at most the given time.  The default
     * sleeps until the timeout or until stop() is called.
     */
    virtual void wait_for_input(std::chrono::milliseconds timeout);

    /** Called from stop() to interrupt wait_for_input(). */
    virtual void wakeup();

    /** Called on the service thread when the loop throws. */
    virtual void failed(const std::string& msg) {}

    virtual void stopped() {}

    virtual std::chrono::milliseconds compute_timeout() const
    {
        using namespace std::literals::chrono_literals;

        return 1s;
    }

    const std::string s_name;
    bool s_started{false};
    std::thread s_thread;
    std::atomic<bool> s_looping{true};
    std::mutex s_wait_mutex;
    std::condition_variable s_wait_cond;
};

}  // namespace isc

#endif
