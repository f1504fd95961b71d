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
 * @file logline_log.hh
 */

#ifndef logline_log_hh
#define logline_log_hh

#include <cstdint>
#include <optional>
#include <string>

#include <stdio.h>
#include <string.h>
#include <sys/types.h>

#ifndef logline_dead2
#    define logline_dead2 __attribute__((noreturn))
#endif

enum class logline_log_level_t : uint32_t {
    TRACE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
};

#if defined(__GNUC__) || defined(__clang__)
#    define LOGLINE_ATTR_FORMAT_PRINTF(a, b) \
        __attribute__((format(printf, a, b)))
#else
#    define LOGLINE_ATTR_FORMAT_PRINTF(a, b)
#endif

void log_msg(enum logline_log_level_t level,
             const char* src_file,
             int line_number,
             const char* fmt,
             ...) LOGLINE_ATTR_FORMAT_PRINTF(4, 5);
void log_abort() logline_dead2;

/**
 * Open the log file named by the LOGLINE_LOG_PATH environment variable, if
 * it is set, and apply the level named by LOGLINE_LOG_LEVEL.
 */
void log_init_from_env();

/**
 * Copy the contents of the in-memory ring of recent messages to the given
 * file descriptor.
 */
void log_write_ring_to(int fd);

std::optional<logline_log_level_t> log_level_from_name(const char* name);

extern std::optional<FILE*> logline_log_file;
extern enum logline_log_level_t logline_log_level;

#define log_msg_wrapper(level, fmt...) \
    do { \
        if (logline_log_level <= level) { \
            log_msg(level, __FILE__, __LINE__, fmt); \
        } \
    } while (false)

#define log_error(fmt...) log_msg_wrapper(logline_log_level_t::ERROR, fmt);

#define log_warning(fmt...) \
    log_msg_wrapper(logline_log_level_t::WARNING, fmt);

#define log_info(fmt...) log_msg_wrapper(logline_log_level_t::INFO, fmt);

#define log_debug(fmt...) log_msg_wrapper(logline_log_level_t::DEBUG, fmt);

#define log_trace(fmt...) log_msg_wrapper(logline_log_level_t::TRACE, fmt);

#define require(e) \
    ((void) ((e) ? 0 : logline_require(#e, __FILE__, __LINE__)))
#define logline_require(e, file, line) \
    (log_msg(logline_log_level_t::ERROR, \
             file, \
             line, \
             "failed precondition `%s'", \
             e), \
     log_abort(), \
     1)

#define require_ge(lhs, rhs) \
    ((void) ((lhs >= rhs) \
                 ? 0 \
                 : logline_require_binary( \
                       #lhs " >= " #rhs, lhs, rhs, __FILE__, __LINE__)))
#define require_lt(lhs, rhs) \
    ((void) ((lhs < rhs) \
                 ? 0 \
                 : logline_require_binary( \
                       #lhs " < " #rhs, lhs, rhs, __FILE__, __LINE__)))

#define logline_require_binary(e, lhs, rhs, file, line) \
    (log_msg(logline_log_level_t::ERROR, \
             file, \
             line, \
             "failed precondition `%s' (lhs=%s; rhs=%s)", \
             e, \
             std::to_string(lhs).c_str(), \
             std::to_string(rhs).c_str()), \
     log_abort(), \
     1)

#define ensure(e) ((void) ((e) ? 0 : logline_ensure(#e, __FILE__, __LINE__)))
#define logline_ensure(e, file, line) \
    (log_msg(logline_log_level_t::ERROR, \
             file, \
             line, \
             "failed postcondition `%s'", \
             e), \
     log_abort(), \
     1)

#define log_perror(e) \
    ((void) ((e != -1) ? 0 : logline_log_perror(#e, __FILE__, __LINE__)))
#define logline_log_perror(e, file, line) \
    (log_msg(logline_log_level_t::ERROR, \
             file, \
             line, \
             "syscall failed `%s' -- %s", \
             e, \
             strerror(errno)), \
     1)

#endif
