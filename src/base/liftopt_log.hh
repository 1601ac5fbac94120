/**
 * Copyright (c) 2014, Timothy Stack
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
 */

#ifndef liftopt_log_hh
#define liftopt_log_hh

#include <cstdint>
#include <optional>
#include <string>

#include <stdio.h>
#include <sys/types.h>

#include "maybe.hh"

enum class liftopt_log_level_t : uint32_t {
    TRACE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
};

void log_argv(int argc, char* argv[]);
#if defined(__GNUC__) || defined(__clang__)
#    define LIFTOPT_ATTR_FORMAT_PRINTF(a, b) \
        __attribute__((format(printf, a, b)))
#else
#    define LIFTOPT_ATTR_FORMAT_PRINTF(a, b)
#endif

void log_msg(enum liftopt_log_level_t level,
             const char* src_file,
             int line_number,
             const char* fmt,
             ...) LIFTOPT_ATTR_FORMAT_PRINTF(4, 5);

/**
 * Parse a level name ("trace", "debug", "info", "warning" or "error", in
 * any case).
 */
liftopt::maybe<liftopt_log_level_t> log_level_from_string(
    const std::string& name);

extern std::optional<FILE*> liftopt_log_file;
extern enum liftopt_log_level_t liftopt_log_level;

#define log_msg_wrapper(level, fmt...) \
    do { \
        if (liftopt_log_level <= level) { \
            log_msg(level, __FILE__, __LINE__, fmt); \
        } \
    } while (false)

#define log_error(fmt...) log_msg_wrapper(liftopt_log_level_t::ERROR, fmt);

#define log_warning(fmt...) \
    log_msg_wrapper(liftopt_log_level_t::WARNING, fmt);

#define log_info(fmt...) log_msg_wrapper(liftopt_log_level_t::INFO, fmt);

#define log_debug(fmt...) log_msg_wrapper(liftopt_log_level_t::DEBUG, fmt);

#define log_trace(fmt...) log_msg_wrapper(liftopt_log_level_t::TRACE, fmt);

#endif
