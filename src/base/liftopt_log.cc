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

#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <sys/time.h>
#include <time.h>

#include "liftopt_log.hh"

#include <algorithm>
#include <atomic>
#include <iterator>
#include <mutex>

#include "config.h"
#include "opt_util.hh"

static constexpr size_t MAX_LOG_LINE_SIZE = 2 * 1024;

std::optional<FILE*> liftopt_log_file;
liftopt_log_level_t liftopt_log_level = liftopt_log_level_t::INFO;

// NOTE: This mutex is leaked so that it is not destroyed during exit.
// Otherwise, any attempts to log will fail.
static std::mutex*
liftopt_log_mutex()
{
    static auto* retval = new std::mutex();

    return retval;
}

static uint32_t
current_thread_id()
{
    static std::atomic<uint32_t> counter{0};
    thread_local uint32_t retval = counter++;

    return retval;
}

static const struct {
    const char* ln_short;
    const char* ln_long;
} LEVEL_NAMES[] = {
    {"T", "trace"},
    {"D", "debug"},
    {"I", "info"},
    {"W", "warning"},
    {"E", "error"},
};

static const char*
source_basename(const char* path)
{
    const char* retval = path;

    for (const char* curr = path; *curr; curr++) {
        if (*curr == '/' || *curr == '\\') {
            retval = curr + 1;
        }
    }

    return retval;
}

/**
 * Write the "<time> <level> t<thread> <file>:<line> " prefix of a log line.
 *
 * @return The number of bytes written.
 */
static size_t
format_prefix(char* buffer,
              size_t len,
              liftopt_log_level_t level,
              const char* src_file,
              int line_number)
{
    struct timeval curr_time;
    struct tm localtm;
    char stamp[32];
    char zone[8];

    gettimeofday(&curr_time, nullptr);
    localtime_r(&curr_time.tv_sec, &localtm);
    strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &localtm);
    strftime(zone, sizeof(zone), "%z", &localtm);

    auto rc = snprintf(buffer,
                       len,
                       "%s.%03d%s %s t%u %s:%d ",
                       stamp,
                       (int) (curr_time.tv_usec / 1000),
                       zone,
                       LEVEL_NAMES[static_cast<uint32_t>(level)].ln_short,
                       current_thread_id(),
                       source_basename(src_file),
                       line_number);
    if (rc < 0) {
        return 0;
    }

    return std::min((size_t) rc, len - 1);
}

void
log_argv(int argc, char* argv[])
{
    auto log_path = liftopt::getenv_opt("LIFTOPT_LOG_PATH");

    if (log_path.is_present() && !liftopt_log_file.has_value()) {
        auto* file = fopen(log_path.unwrap().c_str(), "ae");

        if (file != nullptr) {
            liftopt_log_file = file;
        }
    }

    log_info("%s started", PACKAGE_STRING);
    log_info("argv[%d] =", argc);
    for (int lpc = 0; lpc < argc; lpc++) {
        log_info("    [%d] = %s", lpc, argv[lpc]);
    }
}

liftopt::maybe<liftopt_log_level_t>
log_level_from_string(const std::string& name)
{
    for (size_t lpc = 0; lpc < std::size(LEVEL_NAMES); lpc++) {
        if (strcasecmp(name.c_str(), LEVEL_NAMES[lpc].ln_long) == 0) {
            return liftopt::present((liftopt_log_level_t) lpc);
        }
    }

    return liftopt::nothing;
}

void
log_msg(liftopt_log_level_t level,
        const char* src_file,
        int line_number,
        const char* fmt,
        ...)
{
    char line[MAX_LOG_LINE_SIZE];
    va_list args;

    if (level < liftopt_log_level || !liftopt_log_file.has_value()) {
        return;
    }

    std::lock_guard<std::mutex> log_lock(*liftopt_log_mutex());

    auto prefix_size
        = format_prefix(line, sizeof(line) / 2, level, src_file, line_number);
    auto avail = sizeof(line) - prefix_size - 1;

    va_start(args, fmt);
    auto rc = vsnprintf(&line[prefix_size], avail, fmt, args);
    va_end(args);

    size_t msg_size = 0;
    if (rc > 0) {
        msg_size = std::min((size_t) rc, avail - 1);
    }
    line[prefix_size + msg_size] = '\n';

    liftopt_log_file | [&](auto file) {
        fwrite(line, 1, prefix_size + msg_size + 1, file);
        fflush(file);
    };
}
