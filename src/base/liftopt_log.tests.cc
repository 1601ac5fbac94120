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
 */

#include <string>

#include <stdio.h>

#include "base/liftopt_log.hh"
#include "config.h"
#include "doctest/doctest.h"

TEST_CASE("log_level_from_string")
{
    CHECK(log_level_from_string("debug")
          == liftopt::present(liftopt_log_level_t::DEBUG));
    CHECK(log_level_from_string("WARNING")
          == liftopt::present(liftopt_log_level_t::WARNING));
    CHECK(log_level_from_string("Trace")
          == liftopt::present(liftopt_log_level_t::TRACE));
    CHECK(log_level_from_string("verbose").is_absent());
    CHECK(log_level_from_string("").is_absent());
}

TEST_CASE("log_msg")
{
    auto* tmp = tmpfile();
    auto saved_file = liftopt_log_file;
    auto saved_level = liftopt_log_level;

    REQUIRE(tmp != nullptr);
    liftopt_log_file = tmp;
    liftopt_log_level = liftopt_log_level_t::INFO;

    log_info("answer %d", 42);
    log_debug("filtered %d", 1);

    liftopt_log_file = saved_file;
    liftopt_log_level = saved_level;

    char buffer[1024];
    std::string contents;

    rewind(tmp);
    while (fgets(buffer, sizeof(buffer), tmp) != nullptr) {
        contents += buffer;
    }
    fclose(tmp);

    CHECK(contents.find(" I ") != std::string::npos);
    CHECK(contents.find("liftopt_log.tests.cc") != std::string::npos);
    CHECK(contents.find("answer 42\n") != std::string::npos);
    CHECK(contents.find("filtered") == std::string::npos);
}
