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

#include <optional>
#include <string>
#include <vector>

#include <stdlib.h>

#include "base/opt_util.hh"
#include "config.h"
#include "doctest/doctest.h"

using namespace liftopt;

TEST_CASE("unwrap")
{
    std::optional<int> opt = 4;
    std::optional<int> empty;
    int value = 9;
    int* null_ptr = nullptr;

    CHECK(unwrap(opt) == 4);
    CHECK_THROWS_AS(unwrap(empty), absent_value_error);
    CHECK(unwrap(&value) == 9);
    CHECK_THROWS_AS(unwrap(null_ptr), absent_value_error);
    CHECK(unwrap(present(1)) == 1);
    CHECK(unwrap_or(empty, 2) == 2);
}

TEST_CASE("to_maybe")
{
    CHECK(to_maybe(std::optional<int>(3)) == present(3));
    CHECK(to_maybe(std::optional<int>()).is_absent());
}

TEST_CASE("from_nullable")
{
    int value = 11;
    int* null_ptr = nullptr;
    const char* null_str = nullptr;

    CHECK(from_nullable(&value) == present(11));
    CHECK(from_nullable(null_ptr).is_absent());
    CHECK(from_nullable("abc") == present(std::string("abc")));
    CHECK(from_nullable(null_str).is_absent());
}

TEST_CASE("getenv_opt")
{
    setenv("LIFTOPT_TEST_VAR", "set", 1);
    unsetenv("LIFTOPT_TEST_UNSET");

    CHECK(getenv_opt("LIFTOPT_TEST_VAR") == present(std::string("set")));
    CHECK(getenv_opt("LIFTOPT_TEST_UNSET").is_absent());
}

TEST_CASE("scan_double")
{
    CHECK(scan_double("1.5") == present(1.5));
    CHECK(scan_double("-3") == present(-3.0));
    CHECK(scan_double("0") == present(0.0));
    CHECK(scan_double("").is_absent());
    CHECK(scan_double("abc").is_absent());
    CHECK(scan_double("12abc").is_absent());
    CHECK(scan_double("nan").is_absent());
    CHECK(scan_double("inf").is_absent());
    CHECK(scan_double("-inf").is_absent());
    CHECK(scan_double("1e400").is_absent());
}

TEST_CASE("cget")
{
    std::vector<int> elems = {1, 2, 3};

    CHECK(cget(elems, 0) == present(1));
    CHECK(cget(elems, 2) == present(3));
    CHECK(cget(elems, 3).is_absent());
}

TEST_CASE("optional pipe")
{
    std::optional<int> opt = 3;
    std::optional<int> empty;
    int hit = 0;

    opt | [&hit](int v) { hit = v; };
    CHECK(hit == 3);
    empty | [&hit](int v) { hit = v * 10; };
    CHECK(hit == 3);
}
