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

#include <list>
#include <optional>
#include <string>
#include <vector>

#include "base/fold.hh"
#include "base/ops.hh"
#include "config.h"
#include "doctest/doctest.h"

using namespace liftopt;

TEST_CASE("fold::skips absent values")
{
    std::vector<maybe<int>> values = {present(1), nothing, present(3)};

    CHECK(fold(ops::plus{}, values) == present(4));
    CHECK(fold(ops::plus{}, values.begin(), values.end()) == present(4));
    CHECK(fold(ops::multiplies{}, present(2), absent<int>(), present(5))
          == present(10));
}

TEST_CASE("fold::absent entries do not change the result")
{
    std::vector<maybe<int>> sparse = {nothing, present(3), nothing, present(1)};
    std::vector<maybe<int>> dense = {present(3), present(1)};

    CHECK(fold(ops::minus{}, sparse) == fold(ops::minus{}, dense));
    CHECK(fold(ops::minus{}, sparse) == present(2));
}

TEST_CASE("fold::single present value")
{
    std::vector<maybe<int>> values = {nothing, present(9), nothing};

    CHECK(fold(ops::plus{}, values) == present(9));
}

TEST_CASE("fold::nothing to fold")
{
    std::vector<maybe<int>> empty;
    std::vector<maybe<int>> all_absent = {nothing, nothing};

    CHECK(fold(ops::plus{}, empty).is_absent());
    CHECK(fold(ops::plus{}, all_absent).is_absent());
    CHECK(fold(ops::plus{}, absent<int>(), absent<int>()).is_absent());
}

TEST_CASE("fold::stops when the operation fails")
{
    int calls = 0;
    auto counted_div = [&calls](int lhs, int rhs) -> maybe<int> {
        calls += 1;
        if (rhs == 0) {
            return nothing;
        }
        return present(lhs / rhs);
    };
    std::vector<maybe<int>> values
        = {present(100), present(0), present(5), present(2)};

    CHECK(fold(counted_div, values).is_absent());
    CHECK(calls == 1);

    calls = 0;
    CHECK(fold(counted_div, present(100), present(5), present(2))
          == present(10));
    CHECK(calls == 2);
}

TEST_CASE("fold::raw and optional inputs")
{
    std::list<std::optional<int>> opts = {3, std::nullopt, 4};

    CHECK(fold(ops::plus{}, opts) == present(7));
    CHECK(fold(ops::plus{}, present(1), 2, 3) == present(6));
    CHECK(fold(ops::divides{}, present(1.0), present(0.0)).is_absent());
}

TEST_CASE("fold::minimum")
{
    auto min_of = [](const std::string& lhs, const std::string& rhs) {
        return rhs < lhs ? rhs : lhs;
    };

    CHECK(fold(min_of,
               present(std::string("pear")),
               absent<std::string>(),
               present(std::string("apple")))
          == present(std::string("apple")));
}
