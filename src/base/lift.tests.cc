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

#include "base/liftopt.hh"
#include "config.h"
#include "doctest/doctest.h"

using namespace liftopt;

static int
add3(int a, int b, int c)
{
    return a + b + c;
}

TEST_CASE("lift::plain function")
{
    auto lifted_add = lift(add3);

    CHECK(lifted_add(present(1), present(2), present(3)) == present(6));
    CHECK(lifted_add(present(1), absent<int>(), present(3)).is_absent());
    CHECK(lifted_add(absent<int>(), absent<int>(), absent<int>()).is_absent());
}

TEST_CASE("lift::skips the call on absence")
{
    int calls = 0;
    auto counted = lift([&calls](int a, int b) {
        calls += 1;
        return a * b;
    });

    CHECK(counted(present(3), present(4)) == present(12));
    CHECK(calls == 1);
    CHECK(counted(present(3), absent<int>()).is_absent());
    CHECK(calls == 1);
}

TEST_CASE("lift::raw and optional arguments")
{
    auto concat = lift([](const std::string& lhs, const std::string& rhs) {
        return lhs + rhs;
    });

    CHECK(concat(present(std::string("ab")), std::string("cd"))
          == present(std::string("abcd")));
    CHECK(concat(std::optional<std::string>("x"), std::string("y"))
          == present(std::string("xy")));
    CHECK(concat(std::optional<std::string>(), std::string("y")).is_absent());
}

TEST_CASE("lift::flattens failing functions")
{
    auto safe_div = lift([](int lhs, int rhs) -> maybe<int> {
        if (rhs == 0) {
            return nothing;
        }
        return present(lhs / rhs);
    });
    auto opt_neg = lift([](int v) -> std::optional<int> {
        if (v < 0) {
            return std::nullopt;
        }
        return -v;
    });

    CHECK(safe_div(present(10), present(2)) == present(5));
    CHECK(safe_div(present(10), present(0)).is_absent());
    CHECK(opt_neg(present(4)) == present(-4));
    CHECK(opt_neg(present(-4)).is_absent());
}

TEST_CASE("lift::operators")
{
    auto plus = lift_operator<ops::plus>();
    auto less = lift_operator<ops::less>();

    CHECK(plus(present(2), present(5)) == present(7));
    CHECK(plus(present(2), absent<int>()).is_absent());
    CHECK(less(present(1), present(2)) == present(true));
    CHECK(less(absent<int>(), present(2)).is_absent());
    CHECK(plus.base()(1, 1) == present(2));
}

TEST_CASE("lift::liftings of one function are interchangeable")
{
    auto first = lift(add3);
    auto second = lift(add3);

    CHECK(first(present(1), present(2), present(3))
          == second(present(1), present(2), present(3)));
    CHECK(first(absent<int>(), present(2), present(3))
          == second(absent<int>(), present(2), present(3)));
    CHECK(first(present(1), 2, absent<int>())
          == second(present(1), 2, absent<int>()));

    auto div_op = lift_operator<ops::divides>();
    auto div_fn = lift(ops::divides{});
    const maybe<int> inputs[] = {present(12), present(0), present(-5), nothing};

    for (const auto& lhs : inputs) {
        for (const auto& rhs : inputs) {
            CHECK(div_op(lhs, rhs) == div_fn(lhs, rhs));
            CHECK(div_op(lhs, rhs) == div_op(lhs, rhs));
        }
    }
    CHECK(div_fn(present(12), present(-5)) == present(-2));
    CHECK(div_fn(present(12), present(0)).is_absent());
}
