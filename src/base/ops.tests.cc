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

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include "base/ops.hh"
#include "config.h"
#include "doctest/doctest.h"

using namespace liftopt;

namespace {

struct point {
    int p_x;
    int p_y;
};

struct cents {
    long c_value;
};

bool
operator<(const cents& lhs, const cents& rhs)
{
    return lhs.c_value < rhs.c_value;
}

bool
operator==(const cents& lhs, const cents& rhs)
{
    return lhs.c_value == rhs.c_value;
}

cents
operator-(const cents& value)
{
    return cents{-value.c_value};
}

cents
operator+(const cents& lhs, const cents& rhs)
{
    return cents{lhs.c_value + rhs.c_value};
}

cents
operator-(const cents& lhs, const cents& rhs)
{
    return cents{lhs.c_value - rhs.c_value};
}

cents
operator*(const cents& lhs, const cents& rhs)
{
    return cents{lhs.c_value * rhs.c_value};
}

cents
operator/(const cents& lhs, const cents& rhs)
{
    return cents{lhs.c_value / rhs.c_value};
}

cents
pow(const cents& base, const cents& exp)
{
    return cents{arith::pow(base.c_value, exp.c_value)};
}

cents
floor_div(const cents& lhs, const cents& rhs)
{
    return cents{arith::floor_div(lhs.c_value, rhs.c_value)};
}

}  // namespace

static_assert(is_comparable<int>::value, "");
static_assert(is_comparable<std::string>::value, "");
static_assert(!is_comparable<point>::value, "");
static_assert(is_equality_comparable<std::string>::value, "");
static_assert(!is_equality_comparable<point>::value, "");
static_assert(is_numeric<int>::value, "");
static_assert(is_numeric<long>::value, "");
static_assert(is_numeric<double>::value, "");
static_assert(!is_numeric<bool>::value, "");
static_assert(!is_numeric<std::string>::value, "");
static_assert(!is_numeric<point>::value, "");
static_assert(is_numeric<cents>::value, "");
static_assert(is_comparable<cents>::value, "");

TEST_CASE("ops::comparison")
{
    CHECK((present(1) < present(2)) == present(true));
    CHECK((present(2) < present(1)) == present(false));
    CHECK((present(2) > present(1)) == present(true));
    CHECK((present(2) <= present(2)) == present(true));
    CHECK((present(3) <= present(2)) == present(false));
    CHECK((present(2) >= present(2)) == present(true));
    CHECK((present(1) >= present(2)) == present(false));
    CHECK((absent<int>() <= present(1)).is_absent());
    CHECK((absent<int>() < present(1)).is_absent());
    CHECK((absent<int>() < present(1)).unwrap_or(false) == false);
    CHECK((present(1) > absent<int>()).unwrap_or(false) == false);
    CHECK((present(1) > absent<int>()).is_absent());
    CHECK((present(std::string("a")) < present(std::string("b")))
          == present(true));
}

TEST_CASE("ops::arithmetic")
{
    CHECK(present(2) + present(3) == present(5));
    CHECK(present(2) - present(3) == present(-1));
    CHECK(present(2) * present(3) == present(6));
    CHECK(-present(4) == present(-4));
    CHECK((-absent<int>()).is_absent());
    CHECK((present(2) + absent<int>()).is_absent());
    CHECK(2.0 * present(1.5) == present(3.0));
    CHECK(present(1.5) - 0.5 == present(1.0));
    CHECK(present(cents{3}) + present(cents{4}) == present(cents{7}));
}

TEST_CASE("ops::signed overflow is absent")
{
    constexpr auto int_max = std::numeric_limits<int>::max();
    constexpr auto int_min = std::numeric_limits<int>::min();

    CHECK((present(int_max) + present(1)).is_absent());
    CHECK((present(int_min) - present(1)).is_absent());
    CHECK((present(int_max) * present(2)).is_absent());
    CHECK((-present(int_min)).is_absent());
    CHECK(-present(int_max) == present(-int_max));
    CHECK(present(int_max - 1) + present(1) == present(int_max));

    auto big = present(std::numeric_limits<int64_t>::max());
    CHECK((big + present(int64_t{1})).is_absent());

    CHECK(present(0u) - present(1u)
          == present(std::numeric_limits<unsigned>::max()));
}

TEST_CASE("ops::division")
{
    CHECK(present(7) / present(2) == present(3));
    CHECK((present(7) / present(0)).is_absent());
    CHECK((present(1.0) / present(0.0)).is_absent());
    CHECK(present(1.0) / present(4.0) == present(0.25));
    CHECK(floor_div(present(-7), present(2)) == present(-4));
    CHECK(floor_div(present(7), present(2)) == present(3));
    CHECK(floor_div(present(-7.0), present(2.0)) == present(-4.0));
    CHECK(floor_div(present(1), present(0)).is_absent());

    constexpr auto int_min = std::numeric_limits<int>::min();
    CHECK((present(int_min) / present(-1)).is_absent());
    CHECK(floor_div(present(int_min), present(-1)).is_absent());
    CHECK(present(int_min) / present(1) == present(int_min));
    CHECK(floor_div(present(int_min), present(2)) == present(int_min / 2));
    CHECK(floor_div(present(cents{-7}), present(cents{2}))
          == present(cents{-4}));
}

TEST_CASE("ops::power")
{
    CHECK(pow(present(2), present(10)) == present(1024));
    CHECK(pow(present(3), present(0)) == present(1));
    CHECK(pow(present(2), present(-1)).is_absent());
    CHECK(pow(present(1), present(-3)) == present(1));
    CHECK(pow(present(-1), present(-3)) == present(-1));
    CHECK(pow(present(-1), present(-2)) == present(1));
    CHECK(pow(present(2.0), present(-1.0)) == present(0.5));
    CHECK(pow(present(0.0), present(-1.0)).is_absent());
    CHECK(pow(present(-8.0), present(0.5)).is_absent());
    CHECK(pow(absent<int>(), present(2)).is_absent());
    CHECK(pow(present(2), present(16)) == present(65536));
    CHECK(pow(present(2), present(30)) == present(1 << 30));
    CHECK(pow(present(2), present(31)).is_absent());
    CHECK(pow(present(2), present(40)).is_absent());
    CHECK(pow(present(-2), present(31))
          == present(std::numeric_limits<int>::min()));
    CHECK(pow(present(3), present(40)).is_absent());
    CHECK(pow(present(int64_t{2}), present(int64_t{40}))
          == present(int64_t{1} << 40));
    CHECK(pow(present(cents{2}), present(cents{3})) == present(cents{8}));
}
