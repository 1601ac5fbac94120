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

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "base/maybe.fmt.hh"
#include "doctest/doctest.h"
#include "quadratic.hh"

using namespace liftopt;

TEST_CASE("checked_sqrt")
{
    CHECK(quadratic::checked_sqrt(16.0) == present(4.0));
    CHECK(quadratic::checked_sqrt(0.0) == present(0.0));
    CHECK(quadratic::checked_sqrt(-1.0).is_absent());
}

TEST_CASE("inverse")
{
    CHECK(quadratic::inverse(4.0) == present(0.25));
    CHECK(quadratic::inverse(0.0).is_absent());
}

TEST_CASE("roots::two real roots")
{
    auto roots = quadratic::roots(1.0, 0.0, -4.0);

    CHECK(roots.first == present(-2.0));
    CHECK(roots.second == present(2.0));
    CHECK(fmt::format(FMT_STRING("{} {}"), roots.first, roots.second)
          == "Some(-2) Some(2)");

    auto shifted = quadratic::roots(1.0, -3.0, 2.0);
    CHECK(shifted.first == present(1.0));
    CHECK(shifted.second == present(2.0));
}

TEST_CASE("roots::negative discriminant")
{
    auto roots = quadratic::roots(1.0, 0.0, 4.0);

    CHECK(roots.first.is_absent());
    CHECK(roots.second.is_absent());
}

TEST_CASE("roots::not quadratic")
{
    auto roots = quadratic::roots(0.0, 5.0, 10.0);

    CHECK(roots.first.is_absent());
    CHECK(roots.second.is_absent());
}

TEST_CASE("roots_do")
{
    auto roots = quadratic::roots_do(1.0, 0.0, -4.0);

    REQUIRE(roots.is_present());
    CHECK(roots.unwrap().first == doctest::Approx(-2.0));
    CHECK(roots.unwrap().second == doctest::Approx(2.0));

    auto shifted = quadratic::roots_do(2.0, -6.0, 4.0);
    REQUIRE(shifted.is_present());
    CHECK(shifted.unwrap().first == doctest::Approx(1.0));
    CHECK(shifted.unwrap().second == doctest::Approx(2.0));

    CHECK(quadratic::roots_do(1.0, 0.0, 4.0).is_absent());
    CHECK(quadratic::roots_do(0.0, 5.0, 10.0).is_absent());
}

TEST_CASE("roots_lifted")
{
    auto roots = quadratic::roots_lifted(1.0, 0.0, -4.0);

    REQUIRE(roots.is_present());
    CHECK(roots.unwrap().first == doctest::Approx(-2.0));
    CHECK(roots.unwrap().second == doctest::Approx(2.0));
    CHECK(quadratic::roots_lifted(1.0, 0.0, 4.0).is_absent());
    CHECK(quadratic::roots_lifted(0.0, 5.0, 10.0).is_absent());
}
