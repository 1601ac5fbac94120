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
#include <type_traits>

#include "base/maybe.fmt.hh"
#include "base/maybe.hh"
#include "config.h"
#include "doctest/doctest.h"

using namespace liftopt;

namespace {

struct point {
    int p_x;
    int p_y;
};

}  // namespace

static_assert(!std::is_convertible<int, maybe<int>>::value,
              "a raw value must be wrapped explicitly");
static_assert(!std::is_constructible<bool, maybe<int>>::value,
              "a maybe is not a boolean");
static_assert(std::is_convertible<nothing_t, maybe<std::string>>::value,
              "nothing converts to any maybe");
static_assert(is_equality_comparable<maybe<int>>::value, "");
static_assert(!is_equality_comparable<maybe<point>>::value, "");

TEST_CASE("maybe::presence")
{
    auto p = present(42);
    maybe<int> a = nothing;
    maybe<int> def;

    CHECK(p.is_present());
    CHECK(!p.is_absent());
    CHECK(a.is_absent());
    CHECK(def.is_absent());
    CHECK(absent<std::string>().is_absent());
    CHECK(p.unwrap() == 42);
}

TEST_CASE("maybe::unwrap")
{
    CHECK_THROWS_AS(absent<int>().unwrap(), absent_value_error);
    CHECK(absent<int>().unwrap_or(7) == 7);
    CHECK(present(3).unwrap_or(7) == 3);

    auto name = present(std::string("abc"));
    auto moved = std::move(name).unwrap();
    CHECK(moved == "abc");

    try {
        maybe<double> empty;

        empty.unwrap();
        FAIL("unwrap() of an absent value should throw");
    } catch (const absent_value_error& e) {
        CHECK(std::string(e.what()) == "tried to unwrap an absent value");
    }
}

TEST_CASE("maybe::map")
{
    auto len = present(std::string("hello")).map(
        [](const std::string& str) { return str.size(); });

    CHECK(len == present(size_t{5}));

    int calls = 0;
    auto none = absent<int>().map([&calls](int v) {
        calls += 1;
        return v + 1;
    });
    CHECK(none.is_absent());
    CHECK(calls == 0);
}

TEST_CASE("maybe::and_then")
{
    auto half = [](int v) -> maybe<int> {
        if (v % 2 != 0) {
            return nothing;
        }
        return present(v / 2);
    };

    CHECK(present(8).and_then(half).and_then(half) == present(2));
    CHECK(present(6).and_then(half).and_then(half).is_absent());
    CHECK(absent<int>().and_then(half).is_absent());
}

TEST_CASE("maybe::match")
{
    auto describe = [](const maybe<int>& m) {
        return m.match([](int v) { return std::to_string(v); },
                       []() { return std::string("none"); });
    };

    CHECK(describe(present(12)) == "12");
    CHECK(describe(nothing) == "none");
}

TEST_CASE("maybe::equality")
{
    CHECK(present(1) == present(1));
    CHECK(present(1) != present(2));
    CHECK(present(1) != absent<int>());
    CHECK(absent<int>() == absent<int>());
    CHECK(absent<int>() == nothing);
    CHECK(nothing == absent<int>());
    CHECK(present(1) != nothing);
}

TEST_CASE("maybe::to_optional")
{
    CHECK(present(5).to_optional() == std::optional<int>(5));
    CHECK(!absent<int>().to_optional().has_value());
}

TEST_CASE("maybe::format")
{
    CHECK(fmt::format(FMT_STRING("{}"), present(3)) == "Some(3)");
    CHECK(fmt::format(FMT_STRING("{}"), absent<int>()) == "Nothing");
    CHECK(fmt::format(FMT_STRING("[{}]"), present(std::string("x")))
          == "[Some(x)]");
}
