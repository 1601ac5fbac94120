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

#include "base/seq.hh"
#include "config.h"
#include "doctest/doctest.h"

using namespace liftopt;

TEST_CASE("do_eval::binds every earlier value")
{
    auto res = do_eval([]() { return present(2); },
                       [](int a) { return present(a * 3); },
                       [](int a, int b) { return a + b; });

    CHECK(res == present(8));
}

TEST_CASE("do_eval::short circuits")
{
    int later = 0;
    auto res = do_eval([]() { return present(2); },
                       [](int) -> maybe<int> { return nothing; },
                       [&later](int a, int b) {
                           later += 1;
                           return a + b;
                       });

    CHECK(res.is_absent());
    CHECK(later == 0);
}

TEST_CASE("do_eval::mixed step results")
{
    auto res = do_eval(
        []() { return std::optional<std::string>("ab"); },
        [](const std::string& s) { return s.size(); },
        [](const std::string& s, size_t len) {
            return s + std::to_string(len);
        });

    CHECK(res == present(std::string("ab2")));
    CHECK(do_eval([]() { return 5; }) == present(5));
}

TEST_CASE("chain")
{
    int calls = 0;
    auto inc = [&calls](int v) {
        calls += 1;
        return v + 1;
    };
    auto non_negative = [](int v) -> maybe<int> {
        if (v < 0) {
            return nothing;
        }
        return present(v);
    };

    CHECK(chain(present(1), inc, inc, non_negative) == present(3));
    CHECK(calls == 2);
    CHECK(chain(present(-5), non_negative, inc).is_absent());
    CHECK(calls == 2);
    CHECK(chain(absent<int>(), inc).is_absent());
    CHECK(calls == 2);
    CHECK(chain(present(4)) == present(4));
}

TEST_CASE("sequence")
{
    int calls = 0;
    sequence<int> seq;

    seq.then([&calls](int v) {
           calls += 1;
           return v * 2;
       })
        .then([](int v) -> maybe<int> {
            if (v > 10) {
                return nothing;
            }
            return present(v);
        })
        .then([&calls](int v) {
            calls += 1;
            return v + 1;
        });

    CHECK(seq.size() == 3);
    CHECK(seq.run(present(3)) == present(7));
    CHECK(calls == 2);

    calls = 0;
    CHECK(seq.run(present(6)).is_absent());
    CHECK(calls == 1);

    calls = 0;
    CHECK(seq.run(nothing).is_absent());
    CHECK(calls == 0);
}
