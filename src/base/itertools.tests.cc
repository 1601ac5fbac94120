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
#include <vector>

#include "base/itertools.hh"
#include "base/ops.hh"
#include "base/opt_util.hh"
#include "config.h"
#include "doctest/doctest.h"

using namespace liftopt;

TEST_CASE("itertools::maybe pipes")
{
    CHECK((absent<int>() | itertools::unwrap_or(5)) == 5);
    CHECK((present(2) | itertools::unwrap_or(5)) == 2);
    CHECK((present(2) | itertools::map([](int v) { return v * 4; }))
          == present(8));

    auto positive = [](int v) -> maybe<int> {
        if (v <= 0) {
            return nothing;
        }
        return present(v);
    };
    CHECK((present(3) | itertools::flat_map(positive)) == present(3));
    CHECK((present(-3) | itertools::flat_map(positive)).is_absent());

    int seen = 0;
    present(6) | itertools::for_each([&seen](int v) { seen = v; });
    CHECK(seen == 6);
    absent<int>() | itertools::for_each([&seen](int v) { seen = v + 1; });
    CHECK(seen == 6);
}

TEST_CASE("itertools::minimum of scanned candidates")
{
    auto min_of = [](double lhs, double rhs) { return rhs < lhs ? rhs : lhs; };
    std::vector<maybe<double>> forward;
    std::vector<maybe<double>> backward;

    for (const auto* cand : {"nan", "1", "x", "-2.5", "inf"}) {
        forward.emplace_back(scan_double(cand));
    }
    for (const auto* cand : {"inf", "-2.5", "x", "1", "nan"}) {
        backward.emplace_back(scan_double(cand));
    }

    CHECK((forward | itertools::fold_present(min_of)) == present(-2.5));
    CHECK((backward | itertools::fold_present(min_of)) == present(-2.5));
    CHECK((forward | itertools::present_values()).size() == 2);
}

TEST_CASE("itertools::vector pipes")
{
    std::vector<maybe<int>> values = {present(4), nothing, present(1)};

    auto present_only = values | itertools::present_values();
    CHECK(present_only == std::vector<int>{4, 1});
    CHECK((values | itertools::fold_present(ops::plus{})) == present(5));

    auto flags = values
        | itertools::map([](const maybe<int>& m) { return m.is_present(); });
    CHECK(flags == std::vector<bool>{true, false, true});

    std::string joined;
    present_only
        | itertools::for_each([&joined](int v) { joined += std::to_string(v); });
    CHECK(joined == "41");
}
