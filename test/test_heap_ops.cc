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

#include <limits>
#include <vector>

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "checked_seq.hh"
#include "doctest/doctest.h"
#include "heap_ops.hh"

using namespace liftopt;

TEST_CASE("checked_seq::get")
{
    checked_seq<double> x = {5.7, 2.1, 3.0};

    CHECK(x.get(1) == present(2.1));
    CHECK(x[0] == present(5.7));
    CHECK(x.get(5).is_absent());
    CHECK(x.get(3).is_absent());
    CHECK(x.get(-1).is_absent());
}

TEST_CASE("checked_seq::set")
{
    checked_seq<int> x = {1, 2, 3};

    x.set(0, present(7));
    x.set(1, nothing);
    x.set(3, present(9));
    x.set(-1, present(9));
    CHECK(x.values() == std::vector<int>{7, 2, 3});
    CHECK(x.size() == 3);
}

TEST_CASE("heap::children")
{
    CHECK(heap::left_child(0) == present(ssize_t{1}));
    CHECK(heap::right_child(0) == present(ssize_t{2}));
    CHECK(heap::left_child(2) == present(ssize_t{5}));
    CHECK(heap::right_child(2) == present(ssize_t{6}));
    CHECK(heap::left_child(-1).is_absent());
    CHECK(heap::right_child(-3).is_absent());

    constexpr auto max_index = std::numeric_limits<ssize_t>::max();
    CHECK(heap::left_child(max_index).is_absent());
    CHECK(heap::right_child(max_index).is_absent());
    CHECK(heap::left_child(max_index / 2) == present(max_index));
    CHECK(heap::right_child(max_index / 2).is_absent());
}

TEST_CASE("heap::swap_down")
{
    {
        checked_seq<int> x = {3, 1, 2, 4, 6};

        CHECK(heap::swap_down(0, x) == present(ssize_t{1}));
        CHECK(x.values() == std::vector<int>{1, 3, 2, 4, 6});
        CHECK(heap::swap_down(1, x).is_absent());
    }
    {
        checked_seq<int> x = {5, 4, 1};

        CHECK(heap::swap_down(0, x) == present(ssize_t{2}));
        CHECK(x.values() == std::vector<int>{1, 4, 5});
    }
    {
        checked_seq<int> x = {5, 2};

        CHECK(heap::swap_down(0, x) == present(ssize_t{1}));
        CHECK(x.values() == std::vector<int>{2, 5});
    }
    {
        checked_seq<int> x = {2, 2, 3};

        CHECK(heap::swap_down(0, x).is_absent());
        CHECK(x.values() == std::vector<int>{2, 2, 3});
    }
    {
        checked_seq<int> x = {1};

        CHECK(heap::swap_down(0, x).is_absent());
        CHECK(heap::swap_down(4, x).is_absent());
    }
}

TEST_CASE("heap::indexes outside the sequence")
{
    constexpr auto max_index = std::numeric_limits<ssize_t>::max();
    checked_seq<int> x = {5, 4, 1};

    CHECK(heap::swap_down(max_index, x).is_absent());
    CHECK(heap::swap_down(max_index / 2, x).is_absent());
    CHECK(heap::swap_down(-1, x).is_absent());
    CHECK(heap::sift_down(max_index, x) == max_index);
    CHECK(x.values() == std::vector<int>{5, 4, 1});
    CHECK(heap::min_child(max_index, x).is_absent());
}

TEST_CASE("checked_seq::maybe indexes")
{
    checked_seq<int> x = {1, 2, 3};

    CHECK(x[present(ssize_t{2})] == present(3));
    CHECK(x[absent<ssize_t>()].is_absent());
    x.set(present(ssize_t{0}), present(9));
    x.set(absent<ssize_t>(), present(8));
    CHECK(x.values() == std::vector<int>{9, 2, 3});
}

TEST_CASE("heap::sift_down")
{
    {
        checked_seq<int> x = {9, 1, 2, 3, 4, 5, 6};

        CHECK(heap::sift_down(0, x) == 3);
        CHECK(x.values() == std::vector<int>{1, 3, 2, 9, 4, 5, 6});
    }
    {
        checked_seq<double> x = {3.0, 1.0, 2.0, 4.0, 6.0};

        CHECK(heap::sift_down(0, x) == 1);
        CHECK(x.values() == std::vector<double>{1.0, 3.0, 2.0, 4.0, 6.0});
    }
    {
        checked_seq<int> x = {1, 2, 3};

        CHECK(heap::sift_down(0, x) == 0);
        CHECK(x.values() == std::vector<int>{1, 2, 3});
    }
}

TEST_CASE("heap::min_child")
{
    checked_seq<int> x = {5, 4, 1};

    CHECK(heap::min_child(0, x) == present(1));
    CHECK(heap::min_child(1, x).is_absent());

    checked_seq<int> lone = {5, 4};
    CHECK(heap::min_child(0, lone) == present(4));
}
