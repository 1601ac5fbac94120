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

#include "quadratic.hh"

#include "base/lift.hh"
#include "base/ops.hh"
#include "base/seq.hh"
#include "config.h"

namespace liftopt::quadratic {

static double
discriminant(double a, double b, double c)
{
    return b * b - 4.0 * a * c;
}

maybe<double>
checked_sqrt(double x)
{
    if (x < 0.0) {
        return nothing;
    }

    return present(std::sqrt(x));
}

maybe<double>
inverse(double x)
{
    if (x == 0.0) {
        return nothing;
    }

    return present(1.0 / x);
}

std::pair<maybe<double>, maybe<double>>
roots(double a, double b, double c)
{
    auto sq = checked_sqrt(discriminant(a, b, c));
    auto neg_b = -present(b);
    auto two_a = 2.0 * present(a);

    return {(neg_b - sq) / two_a, (neg_b + sq) / two_a};
}

maybe<std::pair<double, double>>
roots_do(double a, double b, double c)
{
    return do_eval(
        [a] { return inverse(2.0 * a); },
        [a, b, c](double) { return checked_sqrt(discriminant(a, b, c)); },
        [b](double inv, double sq) {
            return std::make_pair((-b - sq) * inv, (-b + sq) * inv);
        });
}

maybe<std::pair<double, double>>
roots_lifted(double a, double b, double c)
{
    auto solve = lift([b](double sq, double inv) {
        return std::make_pair((-b - sq) * inv, (-b + sq) * inv);
    });

    return solve(checked_sqrt(discriminant(a, b, c)), inverse(2.0 * a));
}

}  // namespace liftopt::quadratic
