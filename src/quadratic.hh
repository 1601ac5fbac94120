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

#ifndef liftopt_quadratic_hh
#define liftopt_quadratic_hh

#include <utility>

#include "base/maybe.hh"

namespace liftopt::quadratic {

/**
 * The real square root, absent for negative numbers.
 */
maybe<double> checked_sqrt(double x);

/**
 * 1 / x, absent for zero.
 */
maybe<double> inverse(double x);

/**
 * The roots of a*x^2 + b*x + c, smallest first when a is positive, computed
 * with the lifted arithmetic operators.  Both roots are absent when the
 * discriminant is negative or when a is zero.
 */
std::pair<maybe<double>, maybe<double>> roots(double a, double b, double c);

/**
 * The same roots computed as a single "do" block, so the pair is either
 * entirely present or absent.
 */
maybe<std::pair<double, double>> roots_do(double a, double b, double c);

/**
 * The same roots computed by lifting a function of the square root of the
 * discriminant and of 1 / 2a.
 */
maybe<std::pair<double, double>> roots_lifted(double a, double b, double c);

}  // namespace liftopt::quadratic

#endif
