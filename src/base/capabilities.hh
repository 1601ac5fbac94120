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

#ifndef liftopt_capabilities_hh
#define liftopt_capabilities_hh

#include <cmath>
#include <limits>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace liftopt {

/**
 * Default definitions of the two numeric operations that have no C++
 * operator.  User types provide their own `pow(T, T)` and `floor_div(T, T)`
 * in their namespace and they are picked up by argument-dependent lookup.
 */
namespace arith {

/**
 * Integer power by squaring.
 *
 * @param exp The exponent, must not be negative.
 * @return The power or nullopt if an intermediate product does not fit in T.
 */
template<typename T>
std::enable_if_t<std::is_integral<T>::value, std::optional<T>>
checked_pow(T base, T exp)
{
    T retval = 1;

    while (exp > 0) {
        if ((exp & 1) && __builtin_mul_overflow(retval, base, &retval)) {
            return std::nullopt;
        }
        exp >>= 1;
        if (exp > 0 && __builtin_mul_overflow(base, base, &base)) {
            return std::nullopt;
        }
    }

    return retval;
}

/**
 * Integer power for results known to fit in T.
 */
template<typename T>
std::enable_if_t<std::is_integral<T>::value, T>
pow(T base, T exp)
{
    T retval = 1;

    while (exp > 0) {
        if (exp & 1) {
            retval *= base;
        }
        exp >>= 1;
        if (exp > 0) {
            base *= base;
        }
    }

    return retval;
}

template<typename T>
std::enable_if_t<std::is_floating_point<T>::value, T>
pow(T base, T exp)
{
    return std::pow(base, exp);
}

/**
 * Division that rounds toward negative infinity, so -7 floor_div 2 is -4.
 * The quotient must be representable: rhs is not zero and, for signed T,
 * the division is not min() / -1.
 */
template<typename T>
std::enable_if_t<std::is_integral<T>::value, T>
floor_div(T lhs, T rhs)
{
    T retval = lhs / rhs;

    if ((lhs % rhs != 0) && ((lhs < 0) != (rhs < 0))) {
        retval -= 1;
    }

    return retval;
}

template<typename T>
std::enable_if_t<std::is_floating_point<T>::value, T>
floor_div(T lhs, T rhs)
{
    return std::floor(lhs / rhs);
}

}  // namespace arith

namespace detail {

template<typename T>
struct is_signed_integral
    : std::bool_constant<std::is_integral<T>::value
                         && std::is_signed<T>::value> {};

/**
 * True for the one signed quotient that overflows.
 */
template<typename T>
bool
quotient_overflows(const T& lhs, const T& rhs)
{
    if constexpr (is_signed_integral<T>::value) {
        return lhs == std::numeric_limits<T>::min() && rhs == T(-1);
    } else {
        return false;
    }
}

using arith::floor_div;
using arith::pow;

template<typename T>
auto
power(const T& base, const T& exp) -> decltype(pow(base, exp))
{
    return pow(base, exp);
}

template<typename T>
auto
floor_divide(const T& lhs, const T& rhs) -> decltype(floor_div(lhs, rhs))
{
    return floor_div(lhs, rhs);
}

template<typename T>
using lt_result_t = decltype(std::declval<const T&>() < std::declval<const T&>());

template<typename T>
using eq_result_t
    = decltype(std::declval<const T&>() == std::declval<const T&>());

template<typename T>
using numeric_results_t = std::tuple<
    decltype(-std::declval<const T&>()),
    decltype(std::declval<const T&>() + std::declval<const T&>()),
    decltype(std::declval<const T&>() - std::declval<const T&>()),
    decltype(std::declval<const T&>() * std::declval<const T&>()),
    decltype(std::declval<const T&>() / std::declval<const T&>()),
    decltype(power(std::declval<const T&>(), std::declval<const T&>())),
    decltype(floor_divide(std::declval<const T&>(), std::declval<const T&>()))>;

template<typename T, typename Tuple>
struct all_convertible;

template<typename T, typename... Results>
struct all_convertible<T, std::tuple<Results...>>
    : std::conjunction<std::is_convertible<Results, T>...> {};

}  // namespace detail

/**
 * A type is comparable when it has a less-than relation to itself whose
 * result can be used as a bool.
 */
template<typename T, typename = void>
struct is_comparable : std::false_type {};

template<typename T>
struct is_comparable<
    T,
    std::enable_if_t<std::is_convertible<detail::lt_result_t<T>, bool>::value>>
    : std::true_type {};

template<typename T, typename = void>
struct is_equality_comparable : std::false_type {};

template<typename T>
struct is_equality_comparable<
    T,
    std::enable_if_t<std::is_convertible<detail::eq_result_t<T>, bool>::value>>
    : std::true_type {};

/**
 * A type is numeric when negation, addition, subtraction, multiplication,
 * power, true division and floor division are all closed over it.
 */
template<typename T, typename = void>
struct is_numeric : std::false_type {};

template<typename T>
struct is_numeric<T, std::void_t<detail::numeric_results_t<T>>>
    : std::bool_constant<!std::is_same<std::decay_t<T>, bool>::value
                         && detail::all_convertible<
                             T,
                             detail::numeric_results_t<T>>::value> {};

}  // namespace liftopt

#endif
