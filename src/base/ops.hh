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

#ifndef liftopt_ops_hh
#define liftopt_ops_hh

#include <cmath>
#include <limits>
#include <type_traits>

#include "capabilities.hh"
#include "lift.hh"
#include "maybe.hh"

namespace liftopt {
namespace detail {

template<typename T>
struct identity {
    using type = T;
};

template<typename T>
using identity_t = typename identity<T>::type;

}  // namespace detail

/**
 * Function objects for the operators that can be lifted.  They are checked
 * against the capabilities of the operand type when they are instantiated.
 */
namespace ops {

struct less {
    template<typename T>
    bool operator()(const T& lhs, const T& rhs) const
    {
        static_assert(is_comparable<T>::value,
                      "ops::less requires a comparable type");

        return lhs < rhs;
    }
};

struct greater {
    template<typename T>
    bool operator()(const T& lhs, const T& rhs) const
    {
        static_assert(is_comparable<T>::value,
                      "ops::greater requires a comparable type");

        return rhs < lhs;
    }
};

struct less_equal {
    template<typename T>
    bool operator()(const T& lhs, const T& rhs) const
    {
        static_assert(is_comparable<T>::value,
                      "ops::less_equal requires a comparable type");

        return !(rhs < lhs);
    }
};

struct greater_equal {
    template<typename T>
    bool operator()(const T& lhs, const T& rhs) const
    {
        static_assert(is_comparable<T>::value,
                      "ops::greater_equal requires a comparable type");

        return !(lhs < rhs);
    }
};

struct equal_to {
    template<typename T>
    bool operator()(const T& lhs, const T& rhs) const
    {
        static_assert(is_equality_comparable<T>::value,
                      "ops::equal_to requires an equality comparable type");

        return lhs == rhs;
    }
};

/**
 * The arithmetic function objects return absent when a signed integral
 * result does not fit in T.  Unsigned and floating-point arithmetic keeps
 * the usual language semantics.
 */
struct negate {
    template<typename T>
    maybe<T> operator()(const T& value) const
    {
        static_assert(is_numeric<T>::value,
                      "ops::negate requires a numeric type");

        if constexpr (detail::is_signed_integral<T>::value) {
            if (value == std::numeric_limits<T>::min()) {
                return nothing;
            }
        }

        return present(T(-value));
    }
};

struct plus {
    template<typename T>
    maybe<T> operator()(const T& lhs, const T& rhs) const
    {
        static_assert(is_numeric<T>::value,
                      "ops::plus requires a numeric type");

        if constexpr (detail::is_signed_integral<T>::value) {
            T retval = 0;

            if (__builtin_add_overflow(lhs, rhs, &retval)) {
                return nothing;
            }
            return present(retval);
        } else {
            return present(T(lhs + rhs));
        }
    }
};

struct minus {
    template<typename T>
    maybe<T> operator()(const T& lhs, const T& rhs) const
    {
        static_assert(is_numeric<T>::value,
                      "ops::minus requires a numeric type");

        if constexpr (detail::is_signed_integral<T>::value) {
            T retval = 0;

            if (__builtin_sub_overflow(lhs, rhs, &retval)) {
                return nothing;
            }
            return present(retval);
        } else {
            return present(T(lhs - rhs));
        }
    }
};

struct multiplies {
    template<typename T>
    maybe<T> operator()(const T& lhs, const T& rhs) const
    {
        static_assert(is_numeric<T>::value,
                      "ops::multiplies requires a numeric type");

        if constexpr (detail::is_signed_integral<T>::value) {
            T retval = 0;

            if (__builtin_mul_overflow(lhs, rhs, &retval)) {
                return nothing;
            }
            return present(retval);
        } else {
            return present(T(lhs * rhs));
        }
    }
};

/**
 * True division, a zero divisor gives an absent result.
 */
struct divides {
    template<typename T>
    maybe<T> operator()(const T& lhs, const T& rhs) const
    {
        static_assert(is_numeric<T>::value,
                      "ops::divides requires a numeric type");
        static_assert(is_equality_comparable<T>::value,
                      "ops::divides compares the divisor against zero");

        if (rhs == T{} || detail::quotient_overflows(lhs, rhs)) {
            return nothing;
        }

        return present(T(lhs / rhs));
    }
};

struct floor_divides {
    template<typename T>
    maybe<T> operator()(const T& lhs, const T& rhs) const
    {
        static_assert(is_numeric<T>::value,
                      "ops::floor_divides requires a numeric type");
        static_assert(is_equality_comparable<T>::value,
                      "ops::floor_divides compares the divisor against zero");

        if (rhs == T{} || detail::quotient_overflows(lhs, rhs)) {
            return nothing;
        }

        return present(T(detail::floor_divide(lhs, rhs)));
    }
};

/**
 * Raise to a power.  For built-in types the result is absent when it cannot
 * be represented: an integer to a negative power (except for 1 and -1), zero
 * to a negative power, or a floating-point NaN.
 */
struct power {
    template<typename T>
    maybe<T> operator()(const T& base, const T& exp) const
    {
        static_assert(is_numeric<T>::value,
                      "ops::power requires a numeric type");

        if constexpr (std::is_integral<T>::value) {
            if (exp < 0) {
                if (base == 1) {
                    return present(T(1));
                }
                if (base == -1) {
                    return present(T(exp % 2 == 0 ? 1 : -1));
                }
                return nothing;
            }

            return to_maybe(arith::checked_pow(base, exp));
        } else if constexpr (std::is_floating_point<T>::value) {
            if (base == T{} && exp < T{}) {
                return nothing;
            }

            auto retval = detail::power(base, exp);
            if (std::isnan(retval)) {
                return nothing;
            }
            return present(T(retval));
        }

        return present(T(detail::power(base, exp)));
    }
};

}  // namespace ops

template<typename T, std::enable_if_t<is_comparable<T>::value, int> = 0>
maybe<bool>
operator<(const maybe<T>& lhs, const maybe<T>& rhs)
{
    return lift_operator<ops::less>()(lhs, rhs);
}

template<typename T, std::enable_if_t<is_comparable<T>::value, int> = 0>
maybe<bool>
operator>(const maybe<T>& lhs, const maybe<T>& rhs)
{
    return lift_operator<ops::greater>()(lhs, rhs);
}

template<typename T, std::enable_if_t<is_comparable<T>::value, int> = 0>
maybe<bool>
operator<=(const maybe<T>& lhs, const maybe<T>& rhs)
{
    return lift_operator<ops::less_equal>()(lhs, rhs);
}

template<typename T, std::enable_if_t<is_comparable<T>::value, int> = 0>
maybe<bool>
operator>=(const maybe<T>& lhs, const maybe<T>& rhs)
{
    return lift_operator<ops::greater_equal>()(lhs, rhs);
}

template<typename T, std::enable_if_t<is_numeric<T>::value, int> = 0>
maybe<T>
operator-(const maybe<T>& value)
{
    return lift_operator<ops::negate>()(value);
}

template<typename T, std::enable_if_t<is_numeric<T>::value, int> = 0>
maybe<T>
operator+(const maybe<T>& lhs, const maybe<T>& rhs)
{
    return lift_operator<ops::plus>()(lhs, rhs);
}

template<typename T, std::enable_if_t<is_numeric<T>::value, int> = 0>
maybe<T>
operator+(const maybe<T>& lhs, const detail::identity_t<T>& rhs)
{
    return lift_operator<ops::plus>()(lhs, rhs);
}

template<typename T, std::enable_if_t<is_numeric<T>::value, int> = 0>
maybe<T>
operator+(const detail::identity_t<T>& lhs, const maybe<T>& rhs)
{
    return lift_operator<ops::plus>()(lhs, rhs);
}

template<typename T, std::enable_if_t<is_numeric<T>::value, int> = 0>
maybe<T>
operator-(const maybe<T>& lhs, const maybe<T>& rhs)
{
    return lift_operator<ops::minus>()(lhs, rhs);
}

template<typename T, std::enable_if_t<is_numeric<T>::value, int> = 0>
maybe<T>
operator-(const maybe<T>& lhs, const detail::identity_t<T>& rhs)
{
    return lift_operator<ops::minus>()(lhs, rhs);
}

template<typename T, std::enable_if_t<is_numeric<T>::value, int> = 0>
maybe<T>
operator-(const detail::identity_t<T>& lhs, const maybe<T>& rhs)
{
    return lift_operator<ops::minus>()(lhs, rhs);
}

template<typename T, std::enable_if_t<is_numeric<T>::value, int> = 0>
maybe<T>
operator*(const maybe<T>& lhs, const maybe<T>& rhs)
{
    return lift_operator<ops::multiplies>()(lhs, rhs);
}

template<typename T, std::enable_if_t<is_numeric<T>::value, int> = 0>
maybe<T>
operator*(const maybe<T>& lhs, const detail::identity_t<T>& rhs)
{
    return lift_operator<ops::multiplies>()(lhs, rhs);
}

template<typename T, std::enable_if_t<is_numeric<T>::value, int> = 0>
maybe<T>
operator*(const detail::identity_t<T>& lhs, const maybe<T>& rhs)
{
    return lift_operator<ops::multiplies>()(lhs, rhs);
}

template<typename T,
         std::enable_if_t<is_numeric<T>::value
                              && is_equality_comparable<T>::value,
                          int>
         = 0>
maybe<T>
operator/(const maybe<T>& lhs, const maybe<T>& rhs)
{
    return lift_operator<ops::divides>()(lhs, rhs);
}

template<typename T,
         std::enable_if_t<is_numeric<T>::value
                              && is_equality_comparable<T>::value,
                          int>
         = 0>
maybe<T>
operator/(const maybe<T>& lhs, const detail::identity_t<T>& rhs)
{
    return lift_operator<ops::divides>()(lhs, rhs);
}

template<typename T,
         std::enable_if_t<is_numeric<T>::value
                              && is_equality_comparable<T>::value,
                          int>
         = 0>
maybe<T>
operator/(const detail::identity_t<T>& lhs, const maybe<T>& rhs)
{
    return lift_operator<ops::divides>()(lhs, rhs);
}

template<typename T,
         std::enable_if_t<is_numeric<T>::value
                              && is_equality_comparable<T>::value,
                          int>
         = 0>
maybe<T>
floor_div(const maybe<T>& lhs, const maybe<T>& rhs)
{
    return lift_operator<ops::floor_divides>()(lhs, rhs);
}

template<typename T, std::enable_if_t<is_numeric<T>::value, int> = 0>
maybe<T>
pow(const maybe<T>& base, const maybe<T>& exp)
{
    return lift_operator<ops::power>()(base, exp);
}

}  // namespace liftopt

#endif
