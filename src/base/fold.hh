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

#ifndef liftopt_fold_hh
#define liftopt_fold_hh

#include <array>
#include <iterator>
#include <type_traits>
#include <utility>

#include "func_util.hh"
#include "lift.hh"
#include "maybe.hh"

namespace liftopt {
namespace detail {

template<typename T>
struct is_optional_like
    : std::bool_constant<is_maybe<std::decay_t<T>>::value
                         || is_optional<std::decay_t<T>>::value> {};

template<typename Iter, typename = void>
struct iter_of_optionals : std::false_type {};

template<typename Iter>
struct iter_of_optionals<
    Iter,
    std::void_t<typename std::iterator_traits<Iter>::value_type>>
    : is_optional_like<typename std::iterator_traits<Iter>::value_type> {};

template<typename C, typename = void>
struct container_of_optionals : std::false_type {};

template<typename C>
struct container_of_optionals<
    C,
    std::void_t<decltype(std::begin(std::declval<const C&>())),
                decltype(std::end(std::declval<const C&>()))>>
    : is_optional_like<decltype(*std::begin(std::declval<const C&>()))> {};

}  // namespace detail

/**
 * Left fold over a range of optional values that skips the absent ones.
 *
 * No remaining values gives an absent result and a single remaining value is
 * returned as is.  Otherwise `op` is applied pairwise from the left; if it
 * returns an absent value the fold stops there and the result is absent.
 * `op` may return a plain T, a maybe<T> or a std::optional<T>.
 */
template<typename Op,
         typename Iter,
         std::enable_if_t<detail::iter_of_optionals<Iter>::value, int> = 0>
auto
fold(Op op, Iter first, Iter last) -> maybe<typename detail::lift_arg<
    typename std::iterator_traits<Iter>::value_type>::value_type>
{
    using arg_traits = detail::lift_arg<
        typename std::iterator_traits<Iter>::value_type>;
    using value_type = typename arg_traits::value_type;

    maybe<value_type> retval;

    for (; first != last; ++first) {
        if (arg_traits::is_absent(*first)) {
            continue;
        }

        if (retval.is_absent()) {
            retval = present(arg_traits::get(*first));
            continue;
        }

        maybe<value_type> next
            = detail::invoke_wrapped(op, retval.unwrap(), arg_traits::get(*first));
        if (next.is_absent()) {
            return nothing;
        }
        retval = std::move(next);
    }

    return retval;
}

template<typename Op,
         typename C,
         std::enable_if_t<detail::container_of_optionals<C>::value, int> = 0>
auto
fold(Op op, const C& container)
{
    return fold(std::move(op), std::begin(container), std::end(container));
}

/**
 * Fold over the given arguments, each of which may be a maybe<T>, a
 * std::optional<T> or a plain T.
 */
template<typename Op,
         typename First,
         typename... Rest,
         std::enable_if_t<!detail::iter_of_optionals<First>::value
                              && !detail::container_of_optionals<First>::value,
                          int>
         = 0>
auto
fold(Op op, const First& first, const Rest&... rest)
    -> maybe<typename detail::lift_arg<First>::value_type>
{
    using value_type = typename detail::lift_arg<First>::value_type;

    std::array<maybe<value_type>, 1 + sizeof...(Rest)> args{
        detail::as_maybe(first),
        detail::as_maybe(rest)...,
    };

    return fold(std::move(op), args.begin(), args.end());
}

}  // namespace liftopt

#endif
