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

#ifndef liftopt_lift_hh
#define liftopt_lift_hh

#include <optional>
#include <type_traits>
#include <utility>

#include "func_util.hh"
#include "maybe.hh"
#include "opt_util.hh"

namespace liftopt {
namespace detail {

/**
 * How a lifted function sees one of its arguments.  Anything that is not a
 * maybe or a std::optional is a plain value and always present.
 */
template<typename T>
struct lift_arg {
    using value_type = T;

    static bool is_absent(const T&) { return false; }

    static const T& get(const T& value) { return value; }
};

template<typename T>
struct lift_arg<maybe<T>> {
    using value_type = T;

    static bool is_absent(const maybe<T>& m) { return m.is_absent(); }

    static const T& get(const maybe<T>& m) { return m.unwrap(); }
};

template<typename T>
struct lift_arg<std::optional<T>> {
    using value_type = T;

    static bool is_absent(const std::optional<T>& opt)
    {
        return !opt.has_value();
    }

    static const T& get(const std::optional<T>& opt) { return unwrap(opt); }
};

/**
 * How the result of a base function is brought back into a maybe.  Results
 * that are already optional are passed through so a lifted function never
 * produces a maybe<maybe<R>>.
 */
template<typename R>
struct lift_result {
    using type = maybe<R>;

    template<typename U>
    static type wrap(U&& value)
    {
        return present(std::forward<U>(value));
    }
};

template<typename R>
struct lift_result<maybe<R>> {
    using type = maybe<R>;

    template<typename U>
    static type wrap(U&& value)
    {
        return std::forward<U>(value);
    }
};

template<typename R>
struct lift_result<std::optional<R>> {
    using type = maybe<R>;

    template<typename U>
    static type wrap(U&& value)
    {
        return to_maybe(std::forward<U>(value));
    }
};

template<typename F, typename... Args>
using lifted_result_t = typename lift_result<func::invoke_result_t<
    const F&,
    decltype(lift_arg<Args>::get(std::declval<const Args&>()))...>>::type;

template<typename F, typename... Args>
lifted_result_t<F, Args...>
invoke_wrapped(const F& func, const Args&... args)
{
    using result_type = func::invoke_result_t<
        const F&,
        decltype(lift_arg<Args>::get(std::declval<const Args&>()))...>;

    return lift_result<result_type>::wrap(
        func::invoke(func, lift_arg<Args>::get(args)...));
}

template<typename T>
maybe<typename lift_arg<T>::value_type>
as_maybe(const T& value)
{
    if (lift_arg<T>::is_absent(value)) {
        return nothing;
    }

    return present(lift_arg<T>::get(value));
}

}  // namespace detail

/**
 * A function over plain values turned into a function over possibly absent
 * values.  The result is absent when any argument is absent, otherwise it is
 * the base function's result.  A lifted function only holds a copy of the
 * base function, so two liftings of the same function are interchangeable.
 */
template<typename F>
class lifted {
public:
    explicit constexpr lifted(F func) : l_func(std::move(func)) {}

    template<typename... Args>
    detail::lifted_result_t<F, Args...> operator()(const Args&... args) const
    {
        if ((detail::lift_arg<Args>::is_absent(args) || ...)) {
            return nothing;
        }

        return detail::invoke_wrapped(this->l_func, args...);
    }

    const F& base() const { return this->l_func; }

private:
    F l_func;
};

/**
 * Lift a unary or n-ary function.
 *
 *   auto inv = lift([](double d) { return 1.0 / d; });
 *   inv(present(4.0)) == present(0.25)
 *   inv(absent<double>()) == nothing
 */
template<typename F>
constexpr lifted<std::decay_t<F>>
lift(F&& func)
{
    return lifted<std::decay_t<F>>(std::forward<F>(func));
}

/**
 * Lift one of the operator function objects from ops.hh.
 */
template<typename Op>
constexpr lifted<Op>
lift_operator(Op op = Op{})
{
    return lifted<Op>(std::move(op));
}

}  // namespace liftopt

#endif
