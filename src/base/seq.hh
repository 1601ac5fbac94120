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

#ifndef liftopt_seq_hh
#define liftopt_seq_hh

#include <functional>
#include <tuple>
#include <utility>
#include <vector>

#include "func_util.hh"
#include "lift.hh"
#include "maybe.hh"

namespace liftopt {
namespace detail {

template<typename Step, typename... Bound>
using step_result_t = typename lift_result<
    func::invoke_result_t<Step&, const Bound&...>>::type;

template<typename Step, typename... Bound>
step_result_t<Step, Bound...>
run_step(Step& step, const std::tuple<Bound...>& bound)
{
    using raw_type = func::invoke_result_t<Step&, const Bound&...>;

    return lift_result<raw_type>::wrap(std::apply(step, bound));
}

template<typename... Bound, typename Last>
auto
do_eval_impl(const std::tuple<Bound...>& bound, Last& last)
    -> step_result_t<Last, Bound...>
{
    return run_step(last, bound);
}

template<typename... Bound, typename Step, typename Next, typename... Rest>
auto
do_eval_impl(const std::tuple<Bound...>& bound,
             Step& step,
             Next& next,
             Rest&... rest)
{
    using value_type = typename step_result_t<Step, Bound...>::value_type;
    using next_bound = std::tuple<Bound..., value_type>;
    using result_type = decltype(do_eval_impl(
        std::declval<const next_bound&>(), next, rest...));

    auto res = run_step(step, bound);
    if (res.is_absent()) {
        return result_type{nothing};
    }

    return do_eval_impl(
        std::tuple_cat(bound, std::make_tuple(std::move(res).unwrap())),
        next,
        rest...);
}

}  // namespace detail

/**
 * Evaluate a "do" block.  The first step takes no arguments and every later
 * step receives the values produced by all the steps before it, in order.
 * Steps may return plain values, which count as present, or maybe values.
 * The first absent value stops the evaluation, the remaining steps are not
 * called, and the whole block is absent.
 *
 *   do_eval([] { return inverse(2 * a); },
 *           [&](double) { return checked_sqrt(disc); },
 *           [&](double inv, double sq) { return (-b + sq) * inv; });
 */
template<typename... Steps>
auto
do_eval(Steps... steps)
{
    static_assert(sizeof...(Steps) > 0, "a do block needs at least one step");

    return detail::do_eval_impl(std::tuple<>{}, steps...);
}

/**
 * Thread a value through a series of functions, each receiving the previous
 * result.  Evaluation stops at the first absent value.
 */
template<typename T>
maybe<T>
chain(const maybe<T>& value)
{
    return value;
}

template<typename T, typename F, typename... Rest>
auto
chain(const maybe<T>& value, F func, Rest... rest)
{
    return chain(lift(std::move(func))(value), std::move(rest)...);
}

/**
 * A sequence of steps built at runtime.  Every step maps a T to a maybe<T>
 * and run() stops at the first absent value.
 */
template<typename T>
class sequence {
public:
    using step_type = std::function<maybe<T>(const T&)>;

    template<typename F>
    sequence& then(F func)
    {
        this->s_steps.emplace_back(
            [func = std::move(func)](const T& value) -> maybe<T> {
                return detail::invoke_wrapped(func, value);
            });

        return *this;
    }

    maybe<T> run(maybe<T> initial) const
    {
        auto retval = std::move(initial);

        for (const auto& step : this->s_steps) {
            if (retval.is_absent()) {
                break;
            }
            retval = step(retval.unwrap());
        }

        return retval;
    }

    size_t size() const { return this->s_steps.size(); }

private:
    std::vector<step_type> s_steps;
};

}  // namespace liftopt

#endif
