/**
 * Copyright (c) 2021, Timothy Stack
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

#ifndef liftopt_itertools_hh
#define liftopt_itertools_hh

#include <algorithm>
#include <iterator>
#include <type_traits>
#include <vector>

#include "fold.hh"
#include "func_util.hh"
#include "maybe.hh"

namespace liftopt::itertools {

namespace details {

template<typename T>
struct unwrap_or {
    T uo_value;
};

template<typename F>
struct mapper {
    F m_func;
};

template<typename F>
struct flat_mapper {
    F fm_func;
};

template<typename F>
struct for_eacher {
    F fe_func;
};

template<typename F>
struct present_folder {
    F pf_func;
};

struct present_values {};

}  // namespace details

template<typename T>
inline details::unwrap_or<T>
unwrap_or(T value)
{
    return details::unwrap_or<T>{
        value,
    };
}

template<typename F>
inline details::mapper<F>
map(F func)
{
    return details::mapper<F>{func};
}

template<typename F>
inline details::flat_mapper<F>
flat_map(F func)
{
    return details::flat_mapper<F>{func};
}

template<typename F>
inline details::for_eacher<F>
for_each(F func)
{
    return details::for_eacher<F>{func};
}

/**
 * Fold the present values of a container with liftopt::fold().
 */
template<typename F>
inline details::present_folder<F>
fold_present(F func)
{
    return details::present_folder<F>{func};
}

inline details::present_values
present_values()
{
    return details::present_values{};
}

}  // namespace liftopt::itertools

template<typename T>
T
operator|(const liftopt::maybe<T>& in,
          const liftopt::itertools::details::unwrap_or<T>& unwrapper)
{
    return in.unwrap_or(unwrapper.uo_value);
}

template<typename T,
         typename F,
         std::enable_if_t<liftopt::func::is_invocable<F, T>::value, int> = 0>
auto
operator|(const liftopt::maybe<T>& in,
          const liftopt::itertools::details::mapper<F>& mapper)
{
    return in.map(mapper.m_func);
}

template<typename T,
         typename F,
         std::enable_if_t<liftopt::func::is_invocable<F, T>::value, int> = 0>
auto
operator|(const liftopt::maybe<T>& in,
          const liftopt::itertools::details::flat_mapper<F>& mapper)
{
    return in.and_then(mapper.fm_func);
}

template<typename T,
         typename F,
         std::enable_if_t<liftopt::func::is_invocable<F, T>::value, int> = 0>
void
operator|(const liftopt::maybe<T>& in,
          const liftopt::itertools::details::for_eacher<F>& eacher)
{
    if (in.is_absent()) {
        return;
    }

    liftopt::func::invoke(eacher.fe_func, in.unwrap());
}

template<typename T,
         typename F,
         std::enable_if_t<liftopt::func::is_invocable<F, T>::value, int> = 0>
void
operator|(const std::vector<T>& in,
          const liftopt::itertools::details::for_eacher<F>& eacher)
{
    for (auto& elem : in) {
        liftopt::func::invoke(eacher.fe_func, elem);
    }
}

template<typename T, typename F>
auto
operator|(const std::vector<T>& in,
          const liftopt::itertools::details::mapper<F>& mapper)
    -> std::vector<std::remove_const_t<
        std::remove_reference_t<decltype(mapper.m_func(std::declval<T>()))>>>
{
    using return_type = std::vector<std::remove_const_t<
        std::remove_reference_t<decltype(mapper.m_func(std::declval<T>()))>>>;
    return_type retval;

    retval.reserve(in.size());
    std::transform(
        in.begin(), in.end(), std::back_inserter(retval), mapper.m_func);

    return retval;
}

template<typename T>
std::vector<T>
operator|(const std::vector<liftopt::maybe<T>>& in,
          liftopt::itertools::details::present_values)
{
    std::vector<T> retval;

    for (const auto& elem : in) {
        if (elem.is_present()) {
            retval.emplace_back(elem.unwrap());
        }
    }

    return retval;
}

template<typename T, typename F>
liftopt::maybe<T>
operator|(const std::vector<liftopt::maybe<T>>& in,
          const liftopt::itertools::details::present_folder<F>& folder)
{
    return liftopt::fold(folder.pf_func, in);
}

#endif
