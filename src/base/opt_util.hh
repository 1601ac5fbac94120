/**
 * Copyright (c) 2019, Timothy Stack
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

#ifndef liftopt_opt_util_hh
#define liftopt_opt_util_hh

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <stdlib.h>

#include "maybe.hh"

namespace liftopt {
namespace detail {

template<class T>
typename std::enable_if<std::is_void_v<T>, T>::type
void_or_nullopt()
{
    return;
}

template<class T>
typename std::enable_if<not std::is_void_v<T>, T>::type
void_or_nullopt()
{
    return std::nullopt;
}

}  // namespace detail

/**
 * Unwrap a value from one of the "raw" representations of absence used at
 * the edges of a program.  These behave exactly like maybe<T>::unwrap().
 */
template<typename T>
const T&
unwrap(const maybe<T>& m)
{
    return m.unwrap();
}

template<typename T>
const T&
unwrap(const std::optional<T>& opt)
{
    if (!opt.has_value()) {
        throw absent_value_error();
    }

    return *opt;
}

template<typename T>
T&
unwrap(T* ptr)
{
    if (ptr == nullptr) {
        throw absent_value_error();
    }

    return *ptr;
}

template<typename T>
T
unwrap_or(const std::optional<T>& opt, T def)
{
    if (!opt.has_value()) {
        return def;
    }

    return unwrap(opt);
}

template<typename T>
maybe<T>
to_maybe(std::optional<T> opt)
{
    if (!opt.has_value()) {
        return nothing;
    }

    return present(std::move(*opt));
}

/**
 * Copy the value behind a nullable pointer, a null pointer is absent.
 */
template<typename T,
         std::enable_if_t<!std::is_same<std::remove_cv_t<T>, char>::value, int>
         = 0>
maybe<std::remove_cv_t<T>>
from_nullable(T* ptr)
{
    if (ptr == nullptr) {
        return nothing;
    }

    return present(unwrap(ptr));
}

maybe<std::string> from_nullable(const char* str);

maybe<std::string> getenv_opt(const char* name);

/**
 * Parse the whole of `str` as a finite double.  Trailing text, NaN,
 * infinities and values out of the range of double are absent.
 */
maybe<double> scan_double(std::string_view str);

/**
 * Bounds-checked element access, an index outside of the container is
 * absent instead of an error.
 */
template<template<typename, typename...> class C, typename T>
maybe<T>
cget(const C<T>& container, size_t index)
{
    if (index < container.size()) {
        return present(container[index]);
    }

    return nothing;
}

}  // namespace liftopt

template<class T,
         class F,
         std::enable_if_t<liftopt::detail::is_optional<std::decay_t<T>>::value,
                          int>
         = 0>
auto
operator|(T&& t, F f)
    -> decltype(liftopt::detail::void_or_nullopt<decltype(f(
                    std::forward<T>(t).operator*()))>())
{
    using return_type = decltype(f(std::forward<T>(t).operator*()));
    if (t) {
        return f(std::forward<T>(t).operator*());
    }

    return liftopt::detail::void_or_nullopt<return_type>();
}

#endif
