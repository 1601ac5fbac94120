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

#ifndef liftopt_maybe_hh
#define liftopt_maybe_hh

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "capabilities.hh"
#include "func_util.hh"

namespace liftopt {

/**
 * Thrown by unwrap() when it is called on an absent value.  Absence itself is
 * never an error, unwrapping without checking first is.
 */
class absent_value_error : public std::logic_error {
public:
    absent_value_error();
};

/**
 * The stateless "no value" marker.  It converts to an absent maybe<T> of any
 * T.
 */
struct nothing_t {
    struct tag {};

    constexpr explicit nothing_t(tag) {}
};

constexpr nothing_t nothing{nothing_t::tag{}};

template<typename T>
class maybe;

namespace detail {

template<class T>
struct is_optional : std::false_type {};

template<class T>
struct is_optional<std::optional<T>> : std::true_type {};

template<class T>
struct is_maybe : std::false_type {};

template<class T>
struct is_maybe<maybe<T>> : std::true_type {};

template<typename T>
struct encodes_absence
    : std::bool_constant<std::is_pointer<T>::value
                         || std::is_null_pointer<T>::value
                         || std::is_same<T, nothing_t>::value
                         || is_optional<T>::value || is_maybe<T>::value> {};

}  // namespace detail

template<typename T>
maybe<std::decay_t<T>> present(T&& value);

/**
 * A value of type T that may be absent.
 *
 * The only accessor that can fail is unwrap(), everything else is expressed
 * through it after checking for absence.  There is deliberately no
 * conversion to bool, test with is_present() or collapse the value with
 * unwrap_or() or match().
 */
template<typename T>
class maybe {
    static_assert(!std::is_reference<T>::value,
                  "maybe<T> cannot hold a reference");
    static_assert(!std::is_void<T>::value, "maybe<void> is not a value");
    static_assert(std::is_same<T, std::remove_cv_t<T>>::value,
                  "maybe<T> values are already immutable, drop the cv");
    static_assert(!detail::encodes_absence<T>::value,
                  "T already has its own way of saying 'no value'");

public:
    using value_type = T;

    maybe() = default;

    maybe(nothing_t) {}

    explicit maybe(const T& value) : m_value(value) {}

    explicit maybe(T&& value) : m_value(std::move(value)) {}

    explicit operator bool() const = delete;

    bool is_present() const { return this->m_value.has_value(); }

    bool is_absent() const { return !this->m_value.has_value(); }

    const T& unwrap() const&
    {
        if (this->is_absent()) {
            throw absent_value_error();
        }

        return *this->m_value;
    }

    T&& unwrap() &&
    {
        if (this->is_absent()) {
            throw absent_value_error();
        }

        return std::move(*this->m_value);
    }

    T unwrap_or(T def) const&
    {
        if (this->is_absent()) {
            return def;
        }

        return this->unwrap();
    }

    T unwrap_or(T def) &&
    {
        if (this->is_absent()) {
            return def;
        }

        return std::move(*this).unwrap();
    }

    /**
     * Apply a plain function to the contained value.
     */
    template<typename F>
    auto map(F&& func) const -> maybe<func::invoke_result_t<F, const T&>>
    {
        if (this->is_absent()) {
            return nothing;
        }

        return present(func::invoke(std::forward<F>(func), this->unwrap()));
    }

    /**
     * Apply a function that can itself fail.
     */
    template<typename F>
    auto and_then(F&& func) const -> func::invoke_result_t<F, const T&>
    {
        static_assert(
            detail::is_maybe<func::invoke_result_t<F, const T&>>::value,
            "and_then() expects a function returning a maybe<R>");

        if (this->is_absent()) {
            return nothing;
        }

        return func::invoke(std::forward<F>(func), this->unwrap());
    }

    template<typename P, typename A>
    auto match(P&& on_present, A&& on_absent) const
        -> std::common_type_t<func::invoke_result_t<P, const T&>,
                              func::invoke_result_t<A>>
    {
        if (this->is_absent()) {
            return func::invoke(std::forward<A>(on_absent));
        }

        return func::invoke(std::forward<P>(on_present), this->unwrap());
    }

    std::optional<T> to_optional() const
    {
        if (this->is_absent()) {
            return std::nullopt;
        }

        return this->unwrap();
    }

private:
    std::optional<T> m_value;
};

template<typename T>
maybe<std::decay_t<T>>
present(T&& value)
{
    return maybe<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T>
maybe<T>
absent()
{
    return nothing;
}

template<typename T,
         std::enable_if_t<is_equality_comparable<T>::value, int> = 0>
bool
operator==(const maybe<T>& lhs, const maybe<T>& rhs)
{
    if (lhs.is_absent() || rhs.is_absent()) {
        return lhs.is_absent() && rhs.is_absent();
    }

    return lhs.unwrap() == rhs.unwrap();
}

template<typename T,
         std::enable_if_t<is_equality_comparable<T>::value, int> = 0>
bool
operator!=(const maybe<T>& lhs, const maybe<T>& rhs)
{
    return !(lhs == rhs);
}

template<typename T>
bool
operator==(const maybe<T>& lhs, nothing_t)
{
    return lhs.is_absent();
}

template<typename T>
bool
operator==(nothing_t, const maybe<T>& rhs)
{
    return rhs.is_absent();
}

template<typename T>
bool
operator!=(const maybe<T>& lhs, nothing_t)
{
    return lhs.is_present();
}

template<typename T>
bool
operator!=(nothing_t, const maybe<T>& rhs)
{
    return rhs.is_present();
}

}  // namespace liftopt

#endif
