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

#ifndef liftopt_checked_seq_hh
#define liftopt_checked_seq_hh

#include <sys/types.h>

#include <initializer_list>
#include <utility>
#include <vector>

#include "base/maybe.hh"

namespace liftopt {

/**
 * A sequence whose element access returns an absent value instead of
 * failing when the index is out of range.
 */
template<typename T>
class checked_seq {
public:
    checked_seq() = default;

    explicit checked_seq(std::vector<T> elems) : cs_elems(std::move(elems)) {}

    checked_seq(std::initializer_list<T> elems) : cs_elems(elems) {}

    maybe<T> get(ssize_t index) const
    {
        if (!this->in_range(index)) {
            return nothing;
        }

        return present(this->cs_elems[index]);
    }

    maybe<T> get(const maybe<ssize_t>& index) const
    {
        return index.and_then([this](ssize_t i) { return this->get(i); });
    }

    maybe<T> operator[](ssize_t index) const { return this->get(index); }

    maybe<T> operator[](const maybe<ssize_t>& index) const
    {
        return this->get(index);
    }

    /**
     * Store a present value at the given index.  Absent values and indexes
     * that are out of range leave the sequence unchanged.
     */
    void set(ssize_t index, const maybe<T>& value)
    {
        if (!this->in_range(index) || value.is_absent()) {
            return;
        }

        this->cs_elems[index] = value.unwrap();
    }

    void set(const maybe<ssize_t>& index, const maybe<T>& value)
    {
        if (index.is_absent()) {
            return;
        }

        this->set(index.unwrap(), value);
    }

    size_t size() const { return this->cs_elems.size(); }

    const std::vector<T>& values() const { return this->cs_elems; }

private:
    bool in_range(ssize_t index) const
    {
        return 0 <= index && (size_t) index < this->cs_elems.size();
    }

    std::vector<T> cs_elems;
};

}  // namespace liftopt

#endif
