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

#ifndef liftopt_heap_ops_hh
#define liftopt_heap_ops_hh

#include <sys/types.h>

#include "base/fold.hh"
#include "base/maybe.hh"
#include "base/ops.hh"
#include "checked_seq.hh"

namespace liftopt::heap {

/**
 * Child indexes are absent for a negative parent or when the index does not
 * fit in ssize_t.
 */
inline maybe<ssize_t>
left_child(ssize_t parent)
{
    if (parent < 0) {
        return nothing;
    }

    return present(parent) * ssize_t{2} + ssize_t{1};
}

inline maybe<ssize_t>
right_child(ssize_t parent)
{
    if (parent < 0) {
        return nothing;
    }

    return present(parent) * ssize_t{2} + ssize_t{2};
}

/**
 * One step of a min-heap sift-down: swap the element at `parent` with a
 * strictly smaller child.  Missing children never win a comparison and
 * equal children leave the element in place.
 *
 * @return The index the element moved to, or nothing if it stayed.
 */
template<typename T>
maybe<ssize_t>
swap_down(ssize_t parent, checked_seq<T>& seq)
{
    auto me = seq[parent];

    if (me.is_absent()) {
        return nothing;
    }

    auto left_index = left_child(parent);
    auto right_index = right_child(parent);
    auto left = seq[left_index];
    auto right = seq[right_index];

    if ((left < me).unwrap_or(false) && (left < right).unwrap_or(true)) {
        seq.set(parent, left);
        seq.set(left_index, me);
        return left_index;
    }
    if ((right < me).unwrap_or(false) && (right < left).unwrap_or(true)) {
        seq.set(parent, right);
        seq.set(right_index, me);
        return right_index;
    }

    return nothing;
}

/**
 * Move the element at `parent` down until neither child is smaller.
 *
 * @return The final index of the element.
 */
template<typename T>
ssize_t
sift_down(ssize_t parent, checked_seq<T>& seq)
{
    auto retval = parent;

    for (auto next = swap_down(retval, seq); next.is_present();
         next = swap_down(retval, seq))
    {
        retval = next.unwrap();
    }

    return retval;
}

/**
 * The smallest of the children of `parent`, absent for a leaf.
 */
template<typename T>
maybe<T>
min_child(ssize_t parent, const checked_seq<T>& seq)
{
    return fold(
        [](const T& lhs, const T& rhs) { return rhs < lhs ? rhs : lhs; },
        seq[left_child(parent)],
        seq[right_child(parent)]);
}

}  // namespace liftopt::heap

#endif
