/**
 * Copyright (c) 2017 Melown Technologies SE
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * *  Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * *  Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED.  IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */
#ifndef toastlibs_storage_range_hpp_included_
#define toastlibs_storage_range_hpp_included_

#include <algorithm>

namespace toastlibs { namespace storage {

//! Closed value range, empty when max < min
template<typename T>
struct Range
{
    typedef T value_type;
    T min, max;

    Range() : min(), max() {}
    Range(T l) : min(l), max(l) {}
    Range(T min, T max) : min(min), max(max) {}

    bool empty() const { return max < min; }

    bool operator==(const Range &o) const {
        return (min == o.min) && (max == o.max);
    }

    bool operator!=(const Range &o) const { return !operator==(o); }

    static Range emptyRange() { return { T(1), T(0) }; }
};

template<typename T>
inline Range<T> unite(const Range<T> &l, const Range<T> &r)
{
    if (l.empty()) { return r; }
    if (r.empty()) { return l; }
    return { std::min(l.min, r.min), std::max(l.max, r.max) };
}

/** Extends range to contain given value.
 */
template<typename T>
inline void update(Range<T> &r, const T &v)
{
    if (r.empty()) { r = { v }; return; }
    r.min = std::min(r.min, v);
    r.max = std::max(r.max, v);
}

} } // namespace toastlibs::storage

#endif // toastlibs_storage_range_hpp_included_
