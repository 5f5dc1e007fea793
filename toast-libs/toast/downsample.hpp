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
/**
 * \file toast/downsample.hpp
 *
 * Derivation of parent tile from its four children.
 */

#ifndef toastlibs_toast_downsample_hpp_included_
#define toastlibs_toast_downsample_hpp_included_

#include <array>
#include <functional>

#include <boost/optional.hpp>

#include "image.hpp"

namespace toastlibs { namespace toast {

/** Child images indexed by child index (ul, ur, ll, lr); absent child is
 *  none.
 */
typedef std::array<boost::optional<TileImage>, 4> ChildImages;

/** Reduces 2N x 2N maskable buffer to N x N image of the same mode.
 */
typedef std::function<TileImage(const TileImage &buffer)> Merger;

/** Places children into one maskable buffer twice their size.
 *
 *  With paritySign -1 (row 0 at the top) upper-left child goes to the
 *  top-left quarter; with paritySign +1 (row 0 at the bottom) rows of
 *  quarters are swapped. Absent children leave no-data in their quarter.
 *
 *  Throws storage::InconsistentInput when children differ in size or mix
 *  floating point and 8-bit modes, or when there is no child at all.
 */
TileImage assemble(const ChildImages &children, int paritySign);

/** Mean of each 2x2 block over valid pixels, per channel. Block without
 *  valid pixel yields no-data; 8-bit values are rounded to nearest.
 */
TileImage averagingMerger(const TileImage &buffer);

/** First valid pixel of each 2x2 block (in ul, ur, ll, lr order).
 */
TileImage decimatingMerger(const TileImage &buffer);

/** Assembles children and merges them into one parent tile.
 */
TileImage downsample(const ChildImages &children, int paritySign
                     , const Merger &merger = averagingMerger);

} } // namespace toastlibs::toast

#endif // toastlibs_toast_downsample_hpp_included_
