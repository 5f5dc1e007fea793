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
#include <algorithm>

#include "dbglog/dbglog.hpp"

#include "pyramid.hpp"
#include "tileop.hpp"
#include "error.hpp"
#include "io.hpp"

namespace toastlibs { namespace toast {

namespace {

void checkDepth(Lod depth)
{
    if (depth > MaxLod) {
        LOGTHROW(err1, ConfigurationError)
            << "Pyramid depth " << depth << " exceeds maximum lod "
            << MaxLod << ".";
    }
}

void checkFilter(PyramidMode mode, const TileFilter::pointer &filter)
{
    if ((mode == PyramidMode::generic) && filter && filter->spatial()) {
        LOGTHROW(err1, ConfigurationError)
            << "Spatial filter cannot be used with a generic pyramid.";
    }
}

/** Sum of 4^l for l in [from, to).
 */
std::uint64_t levelSum(Lod from, Lod to)
{
    std::uint64_t sum(0);
    for (Lod lod(from); lod < to; ++lod) { sum += lodTileCount(lod); }
    return sum;
}

} // namespace

Pyramid::Pyramid(PyramidMode mode, Lod depth, const TileId &root
                 , const TileFilter::pointer &filter)
    : mode_(mode), depth_(depth), root_(root), filter_(filter)
{
    checkDepth(depth_);
    checkFilter(mode_, filter_);
}

Pyramid Pyramid::generic(Lod depth, const TileFilter::pointer &filter)
{
    return Pyramid(PyramidMode::generic, depth, TileId(), filter);
}

Pyramid Pyramid::toast(Lod depth)
{
    return Pyramid(PyramidMode::toast, depth, TileId(), nullptr);
}

Pyramid Pyramid::toastFiltered(Lod depth, const TileFilter::pointer &filter)
{
    return Pyramid(PyramidMode::toast, depth, TileId(), filter);
}

Pyramid Pyramid::truncated(Lod depth) const
{
    if (depth < root_.lod) {
        LOGTHROW(err1, ConfigurationError)
            << "Cannot truncate pyramid rooted at " << root_
            << " to depth " << depth << ".";
    }
    return Pyramid(mode_, depth, root_, filter_);
}

bool Pyramid::contains(const TileId &tileId) const
{
    return (valid(tileId) && (tileId.lod <= depth_)
            && above(tileId, root_) && check(filter_, tileId));
}

Pyramid subpyramid(const Pyramid &pyramid, const TileId &root)
{
    if (!valid(root) || (root.lod > pyramid.depth())) {
        LOGTHROW(err1, ConfigurationError)
            << "Tile " << root << " cannot be a root of subpyramid of depth "
            << pyramid.depth() << ".";
    }

    if (!above(root, pyramid.root())) {
        LOGTHROW(err1, ConfigurationError)
            << "Tile " << root << " lies outside of pyramid rooted at "
            << pyramid.root() << ".";
    }

    return Pyramid(pyramid.mode(), pyramid.depth(), root, pyramid.filter());
}

Walker::Walker(const Pyramid &pyramid, WalkMode mode
               , const TileFilter::pointer &filter)
    : depth_(pyramid.depth()), mode_(mode), filter_(pyramid.filter())
    , extra_(filter)
{
    checkFilter(pyramid.mode(), extra_);

    if (check(pyramid.root())) { stack_.emplace_back(pyramid.root()); }
}

bool Walker::check(const TileId &tileId) const
{
    return toast::check(filter_, tileId) && toast::check(extra_, tileId);
}

boost::optional<TileId> Walker::next()
{
    while (!stack_.empty()) {
        auto &top(stack_.back());

        if (top.expanded || (top.tileId.lod >= depth_)) {
            const auto tileId(top.tileId);
            stack_.pop_back();

            if ((mode_ == WalkMode::allLevels) || (tileId.lod == depth_)) {
                return tileId;
            }
            continue;
        }

        top.expanded = true;
        const auto tileId(top.tileId);

        // push in reverse order to get upper-left child first
        const auto kids(children(tileId));
        for (auto ikids(kids.rbegin()), ekids(kids.rend());
             ikids != ekids; ++ikids)
        {
            if (check(*ikids)) { stack_.emplace_back(*ikids); }
        }
    }

    return boost::none;
}

Walker walk(const Pyramid &pyramid, WalkMode mode
            , const TileFilter::pointer &filter)
{
    return Walker(pyramid, mode, filter);
}

std::uint64_t countLiveTiles(const Pyramid &pyramid, WalkMode mode
                             , const TileFilter::pointer &filter)
{
    if (!pyramid.filter() && !filter) {
        const Lod levels(pyramid.depth() - pyramid.root().lod);
        return ((mode == WalkMode::bottomOnly)
                ? lodTileCount(levels) : depth2tiles(levels));
    }

    std::uint64_t count(0);
    auto walker(walk(pyramid, mode, filter));
    while (walker.next()) { ++count; }
    return count;
}

std::uint64_t countOperations(const Pyramid &pyramid, bool baseLevelOnly
                              , const boost::optional<Lod> &topLayer)
{
    const auto sampling(countLiveTiles(pyramid, WalkMode::bottomOnly));
    if (baseLevelOnly) { return sampling; }

    const auto &root(pyramid.root());
    const Lod stop(std::max(root.lod, topLayer ? *topLayer : Lod(0)));
    if (stop >= pyramid.depth()) { return sampling; }

    if (!pyramid.filter()) {
        return sampling + levelSum(stop - root.lod
                                   , pyramid.depth() - root.lod);
    }

    std::uint64_t downsampling(0);
    auto walker(walk(pyramid.truncated(pyramid.depth() - 1)
                     , WalkMode::allLevels));
    while (const auto tileId = walker.next()) {
        if (tileId->lod >= stop) { ++downsampling; }
    }
    return sampling + downsampling;
}

TileId quadrant(const TileId &tileId)
{
    if (tileId.lod <= 1) { return tileId; }
    return parent(tileId, tileId.lod - 1);
}

} } // namespace toastlibs::toast
