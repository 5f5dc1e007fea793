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
 * \file toast/pyramid.hpp
 *
 * Logical tile pyramid (quadtree over TileIds) and its traversal.
 *
 * Nothing is materialized: tree structure is computed from tile coordinates.
 */

#ifndef toastlibs_toast_pyramid_hpp_included_
#define toastlibs_toast_pyramid_hpp_included_

#include <cstdint>
#include <vector>

#include <boost/optional.hpp>

#include "utility/enum-io.hpp"

#include "basetypes.hpp"
#include "filter.hpp"

namespace toastlibs { namespace toast {

enum class PyramidMode {
    generic  //!< pure quadtree, no projection bound in
    , toast  //!< TOAST projection bound in, spatial filters allowed
};

enum class WalkMode {
    bottomOnly   //!< only tiles at pyramid's depth
    , allLevels  //!< all tiles, children before their parent
};

/** Immutable pyramid description: depth, root of (sub)tree and optional
 *  filter.
 */
class Pyramid {
public:
    /** Plain quadtree of given depth. Spatial filter is refused with
     *  ConfigurationError.
     */
    static Pyramid generic(Lod depth
                           , const TileFilter::pointer &filter = nullptr);

    /** Whole-sky TOAST pyramid.
     */
    static Pyramid toast(Lod depth);

    /** TOAST pyramid restricted by a filter.
     */
    static Pyramid toastFiltered(Lod depth
                                 , const TileFilter::pointer &filter);

    PyramidMode mode() const { return mode_; }
    Lod depth() const { return depth_; }
    const TileId& root() const { return root_; }
    const TileFilter::pointer& filter() const { return filter_; }

    /** Same pyramid cut at given (shallower) depth.
     */
    Pyramid truncated(Lod depth) const;

    /** Returns true if tile lies in this pyramid and passes its filter.
     */
    bool contains(const TileId &tileId) const;

private:
    Pyramid(PyramidMode mode, Lod depth, const TileId &root
            , const TileFilter::pointer &filter);

    friend Pyramid subpyramid(const Pyramid &pyramid, const TileId &root);

    PyramidMode mode_;
    Lod depth_;
    TileId root_;
    TileFilter::pointer filter_;
};

/** Restricts pyramid to given tile's subtree, keeping depth.
 *
 *  Throws ConfigurationError if root lies below pyramid's depth or outside of
 *  pyramid's current root subtree.
 */
Pyramid subpyramid(const Pyramid &pyramid, const TileId &root);

/** Lazy depth-first post-order traversal.
 *
 *  Siblings are yielded as a contiguous group; in allLevels mode parent is
 *  yielded right after its children. Rejected tile prunes its whole subtree.
 */
class Walker {
public:
    Walker(const Pyramid &pyramid, WalkMode mode
           , const TileFilter::pointer &filter = nullptr);

    /** Next tile or none when finished.
     */
    boost::optional<TileId> next();

private:
    struct Entry {
        TileId tileId;
        bool expanded;

        Entry(const TileId &tileId) : tileId(tileId), expanded(false) {}
    };

    bool check(const TileId &tileId) const;

    Lod depth_;
    WalkMode mode_;
    TileFilter::pointer filter_;
    TileFilter::pointer extra_;
    std::vector<Entry> stack_;
};

/** Starts a walk. Extra filter is applied on top of pyramid's own one.
 */
Walker walk(const Pyramid &pyramid, WalkMode mode = WalkMode::bottomOnly
            , const TileFilter::pointer &filter = nullptr);

/** Number of tiles a walk would yield.
 */
std::uint64_t countLiveTiles(const Pyramid &pyramid
                             , WalkMode mode = WalkMode::bottomOnly
                             , const TileFilter::pointer &filter = nullptr);

/** Number of sampling and downsampling operations of a build.
 *
 *  \param pyramid pyramid to build
 *  \param baseLevelOnly no downsampling at all
 *  \param topLayer shallowest lod to downsample into
 */
std::uint64_t countOperations(const Pyramid &pyramid, bool baseLevelOnly
                              , const boost::optional<Lod> &topLayer
                              = boost::none);

/** Top-level quadrant (level 1 ancestor) of given tile; level 0 tile is its
 *  own quadrant. Used to split work among workers.
 */
TileId quadrant(const TileId &tileId);

UTILITY_GENERATE_ENUM_IO(PyramidMode,
    ((generic))
    ((toast))
)

UTILITY_GENERATE_ENUM_IO(WalkMode,
    ((bottomOnly))
    ((allLevels))
)

} } // namespace toastlibs::toast

#endif // toastlibs_toast_pyramid_hpp_included_
