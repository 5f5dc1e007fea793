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
 * \file toast/filter.hpp
 *
 * Tile filters: predicates restricting which tiles of a pyramid are visited.
 *
 * Filters must be monotone: if a tile is rejected then all its descendants
 * may be rejected as well. Traversal relies on this and prunes whole subtrees.
 */

#ifndef toastlibs_toast_filter_hpp_included_
#define toastlibs_toast_filter_hpp_included_

#include <memory>
#include <vector>

#include "basetypes.hpp"

namespace toastlibs { namespace toast {

class TileFilter {
public:
    typedef std::shared_ptr<const TileFilter> pointer;

    virtual ~TileFilter() {}

    /** Returns true if tile passes the filter.
     */
    bool operator()(const TileId &tileId) const { return check_impl(tileId); }

    /** Does this filter depend on TOAST projection?
     */
    bool spatial() const { return spatial_impl(); }

private:
    virtual bool check_impl(const TileId &tileId) const = 0;
    virtual bool spatial_impl() const { return false; }
};

/** Longitude/latitude rectangle.
 *
 *  lonMin > lonMax denotes rectangle wrapping through longitude 0. Longitude
 *  span of 2pi (or more) means all longitudes.
 */
struct SkyBounds {
    double lonMin;
    double lonMax;
    double latMin;
    double latMax;

    SkyBounds(double lonMin, double lonMax, double latMin, double latMax)
        : lonMin(lonMin), lonMax(lonMax), latMin(latMin), latMax(latMax)
    {}

    /** Whole sky.
     */
    static SkyBounds all();
};

/** Passes tiles whose footprint intersects given rectangle.
 *
 *  Tile footprint (quad bounded by great circle arcs) is tested exactly;
 *  tiles merely touching the rectangle pass.
 */
class BoundsFilter : public TileFilter {
public:
    /** Throws ProjectionDomainError on invalid bounds.
     */
    BoundsFilter(const SkyBounds &bounds);

    const SkyBounds& bounds() const { return bounds_; }

private:
    virtual bool check_impl(const TileId &tileId) const;
    virtual bool spatial_impl() const { return true; }

    SkyBounds bounds_;

    /** Normalized longitude interval: start in [0, 2pi) and width.
     */
    double lonStart_;
    double lonWidth_;
};

/** Passes given tile, all its descendants and all its ancestors (so that the
 *  tile can be reached from the root).
 */
class AncestorFilter : public TileFilter {
public:
    AncestorFilter(const TileId &tileId) : tileId_(tileId) {}

    const TileId& tileId() const { return tileId_; }

private:
    virtual bool check_impl(const TileId &tileId) const;

    TileId tileId_;
};

/** Passes tiles passing all underlying filters.
 */
class ConjunctionFilter : public TileFilter {
public:
    ConjunctionFilter(const std::vector<TileFilter::pointer> &filters)
        : filters_(filters) {}

private:
    virtual bool check_impl(const TileId &tileId) const;
    virtual bool spatial_impl() const;

    std::vector<TileFilter::pointer> filters_;
};

TileFilter::pointer boundsFilter(const SkyBounds &bounds);

TileFilter::pointer ancestorFilter(const TileId &tileId);

/** Conjunction of two filters; null filter passes everything.
 */
TileFilter::pointer allOf(const TileFilter::pointer &a
                          , const TileFilter::pointer &b);

/** Applies optional filter.
 */
inline bool check(const TileFilter::pointer &filter, const TileId &tileId)
{
    return !filter || (*filter)(tileId);
}

} } // namespace toastlibs::toast

#endif // toastlibs_toast_filter_hpp_included_
