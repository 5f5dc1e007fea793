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
#include <cmath>
#include <utility>
#include <algorithm>

#include "dbglog/dbglog.hpp"

#include "math/geometry.hpp"

#include "filter.hpp"
#include "projection.hpp"
#include "tileop.hpp"
#include "error.hpp"

namespace ublas = boost::numeric::ublas;

namespace toastlibs { namespace toast {

namespace {

const double TwoPi(2.0 * M_PI);

/** Slack for points lying on the rectangle boundary.
 */
const double Eps(1e-12);

/** Do two circular longitude intervals (start, width) overlap?
 */
bool lonOverlap(double s1, double w1, double s2, double w2)
{
    if ((w1 >= TwoPi) || (w2 >= TwoPi)) { return true; }
    return (wrapLon(s2 - s1) <= w1) || (wrapLon(s1 - s2) <= w2);
}

/** Great circle arc from a to b (shorter than pi): u cos(t) + w sin(t) for t
 *  in [0, length].
 */
struct Arc {
    math::Point3 u;
    math::Point3 w;
    double length;

    Arc(const math::Point3 &a, const math::Point3 &b)
        : u(a), w(b - a * ublas::inner_prod(a, b))
        , length(std::acos(std::max(-1.0, std::min
                                    (1.0, ublas::inner_prod(a, b)))))
    {
        w /= ublas::norm_2(w);
    }

    math::Point3 at(double t) const {
        return math::Point3(u * std::cos(t) + w * std::sin(t));
    }

    bool covers(double t) const { return wrapLon(t) <= length; }

    /** z(t) = zAmplitude * cos(t - zPhase)
     */
    double zAmplitude() const { return std::hypot(u(2), w(2)); }
    double zPhase() const { return std::atan2(w(2), u(2)); }
};

/** Normalized longitude/latitude rectangle.
 */
struct Rectangle {
    double lonStart;
    double lonWidth;
    double latMin;
    double latMax;

    bool allLongitudes() const { return lonWidth >= TwoPi; }

    bool inLon(double lon) const {
        const auto d(wrapLon(lon - lonStart));
        return (d <= lonWidth + Eps) || (d >= TwoPi - Eps);
    }

    bool inLat(double lat) const {
        return (lat >= latMin - Eps) && (lat <= latMax + Eps);
    }

    bool contains(const math::Point3 &p) const {
        const auto sky(toSky(p));
        if (!inLat(sky.lat)) { return false; }
        // longitude is meaningless at the poles
        if (std::hypot(p(0), p(1)) < Eps) { return true; }
        return inLon(sky.lon);
    }
};

/** Latitude interval covered by quad's footprint.
 */
std::pair<double, double> latitudeExtent(const Quad &quad)
{
    double zMin(1.0), zMax(-1.0);
    for (int i(0); i < 4; ++i) {
        const Arc arc(quad.corners[i], quad.corners[(i + 1) % 4]);
        zMin = std::min(zMin, arc.u(2));
        zMax = std::max(zMax, arc.u(2));

        const auto amplitude(arc.zAmplitude());
        if (amplitude < Eps) { continue; }
        const auto phase(arc.zPhase());
        if (arc.covers(phase)) { zMax = std::max(zMax, amplitude); }
        if (arc.covers(phase + M_PI)) { zMin = std::min(zMin, -amplitude); }
    }

    if (quad.margin(math::Point3(0, 0, 1)) >= 0) { zMax = 1.0; }
    if (quad.margin(math::Point3(0, 0, -1)) >= 0) { zMin = -1.0; }

    return { std::asin(std::max(-1.0, zMin)), std::asin(std::min(1.0, zMax)) };
}

/** Does arc cross meridian half-plane at given longitude inside rectangle's
 *  latitude range?
 */
bool crossesMeridian(const math::Point3 &a, const math::Point3 &b
                     , double lon, const Rectangle &rect)
{
    const math::Point3 normal(-std::sin(lon), std::cos(lon), 0.0);
    const auto da(ublas::inner_prod(normal, a));
    const auto db(ublas::inner_prod(normal, b));

    // arc lying in the meridian plane is handled by parallel crossings
    if ((da * db > 0) || ((da == 0) && (db == 0))) { return false; }

    const math::Point3 p(a * std::abs(db) + b * std::abs(da));
    const math::Point3 dir(std::cos(lon), std::sin(lon), 0.0);
    if (ublas::inner_prod(dir, p) < -Eps) { return false; }

    return rect.inLat(toSky(p).lat);
}

/** Does arc cross given parallel inside rectangle's longitude range?
 */
bool crossesParallel(const Arc &arc, double lat, const Rectangle &rect)
{
    const auto amplitude(arc.zAmplitude());
    const auto z(std::sin(lat));
    if ((amplitude < Eps) || (std::abs(z) > amplitude)) { return false; }

    const auto phase(arc.zPhase());
    const auto delta(std::acos(std::max(-1.0, std::min(1.0, z / amplitude))));
    for (const auto t : { phase - delta, phase + delta }) {
        if (arc.covers(t) && rect.inLon(toSky(arc.at(t)).lon)) {
            return true;
        }
    }
    return false;
}

/** Exact test of quad's footprint against rectangle. Boundaries touching
 *  counts as intersection.
 */
bool intersects(const Quad &quad, const Rectangle &rect)
{
    const auto lat(latitudeExtent(quad));
    if ((lat.second < rect.latMin - Eps) || (lat.first > rect.latMax + Eps)) {
        return false;
    }

    // footprint is connected: latitude overlap is enough for a full band
    if (rect.allLongitudes()) { return true; }

    for (const auto &corner : quad.corners) {
        if (rect.contains(corner)) { return true; }
    }

    const double lonEnd(rect.lonStart + rect.lonWidth);
    for (const auto lon : { rect.lonStart, lonEnd }) {
        for (const auto lt : { rect.latMin, rect.latMax }) {
            if (quad.margin(toVector(lon, lt)) >= -Eps) { return true; }
        }
    }

    for (int i(0); i < 4; ++i) {
        const auto &a(quad.corners[i]);
        const auto &b(quad.corners[(i + 1) % 4]);
        if (crossesMeridian(a, b, rect.lonStart, rect)
            || crossesMeridian(a, b, lonEnd, rect))
        {
            return true;
        }

        const Arc arc(a, b);
        if (crossesParallel(arc, rect.latMin, rect)
            || crossesParallel(arc, rect.latMax, rect))
        {
            return true;
        }
    }

    return false;
}

} // namespace

SkyBounds SkyBounds::all()
{
    return SkyBounds(0.0, TwoPi, -0.5 * M_PI, 0.5 * M_PI);
}

BoundsFilter::BoundsFilter(const SkyBounds &bounds)
    : bounds_(bounds), lonStart_(), lonWidth_()
{
    if (!std::isfinite(bounds_.lonMin) || !std::isfinite(bounds_.lonMax)
        || !std::isfinite(bounds_.latMin) || !std::isfinite(bounds_.latMax))
    {
        LOGTHROW(err1, ProjectionDomainError)
            << "Sky bounds must be finite.";
    }

    if ((bounds_.latMin < -0.5 * M_PI) || (bounds_.latMax > 0.5 * M_PI)
        || (bounds_.latMin > bounds_.latMax))
    {
        LOGTHROW(err1, ProjectionDomainError)
            << "Invalid latitude bounds [" << bounds_.latMin << ", "
            << bounds_.latMax << "].";
    }

    if ((bounds_.lonMax - bounds_.lonMin) >= TwoPi) {
        lonStart_ = 0.0;
        lonWidth_ = TwoPi;
    } else {
        lonStart_ = wrapLon(bounds_.lonMin);
        lonWidth_ = wrapLon(bounds_.lonMax - bounds_.lonMin);
    }
}

bool BoundsFilter::check_impl(const TileId &tileId) const
{
    if (!tileId.lod) { return true; }

    if (tileId.lod == 1) {
        // level 1 tiles are lunes spanning all latitudes
        const auto lune(level1Lune(tileId.x, tileId.y));
        return lonOverlap(lune.first, lune.second - lune.first
                          , lonStart_, lonWidth_);
    }

    // quick reject through bounding cap
    const auto cap(tileCap(tileId));
    const auto latLo(cap.center.lat - cap.radius);
    const auto latHi(cap.center.lat + cap.radius);

    if ((latHi < bounds_.latMin) || (latLo > bounds_.latMax)) {
        return false;
    }

    if ((latHi < 0.5 * M_PI) && (latLo > -0.5 * M_PI)) {
        const auto ratio(std::min(1.0, std::sin(cap.radius)
                                  / std::cos(cap.center.lat)));
        const auto dlon(std::asin(ratio));

        if (!lonOverlap(wrapLon(cap.center.lon - dlon), 2.0 * dlon
                        , lonStart_, lonWidth_))
        {
            return false;
        }
    }

    Rectangle rect;
    rect.lonStart = lonStart_;
    rect.lonWidth = lonWidth_;
    rect.latMin = bounds_.latMin;
    rect.latMax = bounds_.latMax;
    return intersects(tileQuad(tileId), rect);
}

bool AncestorFilter::check_impl(const TileId &tileId) const
{
    return above(tileId, tileId_) || above(tileId_, tileId);
}

bool ConjunctionFilter::check_impl(const TileId &tileId) const
{
    for (const auto &filter : filters_) {
        if (!check(filter, tileId)) { return false; }
    }
    return true;
}

bool ConjunctionFilter::spatial_impl() const
{
    for (const auto &filter : filters_) {
        if (filter && filter->spatial()) { return true; }
    }
    return false;
}

TileFilter::pointer boundsFilter(const SkyBounds &bounds)
{
    return std::make_shared<BoundsFilter>(bounds);
}

TileFilter::pointer ancestorFilter(const TileId &tileId)
{
    return std::make_shared<AncestorFilter>(tileId);
}

TileFilter::pointer allOf(const TileFilter::pointer &a
                          , const TileFilter::pointer &b)
{
    if (!a) { return b; }
    if (!b) { return a; }
    return std::make_shared<ConjunctionFilter>
        (std::vector<TileFilter::pointer>{ a, b });
}

} } // namespace toastlibs::toast
