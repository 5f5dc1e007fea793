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
#include <limits>
#include <algorithm>

#include "dbglog/dbglog.hpp"

#include "math/geometry.hpp"

#include "projection.hpp"
#include "tileop.hpp"
#include "error.hpp"
#include "io.hpp"

namespace ublas = boost::numeric::ublas;

namespace toastlibs { namespace toast {

namespace {

/** Number of extra subdivision levels used to locate position inside a tile
 *  (gives 1/256 pixel precision).
 */
constexpr int SubpixelDepth(16);

/** Tile size expressed as subdivision depth.
 */
constexpr int TileDepth(8);

const double TwoPi(2.0 * M_PI);

inline math::Point3 unit(const math::Point3 &v)
{
    return math::Point3(v / ublas::norm_2(v));
}

inline math::Point3 mid(const math::Point3 &a, const math::Point3 &b)
{
    return unit(math::Point3(a + b));
}

/** Signed distance of p from great circle through a and b (positive on the
 *  side of reference point).
 */
inline double edgeMargin(const math::Point3 &a, const math::Point3 &b
                         , const math::Point3 &ref, const math::Point3 &p)
{
    const math::Point3 normal(math::crossProduct(a, b));
    const auto n(ublas::norm_2(normal));
    const auto side(ublas::inner_prod(normal, ref));
    const auto margin(ublas::inner_prod(normal, p) / n);
    return (side < 0) ? -margin : margin;
}

/** Index of level 1 tile whose lune contains given longitude.
 */
void level1Index(double lon, unsigned int &x, unsigned int &y)
{
    if (lon < 0.5 * M_PI) { x = 1; y = 1; }
    else if (lon < M_PI) { x = 1; y = 0; }
    else if (lon < 1.5 * M_PI) { x = 0; y = 0; }
    else { x = 0; y = 1; }
}

void fillCoords(const Quad &quad, int depth, int col, int row
                , cv::Mat &lon, cv::Mat &lat)
{
    if (!depth) {
        const auto sky(toSky(quad.center()));
        lon.at<double>(row, col) = sky.lon;
        lat.at<double>(row, col) = sky.lat;
        return;
    }

    const auto half(1 << (depth - 1));
    const auto children(quad.subdivide());
    fillCoords(children[0], depth - 1, col, row, lon, lat);
    fillCoords(children[1], depth - 1, col + half, row, lon, lat);
    fillCoords(children[2], depth - 1, col, row + half, lon, lat);
    fillCoords(children[3], depth - 1, col + half, row + half, lon, lat);
}

} // namespace

double wrapLon(double lon)
{
    auto l(std::fmod(lon, TwoPi));
    if (l < 0) { l += TwoPi; }
    // fmod of tiny negative numbers can round up to 2pi
    if (l >= TwoPi) { l = 0.0; }
    return l;
}

math::Point3 toVector(double lon, double lat)
{
    const auto cl(std::cos(lat));
    return math::Point3(cl * std::cos(lon), cl * std::sin(lon)
                        , std::sin(lat));
}

SkyPosition toSky(const math::Point3 &v)
{
    return SkyPosition(wrapLon(std::atan2(v(1), v(0)))
                       , std::atan2(v(2), std::hypot(v(0), v(1))));
}

math::Point3 Quad::center() const
{
    return increasing ? mid(ll(), ur()) : mid(ul(), lr());
}

std::array<Quad, 4> Quad::subdivide() const
{
    const auto to(mid(ul(), ur()));
    const auto ri(mid(ur(), lr()));
    const auto bo(mid(lr(), ll()));
    const auto le(mid(ll(), ul()));
    const auto ce(center());

    std::array<Quad, 4> out;
    out[0].corners = {{ ul(), to, ce, le }};
    out[1].corners = {{ to, ur(), ri, ce }};
    out[2].corners = {{ le, ce, bo, ll() }};
    out[3].corners = {{ ce, ri, lr(), bo }};
    for (auto &q : out) { q.increasing = increasing; }
    return out;
}

double Quad::margin(const math::Point3 &p) const
{
    const math::Point3 ref
        (corners[0] + corners[1] + corners[2] + corners[3]);

    auto m(std::numeric_limits<double>::max());
    for (int i(0); i < 4; ++i) {
        m = std::min(m, edgeMargin(corners[i], corners[(i + 1) % 4], ref, p));
    }
    return m;
}

Quad level1Quad(unsigned int x, unsigned int y)
{
    const math::Point3 n(0, 0, 1);
    const math::Point3 s(0, 0, -1);
    const auto eq([](double lon) { return toVector(lon, 0.0); });
    const double lam(M_PI);

    Quad q;
    if (!x && !y) {
        q.corners = {{ s, eq(lam), n, eq(lam + 0.5 * M_PI) }};
        q.increasing = true;
    } else if (x && !y) {
        q.corners = {{ eq(lam), s, eq(lam - 0.5 * M_PI), n }};
        q.increasing = false;
    } else if (x && y) {
        q.corners = {{ n, eq(lam - 0.5 * M_PI), s, eq(lam - M_PI) }};
        q.increasing = true;
    } else {
        q.corners = {{ eq(lam + 0.5 * M_PI), n, eq(lam + M_PI), s }};
        q.increasing = false;
    }
    return q;
}

std::pair<double, double> level1Lune(unsigned int x, unsigned int y)
{
    if (x && y) { return { 0.0, 0.5 * M_PI }; }
    if (x) { return { 0.5 * M_PI, M_PI }; }
    if (!y) { return { M_PI, 1.5 * M_PI }; }
    return { 1.5 * M_PI, TwoPi };
}

Quad tileQuad(const TileId &tileId)
{
    if (!tileId.lod || !valid(tileId)) {
        LOGTHROW(err1, ProjectionDomainError)
            << "Tile " << tileId << " has no single covering quad.";
    }

    const auto shift(tileId.lod - 1);
    auto quad(level1Quad(tileId.x >> shift, tileId.y >> shift));
    for (int bit(shift - 1); bit >= 0; --bit) {
        const auto index(((tileId.x >> bit) & 1)
                         + (((tileId.y >> bit) & 1) << 1));
        quad = quad.subdivide()[index];
    }
    return quad;
}

std::array<SkyPosition, 4> tileCorners(const TileId &tileId)
{
    const auto quad(tileQuad(tileId));
    return {{ toSky(quad.ul()), toSky(quad.ur())
            , toSky(quad.lr()), toSky(quad.ll()) }};
}

Cap tileCap(const TileId &tileId)
{
    Cap cap;
    if (!tileId.lod) {
        cap.center = SkyPosition(0.0, 0.5 * M_PI);
        cap.radius = M_PI;
        return cap;
    }

    const auto quad(tileQuad(tileId));
    const auto center(unit(math::Point3(quad.ul() + quad.ur()
                                        + quad.lr() + quad.ll())));

    double radius(0.0);
    for (const auto &corner : quad.corners) {
        const auto d(std::max(-1.0, std::min
                              (1.0, ublas::inner_prod(center, corner))));
        radius = std::max(radius, std::acos(d));
    }

    cap.center = toSky(center);
    // edges are arcs between corners; small slack covers rounding
    cap.radius = radius * (1.0 + 1e-9) + 1e-12;
    return cap;
}

SkyPosition gridToSky(const TileId &tileId, const PixelOffset &offset)
{
    if (!valid(tileId)) {
        LOGTHROW(err1, ProjectionDomainError)
            << "Invalid tile " << tileId << ".";
    }

    if (!std::isfinite(offset.x) || !std::isfinite(offset.y)
        || (offset.x < 0) || (offset.x > TileSize)
        || (offset.y < 0) || (offset.y > TileSize))
    {
        LOGTHROW(err1, ProjectionDomainError)
            << "Pixel offset (" << offset.x << ", " << offset.y
            << ") outside of tile " << tileId << ".";
    }

    // global position at 1/512 pixel precision
    const int sub(TileDepth + 9);
    const int depth(tileId.lod + sub);
    const std::uint64_t limit(std::uint64_t(1) << sub);

    const auto local([&](double value) -> std::uint64_t
    {
        auto v(static_cast<std::uint64_t>(value / TileSize * limit));
        return std::min(v, limit - 1);
    });

    const std::uint64_t gx((std::uint64_t(tileId.x) << sub) + local(offset.x));
    const std::uint64_t gy((std::uint64_t(tileId.y) << sub) + local(offset.y));

    auto quad(level1Quad(gx >> (depth - 1), gy >> (depth - 1)));
    for (int bit(depth - 2); bit >= 0; --bit) {
        const auto index(((gx >> bit) & 1) + (((gy >> bit) & 1) << 1));
        quad = quad.subdivide()[index];
    }

    return toSky(quad.center());
}

GridPosition skyToGrid(double lon, double lat, Lod lod)
{
    if (!std::isfinite(lon) || !std::isfinite(lat)) {
        LOGTHROW(err1, ProjectionDomainError)
            << "Non-finite sky position (" << lon << ", " << lat << ").";
    }

    if (std::abs(lat) > 0.5 * M_PI) {
        LOGTHROW(err1, ProjectionDomainError)
            << "Latitude " << lat << " outside of [-pi/2, pi/2].";
    }

    if (lod > MaxLod) {
        LOGTHROW(err1, ProjectionDomainError)
            << "Lod " << lod << " is deeper than maximum lod "
            << MaxLod << ".";
    }

    lon = wrapLon(lon);
    const auto p(toVector(lon, lat));

    unsigned int x1, y1;
    level1Index(lon, x1, y1);
    auto quad(level1Quad(x1, y1));

    const int depth(lod + SubpixelDepth);
    std::uint64_t gx(x1), gy(y1);

    for (int level(1); level < depth; ++level) {
        const auto children(quad.subdivide());

        int best(0);
        double bestMargin(-std::numeric_limits<double>::max());
        for (int i(0); i < 4; ++i) {
            const auto m(children[i].margin(p));
            if (m > bestMargin) { bestMargin = m; best = i; }
        }

        quad = children[best];
        gx = (gx << 1) | (best & 1);
        gy = (gy << 1) | (best >> 1);
    }

    const int sub(depth - lod);
    const std::uint64_t mask((std::uint64_t(1) << sub) - 1);
    const double scale(double(TileSize) / double(std::uint64_t(1) << sub));

    GridPosition gp;
    gp.tileId = TileId(lod, TileId::index_type(gx >> sub)
                       , TileId::index_type(gy >> sub));
    gp.offset.x = ((gx & mask) + 0.5) * scale;
    gp.offset.y = ((gy & mask) + 0.5) * scale;
    return gp;
}

void tileCoords(const TileId &tileId, cv::Mat &lon, cv::Mat &lat)
{
    if (!valid(tileId)) {
        LOGTHROW(err1, ProjectionDomainError)
            << "Invalid tile " << tileId << ".";
    }

    lon.create(TileSize, TileSize, CV_64FC1);
    lat.create(TileSize, TileSize, CV_64FC1);

    if (tileId.lod) {
        fillCoords(tileQuad(tileId), TileDepth, 0, 0, lon, lat);
        return;
    }

    // whole sphere: four level 1 quads, each occupying one quarter
    const int half(TileSize / 2);
    for (unsigned int y(0); y < 2; ++y) {
        for (unsigned int x(0); x < 2; ++x) {
            fillCoords(level1Quad(x, y), TileDepth - 1, x * half, y * half
                       , lon, lat);
        }
    }
}

} } // namespace toastlibs::toast
