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
 * \file toast/projection.hpp
 *
 * TOAST (Tesselated Octahedral Adaptive Spherical Transformation)
 * projection between sky coordinates and tile grid.
 *
 * All angles are in radians. Longitude (right ascension) lives in [0, 2pi),
 * latitude (declination) in [-pi/2, pi/2].
 *
 * Level 0 square has north pole in its center and south pole in all four of
 * its corners; edge midpoints lie on the equator. Each deeper level splits
 * every quad by great circle arcs between midpoints of its edges.
 */

#ifndef toastlibs_toast_projection_hpp_included_
#define toastlibs_toast_projection_hpp_included_

#include <array>

#include <opencv2/core/core.hpp>

#include "math/geometry_core.hpp"

#include "basetypes.hpp"

namespace toastlibs { namespace toast {

/** Tile size in pixels.
 */
constexpr int TileSize(256);

/** Sky position.
 */
struct SkyPosition {
    double lon;
    double lat;

    SkyPosition(double lon = 0.0, double lat = 0.0) : lon(lon), lat(lat) {}
};

/** Position inside a tile, in pixels, [0, TileSize] x [0, TileSize], origin
 *  at upper-left corner.
 */
struct PixelOffset {
    double x;
    double y;

    PixelOffset(double x = 0.0, double y = 0.0) : x(x), y(y) {}
};

struct GridPosition {
    TileId tileId;
    PixelOffset offset;

    GridPosition() {}
    GridPosition(const TileId &tileId, const PixelOffset &offset)
        : tileId(tileId), offset(offset)
    {}
};

/** Spherical quadrilateral bounded by great circle arcs.
 */
struct Quad {
    /** Corners in order: upper-left, upper-right, lower-right, lower-left.
     */
    std::array<math::Point3, 4> corners;

    /** Diagonal used to find quad center: lower-left to upper-right when true,
     *  upper-left to lower-right otherwise.
     */
    bool increasing;

    Quad() : increasing(true) {}

    const math::Point3& ul() const { return corners[0]; }
    const math::Point3& ur() const { return corners[1]; }
    const math::Point3& lr() const { return corners[2]; }
    const math::Point3& ll() const { return corners[3]; }

    /** Center point (midpoint of the diagonal).
     */
    math::Point3 center() const;

    /** Children in child index order (ul, ur, ll, lr).
     */
    std::array<Quad, 4> subdivide() const;

    /** Does quad contain given (unit) vector?
     *
     *  Returns minimal signed angular-ish margin to quad edges; non-negative
     *  margin means the point is inside.
     */
    double margin(const math::Point3 &p) const;
};

/** Bounding spherical cap.
 */
struct Cap {
    SkyPosition center;
    double radius;

    Cap() : radius() {}
};

/** Maps pixel position inside a tile to sky.
 *
 *  Throws ProjectionDomainError if offset lies outside the tile or tileId is
 *  invalid.
 */
SkyPosition gridToSky(const TileId &tileId, const PixelOffset &offset);

/** Maps sky position to tile and pixel offset at given lod.
 *
 *  Throws ProjectionDomainError if latitude is outside [-pi/2, pi/2],
 *  coordinates are not finite or lod is too deep.
 */
GridPosition skyToGrid(double lon, double lat, Lod lod);

inline GridPosition skyToGrid(const SkyPosition &sky, Lod lod) {
    return skyToGrid(sky.lon, sky.lat, lod);
}

/** Computes sky coordinates of all pixel centers of given tile.
 *
 *  \param tileId tile
 *  \param lon output longitudes (CV_64FC1, TileSize x TileSize)
 *  \param lat output latitudes (CV_64FC1, TileSize x TileSize)
 *
 * Row 0 is the top row of the tile.
 */
void tileCoords(const TileId &tileId, cv::Mat &lon, cv::Mat &lat);

/** Level 1 quad for given index.
 */
Quad level1Quad(unsigned int x, unsigned int y);

/** Quad covered by given tile. Tile must have lod >= 1.
 */
Quad tileQuad(const TileId &tileId);

/** Tile corners (ul, ur, lr, ll) as sky positions. Tile must have lod >= 1.
 */
std::array<SkyPosition, 4> tileCorners(const TileId &tileId);

/** Spherical cap enclosing whole tile.
 */
Cap tileCap(const TileId &tileId);

/** Longitude range [min, max) of level 1 tile's lune.
 */
std::pair<double, double> level1Lune(unsigned int x, unsigned int y);

math::Point3 toVector(double lon, double lat);
SkyPosition toSky(const math::Point3 &v);

/** Wraps longitude into [0, 2pi).
 */
double wrapLon(double lon);

} } // namespace toastlibs::toast

#endif // toastlibs_toast_projection_hpp_included_
