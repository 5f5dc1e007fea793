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
#include <vector>
#include <algorithm>

#include <catch2/catch_test_macros.hpp>

#include "../toast/filter.hpp"
#include "../toast/pyramid.hpp"
#include "../toast/projection.hpp"
#include "../toast/tileop.hpp"
#include "../toast/io.hpp"
#include "../toast/error.hpp"

using namespace toastlibs::toast;

namespace {

std::uint64_t walkLength(const Pyramid &pyramid, WalkMode mode)
{
    std::uint64_t count(0);
    auto walker(walk(pyramid, mode));
    while (walker.next()) { ++count; }
    return count;
}

bool yields(const Pyramid &pyramid, const TileId &tile)
{
    auto walker(walk(pyramid));
    while (const auto tileId = walker.next()) {
        if (*tileId == tile) { return true; }
    }
    return false;
}

/** Samples tile footprint on a regular pixel grid (corners included).
 */
std::vector<SkyPosition> footprint(const TileId &tileId, int steps = 16)
{
    std::vector<SkyPosition> points;
    const double step(double(TileSize) / steps);
    for (int j(0); j <= steps; ++j) {
        for (int i(0); i <= steps; ++i) {
            points.push_back(gridToSky(tileId, PixelOffset(i * step
                                                           , j * step)));
        }
    }
    return points;
}

/** Checks filter against sampled footprints of all tiles at given lod:
 *  a tile with a sample inside the rectangle must pass, a passing tile must
 *  have a sample within tolerance of the rectangle. Returns number of
 *  passing tiles.
 */
std::uint64_t verifyBounds(const SkyBounds &bounds, Lod lod, double tolerance)
{
    const auto filter(boundsFilter(bounds));
    const bool wraps(bounds.lonMin > bounds.lonMax);
    const bool allLon((bounds.lonMax - bounds.lonMin) >= 2 * M_PI);

    auto lonDistance([&](double lon) -> double
    {
        if (allLon) { return 0.0; }
        const bool inside(wraps ? ((lon >= bounds.lonMin)
                                   || (lon <= bounds.lonMax))
                          : ((lon >= bounds.lonMin)
                             && (lon <= bounds.lonMax)));
        if (inside) { return 0.0; }
        auto distance([](double a, double b) {
                const auto d(std::abs(a - b));
                return std::min(d, 2 * M_PI - d);
            });
        return std::min(distance(lon, bounds.lonMin)
                        , distance(lon, bounds.lonMax));
    });

    auto latDistance([&](double lat) -> double
    {
        if (lat < bounds.latMin) { return bounds.latMin - lat; }
        if (lat > bounds.latMax) { return lat - bounds.latMax; }
        return 0.0;
    });

    std::uint64_t passed(0);
    const auto size(tileCount(lod));
    for (unsigned int y(0); y < size; ++y) {
        for (unsigned int x(0); x < size; ++x) {
            const TileId tileId(lod, x, y);

            bool inside(false), near(false);
            for (const auto &sky : footprint(tileId)) {
                const auto dlat(latDistance(sky.lat));
                const auto dlon(lonDistance(sky.lon) * std::cos(sky.lat));
                if (!dlat && !dlon) { inside = true; }
                if ((dlat <= tolerance) && (dlon <= tolerance)) {
                    near = true;
                }
            }

            const bool passes((*filter)(tileId));
            INFO("tile " << tileId);
            if (inside) { REQUIRE(passes); }
            if (passes) { REQUIRE(near); }
            if (passes) { ++passed; }
        }
    }

    // filter is monotone: walk reaches every passing tile
    REQUIRE(countLiveTiles(Pyramid::toastFiltered(lod, filter)) == passed);
    return passed;
}

} // namespace

TEST_CASE("northern band filter")
{
    const SkyBounds bounds(0.0, 2 * M_PI, 0.3, 0.5 * M_PI);
    const auto pyramid(Pyramid::toastFiltered(3, boundsFilter(bounds)));

    const auto count(countLiveTiles(pyramid));
    REQUIRE(count == walkLength(pyramid, WalkMode::bottomOnly));
    REQUIRE(countLiveTiles(pyramid, WalkMode::allLevels)
            == walkLength(pyramid, WalkMode::allLevels));

    // band covers about a third of the sphere
    const auto passed(verifyBounds(bounds, 4, 0.03));
    REQUIRE(passed > 256 / 4);
    REQUIRE(passed < 256 * 3 / 4);

    // northern-most tile is always there, southern-most never
    REQUIRE(yields(pyramid, skyToGrid(2.0, 1.5, 3).tileId));
    REQUIRE_FALSE(yields(pyramid, skyToGrid(2.0, -1.0, 3).tileId));
}

TEST_CASE("bounded rectangle filter matches tile footprints")
{
    SECTION("plain rectangle") {
        verifyBounds(SkyBounds(1.0, 2.2, -0.4, 0.6), 4, 0.04);
    }

    SECTION("rectangle wrapping through longitude 0") {
        verifyBounds(SkyBounds(5.8, 0.5, -0.6, 0.1), 4, 0.04);
    }

    SECTION("southern polar cap") {
        verifyBounds(SkyBounds(0.0, 2 * M_PI, -0.5 * M_PI, -1.2), 4, 0.03);
    }
}

TEST_CASE("whole sky filter passes everything")
{
    const auto pyramid(Pyramid::toastFiltered
                       (3, boundsFilter(SkyBounds::all())));
    REQUIRE(countLiveTiles(pyramid) == 64);
}

TEST_CASE("tiny box keeps the tile containing it")
{
    const double lon(1.0), lat(0.3), eps(1e-3);
    const auto pyramid(Pyramid::toastFiltered
                       (6, boundsFilter(SkyBounds(lon - eps, lon + eps
                                                  , lat - eps, lat + eps))));

    REQUIRE(yields(pyramid, skyToGrid(lon, lat, 6).tileId));
    REQUIRE(countLiveTiles(pyramid) < 64);
}

TEST_CASE("box wrapping through longitude 0")
{
    const auto filter(boundsFilter(SkyBounds(6.0, 0.3, -0.2, 0.2)));
    const auto pyramid(Pyramid::toastFiltered(5, filter));

    REQUIRE(yields(pyramid, skyToGrid(0.1, 0.0, 5).tileId));
    REQUIRE(yields(pyramid, skyToGrid(6.2, 0.1, 5).tileId));
    REQUIRE_FALSE(yields(pyramid, skyToGrid(3.0, 0.0, 5).tileId));
}

TEST_CASE("polar cap filter")
{
    const auto filter(boundsFilter(SkyBounds(0.0, 2 * M_PI, 1.4
                                             , 0.5 * M_PI)));
    const auto pyramid(Pyramid::toastFiltered(4, filter));

    REQUIRE(yields(pyramid, skyToGrid(0.5, 1.5, 4).tileId));
    REQUIRE(yields(pyramid, skyToGrid(4.0, 1.5, 4).tileId));
    REQUIRE_FALSE(yields(pyramid, skyToGrid(4.0, -1.0, 4).tileId));
}

TEST_CASE("invalid bounds are refused")
{
    REQUIRE_THROWS_AS(boundsFilter(SkyBounds(0.0, 1.0, 0.5, 0.1))
                      , ProjectionDomainError);
    REQUIRE_THROWS_AS(boundsFilter(SkyBounds(0.0, 1.0, -2.0, 0.1))
                      , ProjectionDomainError);
    REQUIRE_THROWS_AS(boundsFilter(SkyBounds(NAN, 1.0, 0.0, 0.1))
                      , ProjectionDomainError);
}

TEST_CASE("filter conjunction")
{
    const auto a(ancestorFilter(TileId(2, 0, 0)));
    const auto b(ancestorFilter(TileId(3, 1, 1)));

    REQUIRE(allOf(a, nullptr) == a);
    REQUIRE(allOf(nullptr, b) == b);

    const auto both(allOf(a, b));
    REQUIRE((*both)(TileId(3, 1, 1)));
    REQUIRE((*both)(TileId(1, 0, 0)));
    REQUIRE_FALSE((*both)(TileId(3, 0, 0)));

    REQUIRE_FALSE(both->spatial());
    REQUIRE(allOf(a, boundsFilter(SkyBounds::all()))->spatial());
}
