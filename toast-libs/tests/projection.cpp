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

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "../toast/projection.hpp"
#include "../toast/error.hpp"

using namespace toastlibs::toast;

namespace {

double distance(const SkyPosition &a, const SkyPosition &b)
{
    const auto c(std::sin(a.lat) * std::sin(b.lat)
                 + std::cos(a.lat) * std::cos(b.lat)
                 * std::cos(a.lon - b.lon));
    return std::acos(std::max(-1.0, std::min(1.0, c)));
}

} // namespace

TEST_CASE("grid position survives trip through the sky")
{
    const TileId tiles[] = {
        TileId(0, 0, 0), TileId(1, 0, 1), TileId(3, 5, 2)
        , TileId(8, 100, 37)
    };
    const PixelOffset offsets[] = {
        PixelOffset(64.5, 64.5), PixelOffset(191.25, 30.75)
        , PixelOffset(100.0, 200.0)
    };

    for (const auto &tile : tiles) {
        for (const auto &offset : offsets) {
            const auto sky(gridToSky(tile, offset));
            const auto gp(skyToGrid(sky, tile.lod));

            REQUIRE(gp.tileId == tile);
            REQUIRE(gp.offset.x == Catch::Approx(offset.x).margin(0.05));
            REQUIRE(gp.offset.y == Catch::Approx(offset.y).margin(0.05));
        }
    }
}

TEST_CASE("level 1 tiles split the sky into longitude lunes")
{
    REQUIRE(skyToGrid(0.25 * M_PI, 0.1, 1).tileId == TileId(1, 1, 1));
    REQUIRE(skyToGrid(0.75 * M_PI, -0.4, 1).tileId == TileId(1, 1, 0));
    REQUIRE(skyToGrid(1.25 * M_PI, 0.7, 1).tileId == TileId(1, 0, 0));
    REQUIRE(skyToGrid(1.75 * M_PI, -1.0, 1).tileId == TileId(1, 0, 1));
}

TEST_CASE("north pole lies in the center of the level 0 tile")
{
    const auto sky(gridToSky(TileId(0, 0, 0), PixelOffset(128.0, 128.0)));
    REQUIRE(std::isfinite(sky.lon));
    REQUIRE(sky.lat > 0.5 * M_PI - 1e-3);
}

TEST_CASE("poles map to finite grid positions")
{
    for (const double lat : { 0.5 * M_PI, -0.5 * M_PI }) {
        for (const Lod lod : { Lod(0), Lod(2), Lod(6) }) {
            const auto gp(skyToGrid(1.0, lat, lod));
            REQUIRE(valid(gp.tileId));
            REQUIRE(std::isfinite(gp.offset.x));
            REQUIRE(std::isfinite(gp.offset.y));
        }
    }
}

TEST_CASE("longitude is wrapped")
{
    const auto a(skyToGrid(0.3, 0.2, 5));
    const auto b(skyToGrid(0.3 + 2 * M_PI, 0.2, 5));
    const auto c(skyToGrid(0.3 - 2 * M_PI, 0.2, 5));
    REQUIRE(a.tileId == b.tileId);
    REQUIRE(a.tileId == c.tileId);
}

TEST_CASE("positions outside of the domain are refused")
{
    REQUIRE_THROWS_AS(skyToGrid(0.0, 2.0, 1), ProjectionDomainError);
    REQUIRE_THROWS_AS(skyToGrid(std::numeric_limits<double>::quiet_NaN()
                                , 0.0, 1)
                      , ProjectionDomainError);
    REQUIRE_THROWS_AS(skyToGrid(0.0, 0.0, MaxLod + 1)
                      , ProjectionDomainError);
    REQUIRE_THROWS_AS(gridToSky(TileId(1, 2, 0), PixelOffset(1.0, 1.0))
                      , ProjectionDomainError);
    REQUIRE_THROWS_AS(gridToSky(TileId(1, 0, 0), PixelOffset(-1.0, 1.0))
                      , ProjectionDomainError);
    REQUIRE_THROWS_AS(gridToSky(TileId(1, 0, 0), PixelOffset(1.0, 300.0))
                      , ProjectionDomainError);
}

TEST_CASE("pixel center coordinates agree with grid mapping")
{
    const TileId tile(2, 1, 2);
    cv::Mat lon, lat;
    tileCoords(tile, lon, lat);

    REQUIRE(lon.type() == CV_64FC1);
    REQUIRE(lat.type() == CV_64FC1);
    REQUIRE(lon.rows == TileSize);
    REQUIRE(lon.cols == TileSize);

    for (int j(0); j < TileSize; j += 37) {
        for (int i(0); i < TileSize; i += 23) {
            const SkyPosition pixel(lon.at<double>(j, i), lat.at<double>(j, i));
            REQUIRE(pixel.lon >= 0.0);
            REQUIRE(pixel.lon < 2 * M_PI);
            REQUIRE(std::abs(pixel.lat) <= 0.5 * M_PI);

            const auto expected(gridToSky(tile, PixelOffset(i + 0.5, j + 0.5)));
            REQUIRE(distance(pixel, expected) < 1e-4);
        }
    }
}

TEST_CASE("whole sky tile coordinates are finite")
{
    cv::Mat lon, lat;
    tileCoords(TileId(0, 0, 0), lon, lat);

    for (int j(0); j < TileSize; ++j) {
        for (int i(0); i < TileSize; ++i) {
            REQUIRE(std::isfinite(lon.at<double>(j, i)));
            REQUIRE(std::isfinite(lat.at<double>(j, i)));
        }
    }
}

TEST_CASE("tile cap covers tile corners")
{
    const TileId tile(4, 3, 9);
    const auto cap(tileCap(tile));
    for (const auto &corner : tileCorners(tile)) {
        REQUIRE(distance(cap.center, corner) <= cap.radius);
    }
}
