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
#include <sstream>

#include <catch2/catch_test_macros.hpp>

#include "../toast/tileop.hpp"
#include "../toast/io.hpp"

using namespace toastlibs::toast;

TEST_CASE("children are ordered ul, ur, ll, lr and point back to parent")
{
    const TileId tile(3, 5, 2);
    const auto kids(children(tile));

    REQUIRE(kids[0] == TileId(4, 10, 4));
    REQUIRE(kids[1] == TileId(4, 11, 4));
    REQUIRE(kids[2] == TileId(4, 10, 5));
    REQUIRE(kids[3] == TileId(4, 11, 5));

    for (const auto &kid : kids) {
        REQUIRE(valid(kid));
        REQUIRE(parent(kid) == tile);
        REQUIRE(child(kid) == int(kid.index));
        REQUIRE(above(kid, tile));
        REQUIRE_FALSE(above(tile, kid));
    }
}

TEST_CASE("tile counts")
{
    REQUIRE(tileCount(0) == 1);
    REQUIRE(tileCount(3) == 8);
    REQUIRE(lodTileCount(3) == 64);
    REQUIRE(depth2tiles(0) == 1);
    REQUIRE(depth2tiles(2) == 21);
    REQUIRE(depth2tiles(3) == 85);
}

TEST_CASE("validity of tile indices")
{
    REQUIRE(valid(TileId(0, 0, 0)));
    REQUIRE_FALSE(valid(TileId(0, 1, 0)));
    REQUIRE(valid(TileId(2, 3, 3)));
    REQUIRE_FALSE(valid(TileId(2, 4, 0)));
    REQUIRE_FALSE(valid(TileId(MaxLod + 1, 0, 0)));
}

TEST_CASE("ancestors of a tile set")
{
    const TileId::list tiles{ TileId(3, 0, 0), TileId(3, 1, 1)
            , TileId(3, 7, 7) };

    const auto direct(parents(tiles));
    REQUIRE(direct.size() == 2);
    REQUIRE(direct.count(TileId(2, 0, 0)));
    REQUIRE(direct.count(TileId(2, 3, 3)));

    const auto all(parents(tiles, true));
    REQUIRE(all.size() == 5);
    REQUIRE(all.count(TileId(0, 0, 0)));
    REQUIRE(all.count(TileId(1, 1, 1)));
}

TEST_CASE("tile id text form")
{
    std::ostringstream os;
    os << TileId(4, 3, 12);
    REQUIRE(os.str() == "4-3-12");

    std::istringstream is("7-100-21");
    TileId tile;
    is >> tile;
    REQUIRE(is);
    REQUIRE(tile == TileId(7, 100, 21));
}

TEST_CASE("vertical flip")
{
    REQUIRE(verticalFlip(TileId(2, 1, 0)) == TileId(2, 1, 3));
    REQUIRE(verticalFlip(verticalFlip(TileId(5, 9, 17))) == TileId(5, 9, 17));
}
