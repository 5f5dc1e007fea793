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
#include <vector>
#include <functional>

#include <catch2/catch_test_macros.hpp>

#include "../toast/pyramid.hpp"
#include "../toast/tileop.hpp"
#include "../toast/error.hpp"

using namespace toastlibs::toast;

namespace {

class PredicateFilter : public TileFilter {
public:
    typedef std::function<bool(const TileId&)> Predicate;

    PredicateFilter(const Predicate &predicate) : predicate_(predicate) {}

private:
    virtual bool check_impl(const TileId &tileId) const {
        return predicate_(tileId);
    }

    Predicate predicate_;
};

TileId::list collect(Walker walker)
{
    TileId::list tiles;
    while (const auto tileId = walker.next()) { tiles.push_back(*tileId); }
    return tiles;
}

} // namespace

TEST_CASE("unfiltered pyramid tile counts")
{
    const auto pyramid(Pyramid::toast(3));
    REQUIRE(countLiveTiles(pyramid) == 64);
    REQUIRE(countLiveTiles(pyramid, WalkMode::allLevels) == 85);
    REQUIRE(collect(walk(pyramid)).size() == 64);
    REQUIRE(collect(walk(pyramid, WalkMode::allLevels)).size() == 85);
}

TEST_CASE("children precede their parent")
{
    const auto tiles(collect(walk(Pyramid::toast(1), WalkMode::allLevels)));
    const TileId::list expected{
        TileId(1, 0, 0), TileId(1, 1, 0), TileId(1, 0, 1), TileId(1, 1, 1)
        , TileId(0, 0, 0)
    };
    REQUIRE(tiles == expected);
}

TEST_CASE("siblings are yielded together")
{
    const auto tiles(collect(walk(Pyramid::toast(3))));
    REQUIRE(tiles.size() == 64);
    for (std::size_t i(0); i < tiles.size(); i += 4) {
        const auto p(parent(tiles[i]));
        for (std::size_t j(0); j < 4; ++j) {
            REQUIRE(parent(tiles[i + j]) == p);
            REQUIRE(child(tiles[i + j]) == int(j));
        }
    }
}

TEST_CASE("operation counts")
{
    REQUIRE(countOperations(Pyramid::toast(2), false) == 21);
    REQUIRE(countOperations(Pyramid::toast(2), true) == 16);
    REQUIRE(countOperations(Pyramid::toast(2), false, Lod(1)) == 20);
    REQUIRE(countOperations(Pyramid::toast(2), false, Lod(2)) == 16);
    REQUIRE(countOperations(Pyramid::toast(0), false) == 1);
}

TEST_CASE("subpyramid covers subtree of its root only")
{
    const TileId root(1, 1, 0);
    const auto sub(subpyramid(Pyramid::toast(3), root));
    REQUIRE(sub.root() == root);
    REQUIRE(countLiveTiles(sub) == 16);
    REQUIRE(countLiveTiles(sub, WalkMode::allLevels) == 21);

    for (const auto &tile : collect(walk(sub))) {
        REQUIRE(tile.lod == 3);
        REQUIRE(above(tile, root));
    }

    REQUIRE(sub.contains(TileId(2, 2, 0)));
    REQUIRE_FALSE(sub.contains(TileId(2, 0, 0)));

    REQUIRE(countOperations(sub, false) == 21);
}

TEST_CASE("invalid subpyramid roots are refused")
{
    REQUIRE_THROWS_AS(subpyramid(Pyramid::toast(2), TileId(3, 0, 0))
                      , ConfigurationError);
    REQUIRE_THROWS_AS(subpyramid(Pyramid::toast(4), TileId(2, 4, 0))
                      , ConfigurationError);

    const auto sub(subpyramid(Pyramid::toast(4), TileId(1, 0, 0)));
    REQUIRE_THROWS_AS(subpyramid(sub, TileId(2, 3, 3)), ConfigurationError);
}

TEST_CASE("ancestor filter keeps one subtree")
{
    const TileId target(2, 1, 3);
    const auto pyramid(Pyramid::toastFiltered(4, ancestorFilter(target)));
    REQUIRE(countLiveTiles(pyramid) == 16);

    // target subtree + its two proper ancestors
    REQUIRE(countLiveTiles(pyramid, WalkMode::allLevels) == 21 + 2);
}

TEST_CASE("rejected root yields empty walk")
{
    const auto rejectRoot(std::make_shared<PredicateFilter>
                          ([](const TileId &tileId) {
                              return tileId.lod > 0;
                          }));

    REQUIRE(collect(walk(Pyramid::toast(2), WalkMode::allLevels
                         , rejectRoot)).empty());
    REQUIRE(countLiveTiles(Pyramid::toast(2), WalkMode::bottomOnly
                           , rejectRoot) == 0);
}

TEST_CASE("rejected tile prunes its subtree")
{
    const auto rejectOne(std::make_shared<PredicateFilter>
                         ([](const TileId &tileId) {
                             return tileId != TileId(1, 0, 0);
                         }));

    const auto pyramid(Pyramid::generic(3, rejectOne));
    REQUIRE(countLiveTiles(pyramid) == 48);
}

TEST_CASE("generic pyramid refuses spatial filter")
{
    const auto filter(boundsFilter(SkyBounds::all()));
    REQUIRE_THROWS_AS(Pyramid::generic(3, filter), ConfigurationError);
    REQUIRE_THROWS_AS(walk(Pyramid::generic(3), WalkMode::bottomOnly, filter)
                      , ConfigurationError);
}

TEST_CASE("too deep pyramid is refused")
{
    REQUIRE_THROWS_AS(Pyramid::toast(MaxLod + 1), ConfigurationError);
}

TEST_CASE("quadrant of a tile")
{
    REQUIRE(quadrant(TileId(3, 5, 2)) == TileId(1, 1, 0));
    REQUIRE(quadrant(TileId(1, 0, 1)) == TileId(1, 0, 1));
    REQUIRE(quadrant(TileId(0, 0, 0)) == TileId(0, 0, 0));
}
