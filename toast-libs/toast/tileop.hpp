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
#ifndef toastlibs_toast_tileop_hpp_included_
#define toastlibs_toast_tileop_hpp_included_

#include <set>
#include <cstdint>

#include "basetypes.hpp"

namespace toastlibs { namespace toast {

TileId parent(const TileId &tileId, Lod diff = 1);

Children children(const TileId &tileId);

/** Check whether super tile is above (or exactly the same tile) as tile.
 */
bool above(const TileId &tile, const TileId &super);

/** Index of tile inside its parent (0: ul, 1: ur, 2: ll, 3: lr).
 */
int child(const TileId &tileId);

/** Checks tile index against its lod.
 */
bool valid(const TileId &tileId);

/** Number of tiles in one row (or column) of given lod.
 */
std::uint64_t tileCount(Lod lod);

/** Number of tiles in whole lod.
 */
std::uint64_t lodTileCount(Lod lod);

/** Number of tiles in whole pyramid with lods 0..depth.
 */
std::uint64_t depth2tiles(Lod depth);

/** Collects parents of all given tiles. If allAncestors is true, ancestors
 *  up to the root are collected as well.
 */
std::set<TileId> parents(const TileId::list &tiles, bool allAncestors = false);

TileId verticalFlip(const TileId &tileId);

// inline stuff

inline TileId parent(const TileId &tileId, Lod diff)
{
    // do not let new id to go above root
    if (diff > tileId.lod) { return {}; }
    return TileId(tileId.lod - diff, tileId.x >> diff, tileId.y >> diff);
}

inline Children children(const TileId &tileId)
{
    TileId base(tileId.lod + 1, tileId.x << 1, tileId.y << 1);

    return {{
        { base, 0 }                                  // upper-left
        , { base.lod, base.x + 1, base.y, 1 }        // upper-right
        , { base.lod, base.x, base.y + 1, 2 }        // lower-left
        , { base.lod, base.x + 1, base.y + 1, 3 }    // lower-right
    }};
}

inline int child(const TileId &tileId)
{
    return (tileId.x & 1l) + ((tileId.y & 1l) << 1);
}

inline std::uint64_t tileCount(Lod lod)
{
    return std::uint64_t(1) << lod;
}

inline std::uint64_t lodTileCount(Lod lod)
{
    return std::uint64_t(1) << (2 * lod);
}

inline std::uint64_t depth2tiles(Lod depth)
{
    return ((std::uint64_t(1) << (2 * (depth + 1))) - 1) / 3;
}

inline bool valid(const TileId &tileId)
{
    if (tileId.lod > MaxLod) { return false; }
    const auto tc(tileCount(tileId.lod));
    return (tileId.x < tc) && (tileId.y < tc);
}

inline TileId verticalFlip(const TileId &tileId)
{
    return TileId(tileId.lod, tileId.x
                  , (std::uint64_t(1) << tileId.lod) - 1 - tileId.y);
}

} } // namespace toastlibs::toast

#endif // toastlibs_toast_tileop_hpp_included_
