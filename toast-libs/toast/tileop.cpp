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
#include "tileop.hpp"

namespace toastlibs { namespace toast {

bool above(const TileId &tile, const TileId &super)
{
    // tile cannot be above super tile
    if (tile.lod < super.lod) { return false; }

    // same lod -> must be the same tile
    if (tile.lod == super.lod) { return tile == super; }

    // calculate parent of tile at super's lod
    return (parent(tile, tile.lod - super.lod) == super);
}

std::set<TileId> parents(const TileId::list &tiles, bool allAncestors)
{
    std::set<TileId> out;

    for (const auto &tile : tiles) {
        auto current(tile);
        while (current.lod) {
            current = parent(current);
            if (!out.insert(current).second && allAncestors) {
                // already there including all its ancestors
                break;
            }
            if (!allAncestors) { break; }
        }
    }

    return out;
}

} } // namespace toastlibs::toast
