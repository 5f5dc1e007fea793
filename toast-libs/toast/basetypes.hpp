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
#ifndef toastlibs_toast_basetypes_hpp_included_
#define toastlibs_toast_basetypes_hpp_included_

#include <array>
#include <cstdint>
#include <vector>
#include <string>

#include "utility/enum-io.hpp"

#include "../storage/range.hpp"

namespace toastlibs { namespace toast {

using storage::Range;

/** Level of detail; 16 bits so that it prints as a number.
 */
typedef std::uint16_t Lod;

/** Deepest supported level of detail.
 */
constexpr Lod MaxLod(30);

/** Tile identifier: LOD + tile index from upper-left corner of the TOAST
 *  square.
 */
struct TileId {
    typedef unsigned int index_type;
    Lod lod;
    index_type x;
    index_type y;

    TileId(Lod lod = 0, index_type x = 0, index_type y = 0)
        : lod(lod), x(x), y(y)
    {}

    bool operator<(const TileId &tid) const;
    bool operator==(const TileId &tid) const;
    bool operator!=(const TileId &tid) const;

    typedef std::vector<TileId> list;
};

struct Child : TileId {
    unsigned int index;

    Child(const TileId &tileId = TileId(), unsigned int index = 0)
        : TileId(tileId), index(index)
    {}

    Child(Lod lod, unsigned int x, unsigned int y, unsigned int index)
        : TileId(lod, x, y), index(index)
    {}
};

typedef std::array<Child, 4> Children;

/** What to do when creating a pyramid over an existing one.
 */
enum class CreateMode {
    failIfExists //!< creation fails if pyramid already exists
    , overwrite  //!< existing pyramid is replaced with new one
};

// inline stuff

inline bool TileId::operator==(const TileId &tid) const
{
    return ((lod == tid.lod) && (x == tid.x) && (y == tid.y));
}

inline bool TileId::operator!=(const TileId &tid) const
{
    return ((lod != tid.lod) || (x != tid.x) || (y != tid.y));
}

inline bool TileId::operator<(const TileId &tid) const
{
    if (lod < tid.lod) { return true; }
    else if (tid.lod < lod) { return false; }

    if (x < tid.x) { return true; }
    else if (tid.x < x) { return false; }

    return y < tid.y;
}

UTILITY_GENERATE_ENUM_IO(CreateMode,
    ((failIfExists))
    ((overwrite))
)

} } // namespace toastlibs::toast

#endif // toastlibs_toast_basetypes_hpp_included_
