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
 * \file toast/pyramidio/metadata.hpp
 *
 * Per-tile sidecar metadata.
 */

#ifndef toastlibs_toast_pyramidio_metadata_hpp_included_
#define toastlibs_toast_pyramidio_metadata_hpp_included_

#include <iostream>

#include <boost/filesystem/path.hpp>

#include "utility/enum-io.hpp"

#include "../image.hpp"

namespace toastlibs { namespace toast {

/** How tile came to existence.
 */
enum class Provenance {
    sampled   //!< sampled from source data
    , merged  //!< downsampled from its children
};

struct TileMetadata {
    Provenance provenance;

    /** Range of valid data (f32 tiles only, empty otherwise).
     */
    DataRange dataRange;

    TileMetadata()
        : provenance(Provenance::sampled)
        , dataRange(DataRange::emptyRange())
    {}
};

TileMetadata loadMetadata(std::istream &in
                          , const boost::filesystem::path &path
                          = "UNKNOWN");

void saveMetadata(std::ostream &out, const TileMetadata &metadata);

UTILITY_GENERATE_ENUM_IO(Provenance,
    ((sampled))
    ((merged))
)

} } // namespace toastlibs::toast

#endif // toastlibs_toast_pyramidio_metadata_hpp_included_
