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
 * \file toast/pyramidio/config.hpp
 *
 * Persistent configuration of a pyramid storage root.
 */

#ifndef toastlibs_toast_pyramidio_config_hpp_included_
#define toastlibs_toast_pyramidio_config_hpp_included_

#include <iostream>

#include <boost/filesystem/path.hpp>

#include "utility/enum-io.hpp"

namespace toastlibs { namespace toast {

/** Tile file format.
 */
enum class Format {
    png    //!< 8-bit rgb/rgba
    , jpg  //!< 8-bit rgb, lossy
    , npy  //!< NumPy array of 32-bit floats
};

/** Tile path layout under storage root.
 */
enum class PathScheme {
    lyyx  //!< {lod}/{y}/{y}_{x}.ext
    , lxy //!< {lod}/{x}/{y}.ext
};

struct PyramidConfig {
    Format format;
    PathScheme scheme;

    /** -1: row 0 of stored image is the top row; +1: row 0 is the bottom
     *  row.
     */
    int verticalParitySign;

    int tileSize;

    PyramidConfig()
        : format(Format::png), scheme(PathScheme::lyyx)
        , verticalParitySign(-1), tileSize(256)
    {}
};

/** File extension (including the dot) for given format.
 */
const char* extension(Format format);

namespace pyramidio {

/** Name of config file inside storage root.
 */
extern const char *ConfigName;

PyramidConfig loadConfig(std::istream &in
                         , const boost::filesystem::path &path
                         = "UNKNOWN");

PyramidConfig loadConfig(const boost::filesystem::path &path);

void saveConfig(std::ostream &out, const PyramidConfig &config);

/** Saves config atomically (temporary file + rename).
 */
void saveConfig(const boost::filesystem::path &path
                , const PyramidConfig &config);

} // namespace pyramidio

UTILITY_GENERATE_ENUM_IO(Format,
    ((png))
    ((jpg))
    ((npy))
)

UTILITY_GENERATE_ENUM_IO(PathScheme,
    ((lyyx))
    ((lxy))
)

} } // namespace toastlibs::toast

#endif // toastlibs_toast_pyramidio_config_hpp_included_
