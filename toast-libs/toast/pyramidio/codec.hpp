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
 * \file toast/pyramidio/codec.hpp
 *
 * Tile image serialization.
 */

#ifndef toastlibs_toast_pyramidio_codec_hpp_included_
#define toastlibs_toast_pyramidio_codec_hpp_included_

#include <vector>

#include <boost/filesystem/path.hpp>

#include "../image.hpp"
#include "config.hpp"

namespace toastlibs { namespace toast {

/** Can image of given mode be stored in given format?
 */
bool compatible(ImageMode mode, Format format);

/** Serializes image. Throws storage::FormatError when the image mode cannot
 *  be stored in the format.
 */
std::vector<unsigned char> encode(const TileImage &image, Format format);

/** Deserializes image. Throws storage::Corrupted on malformed data.
 *
 *  \param data serialized image
 *  \param format tile format
 *  \param path source path (for error reporting only)
 */
TileImage decode(const std::vector<unsigned char> &data, Format format
                 , const boost::filesystem::path &path);

namespace npy {

/** Serializes 2D CV_32FC1 matrix as NumPy v1.0 array ("<f4").
 */
std::vector<unsigned char> write(const cv::Mat &data);

/** Parses NumPy array of little-endian 32-bit floats.
 */
cv::Mat read(const std::vector<unsigned char> &data
             , const boost::filesystem::path &path);

} // namespace npy

} } // namespace toastlibs::toast

#endif // toastlibs_toast_pyramidio_codec_hpp_included_
