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
 * \file toast/image.hpp
 *
 * Tile pixel buffer.
 */

#ifndef toastlibs_toast_image_hpp_included_
#define toastlibs_toast_image_hpp_included_

#include <opencv2/core/core.hpp>

#include "utility/enum-io.hpp"

#include "../storage/range.hpp"

namespace toastlibs { namespace toast {

/** Pixel layout of a tile.
 *
 *  rgb:  CV_8UC3, cannot represent no-data
 *  rgba: CV_8UC4, alpha 0 marks no-data
 *  f32:  CV_32FC1, NaN marks no-data
 *
 *  Channels are stored in R, G, B(, A) order.
 */
enum class ImageMode { rgb, rgba, f32 };

typedef storage::Range<double> DataRange;

/** Tile image: OpenCV matrix tagged with image mode.
 */
class TileImage {
public:
    TileImage() : mode_(ImageMode::rgba) {}

    /** Wraps existing matrix; type must agree with mode.
     */
    TileImage(ImageMode mode, const cv::Mat &data);

    /** Creates image filled with no-data (or black for rgb).
     */
    TileImage(ImageMode mode, int width, int height);

    ImageMode mode() const { return mode_; }

    const cv::Mat& data() const { return data_; }
    cv::Mat& data() { return data_; }

    int width() const { return data_.cols; }
    int height() const { return data_.rows; }

    /** Is pixel valid (i.e. not no-data)?
     */
    bool valid(int x, int y) const;

    /** Has no valid pixel.
     */
    bool empty() const;

    /** Can represent no-data?
     */
    bool maskable() const { return mode_ != ImageMode::rgb; }

    /** Minimum and maximum of valid samples. Defined only for f32 images,
     *  empty range otherwise.
     */
    DataRange dataRange() const;

    /** Returns maskable version of this image (rgb is converted to rgba).
     */
    TileImage asMaskable() const;

    /** Flips image upside down in place.
     */
    void flipVertically();

    /** OpenCV type used for given mode.
     */
    static int cvType(ImageMode mode);

    /** Maskable counterpart of given mode.
     */
    static ImageMode maskableMode(ImageMode mode);

private:
    ImageMode mode_;
    cv::Mat data_;
};

UTILITY_GENERATE_ENUM_IO(ImageMode,
    ((rgb))
    ((rgba))
    ((f32))
)

} } // namespace toastlibs::toast

#endif // toastlibs_toast_image_hpp_included_
