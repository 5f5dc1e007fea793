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
 * \file toast/sampler.hpp
 *
 * Samplers: sources of pixel values for given sky coordinates.
 */

#ifndef toastlibs_toast_sampler_hpp_included_
#define toastlibs_toast_sampler_hpp_included_

#include <memory>
#include <functional>

#include <opencv2/core/core.hpp>

#include "image.hpp"

namespace toastlibs { namespace toast {

/** Sampler interface.
 *
 *  Maps co-indexed matrices of longitudes and latitudes (CV_64FC1, same
 *  size) to an image of the same size. Positions outside of source data are
 *  reported as no-data.
 *
 *  Implementations must be safe to call from multiple threads at once.
 */
class Sampler {
public:
    typedef std::shared_ptr<Sampler> pointer;

    virtual ~Sampler() {}

    TileImage sample(const cv::Mat &lon, const cv::Mat &lat) const;

    /** Mode of images produced by this sampler.
     */
    ImageMode mode() const { return mode_impl(); }

private:
    virtual TileImage sample_impl(const cv::Mat &lon, const cv::Mat &lat)
        const = 0;

    virtual ImageMode mode_impl() const = 0;
};

/** Sampler calling user supplied function for each position. Produces f32
 *  images; function returns NaN for no-data.
 */
class FunctionSampler : public Sampler {
public:
    typedef std::function<double(double lon, double lat)> Function;

    FunctionSampler(const Function &function) : function_(function) {}

private:
    virtual TileImage sample_impl(const cv::Mat &lon, const cv::Mat &lat)
        const;

    virtual ImageMode mode_impl() const { return ImageMode::f32; }

    Function function_;
};

/** Sampler over all-sky image in plate carree projection.
 *
 *  Image must be twice as wide as tall. Longitude grows to the left with
 *  (lon, lat) = (0, 0) in image center; top row is the north pole.
 */
class CartesianSampler : public Sampler {
public:
    CartesianSampler(const TileImage &image);

private:
    virtual TileImage sample_impl(const cv::Mat &lon, const cv::Mat &lat)
        const;

    virtual ImageMode mode_impl() const { return image_.mode(); }

    TileImage image_;
};

} } // namespace toastlibs::toast

#endif // toastlibs_toast_sampler_hpp_included_
