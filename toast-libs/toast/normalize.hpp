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
 * \file toast/normalize.hpp
 *
 * Conversion of scientific (f32) data to display-ready 8-bit values.
 */

#ifndef toastlibs_toast_normalize_hpp_included_
#define toastlibs_toast_normalize_hpp_included_

#include "utility/enum-io.hpp"

#include "sampler.hpp"

namespace toastlibs { namespace toast {

enum class Stretch { linear, log, power, sqrt, asinh };

struct NormalizeOptions {
    double vmin;
    double vmax;
    Stretch stretch;

    /** Value (in stretched space) mapped to mid-gray.
     */
    double bias;

    /** Slope multiplier applied around bias.
     */
    double contrast;

    NormalizeOptions(double vmin = 0.0, double vmax = 1.0
                     , Stretch stretch = Stretch::linear)
        : vmin(vmin), vmax(vmax), stretch(stretch), bias(0.5), contrast(1.0)
    {}
};

/** Validates options. Throws ConfigurationError.
 */
void validate(const NormalizeOptions &options);

/** Normalizes single value into [0, 1]. NaN stays NaN.
 */
double normalize(double value, const NormalizeOptions &options);

/** Normalizes f32 image into gray rgba image. No-data pixels get alpha 0.
 */
TileImage normalize(const TileImage &image, const NormalizeOptions &options);

/** Sampler wrapping an f32 sampler and normalizing its output.
 */
class Normalizer : public Sampler {
public:
    Normalizer(const Sampler::pointer &base, const NormalizeOptions &options);

    const NormalizeOptions& options() const { return options_; }

private:
    virtual TileImage sample_impl(const cv::Mat &lon, const cv::Mat &lat)
        const;

    virtual ImageMode mode_impl() const { return ImageMode::rgba; }

    Sampler::pointer base_;
    NormalizeOptions options_;
};

UTILITY_GENERATE_ENUM_IO(Stretch,
    ((linear))
    ((log))
    ((power))
    ((sqrt))
    ((asinh))
)

} } // namespace toastlibs::toast

#endif // toastlibs_toast_normalize_hpp_included_
