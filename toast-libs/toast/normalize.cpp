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
#include <cstdint>
#include <cmath>
#include <algorithm>

#include "dbglog/dbglog.hpp"

#include "normalize.hpp"
#include "error.hpp"

namespace toastlibs { namespace toast {

namespace {

inline double clip(double value)
{
    return std::max(0.0, std::min(1.0, value));
}

double stretch(double x, Stretch stretch)
{
    switch (stretch) {
    case Stretch::linear: return x;
    case Stretch::log: return std::log10(1000.0 * x + 1.0) / std::log10(1001.0);
    case Stretch::power: return (std::pow(1000.0, x) - 1.0) / 999.0;
    case Stretch::sqrt: return std::sqrt(x);
    case Stretch::asinh: return std::asinh(10.0 * x) / std::asinh(10.0);
    }
    throw;
}

} // namespace

void validate(const NormalizeOptions &options)
{
    if (!std::isfinite(options.vmin) || !std::isfinite(options.vmax)) {
        LOGTHROW(err1, ConfigurationError)
            << "Normalization bounds must be finite, got ["
            << options.vmin << ", " << options.vmax << "].";
    }

    if (options.vmin == options.vmax) {
        LOGTHROW(err1, ConfigurationError)
            << "Degenerate normalization bounds ["
            << options.vmin << ", " << options.vmax << "].";
    }

    if (!std::isfinite(options.bias) || !std::isfinite(options.contrast)) {
        LOGTHROW(err1, ConfigurationError)
            << "Normalization bias and contrast must be finite.";
    }
}

double normalize(double value, const NormalizeOptions &options)
{
    if (std::isnan(value)) { return value; }

    const auto x(clip((value - options.vmin)
                      / (options.vmax - options.vmin)));
    const auto y(stretch(x, options.stretch));
    return clip(options.contrast * (y - options.bias) + 0.5);
}

TileImage normalize(const TileImage &image, const NormalizeOptions &options)
{
    validate(options);

    if (image.mode() != ImageMode::f32) {
        LOGTHROW(err1, ConfigurationError)
            << "Only f32 images can be normalized, got <"
            << image.mode() << ">.";
    }

    const auto &src(image.data());
    TileImage out(ImageMode::rgba, image.width(), image.height());
    auto &dst(out.data());

    for (int j(0); j < src.rows; ++j) {
        for (int i(0); i < src.cols; ++i) {
            const auto value(src.at<float>(j, i));
            if (std::isnan(value)) { continue; }

            const auto gray(cv::saturate_cast<std::uint8_t>
                            (std::round(255.0 * normalize(value, options))));
            dst.at<cv::Vec4b>(j, i) = cv::Vec4b(gray, gray, gray, 255);
        }
    }

    return out;
}

Normalizer::Normalizer(const Sampler::pointer &base
                       , const NormalizeOptions &options)
    : base_(base), options_(options)
{
    validate(options_);

    if (!base_) {
        LOGTHROW(err1, ConfigurationError)
            << "Normalizer needs a base sampler.";
    }

    if (base_->mode() != ImageMode::f32) {
        LOGTHROW(err1, ConfigurationError)
            << "Normalizer needs f32 base sampler, got <"
            << base_->mode() << ">.";
    }
}

TileImage Normalizer::sample_impl(const cv::Mat &lon, const cv::Mat &lat)
    const
{
    return normalize(base_->sample(lon, lat), options_);
}

} } // namespace toastlibs::toast
