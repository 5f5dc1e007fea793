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
#include <cmath>
#include <cstring>
#include <algorithm>
#include <stdexcept>

#include "dbglog/dbglog.hpp"

#include "sampler.hpp"
#include "projection.hpp"
#include "error.hpp"

namespace toastlibs { namespace toast {

TileImage Sampler::sample(const cv::Mat &lon, const cv::Mat &lat) const
{
    if ((lon.type() != CV_64FC1) || (lat.type() != CV_64FC1)
        || (lon.size() != lat.size()))
    {
        LOGTHROW(err2, std::logic_error)
            << "Sampler input must be two CV_64FC1 matrices of the "
            "same size.";
    }

    auto image(sample_impl(lon, lat));
    if ((image.mode() != mode()) || (image.data().size() != lon.size())) {
        LOGTHROW(err2, std::logic_error)
            << "Sampler produced image of mode <" << image.mode()
            << "> and size " << image.width() << "x" << image.height()
            << "; expected <" << mode() << "> and size "
            << lon.cols << "x" << lon.rows << ".";
    }
    return image;
}

TileImage FunctionSampler::sample_impl(const cv::Mat &lon
                                       , const cv::Mat &lat) const
{
    TileImage image(ImageMode::f32, lon.cols, lon.rows);
    auto &data(image.data());

    for (int j(0); j < lon.rows; ++j) {
        for (int i(0); i < lon.cols; ++i) {
            data.at<float>(j, i) = float(function_(lon.at<double>(j, i)
                                                   , lat.at<double>(j, i)));
        }
    }

    return image;
}

CartesianSampler::CartesianSampler(const TileImage &image)
    : image_(image)
{
    if (image_.width() != 2 * image_.height()) {
        LOGTHROW(err1, ConfigurationError)
            << "Plate carree image must be twice as wide as tall, got "
            << image_.width() << "x" << image_.height() << ".";
    }
}

TileImage CartesianSampler::sample_impl(const cv::Mat &lon
                                        , const cv::Mat &lat) const
{
    const auto &src(image_.data());
    const auto nx(src.cols);
    const auto ny(src.rows);
    const auto elemSize(src.elemSize());

    TileImage image(image_.mode(), lon.cols, lon.rows);
    auto &data(image.data());

    for (int j(0); j < lon.rows; ++j) {
        for (int i(0); i < lon.cols; ++i) {
            const auto l(wrapLon(lon.at<double>(j, i) + M_PI));
            const auto b(lat.at<double>(j, i) + 0.5 * M_PI);

            const int col(std::max(0, std::min
                                   (nx - 1, int(nx * (1.0 - l / (2 * M_PI))))));
            const int row(std::max(0, std::min
                                   (ny - 1, int(ny * (1.0 - b / M_PI)))));

            std::memcpy(data.ptr(j, i), src.ptr(row, col), elemSize);
        }
    }

    return image;
}

} } // namespace toastlibs::toast
