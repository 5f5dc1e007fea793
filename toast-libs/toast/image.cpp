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
#include <limits>

#include <opencv2/imgproc/imgproc.hpp>

#include "dbglog/dbglog.hpp"

#include "../storage/error.hpp"

#include "image.hpp"

namespace toastlibs { namespace toast {

int TileImage::cvType(ImageMode mode)
{
    switch (mode) {
    case ImageMode::rgb: return CV_8UC3;
    case ImageMode::rgba: return CV_8UC4;
    case ImageMode::f32: return CV_32FC1;
    }
    throw;
}

ImageMode TileImage::maskableMode(ImageMode mode)
{
    return (mode == ImageMode::rgb) ? ImageMode::rgba : mode;
}

TileImage::TileImage(ImageMode mode, const cv::Mat &data)
    : mode_(mode), data_(data)
{
    if (data_.type() != cvType(mode_)) {
        LOGTHROW(err1, storage::InconsistentInput)
            << "Matrix of type " << data_.type()
            << " cannot hold image of mode <" << mode_ << ">.";
    }
}

TileImage::TileImage(ImageMode mode, int width, int height)
    : mode_(mode)
{
    switch (mode_) {
    case ImageMode::rgb:
        data_.create(height, width, CV_8UC3);
        data_ = cv::Scalar(0, 0, 0);
        break;

    case ImageMode::rgba:
        data_.create(height, width, CV_8UC4);
        data_ = cv::Scalar(0, 0, 0, 0);
        break;

    case ImageMode::f32:
        data_.create(height, width, CV_32FC1);
        data_ = cv::Scalar(std::numeric_limits<float>::quiet_NaN());
        break;
    }
}

bool TileImage::valid(int x, int y) const
{
    switch (mode_) {
    case ImageMode::rgb: return true;
    case ImageMode::rgba: return data_.at<cv::Vec4b>(y, x)[3];
    case ImageMode::f32: return !std::isnan(data_.at<float>(y, x));
    }
    throw;
}

bool TileImage::empty() const
{
    if (data_.empty()) { return true; }

    switch (mode_) {
    case ImageMode::rgb:
        return false;

    case ImageMode::rgba:
        for (auto i(data_.begin<cv::Vec4b>()), e(data_.end<cv::Vec4b>());
             i != e; ++i)
        {
            if ((*i)[3]) { return false; }
        }
        return true;

    case ImageMode::f32:
        for (auto i(data_.begin<float>()), e(data_.end<float>()); i != e; ++i)
        {
            if (!std::isnan(*i)) { return false; }
        }
        return true;
    }
    throw;
}

DataRange TileImage::dataRange() const
{
    auto range(DataRange::emptyRange());
    if (mode_ != ImageMode::f32) { return range; }

    for (auto i(data_.begin<float>()), e(data_.end<float>()); i != e; ++i) {
        if (!std::isnan(*i)) { storage::update(range, double(*i)); }
    }
    return range;
}

TileImage TileImage::asMaskable() const
{
    if (maskable()) { return *this; }

    cv::Mat rgba;
    cv::cvtColor(data_, rgba, cv::COLOR_RGB2RGBA);
    return TileImage(ImageMode::rgba, rgba);
}

void TileImage::flipVertically()
{
    cv::Mat tmp;
    cv::flip(data_, tmp, 0);
    data_ = tmp;
}

} } // namespace toastlibs::toast
