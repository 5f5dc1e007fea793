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
#include <cstdint>
#include <limits>

#include "dbglog/dbglog.hpp"

#include "../storage/error.hpp"

#include "downsample.hpp"

namespace toastlibs { namespace toast {

namespace {

// block offsets in ul, ur, ll, lr order
const int BlockX[4] = { 0, 1, 0, 1 };
const int BlockY[4] = { 0, 0, 1, 1 };

void checkBuffer(const TileImage &buffer)
{
    if ((buffer.width() % 2) || (buffer.height() % 2)) {
        LOGTHROW(err1, storage::InconsistentInput)
            << "Cannot merge buffer of odd size " << buffer.width()
            << "x" << buffer.height() << ".";
    }
}

template <int Channels>
inline bool validPixel(const cv::Vec<std::uint8_t, Channels> &px)
{
    return (Channels != 4) || px[Channels - 1];
}

void averageFloat(const cv::Mat &src, cv::Mat &dst)
{
    for (int j(0); j < dst.rows; ++j) {
        for (int i(0); i < dst.cols; ++i) {
            double sum(0.0);
            int count(0);
            for (int b(0); b < 4; ++b) {
                const auto value(src.at<float>(2 * j + BlockY[b]
                                               , 2 * i + BlockX[b]));
                if (std::isnan(value)) { continue; }
                sum += value;
                ++count;
            }

            dst.at<float>(j, i)
                = (count ? float(sum / count)
                   : std::numeric_limits<float>::quiet_NaN());
        }
    }
}

template <int Channels>
void averageByte(const cv::Mat &src, cv::Mat &dst)
{
    typedef cv::Vec<std::uint8_t, Channels> Pixel;

    for (int j(0); j < dst.rows; ++j) {
        for (int i(0); i < dst.cols; ++i) {
            int sum[Channels] = { 0 };
            int count(0);
            for (int b(0); b < 4; ++b) {
                const auto &px(src.at<Pixel>(2 * j + BlockY[b]
                                             , 2 * i + BlockX[b]));
                if (!validPixel(px)) { continue; }
                for (int c(0); c < Channels; ++c) { sum[c] += px[c]; }
                ++count;
            }

            auto &out(dst.at<Pixel>(j, i));
            out = Pixel::all(0);
            if (!count) { continue; }
            for (int c(0); c < Channels; ++c) {
                out[c] = cv::saturate_cast<std::uint8_t>
                    (std::round(double(sum[c]) / count));
            }
        }
    }
}

void decimateFloat(const cv::Mat &src, cv::Mat &dst)
{
    for (int j(0); j < dst.rows; ++j) {
        for (int i(0); i < dst.cols; ++i) {
            auto &out(dst.at<float>(j, i));
            out = std::numeric_limits<float>::quiet_NaN();
            for (int b(0); b < 4; ++b) {
                const auto value(src.at<float>(2 * j + BlockY[b]
                                               , 2 * i + BlockX[b]));
                if (!std::isnan(value)) { out = value; break; }
            }
        }
    }
}

template <int Channels>
void decimateByte(const cv::Mat &src, cv::Mat &dst)
{
    typedef cv::Vec<std::uint8_t, Channels> Pixel;

    for (int j(0); j < dst.rows; ++j) {
        for (int i(0); i < dst.cols; ++i) {
            auto &out(dst.at<Pixel>(j, i));
            out = Pixel::all(0);
            for (int b(0); b < 4; ++b) {
                const auto &px(src.at<Pixel>(2 * j + BlockY[b]
                                             , 2 * i + BlockX[b]));
                if (validPixel(px)) { out = px; break; }
            }
        }
    }
}

} // namespace

TileImage assemble(const ChildImages &children, int paritySign)
{
    const TileImage *first(nullptr);
    for (const auto &child : children) {
        if (child) { first = &*child; break; }
    }

    if (!first) {
        LOGTHROW(err1, storage::InconsistentInput)
            << "No child image to assemble.";
    }

    const auto mode(TileImage::maskableMode(first->mode()));
    const auto width(first->width());
    const auto height(first->height());

    for (const auto &child : children) {
        if (!child) { continue; }

        if (TileImage::maskableMode(child->mode()) != mode) {
            LOGTHROW(err1, storage::InconsistentInput)
                << "Cannot assemble children of modes <" << first->mode()
                << "> and <" << child->mode() << ">.";
        }

        if ((child->width() != width) || (child->height() != height)) {
            LOGTHROW(err1, storage::InconsistentInput)
                << "Cannot assemble children of sizes " << width << "x"
                << height << " and " << child->width() << "x"
                << child->height() << ".";
        }
    }

    TileImage buffer(mode, 2 * width, 2 * height);

    for (int index(0); index < 4; ++index) {
        const auto &child(children[index]);
        if (!child) { continue; }

        const int cx(index & 1);
        const int cy((index >> 1) & 1);
        const int row((paritySign > 0) ? (1 - cy) : cy);

        cv::Mat roi(buffer.data()
                    , cv::Rect(cx * width, row * height, width, height));
        child->asMaskable().data().copyTo(roi);
    }

    return buffer;
}

TileImage averagingMerger(const TileImage &buffer)
{
    checkBuffer(buffer);

    TileImage out(buffer.mode(), buffer.width() / 2, buffer.height() / 2);
    switch (buffer.mode()) {
    case ImageMode::f32:
        averageFloat(buffer.data(), out.data());
        break;

    case ImageMode::rgb:
        averageByte<3>(buffer.data(), out.data());
        break;

    case ImageMode::rgba:
        averageByte<4>(buffer.data(), out.data());
        break;
    }

    return out;
}

TileImage decimatingMerger(const TileImage &buffer)
{
    checkBuffer(buffer);

    TileImage out(buffer.mode(), buffer.width() / 2, buffer.height() / 2);
    switch (buffer.mode()) {
    case ImageMode::f32:
        decimateFloat(buffer.data(), out.data());
        break;

    case ImageMode::rgb:
        decimateByte<3>(buffer.data(), out.data());
        break;

    case ImageMode::rgba:
        decimateByte<4>(buffer.data(), out.data());
        break;
    }

    return out;
}

TileImage downsample(const ChildImages &children, int paritySign
                     , const Merger &merger)
{
    return merger(assemble(children, paritySign));
}

} } // namespace toastlibs::toast
