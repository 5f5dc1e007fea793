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
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "../toast/sampler.hpp"
#include "../toast/normalize.hpp"
#include "../toast/error.hpp"

#include "testing.hpp"

using namespace toastlibs::toast;
namespace testing = toastlibs::testing;

namespace {

void grid(int width, int height, cv::Mat &lon, cv::Mat &lat)
{
    lon.create(height, width, CV_64FC1);
    lat.create(height, width, CV_64FC1);
    for (int j(0); j < height; ++j) {
        for (int i(0); i < width; ++i) {
            lon.at<double>(j, i) = 0.1 * i;
            lat.at<double>(j, i) = -0.2 * j;
        }
    }
}

} // namespace

TEST_CASE("function sampler evaluates function at every position")
{
    FunctionSampler sampler([](double lon, double lat) {
            return lon + 10 * lat;
        });
    REQUIRE(sampler.mode() == ImageMode::f32);

    cv::Mat lon, lat;
    grid(4, 3, lon, lat);
    const auto image(sampler.sample(lon, lat));

    REQUIRE(image.mode() == ImageMode::f32);
    REQUIRE(image.width() == 4);
    REQUIRE(image.height() == 3);
    REQUIRE(image.data().at<float>(2, 3)
            == Catch::Approx(0.3 - 4.0).epsilon(1e-6));
}

TEST_CASE("sampler refuses mismatched coordinates")
{
    FunctionSampler sampler([](double, double) { return 1.0; });

    cv::Mat lon, lat;
    grid(4, 3, lon, lat);

    REQUIRE_THROWS_AS(sampler.sample(lon, lat.rowRange(0, 2))
                      , std::logic_error);

    cv::Mat lonf;
    lon.convertTo(lonf, CV_32FC1);
    REQUIRE_THROWS_AS(sampler.sample(lonf, lat), std::logic_error);
}

TEST_CASE("plate carree sampler picks nearest pixel")
{
    // value = 10 * column + row
    cv::Mat data(4, 8, CV_32FC1);
    for (int j(0); j < data.rows; ++j) {
        for (int i(0); i < data.cols; ++i) {
            data.at<float>(j, i) = float(10 * i + j);
        }
    }

    CartesianSampler sampler(TileImage(ImageMode::f32, data));
    REQUIRE(sampler.mode() == ImageMode::f32);

    cv::Mat lon(1, 3, CV_64FC1), lat(1, 3, CV_64FC1);
    lon.at<double>(0, 0) = 0.0; lat.at<double>(0, 0) = 0.0;
    lon.at<double>(0, 1) = 0.1; lat.at<double>(0, 1) = 1.5;
    lon.at<double>(0, 2) = 0.0; lat.at<double>(0, 2) = -0.5 * M_PI;

    const auto image(sampler.sample(lon, lat));
    REQUIRE(image.data().at<float>(0, 0) == 42.0f);
    REQUIRE(image.data().at<float>(0, 1) == 30.0f);
    REQUIRE(image.data().at<float>(0, 2) == 43.0f);
}

TEST_CASE("plate carree image must be twice as wide as tall")
{
    REQUIRE_THROWS_AS(CartesianSampler(TileImage(ImageMode::rgba, 10, 10))
                      , ConfigurationError);
}

TEST_CASE("value normalization")
{
    const NormalizeOptions linear(0.0, 2.0);
    REQUIRE(normalize(0.5, linear) == Catch::Approx(0.25));
    REQUIRE(normalize(-1.0, linear) == 0.0);
    REQUIRE(normalize(5.0, linear) == 1.0);
    REQUIRE(std::isnan(normalize(std::numeric_limits<double>::quiet_NaN()
                                 , linear)));

    const NormalizeOptions sqrt(0.0, 1.0, Stretch::sqrt);
    REQUIRE(normalize(0.25, sqrt) == Catch::Approx(0.5));

    for (const auto stretch : { Stretch::log, Stretch::power
                                , Stretch::asinh })
    {
        const NormalizeOptions options(0.0, 1.0, stretch);
        REQUIRE(normalize(0.0, options) == Catch::Approx(0.0).margin(1e-12));
        REQUIRE(normalize(1.0, options) == Catch::Approx(1.0));
    }
}

TEST_CASE("degenerate normalization is refused")
{
    REQUIRE_THROWS_AS(validate(NormalizeOptions(1.0, 1.0))
                      , ConfigurationError);
    REQUIRE_THROWS_AS(validate(NormalizeOptions
                               (0.0, std::numeric_limits<double>::infinity()))
                      , ConfigurationError);
}

TEST_CASE("normalizer renders gray rgba keeping no-data transparent")
{
    const auto base(std::make_shared<FunctionSampler>
                    ([](double lon, double) {
                        return (lon > 0.15)
                            ? std::numeric_limits<double>::quiet_NaN()
                            : 0.5;
                    }));

    Normalizer normalizer(base, NormalizeOptions(0.0, 1.0));
    REQUIRE(normalizer.mode() == ImageMode::rgba);

    cv::Mat lon, lat;
    grid(4, 1, lon, lat);
    const auto image(normalizer.sample(lon, lat));

    REQUIRE(image.mode() == ImageMode::rgba);
    REQUIRE(image.data().at<cv::Vec4b>(0, 0) == cv::Vec4b(128, 128, 128, 255));
    REQUIRE(image.data().at<cv::Vec4b>(0, 1) == cv::Vec4b(128, 128, 128, 255));
    REQUIRE(image.data().at<cv::Vec4b>(0, 2)[3] == 0);
    REQUIRE(image.data().at<cv::Vec4b>(0, 3)[3] == 0);
}

TEST_CASE("normalizer needs floating point base")
{
    const auto base(std::make_shared<CartesianSampler>
                    (TileImage(ImageMode::rgb, 8, 4)));
    REQUIRE_THROWS_AS(Normalizer(base, NormalizeOptions())
                      , ConfigurationError);
    REQUIRE_THROWS_AS(Normalizer(testing::constantSampler(1.0)
                                 , NormalizeOptions(2.0, 2.0))
                      , ConfigurationError);
}
