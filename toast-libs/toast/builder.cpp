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
#include <boost/filesystem.hpp>

#include <opencv2/imgproc/imgproc.hpp>

#include "dbglog/dbglog.hpp"

#include "utility/openmp.hpp"
#include "utility/progress.hpp"

#include "../storage/error.hpp"

#include "builder.hpp"
#include "error.hpp"
#include "projection.hpp"
#include "pyramid.hpp"
#include "pyramidio/codec.hpp"
#include "tileop.hpp"
#include "io.hpp"

namespace fs = boost::filesystem;

namespace toastlibs { namespace toast {

namespace {

/** Can images of given mode be stored in given format (possibly after
 *  dropping alpha)?
 */
bool storable(ImageMode mode, Format format)
{
    return (compatible(mode, format)
            || ((mode == ImageMode::rgba) && (format == Format::jpg)));
}

TileImage prepareForStorage(const TileImage &image, Format format)
{
    if (compatible(image.mode(), format)) { return image; }

    // only rgba -> jpg gets here
    cv::Mat rgb;
    cv::cvtColor(image.data(), rgb, cv::COLOR_RGBA2RGB);
    return TileImage(ImageMode::rgb, rgb);
}

void checkStorage(const PyramidIO &pio)
{
    if (pio.config().tileSize != TileSize) {
        LOGTHROW(err2, ConfigurationError)
            << "Pyramid at " << pio.root() << " has tile size "
            << pio.config().tileSize << ", only " << TileSize
            << " is supported.";
    }
}

/** Pyramid for the downsampling phase. Spatial filter needs projection bound
 *  in, otherwise plain quadtree suffices.
 */
Pyramid cascadePyramid(Lod depth, const BuildConfig &config)
{
    if (config.tileFilter && config.tileFilter->spatial()) {
        return Pyramid::toastFiltered(depth, config.tileFilter);
    }
    return Pyramid::generic(depth, config.tileFilter);
}

/** Thread-safe accumulation of build counters.
 */
class Accounting {
public:
    typedef std::size_t BuildReport::*Counter;

    void operator()(Counter counter) {
        UTILITY_OMP(critical(toastlibs_builder_report))
        ++(report_.*counter);
    }

    const BuildReport& report() const { return report_; }

private:
    BuildReport report_;
};

} // namespace

BuildReport& BuildReport::operator+=(const BuildReport &other)
{
    sampled += other.sampled;
    merged += other.merged;
    written += other.written;
    skippedEmpty += other.skippedEmpty;
    skippedExisting += other.skippedExisting;
    failed += other.failed;
    return *this;
}

void validate(Lod depth, const BuildConfig &config)
{
    if (depth > MaxLod) {
        LOGTHROW(err2, ConfigurationError)
            << "Pyramid depth " << depth << " exceeds maximum depth "
            << MaxLod << ".";
    }

    if (config.topLayer && (*config.topLayer > depth)) {
        LOGTHROW(err2, ConfigurationError)
            << "Top layer " << *config.topLayer
            << " lies below pyramid depth " << depth << ".";
    }

    if (!config.merger) {
        LOGTHROW(err2, ConfigurationError) << "No merger configured.";
    }
}

Pyramid samplingPyramid(Lod depth, const BuildConfig &config)
{
    if (config.tileFilter) {
        return Pyramid::toastFiltered(depth, config.tileFilter);
    }
    return Pyramid::toast(depth);
}

std::uint64_t countOperations(Lod depth, const BuildConfig &config)
{
    validate(depth, config);
    return countOperations(samplingPyramid(depth, config)
                           , config.baseLevelOnly, config.topLayer);
}

BuildReport sampleLayer(const Sampler &sampler, Lod depth
                        , const PyramidIO &pio, const BuildConfig &config)
{
    validate(depth, config);
    checkStorage(pio);

    const auto format(pio.defaultFormat());
    if (!storable(sampler.mode(), format)) {
        LOGTHROW(err2, ConfigurationError)
            << "Sampler producing " << sampler.mode()
            << " images cannot feed " << format << " pyramid at "
            << pio.root() << ".";
    }

    const auto pyramid(samplingPyramid(depth, config));
    const bool flip(pio.defaultVerticalParitySign() > 0);

    LOG(info3) << "Sampling tiles at lod " << depth << " into "
               << pio.root() << ".";

    const utility::Progress::ratio_t reportRatio(5, 1000);
    utility::ts::Progress progress("sample", countLiveTiles(pyramid)
                                   , reportRatio);

    Accounting account;

    auto process([&](const TileId &tileId)
    {
        if ((config.resume == ResumePolicy::skipExisting)
            && pio.exists(tileId))
        {
            LOG(info1) << "Tile " << tileId << " already exists.";
            account(&BuildReport::skippedExisting);
            return;
        }

        cv::Mat lon, lat;
        tileCoords(tileId, lon, lat);
        auto image(sampler.sample(lon, lat));
        account(&BuildReport::sampled);

        if (image.empty()) {
            LOG(info1) << "Tile " << tileId << " has no data.";
            account(&BuildReport::skippedEmpty);
            return;
        }

        if (flip) { image.flipVertically(); }

        pio.writeImage(tileId, prepareForStorage(image, format));

        if (config.metadata) {
            auto writer(pio.openMetadataForWrite(tileId));
            writer.metadata().provenance = Provenance::sampled;
            writer.metadata().dataRange = image.dataRange();
            writer.commit();
        }

        account(&BuildReport::written);
    });

    UTILITY_OMP(parallel)
    UTILITY_OMP(single)
    {
        auto walker(walk(pyramid, WalkMode::bottomOnly));
        while (const auto next = walker.next()) {
            const TileId tileId(*next);
            UTILITY_OMP(task)
            {
                try {
                    process(tileId);
                } catch (const std::exception &e) {
                    LOG(warn3) << "Failed to sample tile " << tileId << ": "
                               << e.what();
                    account(&BuildReport::failed);
                }
                ++progress;
            }
        }
    }

    LOG(info3) << "Sampling done (" << account.report() << ").";
    return account.report();
}

BuildReport cascade(const PyramidIO &pio, Lod depth
                    , const BuildConfig &config)
{
    validate(depth, config);
    checkStorage(pio);

    const auto pyramid(cascadePyramid(depth, config));
    const auto format(pio.defaultFormat());
    const auto paritySign(pio.defaultVerticalParitySign());
    const Lod stop(config.topLayer ? *config.topLayer : Lod(0));

    Accounting account;
    if (depth <= stop) { return account.report(); }

    const utility::Progress::ratio_t reportRatio(5, 1000);
    utility::ts::Progress progress
        ("downsample"
         , countOperations(pyramid, false, config.topLayer)
         - countLiveTiles(pyramid)
         , reportRatio);

    auto process([&](const TileId &tileId)
    {
        if ((config.resume == ResumePolicy::skipExisting)
            && pio.exists(tileId))
        {
            LOG(info1) << "Tile " << tileId << " already exists.";
            account(&BuildReport::skippedExisting);
            return;
        }

        ChildImages images;
        auto range(DataRange::emptyRange());
        bool any(false);

        for (const auto &child : children(tileId)) {
            auto &image(images[child.index]);
            image = pio.readImage(child, NullWhenNotFound);
            if (!image) { continue; }
            any = true;

            if (config.metadata) {
                auto reader(pio.openMetadataForRead(child));
                if (reader.metadata()) {
                    range = storage::unite(range
                                           , reader.metadata()->dataRange);
                    continue;
                }
            }
            range = storage::unite(range, image->dataRange());
        }

        if (!any) {
            account(&BuildReport::skippedEmpty);
            return;
        }

        const auto parent(downsample(images, paritySign, config.merger));
        account(&BuildReport::merged);

        if (parent.empty()) {
            LOG(info1) << "Tile " << tileId << " has no data.";
            account(&BuildReport::skippedEmpty);
            return;
        }

        const auto stored(prepareForStorage(parent, format));
        pio.updateImage(tileId, [&](boost::optional<TileImage> &image)
        {
            image = stored;
        });

        if (config.metadata) {
            auto writer(pio.openMetadataForWrite(tileId));
            writer.metadata().provenance = Provenance::merged;
            writer.metadata().dataRange = range;
            writer.commit();
        }

        account(&BuildReport::written);
    });

    // every lod is finished before its parent lod starts: end of the
    // parallel region is the barrier
    for (int lod(depth - 1); lod >= int(stop); --lod) {
        LOG(info3) << "Downsampling into lod " << lod << ".";
        const auto level(pyramid.truncated(Lod(lod)));

        UTILITY_OMP(parallel)
        UTILITY_OMP(single)
        {
            auto walker(walk(level, WalkMode::bottomOnly));
            while (const auto next = walker.next()) {
                const TileId tileId(*next);
                UTILITY_OMP(task)
                {
                    try {
                        process(tileId);
                    } catch (const std::exception &e) {
                        LOG(warn3) << "Failed to downsample tile " << tileId
                                   << ": " << e.what();
                        account(&BuildReport::failed);
                    }
                    ++progress;
                }
            }
        }
    }

    LOG(info3) << "Downsampling done (" << account.report() << ").";
    return account.report();
}

BuildReport build(const Sampler &sampler, Lod depth, const PyramidIO &pio
                  , const BuildConfig &config)
{
    validate(depth, config);

    LOG(info3) << "Building pyramid of depth " << depth << " at "
               << pio.root() << " (" << countOperations(depth, config)
               << " operations).";

    auto report(sampleLayer(sampler, depth, pio, config));
    if (!config.baseLevelOnly) {
        report += cascade(pio, depth, config);
    }

    if (report.failed) {
        LOG(warn3) << "Pyramid at " << pio.root() << " built with "
                   << report.failed << " failed tile(s).";
    }
    LOG(info3) << "Pyramid built (" << report << ").";
    return report;
}

BuildReport build(const Sampler &sampler, Lod depth, const fs::path &root
                  , const BuildConfig &config)
{
    validate(depth, config);

    if (fs::exists(root / pyramidio::ConfigName)) {
        return build(sampler, depth, PyramidIO::open(root), config);
    }

    PyramidConfig pc;
    pc.format = ((sampler.mode() == ImageMode::f32)
                 ? Format::npy : Format::png);
    return build(sampler, depth, PyramidIO::create(root, pc), config);
}

} } // namespace toastlibs::toast
