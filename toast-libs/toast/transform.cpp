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
#include "dbglog/dbglog.hpp"

#include "utility/openmp.hpp"
#include "utility/progress.hpp"

#include "transform.hpp"
#include "error.hpp"
#include "pyramid.hpp"
#include "pyramidio/codec.hpp"
#include "io.hpp"

namespace toastlibs { namespace toast {

BuildReport normalizePyramid(const PyramidIO &src, const PyramidIO &dst
                             , Lod depth, const NormalizeOptions &options
                             , const TileFilter::pointer &filter)
{
    validate(options);

    if (depth > MaxLod) {
        LOGTHROW(err2, ConfigurationError)
            << "Pyramid depth " << depth << " exceeds maximum depth "
            << MaxLod << ".";
    }

    if (!compatible(ImageMode::f32, src.defaultFormat())) {
        LOGTHROW(err2, ConfigurationError)
            << "Pyramid at " << src.root() << " does not hold f32 tiles.";
    }

    if (!compatible(ImageMode::rgba, dst.defaultFormat())) {
        LOGTHROW(err2, ConfigurationError)
            << "Pyramid at " << dst.root() << " cannot hold rgba tiles.";
    }

    const auto pyramid((filter && filter->spatial())
                       ? Pyramid::toastFiltered(depth, filter)
                       : Pyramid::generic(depth, filter));
    const bool flip(src.defaultVerticalParitySign()
                    != dst.defaultVerticalParitySign());

    const utility::Progress::ratio_t reportRatio(5, 1000);
    utility::ts::Progress progress
        ("normalize", countLiveTiles(pyramid, WalkMode::allLevels)
         , reportRatio);

    BuildReport report;

    auto process([&](const TileId &tileId)
    {
        const auto image(src.readImage(tileId, NullWhenNotFound));
        if (!image) { return; }

        auto out(normalize(*image, options));
        if (flip) { out.flipVertically(); }
        dst.writeImage(tileId, out);

        auto provenance(Provenance::sampled);
        {
            auto reader(src.openMetadataForRead(tileId));
            if (reader.metadata()) {
                provenance = reader.metadata()->provenance;
            }
        }

        auto writer(dst.openMetadataForWrite(tileId));
        writer.metadata().provenance = provenance;
        writer.commit();

        UTILITY_OMP(critical(toastlibs_transform_report))
        ++report.written;
    });

    UTILITY_OMP(parallel)
    UTILITY_OMP(single)
    {
        auto walker(walk(pyramid, WalkMode::allLevels));
        while (const auto next = walker.next()) {
            const TileId tileId(*next);
            UTILITY_OMP(task)
            {
                try {
                    process(tileId);
                } catch (const std::exception &e) {
                    LOG(warn3) << "Failed to normalize tile " << tileId
                               << ": " << e.what();
                    UTILITY_OMP(critical(toastlibs_transform_report))
                    ++report.failed;
                }
                ++progress;
            }
        }
    }

    LOG(info3) << "Normalized pyramid " << src.root() << " into "
               << dst.root() << " (" << report << ").";
    return report;
}

} } // namespace toastlibs::toast
