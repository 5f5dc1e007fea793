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
 * \file toast/builder.hpp
 *
 * Pyramid build: sampling of the deepest layer followed by depth-by-depth
 * downsampling towards the root.
 */

#ifndef toastlibs_toast_builder_hpp_included_
#define toastlibs_toast_builder_hpp_included_

#include <cstdint>
#include <iostream>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include "utility/enum-io.hpp"

#include "basetypes.hpp"
#include "filter.hpp"
#include "sampler.hpp"
#include "downsample.hpp"
#include "pyramidio.hpp"

namespace toastlibs { namespace toast {

/** What to do with tiles already present in the storage.
 */
enum class ResumePolicy {
    overwrite       //!< regenerate every tile
    , skipExisting  //!< keep tiles already written
};

struct BuildConfig {
    /** Restricts built tiles; none means whole sky.
     */
    TileFilter::pointer tileFilter;

    /** Build only the deepest layer.
     */
    bool baseLevelOnly;

    /** Shallowest lod to downsample into; none means down to the root.
     */
    boost::optional<Lod> topLayer;

    ResumePolicy resume;

    /** Write per-tile metadata.
     */
    bool metadata;

    Merger merger;

    BuildConfig()
        : baseLevelOnly(false), resume(ResumePolicy::overwrite)
        , metadata(true), merger(averagingMerger)
    {}
};

/** Build outcome.
 */
struct BuildReport {
    std::size_t sampled;          //!< tiles sampled from source
    std::size_t merged;           //!< tiles downsampled from children
    std::size_t written;          //!< tiles stored
    std::size_t skippedEmpty;     //!< tiles not stored due to no data
    std::size_t skippedExisting;  //!< tiles kept due to resume policy
    std::size_t failed;           //!< tiles failed (logged)

    BuildReport()
        : sampled(), merged(), written(), skippedEmpty(), skippedExisting()
        , failed()
    {}

    BuildReport& operator+=(const BuildReport &other);
};

/** Checks build parameters; throws ConfigurationError.
 */
void validate(Lod depth, const BuildConfig &config);

/** Pyramid sampled by a build of given depth and configuration.
 */
Pyramid samplingPyramid(Lod depth, const BuildConfig &config);

/** Number of sampling and downsampling operations of a build.
 */
std::uint64_t countOperations(Lod depth, const BuildConfig &config);

/** Samples all (filtered) tiles at given depth and stores non-empty ones.
 */
BuildReport sampleLayer(const Sampler &sampler, Lod depth
                        , const PyramidIO &pio, const BuildConfig &config);

/** Derives all (filtered) tiles above given depth from stored tiles at given
 *  depth, one lod after another, stopping at config.topLayer (or at the
 *  root).
 */
BuildReport cascade(const PyramidIO &pio, Lod depth
                    , const BuildConfig &config);

/** Full build: sampleLayer() followed by cascade() unless
 *  config.baseLevelOnly is set.
 */
BuildReport build(const Sampler &sampler, Lod depth, const PyramidIO &pio
                  , const BuildConfig &config = BuildConfig());

/** Full build into given storage root. Existing pyramid is reused (its
 *  configuration must suit the sampler), missing one is created with format
 *  matching the sampler.
 */
BuildReport build(const Sampler &sampler, Lod depth
                  , const boost::filesystem::path &root
                  , const BuildConfig &config = BuildConfig());

template<typename CharT, typename Traits>
inline std::basic_ostream<CharT, Traits>&
operator<<(std::basic_ostream<CharT, Traits> &os, const BuildReport &r)
{
    return os << "sampled: " << r.sampled << ", merged: " << r.merged
              << ", written: " << r.written
              << ", skipped empty: " << r.skippedEmpty
              << ", skipped existing: " << r.skippedExisting
              << ", failed: " << r.failed;
}

UTILITY_GENERATE_ENUM_IO(ResumePolicy,
    ((overwrite))
    ((skipExisting))
)

} } // namespace toastlibs::toast

#endif // toastlibs_toast_builder_hpp_included_
