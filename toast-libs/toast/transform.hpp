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
 * \file toast/transform.hpp
 *
 * Whole-pyramid transformations.
 */

#ifndef toastlibs_toast_transform_hpp_included_
#define toastlibs_toast_transform_hpp_included_

#include "normalize.hpp"
#include "builder.hpp"

namespace toastlibs { namespace toast {

/** Renders every stored tile of an f32 (npy) pyramid into display-ready rgba
 *  tile of destination pyramid.
 *
 *  Tiles are flipped when pyramids differ in vertical parity; metadata
 *  provenance is carried over. Missing tiles are skipped.
 *
 *  \param src source pyramid (npy format)
 *  \param dst destination pyramid (png format)
 *  \param depth deepest lod to convert
 *  \param options normalization applied to each sample
 *  \param filter optional tile restriction
 */
BuildReport normalizePyramid(const PyramidIO &src, const PyramidIO &dst
                             , Lod depth, const NormalizeOptions &options
                             , const TileFilter::pointer &filter = nullptr);

} } // namespace toastlibs::toast

#endif // toastlibs_toast_transform_hpp_included_
