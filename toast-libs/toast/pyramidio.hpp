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
 * \file toast/pyramidio.hpp
 *
 * Tiled storage: maps tiles to files under a storage root, reads and writes
 * tile images and per-tile metadata.
 *
 * Every file is published atomically (written to a temporary file and renamed
 * over the destination) so a reader never sees a partial write.
 * Read-modify-write cycles are serialized per tile by lock records.
 */

#ifndef toastlibs_toast_pyramidio_hpp_included_
#define toastlibs_toast_pyramidio_hpp_included_

#include <chrono>
#include <memory>
#include <functional>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include "../storage/locking.hpp"

#include "basetypes.hpp"
#include "image.hpp"
#include "pyramidio/config.hpp"
#include "pyramidio/metadata.hpp"

namespace toastlibs { namespace toast {

struct NullWhenNotFound_t {};
const extern NullWhenNotFound_t NullWhenNotFound;

/** Scoped read access to tile metadata. Holds tile's metadata lock for its
 *  whole lifetime.
 */
class MetadataReader {
public:
    /** Metadata, none if tile has no metadata.
     */
    const boost::optional<TileMetadata>& metadata() const {
        return metadata_;
    }

private:
    MetadataReader(std::unique_ptr<storage::ScopedLock> &&lock
                   , const boost::optional<TileMetadata> &metadata)
        : lock_(std::move(lock)), metadata_(metadata)
    {}

    friend class PyramidIO;

    std::unique_ptr<storage::ScopedLock> lock_;
    boost::optional<TileMetadata> metadata_;
};

/** Scoped write access to tile metadata. Holds tile's metadata lock for its
 *  whole lifetime. Changes are published by commit(); uncommitted changes are
 *  dropped.
 */
class MetadataWriter {
public:
    /** Metadata to modify, initialized from stored one (if any).
     */
    TileMetadata& metadata() { return metadata_; }

    /** Did metadata exist before?
     */
    bool existed() const { return existed_; }

    /** Atomically replaces stored metadata.
     */
    void commit();

private:
    MetadataWriter(std::unique_ptr<storage::ScopedLock> &&lock
                   , const boost::filesystem::path &path
                   , const boost::optional<TileMetadata> &metadata)
        : lock_(std::move(lock)), path_(path)
        , metadata_(metadata ? *metadata : TileMetadata())
        , existed_(bool(metadata))
    {}

    friend class PyramidIO;

    std::unique_ptr<storage::ScopedLock> lock_;
    boost::filesystem::path path_;
    TileMetadata metadata_;
    bool existed_;
};

class PyramidIO {
public:
    /** Read-modify-write callback: receives current image (or none), leaves
     *  new image (or none to remove the tile) in place.
     */
    typedef std::function<void(boost::optional<TileImage>&)> Mutator;

    /** Storage over given root with given configuration; nothing is touched
     *  on disk.
     */
    PyramidIO(const boost::filesystem::path &root
              , const PyramidConfig &config = PyramidConfig()
              , const storage::LockPolicy &lockPolicy
              = storage::LockPolicy());

    /** Creates new storage root with persisted config.
     */
    static PyramidIO create(const boost::filesystem::path &root
                            , const PyramidConfig &config
                            , CreateMode mode = CreateMode::failIfExists
                            , const storage::LockPolicy &lockPolicy
                            = storage::LockPolicy());

    /** Opens existing storage root; throws storage::NoSuchPyramid if there is
     *  no config.
     */
    static PyramidIO open(const boost::filesystem::path &root
                          , const storage::LockPolicy &lockPolicy
                          = storage::LockPolicy());

    const boost::filesystem::path& root() const { return root_; }
    const PyramidConfig& config() const { return config_; }
    const storage::LockPolicy& lockPolicy() const { return lockPolicy_; }

    boost::filesystem::path tilePath(const TileId &tileId) const;

    boost::filesystem::path metadataPath(const TileId &tileId) const;

    /** Reads tile image.
     *
     *  Throws storage::NoSuchTile if tile does not exist and
     *  storage::Corrupted if it cannot be decoded.
     */
    TileImage readImage(const TileId &tileId) const;

    /** Reads tile image, returns none if tile does not exist.
     */
    boost::optional<TileImage> readImage(const TileId &tileId
                                         , const NullWhenNotFound_t&) const;

    /** Atomically replaces tile image.
     */
    void writeImage(const TileId &tileId, const TileImage &image) const;

    /** Read-modify-write under tile's lock.
     *
     *  Throws storage::LockContention if the lock cannot be obtained.
     */
    void updateImage(const TileId &tileId, const Mutator &mutator) const;

    bool exists(const TileId &tileId) const;

    void removeImage(const TileId &tileId) const;

    MetadataReader openMetadataForRead(const TileId &tileId) const;

    MetadataWriter openMetadataForWrite(const TileId &tileId) const;

    /** Sweeps stale lock records and temporary files abandoned by dead
     *  writers under this storage root.
     */
    std::size_t cleanLockfiles(std::chrono::seconds staleAge
                               = std::chrono::seconds(3600)) const;

    Format defaultFormat() const { return config_.format; }

    PathScheme pathScheme() const { return config_.scheme; }

    /** URL template of tiles relative to storage root ({1}: lod, {2}: x,
     *  {3}: y).
     */
    std::string pathTemplate() const;

    int defaultVerticalParitySign() const {
        return config_.verticalParitySign;
    }

private:
    boost::filesystem::path tileStem(const TileId &tileId) const;

    boost::optional<TileMetadata>
    loadMetadata(const boost::filesystem::path &path) const;

    boost::filesystem::path root_;
    PyramidConfig config_;
    storage::LockPolicy lockPolicy_;
};

} } // namespace toastlibs::toast

#endif // toastlibs_toast_pyramidio_hpp_included_
