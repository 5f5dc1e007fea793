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
#include <cerrno>
#include <fstream>
#include <sstream>
#include <iterator>
#include <system_error>

#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>

#include "dbglog/dbglog.hpp"

#include "utility/path.hpp"
#include "utility/raise.hpp"

#include "../storage/error.hpp"
#include "../storage/atomicfile.hpp"

#include "pyramidio.hpp"
#include "pyramidio/codec.hpp"
#include "tileop.hpp"
#include "io.hpp"

namespace fs = boost::filesystem;

namespace toastlibs { namespace toast {

const NullWhenNotFound_t NullWhenNotFound;

namespace {

const std::string MetadataExtension(".meta.json");

/** Reads whole file. Returns false if file does not exist.
 */
bool readFile(const fs::path &path, std::vector<unsigned char> &data)
{
    std::ifstream f(path.string(), std::ios_base::in | std::ios_base::binary);
    if (!f) {
        if ((errno == ENOENT) || (errno == ENOTDIR)) { return false; }
        std::system_error e
            (errno, std::system_category()
             , utility::formatError("Failed to open file %s.", path));
        LOG(err2) << e.what();
        throw e;
    }

    data.assign(std::istreambuf_iterator<char>(f)
                , std::istreambuf_iterator<char>());
    if (f.bad()) {
        LOGTHROW(err2, storage::IOError)
            << "Failed to read file " << path << ".";
    }
    return true;
}

} // namespace

void MetadataWriter::commit()
{
    std::ostringstream os;
    saveMetadata(os, metadata_);
    const auto content(os.str());

    LOG(info1) << "Saving tile metadata to " << path_ << ".";
    storage::writeAtomically(path_, content.data(), content.size());
    existed_ = true;
}

PyramidIO::PyramidIO(const fs::path &root, const PyramidConfig &config
                     , const storage::LockPolicy &lockPolicy)
    : root_(root), config_(config), lockPolicy_(lockPolicy)
{}

PyramidIO PyramidIO::create(const fs::path &root
                            , const PyramidConfig &config
                            , CreateMode mode
                            , const storage::LockPolicy &lockPolicy)
{
    const auto configPath(root / pyramidio::ConfigName);

    if (fs::exists(configPath)) {
        if (mode == CreateMode::failIfExists) {
            LOGTHROW(err2, storage::PyramidAlreadyExists)
                << "Pyramid at " << root << " already exists.";
        }

        LOG(info2) << "Removing existing pyramid at " << root << ".";
        fs::remove_all(root);
    }

    fs::create_directories(root);
    pyramidio::saveConfig(configPath, config);

    LOG(info2) << "Created pyramid at " << root << " (format: "
               << config.format << ", scheme: " << config.scheme
               << ", vertical parity: " << config.verticalParitySign
               << ").";
    return PyramidIO(root, config, lockPolicy);
}

PyramidIO PyramidIO::open(const fs::path &root
                          , const storage::LockPolicy &lockPolicy)
{
    return PyramidIO(root, pyramidio::loadConfig
                     (root / pyramidio::ConfigName), lockPolicy);
}

fs::path PyramidIO::tileStem(const TileId &tileId) const
{
    const auto lod(boost::lexical_cast<std::string>(tileId.lod));
    const auto x(boost::lexical_cast<std::string>(tileId.x));
    const auto y(boost::lexical_cast<std::string>(tileId.y));

    switch (config_.scheme) {
    case PathScheme::lyyx:
        return root_ / lod / y / (y + "_" + x);

    case PathScheme::lxy:
        return root_ / lod / x / y;
    }
    throw;
}

fs::path PyramidIO::tilePath(const TileId &tileId) const
{
    return utility::addExtension(tileStem(tileId)
                                 , extension(config_.format));
}

fs::path PyramidIO::metadataPath(const TileId &tileId) const
{
    return utility::addExtension(tileStem(tileId), MetadataExtension);
}

std::string PyramidIO::pathTemplate() const
{
    const std::string ext(extension(config_.format));
    switch (config_.scheme) {
    case PathScheme::lyyx: return "{1}/{3}/{3}_{2}" + ext;
    case PathScheme::lxy: return "{1}/{2}/{3}" + ext;
    }
    throw;
}

TileImage PyramidIO::readImage(const TileId &tileId) const
{
    if (auto image = readImage(tileId, NullWhenNotFound)) {
        return *image;
    }

    LOGTHROW(err1, storage::NoSuchTile)
        << "There is no tile " << tileId << " in pyramid " << root_ << ".";
    throw;
}

boost::optional<TileImage>
PyramidIO::readImage(const TileId &tileId, const NullWhenNotFound_t&) const
{
    const auto path(tilePath(tileId));

    std::vector<unsigned char> data;
    if (!readFile(path, data)) { return boost::none; }
    LOG(info1) << "Loaded tile " << tileId << " from " << path << ".";

    auto image(decode(data, config_.format, path));
    if ((image.width() != config_.tileSize)
        || (image.height() != config_.tileSize))
    {
        LOGTHROW(err1, storage::Corrupted)
            << "Tile " << path << " has size " << image.width() << "x"
            << image.height() << ", expected " << config_.tileSize
            << "x" << config_.tileSize << ".";
    }

    return image;
}

void PyramidIO::writeImage(const TileId &tileId, const TileImage &image)
    const
{
    if ((image.width() != config_.tileSize)
        || (image.height() != config_.tileSize))
    {
        LOGTHROW(err1, storage::InconsistentInput)
            << "Cannot store " << image.width() << "x" << image.height()
            << " image as tile " << tileId << " of size "
            << config_.tileSize << ".";
    }

    const auto data(encode(image, config_.format));
    const auto path(tilePath(tileId));
    LOG(info1) << "Saving tile " << tileId << " to " << path << ".";
    storage::writeAtomically(path, data.data(), data.size());
}

void PyramidIO::updateImage(const TileId &tileId, const Mutator &mutator)
    const
{
    const auto path(tilePath(tileId));
    fs::create_directories(path.parent_path());

    storage::ScopedLock lock(storage::lockPath(path), lockPolicy_);

    auto image(readImage(tileId, NullWhenNotFound));
    const bool existed(image);

    mutator(image);

    if (image) {
        writeImage(tileId, *image);
    } else if (existed) {
        removeImage(tileId);
    }

    lock.unlock();
}

bool PyramidIO::exists(const TileId &tileId) const
{
    return fs::exists(tilePath(tileId));
}

void PyramidIO::removeImage(const TileId &tileId) const
{
    const auto path(tilePath(tileId));
    LOG(info1) << "Removing tile " << tileId << " (" << path << ").";
    fs::remove(path);
}

boost::optional<TileMetadata>
PyramidIO::loadMetadata(const fs::path &path) const
{
    std::vector<unsigned char> data;
    if (!readFile(path, data)) { return boost::none; }

    std::istringstream is(std::string(data.begin(), data.end()));
    return toast::loadMetadata(is, path);
}

MetadataReader PyramidIO::openMetadataForRead(const TileId &tileId) const
{
    const auto path(metadataPath(tileId));
    fs::create_directories(path.parent_path());

    std::unique_ptr<storage::ScopedLock> lock
        (new storage::ScopedLock(storage::lockPath(path), lockPolicy_));
    auto metadata(loadMetadata(path));
    return MetadataReader(std::move(lock), metadata);
}

MetadataWriter PyramidIO::openMetadataForWrite(const TileId &tileId) const
{
    const auto path(metadataPath(tileId));
    fs::create_directories(path.parent_path());

    std::unique_ptr<storage::ScopedLock> lock
        (new storage::ScopedLock(storage::lockPath(path), lockPolicy_));
    auto metadata(loadMetadata(path));
    return MetadataWriter(std::move(lock), path, metadata);
}

std::size_t PyramidIO::cleanLockfiles(std::chrono::seconds staleAge) const
{
    return storage::cleanLockfiles(root_, staleAge);
}

} } // namespace toastlibs::toast
