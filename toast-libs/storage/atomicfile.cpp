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
#include <sys/types.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <fstream>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>

#include "dbglog/dbglog.hpp"

#include "utility/path.hpp"

#include "error.hpp"
#include "locking.hpp"
#include "atomicfile.hpp"

namespace fs = boost::filesystem;

namespace toastlibs { namespace storage {

namespace {

const std::string TmpExtension(".tmp");

std::atomic<unsigned long> tmpCounter(0);

/** Host name usable inside file name extension.
 */
const std::string& fileHostname()
{
    static const std::string host([]() -> std::string
    {
        auto name(hostname());
        for (auto &c : name) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && (c != '-')) {
                c = '_';
            }
        }
        return name;
    }());
    return host;
}

fs::path buildTmpPath(const fs::path &path)
{
    // unique among hosts, processes (pid) and threads (counter)
    const auto ext(str(boost::format(".%s-%d-%d%s")
                       % fileHostname() % ::getpid() % tmpCounter++
                       % TmpExtension));
    return utility::addExtension(path, ext);
}

} // namespace

AtomicFile::AtomicFile(const fs::path &path)
    : path_(path), tmpPath_(buildTmpPath(path))
{
    const auto dir(path_.parent_path());
    if (!dir.empty()) { fs::create_directories(dir); }
}

AtomicFile::~AtomicFile()
{
    if (tmpPath_.empty()) { return; }

    boost::system::error_code ec;
    fs::remove(tmpPath_, ec);
    if (ec) {
        LOG(warn2) << "Unable to remove temporary file " << tmpPath_
                   << ": " << ec.message() << ".";
    }
}

void AtomicFile::commit()
{
    if (tmpPath_.empty()) { return; }
    LOG(info1) << "Moving file " << tmpPath_ << " to " << path_ << ".";
    fs::rename(tmpPath_, path_);
    tmpPath_.clear();
}

void AtomicFile::rollback()
{
    if (tmpPath_.empty()) { return; }
    LOG(warn2) << "Removing failed file " << tmpPath_ << ".";
    fs::remove(tmpPath_);
    tmpPath_.clear();
}

void writeAtomically(const fs::path &path, const void *data
                     , std::size_t size)
{
    AtomicFile af(path);

    try {
        std::ofstream f;
        f.exceptions(std::ios::badbit | std::ios::failbit);
        f.open(af.tmpPath().string()
               , std::ios_base::out | std::ios_base::trunc
               | std::ios_base::binary);
        f.write(static_cast<const char*>(data), size);
        f.close();
    } catch (const std::exception &e) {
        af.rollback();
        LOGTHROW(err2, IOError)
            << "Unable to write file " << af.tmpPath() << ": <"
            << e.what() << ">.";
    }

    af.commit();
}

boost::optional<TemporaryOwner> temporaryOwner(const fs::path &path)
{
    if (path.extension() != TmpExtension) { return boost::none; }

    // tag is "<host>-<pid>-<n>"
    auto tag(path.stem().extension().string());
    if (tag.size() < 2) { return boost::none; }
    tag.erase(0, 1);

    const auto counterSep(tag.rfind('-'));
    if (!counterSep || (counterSep == std::string::npos)) {
        return boost::none;
    }
    const auto pidSep(tag.rfind('-', counterSep - 1));
    if (!pidSep || (pidSep == std::string::npos)) { return boost::none; }

    TemporaryOwner owner;
    unsigned long counter(0);
    if (!boost::conversion::try_lexical_convert
        (tag.substr(pidSep + 1, counterSep - pidSep - 1), owner.pid)
        || !boost::conversion::try_lexical_convert
        (tag.substr(counterSep + 1), counter))
    {
        return boost::none;
    }

    owner.local = (tag.substr(0, pidSep) == fileHostname());
    return owner;
}

} } // namespace toastlibs::storage
