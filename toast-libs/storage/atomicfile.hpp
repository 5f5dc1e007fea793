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
 * \file storage/atomicfile.hpp
 *
 * Replace-on-write file publishing: content is written to a temporary
 * sibling file which is renamed over the destination on commit.
 */

#ifndef toastlibs_storage_atomicfile_hpp_included_
#define toastlibs_storage_atomicfile_hpp_included_

#include <cstddef>

#include <sys/types.h>

#include <boost/optional.hpp>
#include <boost/noncopyable.hpp>
#include <boost/filesystem/path.hpp>

namespace toastlibs { namespace storage {

class AtomicFile : boost::noncopyable {
public:
    /** Prepares temporary file name for given destination. Destination
     *  directory is created if it does not exist.
     */
    AtomicFile(const boost::filesystem::path &path);

    /** Removes temporary file unless commit() has been called.
     */
    ~AtomicFile();

    /** Path to write content to.
     */
    const boost::filesystem::path& tmpPath() const { return tmpPath_; }

    const boost::filesystem::path& path() const { return path_; }

    /** Publishes temporary file under final name.
     */
    void commit();

    /** Drops temporary file.
     */
    void rollback();

private:
    boost::filesystem::path path_;
    boost::filesystem::path tmpPath_;
};

/** Writes data to file via AtomicFile.
 */
void writeAtomically(const boost::filesystem::path &path
                     , const void *data, std::size_t size);

/** Writer of a temporary file, as recorded in its name
 *  (<path>.<host>-<pid>-<n>.tmp).
 */
struct TemporaryOwner {
    ::pid_t pid;
    bool local; //!< written on this host

    TemporaryOwner() : pid(), local() {}
};

/** Returns owner of AtomicFile's temporary file, none if given path is not
 *  such a file.
 */
boost::optional<TemporaryOwner>
temporaryOwner(const boost::filesystem::path &path);

} } // namespace toastlibs::storage

#endif // toastlibs_storage_atomicfile_hpp_included_
