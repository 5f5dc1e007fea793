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
 * \file storage/locking.hpp
 *
 * Advisory file-based locking of individual storage entries.
 *
 * A lock is a lock record file created exclusively next to the guarded entry.
 * The record holds owner's pid, host name and creation time so that records
 * left behind by crashed writers can be recognized and swept away.
 */

#ifndef toastlibs_storage_locking_hpp_included_
#define toastlibs_storage_locking_hpp_included_

#include <sys/types.h>

#include <ctime>
#include <chrono>
#include <string>
#include <stdexcept>

#include <boost/optional.hpp>
#include <boost/noncopyable.hpp>
#include <boost/filesystem/path.hpp>

#include "utility/enum-io.hpp"

namespace toastlibs { namespace storage {

struct LockError : public std::runtime_error {
    LockError(const std::string &msg) : std::runtime_error(msg) {}
};

/** Entry is locked by another writer and waiting policy has been exhausted.
 */
struct LockContention : public LockError {
    LockContention(const std::string &msg) : LockError(msg) {}
};

enum class LockMode {
    block      //!< wait until lock is released
    , bounded  //!< wait at most LockPolicy::timeout
};

/** How to wait for a lock held by someone else.
 */
struct LockPolicy {
    LockMode mode;
    std::chrono::milliseconds timeout;
    std::chrono::milliseconds initialBackoff;
    std::chrono::milliseconds maxBackoff;

    LockPolicy()
        : mode(LockMode::bounded), timeout(std::chrono::seconds(60))
        , initialBackoff(5), maxBackoff(1000)
    {}

    LockPolicy(LockMode mode, std::chrono::milliseconds timeout)
        : mode(mode), timeout(timeout), initialBackoff(5), maxBackoff(1000)
    {}
};

/** Content of lock record file.
 */
struct LockRecord {
    ::pid_t pid;
    std::string hostname;
    std::time_t created;

    LockRecord() : pid(), created() {}

    /** Record describing this process.
     */
    static LockRecord current();
};

/** Path of lock record guarding given path.
 */
boost::filesystem::path lockPath(const boost::filesystem::path &path);

/** Tries to create lock record at given path. Returns false if lock is held
 *  by someone else.
 */
bool tryLock(const boost::filesystem::path &lockPath);

/** Creates lock record at given path, waiting according to policy.
 *
 *  Throws LockContention if lock cannot be obtained in bounded mode.
 */
void lock(const boost::filesystem::path &lockPath, const LockPolicy &policy);

/** Removes lock record.
 */
void unlock(const boost::filesystem::path &lockPath);

/** Reads lock record. Returns none if record is missing or unparsable.
 */
boost::optional<LockRecord>
readLockRecord(const boost::filesystem::path &lockPath);

/** Checks whether lock record at given path belongs to a dead writer.
 *
 *  Record created on this host is stale iff its process no longer exists.
 *  Record from another host (or unreadable record) is stale iff it is older
 *  than staleAge.
 */
bool staleLock(const boost::filesystem::path &lockPath
               , std::chrono::seconds staleAge);

/** Removes lock record at given path if it is stale.
 *
 *  The record is renamed away first and checked again, so a live record
 *  that replaced the stale one in the meantime is put back instead of being
 *  removed.
 *
 *  \return true if stale record was removed
 */
bool removeStaleLock(const boost::filesystem::path &lockPath
                     , std::chrono::seconds staleAge);

/** Checks whether given path is a temporary file of AtomicFile left by a
 *  dead writer (same rules as staleLock, owner is taken from file name).
 */
bool staleTemporary(const boost::filesystem::path &path
                    , std::chrono::seconds staleAge);

/** Removes all stale lock records and abandoned temporary files under given
 *  root.
 *
 *  \return number of removed files
 */
std::size_t cleanLockfiles(const boost::filesystem::path &root
                           , std::chrono::seconds staleAge);

/** Name of this host.
 */
std::string hostname();

/** Holds lock record for its whole lifetime.
 */
class ScopedLock : boost::noncopyable {
public:
    ScopedLock(const boost::filesystem::path &lockPath
               , const LockPolicy &policy);

    ScopedLock(ScopedLock &&other);

    ~ScopedLock();

    /** Releases lock before scope exit.
     */
    void unlock();

    const boost::filesystem::path& path() const { return lockPath_; }

private:
    boost::filesystem::path lockPath_;
    bool locked_;
};

UTILITY_GENERATE_ENUM_IO(LockMode,
    ((block))
    ((bounded))
)

} } // namespace toastlibs::storage

#endif // toastlibs_storage_locking_hpp_included_
