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
#include <csignal>
#include <system_error>
#include <thread>
#include <atomic>
#include <algorithm>
#include <fstream>

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#include <boost/format.hpp>
#include <boost/filesystem.hpp>

#include "dbglog/dbglog.hpp"

#include "utility/filedes.hpp"
#include "utility/raise.hpp"
#include "utility/path.hpp"

#include "atomicfile.hpp"
#include "locking.hpp"

namespace fs = boost::filesystem;

namespace toastlibs { namespace storage {

namespace {

const std::string LockExtension(".lock");

std::string format(const LockRecord &record)
{
    return str(boost::format("%d %s %d\n")
               % record.pid % record.hostname % record.created);
}

std::atomic<unsigned long> grabCounter(0);

bool processAlive(::pid_t pid)
{
    if (pid <= 0) { return false; }
    if (!::kill(pid, 0)) { return true; }
    // EPERM: process exists but belongs to someone else
    return (errno != ESRCH);
}

/** Owner from this host is checked for life, anything else by age.
 */
bool stale(const fs::path &path, bool local, ::pid_t pid
           , std::chrono::seconds staleAge)
{
    if (local) { return !processAlive(pid); }

    boost::system::error_code ec;
    const auto mtime(fs::last_write_time(path, ec));
    if (ec) {
        // vanished in the meantime
        return false;
    }

    return ((std::time(nullptr) - mtime) > staleAge.count());
}

std::string errnoMessage(int err)
{
    return std::error_code(err, std::system_category()).message();
}

} // namespace

std::string hostname()
{
    char hostname[256];
    if (-1 == ::gethostname(hostname, sizeof(hostname))) {
        std::system_error e
            (errno, std::system_category()
             , utility::formatError("Failed to get host name."));
        LOG(err2) << e.what();
        throw e;
    }
    hostname[sizeof(hostname) - 1] = '\0';
    return hostname;
}

LockRecord LockRecord::current()
{
    LockRecord record;
    record.pid = ::getpid();
    record.hostname = hostname();
    record.created = std::time(nullptr);
    return record;
}

fs::path lockPath(const fs::path &path)
{
    return utility::addExtension(path, LockExtension);
}

bool tryLock(const fs::path &lockPath)
{
    const auto content(format(LockRecord::current()));

    utility::Filedes fd(::open(lockPath.string().c_str()
                               , O_WRONLY | O_CREAT | O_EXCL, 0644)
                        , lockPath);
    if (!fd) {
        if (errno == EEXIST) { return false; }
        std::system_error e
            (errno, std::system_category()
             , utility::formatError
             ("Failed to create lock record %s.", lockPath));
        LOG(err2) << e.what();
        throw e;
    }

    auto left(content.size());
    const char *data(content.data());
    while (left) {
        auto bytes(::write(fd, data, left));
        if (-1 == bytes) {
            if (EINTR == errno) { continue; }
            const auto err(errno);
            ::unlink(lockPath.string().c_str());
            std::system_error e
                (err, std::system_category()
                 , utility::formatError
                 ("Failed to write lock record %s.", lockPath));
            LOG(err2) << e.what();
            throw e;
        }
        left -= bytes;
        data += bytes;
    }

    return true;
}

void lock(const fs::path &lockPath, const LockPolicy &policy)
{
    typedef std::chrono::steady_clock clock;
    const auto deadline(clock::now() + policy.timeout);
    auto backoff(policy.initialBackoff);

    for (;;) {
        if (tryLock(lockPath)) { return; }

        if (policy.mode == LockMode::bounded) {
            const auto now(clock::now());
            if (now >= deadline) {
                LOGTHROW(err1, LockContention)
                    << "Unable to obtain lock " << lockPath
                    << " within " << policy.timeout.count() << " ms.";
            }

            // do not oversleep the deadline
            auto left(std::chrono::duration_cast<std::chrono::milliseconds>
                      (deadline - now));
            std::this_thread::sleep_for(std::min(backoff, left));
        } else {
            std::this_thread::sleep_for(backoff);
        }

        backoff = std::min(backoff * 2, policy.maxBackoff);
    }
}

void unlock(const fs::path &lockPath)
{
    if (-1 == ::unlink(lockPath.string().c_str())) {
        std::system_error e
            (errno, std::system_category()
             , utility::formatError
             ("Failed to remove lock record %s.", lockPath));
        LOG(err2) << e.what();
        throw e;
    }
}

boost::optional<LockRecord> readLockRecord(const fs::path &lockPath)
{
    std::ifstream f(lockPath.string());
    if (!f) { return boost::none; }

    LockRecord record;
    f >> record.pid >> record.hostname >> record.created;
    if (f.fail()) { return boost::none; }
    return record;
}

bool staleLock(const fs::path &lockPath, std::chrono::seconds staleAge)
{
    const auto record(readLockRecord(lockPath));
    if (record && (record->hostname == hostname())) {
        return stale(lockPath, true, record->pid, staleAge);
    }
    return stale(lockPath, false, 0, staleAge);
}

bool removeStaleLock(const fs::path &lockPath, std::chrono::seconds staleAge)
{
    if (!staleLock(lockPath, staleAge)) {
        LOG(info1) << "Keeping live lock record " << lockPath << ".";
        return false;
    }

    // take the record away first: a record created by a new writer after
    // another sweeper removed the stale one must survive
    const auto grabbed(utility::addExtension
                       (lockPath, str(boost::format(".%d-%d%s")
                                      % ::getpid() % grabCounter++
                                      % LockExtension)));
    if (-1 == ::rename(lockPath.c_str(), grabbed.c_str())) {
        if (errno != ENOENT) {
            LOG(warn2) << "Unable to take stale lock record " << lockPath
                       << " away: " << errnoMessage(errno) << ".";
        }
        return false;
    }

    boost::system::error_code ec;
    if (staleLock(grabbed, staleAge)) {
        LOG(warn2) << "Removing stale lock record " << lockPath << ".";
        if (fs::remove(grabbed, ec)) { return true; }
        if (ec) {
            LOG(warn2) << "Unable to remove stale lock record " << grabbed
                       << ": " << ec.message() << ".";
        }
        // otherwise taken away by another sweeper
        return false;
    }

    LOG(warn2) << "Lock record " << lockPath
               << " has been taken over by a live writer, restoring.";
    if (-1 == ::link(grabbed.c_str(), lockPath.c_str())) {
        LOG(warn2) << "Unable to restore lock record " << lockPath << ": "
                   << errnoMessage(errno) << ".";
    }
    fs::remove(grabbed, ec);
    if (ec) {
        LOG(warn2) << "Unable to remove lock record copy " << grabbed
                   << ": " << ec.message() << ".";
    }
    return false;
}

bool staleTemporary(const fs::path &path, std::chrono::seconds staleAge)
{
    const auto owner(temporaryOwner(path));
    if (!owner) { return false; }
    return stale(path, owner->local, owner->pid, staleAge);
}

std::size_t cleanLockfiles(const fs::path &root
                           , std::chrono::seconds staleAge)
{
    LOG(info2) << "Sweeping stale lock records under " << root << ".";

    std::size_t locks(0), temporaries(0);
    for (fs::recursive_directory_iterator iroot(root), eroot;
         iroot != eroot; ++iroot)
    {
        const auto &path(iroot->path());
        if (!fs::is_regular_file(iroot->symlink_status())) { continue; }

        if (path.extension() == LockExtension) {
            if (removeStaleLock(path, staleAge)) { ++locks; }
            continue;
        }

        if (!staleTemporary(path, staleAge)) { continue; }

        LOG(warn2) << "Removing abandoned temporary file " << path << ".";
        boost::system::error_code ec;
        if (fs::remove(path, ec)) {
            ++temporaries;
        } else if (ec) {
            LOG(warn2) << "Unable to remove temporary file " << path
                       << ": " << ec.message() << ".";
        }
    }

    LOG(info2) << "Removed " << locks << " stale lock record(s) and "
               << temporaries << " abandoned temporary file(s).";
    return locks + temporaries;
}

ScopedLock::ScopedLock(const fs::path &lockPath, const LockPolicy &policy)
    : lockPath_(lockPath), locked_(false)
{
    lock(lockPath_, policy);
    locked_ = true;
}

ScopedLock::ScopedLock(ScopedLock &&other)
    : lockPath_(std::move(other.lockPath_)), locked_(other.locked_)
{
    other.locked_ = false;
}

ScopedLock::~ScopedLock()
{
    if (!locked_) { return; }

    boost::system::error_code ec;
    fs::remove(lockPath_, ec);
    if (ec) {
        LOG(err2) << "Unable to release lock " << lockPath_
                  << ": " << ec.message() << ".";
    }
}

void ScopedLock::unlock()
{
    if (!locked_) { return; }
    storage::unlock(lockPath_);
    locked_ = false;
}

} } // namespace toastlibs::storage
