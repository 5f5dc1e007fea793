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
#include <ctime>
#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include <fstream>
#include <iterator>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/filesystem.hpp>

#include <catch2/catch_test_macros.hpp>

#include "../storage/locking.hpp"
#include "../storage/atomicfile.hpp"
#include "../toast/pyramidio.hpp"
#include "../toast/projection.hpp"

#include "testing.hpp"

using namespace toastlibs;
namespace fs = boost::filesystem;
namespace testing = toastlibs::testing;

namespace {

void writeRecord(const fs::path &path, ::pid_t pid
                 , const std::string &host)
{
    std::ofstream f(path.string());
    f << pid << ' ' << host << ' ' << std::time(nullptr) << '\n';
}

std::string slurp(const fs::path &path)
{
    std::ifstream f(path.string());
    return std::string(std::istreambuf_iterator<char>(f)
                       , std::istreambuf_iterator<char>());
}

void spit(const fs::path &path)
{
    fs::create_directories(path.parent_path());
    std::ofstream f(path.string());
    f << "partial";
}

std::size_t countFiles(const fs::path &root, const std::string &ext = "")
{
    std::size_t count(0);
    for (fs::recursive_directory_iterator i(root), e; i != e; ++i) {
        if (!fs::is_regular_file(i->status())) { continue; }
        if (ext.empty() || (i->path().extension() == ext)) { ++count; }
    }
    return count;
}

::pid_t deadPid()
{
    const auto pid(::fork());
    if (!pid) { ::_exit(0); }
    int status(0);
    ::waitpid(pid, &status, 0);
    return pid;
}

} // namespace

TEST_CASE("lock record is exclusive")
{
    testing::TemporaryDirectory tmp;
    const auto path(storage::lockPath(tmp.path() / "tile.png"));
    REQUIRE(path == tmp.path() / "tile.png.lock");

    REQUIRE(storage::tryLock(path));
    REQUIRE_FALSE(storage::tryLock(path));

    const auto record(storage::readLockRecord(path));
    REQUIRE(record);
    REQUIRE(record->pid == ::getpid());
    REQUIRE(record->hostname == storage::hostname());

    storage::unlock(path);
    REQUIRE_FALSE(fs::exists(path));
    REQUIRE(storage::tryLock(path));
    storage::unlock(path);
}

TEST_CASE("bounded wait gives up on contention")
{
    testing::TemporaryDirectory tmp;
    const auto path(tmp.path() / "tile.png.lock");
    REQUIRE(storage::tryLock(path));

    const storage::LockPolicy policy(storage::LockMode::bounded
                                     , std::chrono::milliseconds(50));
    REQUIRE_THROWS_AS(storage::lock(path, policy), storage::LockContention);
    REQUIRE_THROWS_AS(storage::ScopedLock(path, policy)
                      , storage::LockContention);

    storage::unlock(path);
}

TEST_CASE("scoped lock releases on scope exit")
{
    testing::TemporaryDirectory tmp;
    const auto path(tmp.path() / "meta.json.lock");

    {
        storage::ScopedLock lock(path, storage::LockPolicy());
        REQUIRE(fs::exists(path));
        REQUIRE(lock.path() == path);
    }
    REQUIRE_FALSE(fs::exists(path));

    storage::ScopedLock lock(path, storage::LockPolicy());
    lock.unlock();
    REQUIRE_FALSE(fs::exists(path));
}

TEST_CASE("waiting writer gets the lock once it is released")
{
    testing::TemporaryDirectory tmp;
    const auto path(tmp.path() / "tile.npy.lock");
    REQUIRE(storage::tryLock(path));

    std::thread releaser([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            storage::unlock(path);
        });

    storage::lock(path, storage::LockPolicy(storage::LockMode::block
                                            , std::chrono::milliseconds(0)));
    releaser.join();
    REQUIRE(fs::exists(path));
    storage::unlock(path);
}

TEST_CASE("concurrent updates are serialized")
{
    testing::TemporaryDirectory tmp;

    toast::PyramidConfig config;
    config.format = toast::Format::npy;
    const auto pio(toast::PyramidIO::create(tmp.path(), config));

    const toast::TileId tile(2, 1, 2);
    pio.writeImage(tile, testing::constantImage(0.0f));

    const int threads(8), rounds(5);
    std::atomic<bool> done(false);
    std::atomic<int> reads(0), badReads(0);

    // reader never sees a partially written tile
    std::thread reader([&]() {
            do {
                try {
                    const auto image(pio.readImage(tile));
                    if ((image.width() != toast::TileSize)
                        || (image.height() != toast::TileSize))
                    {
                        ++badReads;
                    }
                } catch (const std::exception&) {
                    ++badReads;
                }
                ++reads;
            } while (!done);
        });

    std::vector<std::thread> workers;
    for (int t(0); t < threads; ++t) {
        workers.emplace_back([&]() {
                for (int r(0); r < rounds; ++r) {
                    pio.updateImage
                        (tile, [](boost::optional<toast::TileImage> &image) {
                            image->data().at<float>(0, 0) += 1.0f;
                        });
                }
            });
    }
    for (auto &worker : workers) { worker.join(); }
    done = true;
    reader.join();

    REQUIRE(reads.load() > 0);
    REQUIRE(badReads.load() == 0);
    REQUIRE(pio.readImage(tile).data().at<float>(0, 0)
            == float(threads * rounds));
}

TEST_CASE("stale lock records are swept")
{
    testing::TemporaryDirectory tmp;
    const auto dir(tmp.path() / "3" / "1");
    fs::create_directories(dir);

    const auto dead(dir / "1_0.png.lock");
    writeRecord(dead, deadPid(), storage::hostname());

    const auto foreign(dir / "1_1.png.lock");
    writeRecord(foreign, 1, "some-other-host.invalid");
    fs::last_write_time(foreign, std::time(nullptr) - 7200);

    const auto foreignFresh(dir / "1_2.png.lock");
    writeRecord(foreignFresh, 1, "some-other-host.invalid");

    const auto live(dir / "1_3.png.lock");
    writeRecord(live, ::getpid(), storage::hostname());

    REQUIRE(storage::staleLock(dead, std::chrono::seconds(3600)));
    REQUIRE_FALSE(storage::staleLock(live, std::chrono::seconds(3600)));

    REQUIRE(storage::cleanLockfiles(tmp.path(), std::chrono::seconds(3600))
            == 2);
    REQUIRE_FALSE(fs::exists(dead));
    REQUIRE_FALSE(fs::exists(foreign));
    REQUIRE(fs::exists(foreignFresh));
    REQUIRE(fs::exists(live));
}

TEST_CASE("stale lock removal")
{
    testing::TemporaryDirectory tmp;
    const auto path(tmp.path() / "2_1.npy.lock");
    const std::chrono::seconds staleAge(3600);

    SECTION("live record stays untouched") {
        writeRecord(path, ::getpid(), storage::hostname());
        const auto before(slurp(path));

        REQUIRE_FALSE(storage::removeStaleLock(path, staleAge));
        REQUIRE(slurp(path) == before);
        REQUIRE(countFiles(tmp.path()) == 1);
    }

    SECTION("dead record goes away without leftovers") {
        writeRecord(path, deadPid(), storage::hostname());

        REQUIRE(storage::removeStaleLock(path, staleAge));
        REQUIRE(countFiles(tmp.path()) == 0);
        REQUIRE_FALSE(storage::removeStaleLock(path, staleAge));
    }
}

TEST_CASE("concurrent sweeps never remove a live lock")
{
    testing::TemporaryDirectory tmp;
    const std::chrono::seconds staleAge(3600);

    const int records(40);
    const auto dead(deadPid());
    std::vector<fs::path> paths;
    for (int i(0); i < records; ++i) {
        paths.push_back(tmp.path() / ("tile-" + std::to_string(i) + ".lock"));
        writeRecord(paths.back(), dead, storage::hostname());
    }

    std::atomic<bool> writerDone(false);
    std::atomic<std::size_t> removed(0);
    std::vector<fs::path> taken;

    // new writer grabs each lock as soon as its stale record disappears
    std::thread writer([&]() {
            for (const auto &path : paths) {
                const auto deadline(std::chrono::steady_clock::now()
                                    + std::chrono::seconds(5));
                while (std::chrono::steady_clock::now() < deadline) {
                    if (storage::tryLock(path)) {
                        taken.push_back(path);
                        break;
                    }
                    std::this_thread::yield();
                }
            }
            writerDone = true;
        });

    std::vector<std::thread> sweepers;
    for (int t(0); t < 4; ++t) {
        sweepers.emplace_back([&]() {
                do {
                    removed += storage::cleanLockfiles(tmp.path(), staleAge);
                } while (!writerDone);
            });
    }

    writer.join();
    for (auto &sweeper : sweepers) { sweeper.join(); }

    REQUIRE(removed.load() == std::size_t(records));
    REQUIRE(taken.size() == std::size_t(records));
    for (const auto &path : taken) {
        REQUIRE(fs::exists(path));
        REQUIRE(storage::readLockRecord(path)->pid == ::getpid());
    }
    REQUIRE(countFiles(tmp.path()) == std::size_t(records));
}

TEST_CASE("abandoned temporary files are swept")
{
    testing::TemporaryDirectory tmp;
    const auto target(tmp.path() / "3" / "1" / "1_0.npy");

    // writer dies before publishing its file
    const auto pid(::fork());
    if (!pid) {
        storage::AtomicFile af(target);
        std::ofstream f(af.tmpPath().string());
        f << "partial";
        f.close();
        ::_exit(0);
    }
    int status(0);
    ::waitpid(pid, &status, 0);
    REQUIRE(countFiles(tmp.path(), ".tmp") == 1);

    // writer still working on its file
    storage::AtomicFile live(tmp.path() / "3" / "1" / "1_1.npy");
    {
        std::ofstream f(live.tmpPath().string());
        f << "partial";
    }

    const auto foreign(tmp.path() / "3" / "1" / "1_2.npy.other-host-1-0.tmp");
    spit(foreign);
    const auto foreignOld
        (tmp.path() / "3" / "1" / "1_3.npy.other-host-1-1.tmp");
    spit(foreignOld);
    fs::last_write_time(foreignOld, std::time(nullptr) - 7200);

    const auto owner(storage::temporaryOwner(foreign));
    REQUIRE(owner);
    REQUIRE(owner->pid == 1);
    REQUIRE_FALSE(owner->local);
    REQUIRE_FALSE(storage::temporaryOwner(target));

    REQUIRE(storage::cleanLockfiles(tmp.path(), std::chrono::seconds(3600))
            == 2);
    REQUIRE(countFiles(tmp.path(), ".tmp") == 2);
    REQUIRE(fs::exists(live.tmpPath()));
    REQUIRE(fs::exists(foreign));
    REQUIRE_FALSE(fs::exists(foreignOld));
}

TEST_CASE("atomic file is published on commit only")
{
    testing::TemporaryDirectory tmp;
    const auto path(tmp.path() / "a" / "b" / "file.txt");

    {
        storage::AtomicFile af(path);
        std::ofstream f(af.tmpPath().string());
        f << "draft";
        f.close();
        REQUIRE(fs::exists(af.tmpPath()));
    }
    REQUIRE_FALSE(fs::exists(path));

    const std::string content("final");
    storage::writeAtomically(path, content.data(), content.size());
    REQUIRE(fs::file_size(path) == content.size());
}
