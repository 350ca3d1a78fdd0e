/*
 * FireSync - Desktop
 * Copyright (C) 2023-2025 Infomaniak Network SA
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "testsyncroundworker.h"
#include "test_utility/testhelpers.h"
#include "libcommonserver/io/iohelper.h"
#include "libcommonserver/utility/utility.h"
#include "requests/parameterscache.h"

#include <filesystem>
#include <thread>

namespace FSC {

static const uint64_t testChunkSize = 1024;

void TestSyncRoundWorker::setUp() {
    start();

    Parameters &parameters = ParametersCache::instance(true)->parameters();
    parameters.setChunkSize(testChunkSize);
    parameters.setSyncIntervalSec(60);

    _tempDir = std::make_unique<LocalTemporaryDirectory>("TestSyncRoundWorker");
    _syncRoot = _tempDir->path() / "sync";
    IoError ioError = IoError::Success;
    CPPUNIT_ASSERT(IoHelper::createDirectory(_syncRoot, false, ioError));

    _syncDb = std::make_shared<SyncDb>(_tempDir->path() / "sync.db", "1.0.0");
    _remote = std::make_unique<MockRemote>();
    _cache = std::make_unique<ChunkCache>(_tempDir->path() / "cache");
    CPPUNIT_ASSERT(_cache->init());
    _pathLockManager = std::make_unique<PathLockManager>();
    _reconciler = std::make_unique<SyncReconciler>(_syncDb, *_remote, *_remote, *_cache, *_pathLockManager, _syncRoot);
    _eventQueue = std::make_unique<SyncEventQueue>();
    _worker = std::make_unique<SyncRoundWorker>(*_eventQueue, *_reconciler, "Sync round worker");
}

void TestSyncRoundWorker::tearDown() {
    _worker.reset();
    _eventQueue.reset();
    _reconciler.reset();
    _pathLockManager.reset();
    _cache.reset();
    _remote.reset();
    _syncDb->close();
    _syncDb.reset();
    _tempDir.reset();
    ParametersCache::reset();
    stop();
}

void TestSyncRoundWorker::testRunRound() {
    const std::string content = testhelpers::generateBytes(3000, 1);
    (void) _remote->putRemoteFile("/a.txt", content, testChunkSize);

    RoundReport report;
    bool skipped = true;
    CPPUNIT_ASSERT(_worker->runRound(report, skipped));
    CPPUNIT_ASSERT(!skipped);
    CPPUNIT_ASSERT_EQUAL(1, report.reconciledFiles);
    CPPUNIT_ASSERT_EQUAL(1, _worker->completedRounds());
    CPPUNIT_ASSERT_EQUAL(0, _worker->skippedRounds());
    CPPUNIT_ASSERT_EQUAL(content, testhelpers::readFile(Utility::toLocalPath(_syncRoot, "/a.txt")));
}

void TestSyncRoundWorker::testOverlappingRoundSkipped() {
    (void) _remote->putRemoteFile("/a.txt", testhelpers::generateBytes(3000, 2), testChunkSize);

    {
        // Another round holds the lock
        const std::scoped_lock lock(_worker->_roundMutex);
        RoundReport report;
        bool skipped = false;
        ExitInfo exitInfo;
        std::thread roundThread([&] { exitInfo = _worker->runRound(report, skipped); });
        roundThread.join();
        CPPUNIT_ASSERT(exitInfo);
        CPPUNIT_ASSERT(skipped);
        CPPUNIT_ASSERT_EQUAL(1, _worker->skippedRounds());
        CPPUNIT_ASSERT_EQUAL(0, _worker->completedRounds());
        CPPUNIT_ASSERT_EQUAL(0, _remote->fetchCount());
        CPPUNIT_ASSERT(!std::filesystem::exists(Utility::toLocalPath(_syncRoot, "/a.txt")));
    }

    RoundReport report;
    bool skipped = true;
    CPPUNIT_ASSERT(_worker->runRound(report, skipped));
    CPPUNIT_ASSERT(!skipped);
    CPPUNIT_ASSERT_EQUAL(1, _worker->skippedRounds());
    CPPUNIT_ASSERT_EQUAL(1, _worker->completedRounds());
    CPPUNIT_ASSERT(std::filesystem::exists(Utility::toLocalPath(_syncRoot, "/a.txt")));
}

void TestSyncRoundWorker::testRoundAtStartUp() {
    (void) _remote->putRemoteFile("/a.txt", testhelpers::generateBytes(3000, 3), testChunkSize);

    _worker->start();
    for (int i = 0; i < 100 && _worker->completedRounds() == 0; i++) {
        Utility::msleep(50);
    }
    _worker->stop();
    _worker->waitForExit();

    CPPUNIT_ASSERT_EQUAL(1, _worker->completedRounds());
    CPPUNIT_ASSERT(std::filesystem::exists(Utility::toLocalPath(_syncRoot, "/a.txt")));
}

} // namespace FSC
