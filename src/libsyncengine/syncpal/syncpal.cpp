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

#include "syncpal.h"
#include "chunkstore/httpremote.h"
#include "libcommonserver/io/iohelper.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/utility.h"
#include "requests/parameterscache.h"

#include <log4cplus/loggingmacros.h>

namespace FSC {

SyncPal::SyncPal(const SyncPath &syncDir, const SyncPath &dbPath, const SyncPath &cacheDir, const std::string &apiUrl) :
    _logger(Log::instance()->getLogger()),
    _syncDir(syncDir),
    _dbPath(dbPath),
    _cacheDir(cacheDir) {
    const auto httpRemote = std::make_shared<HttpRemote>(apiUrl);
    _client = httpRemote;
    _remote = httpRemote;
}

SyncPal::SyncPal(const SyncPath &syncDir, const SyncPath &dbPath, const SyncPath &cacheDir,
                 std::shared_ptr<ChunkStoreClient> client, std::shared_ptr<SyncRemote> remote) :
    _logger(Log::instance()->getLogger()),
    _syncDir(syncDir),
    _dbPath(dbPath),
    _cacheDir(cacheDir),
    _client(client),
    _remote(remote) {}

SyncPal::~SyncPal() {
    stop();
    LOG_DEBUG(_logger, "SyncPal destroyed");
}

ExitInfo SyncPal::init() {
    LOG_INFO(_logger, "SyncPal initialization: syncDir=" << Utility::formatSyncPath(_syncDir));

    bool isDirectory = false;
    IoError ioError = IoError::Success;
    if (!IoHelper::checkIfIsDirectory(_syncDir, isDirectory, ioError)) {
        LOG_WARN(_logger, "Error in IoHelper::checkIfIsDirectory: " << Utility::formatIoError(_syncDir, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }
    if (!isDirectory) {
        if (!IoHelper::createDirectory(_syncDir, true, ioError)) {
            LOG_WARN(_logger, "Unable to create the sync directory: " << Utility::formatIoError(_syncDir, ioError));
            return {ExitCode::SystemError, ExitCause::SyncDirDoesntExist};
        }
        LOG_INFO(_logger, "Sync directory created: " << Utility::formatSyncPath(_syncDir));
    }

    try {
        _syncDb = std::make_shared<SyncDb>(_dbPath, FS_VERSION_STRING);
    } catch (const std::runtime_error &e) {
        LOG_WARN(_logger, "Error in SyncDb::SyncDb: " << e.what());
        return {ExitCode::DbError, ExitCause::DbAccessError};
    }

    _chunkCache = std::make_unique<ChunkCache>(_cacheDir);
    if (const auto exitInfo = _chunkCache->init(); !exitInfo) {
        LOG_WARN(_logger, "Error in ChunkCache::init: " << exitInfo);
        return exitInfo;
    }

    const Parameters &parameters = ParametersCache::instance()->parameters();
    _jobManager = std::make_unique<JobManager>(parameters.transferParallelJobs());

    _uploadCoordinator =
            std::make_unique<UploadCoordinator>(_syncDb, *_client, _pathLockManager, _syncDir, _jobManager.get());
    _syncReconciler = std::make_unique<SyncReconciler>(_syncDb, *_remote, *_client, *_chunkCache, _pathLockManager,
                                                       _syncDir, _jobManager.get());

    _folderWatcher = FolderWatcher::create(_eventQueue, _syncDir);
    _localChangeWorker =
            std::make_unique<LocalChangeWorker>(_eventQueue, *_uploadCoordinator, "Local Change Worker");
    _syncRoundWorker = std::make_unique<SyncRoundWorker>(_eventQueue, *_syncReconciler, "Sync Round Worker");

    return ExitCode::Ok;
}

ExitInfo SyncPal::start() {
    if (!_syncDb) {
        LOG_WARN(_logger, "SyncPal not initialized");
        return {ExitCode::LogicError, ExitCause::Unknown};
    }
    if (_isRunning) return ExitCode::Ok;

    // Watch first so that no change made during the scan is missed
    _folderWatcher->start();
    if (const auto exitInfo = _folderWatcher->scanExistingItems(); !exitInfo) {
        _folderWatcher->stop();
        return exitInfo;
    }

    _localChangeWorker->start();
    _syncRoundWorker->start();
    _isRunning = true;

    LOG_INFO(_logger, "SyncPal started");
    return ExitCode::Ok;
}

void SyncPal::stop() {
    if (!_isRunning) return;

    LOG_INFO(_logger, "SyncPal stopping");

    _eventQueue.close();
    _localChangeWorker->stop();
    _syncRoundWorker->stop();
    _localChangeWorker->waitForExit();
    _syncRoundWorker->waitForExit();
    _folderWatcher->stop();
    _isRunning = false;

    LOG_INFO(_logger, "SyncPal stopped");
}

ExitInfo SyncPal::syncOnce(RoundReport &report) {
    if (!_syncDb) {
        LOG_WARN(_logger, "SyncPal not initialized");
        return {ExitCode::LogicError, ExitCause::Unknown};
    }

    if (const auto exitInfo = _folderWatcher->scanExistingItems(); !exitInfo) {
        return exitInfo;
    }
    _localChangeWorker->processPendingEvents();

    bool skipped = false;
    return _syncRoundWorker->runRound(report, skipped);
}

} // namespace FSC
