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

#pragma once

#include "localchangeworker.h"
#include "pathlockmanager.h"
#include "synceventqueue.h"
#include "syncroundworker.h"
#include "cache/chunkcache.h"
#include "chunkstore/chunkstoreclient.h"
#include "chunkstore/syncremote.h"
#include "db/syncdb.h"
#include "jobs/jobmanager.h"
#include "reconciliation/syncreconciler.h"
#include "update_detection/folderwatcher.h"
#include "upload/uploadcoordinator.h"

#include <log4cplus/logger.h>

#include <memory>

namespace FSC {

/**
 * Everything needed to keep one sync directory in sync with the chunk store.
 */
class SyncPal {
    public:
        // Components talking to the chunk store over HTTP at apiUrl
        SyncPal(const SyncPath &syncDir, const SyncPath &dbPath, const SyncPath &cacheDir, const std::string &apiUrl);
        SyncPal(const SyncPath &syncDir, const SyncPath &dbPath, const SyncPath &cacheDir,
                std::shared_ptr<ChunkStoreClient> client, std::shared_ptr<SyncRemote> remote);
        ~SyncPal();

        SyncPal(SyncPal const &) = delete;
        void operator=(SyncPal const &) = delete;

        // Open the database and the chunk cache, and build the components
        ExitInfo init();

        // Start the folder watcher, queue the initial scan and start the workers
        ExitInfo start();
        void stop();

        // Upload every local change found by a scan of the sync directory, then run one sync round
        ExitInfo syncOnce(RoundReport &report);

        inline bool isRunning() const { return _isRunning; }
        inline const SyncPath &syncDir() const { return _syncDir; }
        inline std::shared_ptr<SyncDb> syncDb() const { return _syncDb; }
        inline SyncEventQueue &eventQueue() { return _eventQueue; }
        inline UploadCoordinator *uploadCoordinator() const { return _uploadCoordinator.get(); }
        inline SyncReconciler *syncReconciler() const { return _syncReconciler.get(); }

    private:
        log4cplus::Logger _logger;
        SyncPath _syncDir;
        SyncPath _dbPath;
        SyncPath _cacheDir;
        bool _isRunning = false;

        SyncEventQueue _eventQueue;
        std::shared_ptr<SyncDb> _syncDb;
        std::shared_ptr<ChunkStoreClient> _client;
        std::shared_ptr<SyncRemote> _remote;
        std::unique_ptr<ChunkCache> _chunkCache;
        PathLockManager _pathLockManager;
        std::unique_ptr<JobManager> _jobManager;
        std::unique_ptr<UploadCoordinator> _uploadCoordinator;
        std::unique_ptr<SyncReconciler> _syncReconciler;
        std::unique_ptr<FolderWatcher> _folderWatcher;
        std::unique_ptr<LocalChangeWorker> _localChangeWorker;
        std::unique_ptr<SyncRoundWorker> _syncRoundWorker;
};

} // namespace FSC
