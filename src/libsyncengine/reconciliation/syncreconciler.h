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

#include "cache/chunkcache.h"
#include "chunkstore/chunkstoreclient.h"
#include "chunkstore/syncremote.h"
#include "db/syncdb.h"
#include "reconstruction/filereconstructor.h"
#include "syncpal/pathlockmanager.h"

#include <log4cplus/logger.h>

#include <memory>
#include <optional>

namespace FSC {

class JobManager;
class RoundChunkSource;

struct RoundReport {
        bool upToDate = false;
        int updatedFiles = 0;
        int reconciledFiles = 0;
        int downloadedChunks = 0;
        int reusedChunks = 0;
        std::vector<std::string> failedPaths;
};

/**
 * Pull the remote changes since the cursor and apply them to the sync directory.
 *
 * The cursor is advanced to the server timestamp only when every file of the delta has been reconciled. Otherwise the
 * cursor given as input is returned unchanged so that the next round fetches the same delta again.
 * A remote file always wins over uncommitted local edits at the same path.
 */
class SyncReconciler {
    public:
        SyncReconciler(std::shared_ptr<SyncDb> syncDb, SyncRemote &remote, ChunkStoreClient &client, ChunkCache &cache,
                       PathLockManager &pathLockManager, const SyncPath &syncRoot, JobManager *jobManager = nullptr);

        ExitInfo runRound(const SyncCursor &in, SyncCursor &out, RoundReport &report);

        // Run a round from the persisted cursor and persist the resulting cursor
        ExitInfo syncOnce(RoundReport &report);

    private:
        ExitInfo reconcileFile(const RemoteFile &remoteFile, RoundReport &report);
        ExitInfo moveLocalFile(const std::string &fromItemPath, const std::string &toItemPath);
        ExitInfo resolveParts(const RemoteFile &remoteFile, const std::vector<ManifestEntry> &manifest,
                              const std::vector<DbChunk> &localChunks, const std::optional<std::string> &movedFromPath,
                              RoundChunkSource &source, std::vector<std::string> &toDownload);
        bool findSlice(const std::string &itemPath, int partNumber, const std::string &fingerprint, RoundChunkSource &source,
                       int targetPartNumber);
        ExitInfo downloadChunks(const std::vector<std::string> &fingerprints);
        ExitInfo ensureFolderChain(const std::string &folderPath, const EntityId &folderId, DbFolder &folder);

        SyncCursor advanceCursor(const SyncCursor &in, const SyncCursor &serverCursor) const;

        log4cplus::Logger _logger;
        std::shared_ptr<SyncDb> _syncDb;
        SyncRemote &_remote;
        ChunkStoreClient &_client;
        ChunkCache &_cache;
        PathLockManager &_pathLockManager;
        SyncPath _syncRoot;
        JobManager *_jobManager = nullptr;
        FileReconstructor _reconstructor;
};

} // namespace FSC
