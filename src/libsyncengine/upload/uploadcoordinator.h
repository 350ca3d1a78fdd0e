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

#include "chunking/chunker.h"
#include "chunkstore/chunkstoreclient.h"
#include "db/syncdb.h"
#include "syncpal/pathlockmanager.h"

#include <log4cplus/logger.h>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_set>

namespace FSC {

class JobManager;

struct UploadResult {
        UploadOutcome outcome = UploadOutcome::Unknown;
        UploadState finalState = UploadState::Chunking;
        EntityId fileId;
        int partCount = 0;
        int uploadedParts = 0; // Parts whose bytes were sent
        int deduplicatedParts = 0; // Parts already known by the store, or shared with another part of the file
        int renegotiations = 0;
        int confirmAttempts = 0;
};

/**
 * Drive the upload of one local file:
 * Chunking -> Negotiating -> Transferring -> Confirming -> Done, any state may end in Failed.
 *
 * Only the parts the store does not already hold are transferred. The progress of each part is kept across
 * renegotiations, so a run resumes after an expired transfer handle without sending a part twice.
 */
class UploadCoordinator {
    public:
        UploadCoordinator(std::shared_ptr<SyncDb> syncDb, ChunkStoreClient &client, PathLockManager &pathLockManager,
                          const SyncPath &syncRoot, JobManager *jobManager = nullptr);

        ExitInfo upload(const std::string &itemPath, UploadResult &result);

        // Register a folder and its missing ancestors, remotely then locally
        ExitInfo registerFolderChain(const std::string &folderPath, DbFolder &folder);

    private:
        struct PartState {
                ChunkInfo info;
                PartStatus status = PartStatus::Pending;
                bool deduplicated = false;
                EntityId chunkId;
                std::string etag;
                std::optional<TransferHandle> handle;
        };

        struct UploadRun {
                std::string itemPath;
                SyncPath localPath;
                UploadState state = UploadState::Chunking;
                EntityId fileId;
                std::string fileHash; // Whole-file fingerprint
                std::string masterFingerprint;
                DbFolder folder;
                std::string uploadId;
                std::map<int, PartState> parts;
                int renegotiations = 0;
                int confirmAttempts = 0;
                ExitInfo exitInfo = ExitCode::Ok;
                UploadOutcome outcome = UploadOutcome::Unknown;
        };

        ExitInfo chunking(UploadRun &run);
        ExitInfo negotiating(UploadRun &run);
        ExitInfo transferring(UploadRun &run);
        ExitInfo confirming(UploadRun &run);
        ExitInfo commit(UploadRun &run);

        ExitInfo validatePlan(const NegotiationRequest &request, const UploadPlan &plan) const;
        bool renegotiate(UploadRun &run, const std::string &reason);
        void inheritSharedParts(UploadRun &run);

        log4cplus::Logger _logger;
        std::shared_ptr<SyncDb> _syncDb;
        ChunkStoreClient &_client;
        PathLockManager &_pathLockManager;
        SyncPath _syncRoot;
        JobManager *_jobManager = nullptr;

        std::mutex _registeredFoldersMutex;
        std::unordered_set<std::string> _registeredFolders; // Folder paths registered remotely by this instance
};

} // namespace FSC
