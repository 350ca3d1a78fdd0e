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

#include "chunkstore/chunkstoreclient.h"
#include "chunkstore/syncremote.h"

#include <map>
#include <mutex>
#include <set>
#include <unordered_map>

namespace FSC {

/**
 * In-memory chunk store: fingerprint-addressed objects, one manifest per file and a logical clock.
 * Every mutation moves the clock one second forward, fetchChanges returns the files modified strictly after the cursor.
 */
class MockRemote : public ChunkStoreClient, public SyncRemote {
    public:
        MockRemote();

        ExitInfo negotiateUpload(const NegotiationRequest &request, UploadPlan &plan) override;
        ExitInfo uploadPart(const TransferHandle &handle, const std::string &bytes, UploadAck &ack) override;
        ExitInfo downloadChunk(const ChunkLocator &locator, std::string &bytes) override;
        ExitInfo confirm(const ConfirmRequest &request, ConfirmResult &result) override;
        ExitInfo registerFolder(const DbFolder &folder) override;
        ExitInfo fetchChanges(const SyncCursor &cursor, SyncDelta &delta) override;

        // Store a file as another device would, return its identifier
        EntityId putRemoteFile(const std::string &filePath, const std::string &content, uint64_t chunkSize,
                               const EntityId &fileId = EntityId());
        void moveRemoteFile(const EntityId &fileId, const std::string &newFilePath);
        void removeRemotePart(const EntityId &fileId, int partNumber);
        bool remoteFile(const EntityId &fileId, RemoteFile &file) const;
        bool remoteFileByPath(const std::string &filePath, RemoteFile &file) const;
        std::string remoteContent(const EntityId &fileId) const;

        bool hasObject(const std::string &fingerprint) const;
        size_t objectCount() const;
        bool hasFolder(const std::string &folderPath) const;

        // Server clock, in microseconds
        SyncTime clock() const;
        void setClock(SyncTime clockUs);

        // Fault injection
        void expireNextHandles(int count) { _expireHandles = count; }
        void rejectNextUploads(int count) { _rejectUploads = count; }
        void corruptNextDownloads(int count) { _corruptDownloads = count; }
        void failNextConfirms(int count, const ExitInfo &exitInfo = {ExitCode::BackError, ExitCause::Http5xx});
        void dropObjectOnConfirm(const std::string &fingerprint) { _droppedOnConfirm.insert(fingerprint); }
        void failDownloadsForPath(const std::string &filePath) { _failingPaths.insert(filePath); }
        void clearDownloadFailures() { _failingPaths.clear(); }
        void failNextFetches(int count) { _failFetches = count; }

        // Counters
        int negotiateCount() const { return _negotiateCount; }
        int uploadCount() const { return _uploadCount; }
        int downloadCount() const { return _downloadCount; }
        int confirmCount() const { return _confirmCount; }
        int registerFolderCount() const { return _registerFolderCount; }
        int fetchCount() const { return _fetchCount; }
        void resetCounters();

        static const std::string uploadUrlPrefix;

    private:
        struct StoredFile {
                RemoteFile file;
                SyncTime modifiedUs = 0;
        };

        struct UploadSession {
                NegotiationRequest request;
                std::map<int, std::string> chunkIds;
        };

        SyncTime tick();
        bool fingerprintOfFailingPath(const std::string &fingerprint) const;

        mutable std::mutex _mutex;
        SyncTime _clockUs;
        int _nextId = 0;

        std::unordered_map<std::string, std::string> _objects;
        std::map<EntityId, StoredFile> _files;
        std::map<std::string, DbFolder> _folders;
        std::map<std::string, UploadSession> _sessions;

        int _expireHandles = 0;
        int _rejectUploads = 0;
        int _corruptDownloads = 0;
        int _failConfirms = 0;
        ExitInfo _confirmFailure;
        std::set<std::string> _droppedOnConfirm;
        std::set<std::string> _failingPaths;
        int _failFetches = 0;

        int _negotiateCount = 0;
        int _uploadCount = 0;
        int _downloadCount = 0;
        int _confirmCount = 0;
        int _registerFolderCount = 0;
        int _fetchCount = 0;
};

} // namespace FSC
