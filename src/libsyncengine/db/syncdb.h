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

#include "dbentities.h"
#include "metadatarecord.h"
#include "synccursor.h"
#include "libcommonserver/db/db.h"

#include <optional>
#include <string>
#include <vector>

namespace FSC {

/**
 * Local mirror of the folder, file and chunk metadata, plus the sync cursor.
 * Only the upload coordinator and the sync reconciler write to it, always under the per-path lock of the file.
 */
class SyncDb : public Db {
    public:
        static const std::string rootFolderPath;

        /// @throw std::runtime_error
        SyncDb(const std::filesystem::path &dbPath, const std::string &version);

        std::string dbType() const override { return "Sync"; }

        bool create(bool &retry) override;
        bool prepare() override;
        bool upgrade(const std::string &fromVersion, const std::string &toVersion) override;

        // Folders
        bool upsertFolder(const DbFolder &folder);
        bool selectFolderByPath(const std::string &folderPath, DbFolder &folder, bool &found);
        bool selectFolderById(const EntityId &folderId, DbFolder &folder, bool &found);
        bool rootFolder(DbFolder &folder);

        // Files
        bool upsertFile(const DbFile &file);
        bool selectFileByPath(const std::string &filePath, DbFile &file, bool &found);
        bool selectFileById(const EntityId &fileId, DbFile &file, bool &found);
        bool selectAllFiles(std::vector<DbFile> &files);

        // Chunks
        bool upsertChunk(const DbChunk &chunk);
        bool selectChunks(const EntityId &fileId, std::vector<DbChunk> &chunks);

        // Locations (file path, part number) of the chunks with the given fingerprint, in any file
        bool selectChunkLocations(const std::string &fingerprint, std::vector<std::pair<std::string, int>> &locations);

        /**
         * Write a file row and its complete chunk list in a single transaction.
         * \param file The file row. An existing row with the same file_id is replaced.
         * \param chunks The complete chunk list, replacing every chunk row of the file.
         * \param replacedFileId The identifier of a local row that the file row replaces (identifier adopted from the remote).
         * The replaced row is dropped instead if a row with the new identifier already exists.
         * \return true if everything was committed, false if nothing was.
         */
        bool commitFile(const DbFile &file, const std::vector<DbChunk> &chunks,
                        const std::optional<EntityId> &replacedFileId = std::nullopt);

        // Insert or update any metadata record
        bool upsertRecord(const MetadataRecord &record);

        // Sync cursor
        bool loadCursor(SyncCursor &cursor, bool &found);
        bool storeCursor(const SyncCursor &cursor);

    private:
        bool initData();

        bool execCreateRequest(const char *requestId, const char *query, bool &retry);
        bool upsertFolderNoLock(const DbFolder &folder);
        bool selectFolderNoLock(const char *requestId, const std::string &key, DbFolder &folder, bool &found);
        bool upsertFileNoLock(const DbFile &file);
        bool selectFileNoLock(const char *requestId, const std::string &key, DbFile &file, bool &found);
        void readFileRow(const char *requestId, DbFile &file);
        void bindChunk(const char *requestId, const DbChunk &chunk);
        bool upsertChunkNoLock(const DbChunk &chunk);
        bool insertChunkNoLock(const DbChunk &chunk);
        bool deleteChunksNoLock(const EntityId &fileId);
        bool updateFileIdNoLock(const EntityId &oldFileId, const EntityId &newFileId);
        bool deleteFileNoLock(const EntityId &fileId);

        friend class TestSyncDb;
};

} // namespace FSC
