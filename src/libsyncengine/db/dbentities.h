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

#include "libcommon/utility/types.h"

#include <optional>
#include <string>

namespace FSC {

class DbFolder {
    public:
        DbFolder() = default;
        DbFolder(const EntityId &folderId, const std::string &folderPath, const std::string &folderName,
                 const std::optional<EntityId> &parentFolderId);

        static constexpr EntityKind kind = EntityKind::Folder;

        inline const EntityId &folderId() const { return _folderId; }
        inline const std::string &folderPath() const { return _folderPath; }
        inline const std::string &folderName() const { return _folderName; }
        inline const std::optional<EntityId> &parentFolderId() const { return _parentFolderId; }

        inline void setFolderId(const EntityId &folderId) { _folderId = folderId; }
        inline void setFolderPath(const std::string &folderPath) { _folderPath = folderPath; }
        inline void setFolderName(const std::string &folderName) { _folderName = folderName; }
        inline void setParentFolderId(const std::optional<EntityId> &parentFolderId) { _parentFolderId = parentFolderId; }

        inline bool isRoot() const { return !_parentFolderId.has_value(); }

        bool operator==(const DbFolder &other) const = default;

    private:
        EntityId _folderId;
        std::string _folderPath; // Canonical path, "/" for the root
        std::string _folderName;
        std::optional<EntityId> _parentFolderId; // Not set for the root
};

class DbFile {
    public:
        DbFile() = default;
        DbFile(const EntityId &fileId, const std::string &filePath, const std::string &fileName, const std::string &fileType,
               const EntityId &folderId, const std::optional<std::string> &fileHash);

        static constexpr EntityKind kind = EntityKind::File;

        inline const EntityId &fileId() const { return _fileId; }
        inline const std::string &filePath() const { return _filePath; }
        inline const std::string &fileName() const { return _fileName; }
        inline const std::string &fileType() const { return _fileType; }
        inline const EntityId &folderId() const { return _folderId; }
        inline const std::optional<std::string> &fileHash() const { return _fileHash; }

        inline void setFileId(const EntityId &fileId) { _fileId = fileId; }
        inline void setFilePath(const std::string &filePath) { _filePath = filePath; }
        inline void setFileName(const std::string &fileName) { _fileName = fileName; }
        inline void setFileType(const std::string &fileType) { _fileType = fileType; }
        inline void setFolderId(const EntityId &folderId) { _folderId = folderId; }
        inline void setFileHash(const std::optional<std::string> &fileHash) { _fileHash = fileHash; }

        bool operator==(const DbFile &other) const = default;

    private:
        EntityId _fileId;
        std::string _filePath;
        std::string _fileName;
        std::string _fileType;
        EntityId _folderId;
        std::optional<std::string> _fileHash; // Whole-file fingerprint of the last committed content
};

class DbChunk {
    public:
        DbChunk() = default;
        DbChunk(const EntityId &chunkId, const EntityId &fileId, int partNumber, const std::string &fingerprint,
                const std::string &createdAt, std::optional<SyncTime> lastSynced);

        static constexpr EntityKind kind = EntityKind::Chunk;

        inline const EntityId &chunkId() const { return _chunkId; }
        inline const EntityId &fileId() const { return _fileId; }
        inline int partNumber() const { return _partNumber; }
        inline const std::string &fingerprint() const { return _fingerprint; }
        inline const std::string &createdAt() const { return _createdAt; }
        inline std::optional<SyncTime> lastSynced() const { return _lastSynced; }

        inline void setChunkId(const EntityId &chunkId) { _chunkId = chunkId; }
        inline void setFileId(const EntityId &fileId) { _fileId = fileId; }
        inline void setPartNumber(int partNumber) { _partNumber = partNumber; }
        inline void setFingerprint(const std::string &fingerprint) { _fingerprint = fingerprint; }
        inline void setCreatedAt(const std::string &createdAt) { _createdAt = createdAt; }
        inline void setLastSynced(std::optional<SyncTime> lastSynced) { _lastSynced = lastSynced; }

        bool operator==(const DbChunk &other) const = default;

    private:
        EntityId _chunkId;
        EntityId _fileId;
        int _partNumber = 0;
        std::string _fingerprint;
        std::string _createdAt; // Server timestamp, kept verbatim
        std::optional<SyncTime> _lastSynced;
};

} // namespace FSC
