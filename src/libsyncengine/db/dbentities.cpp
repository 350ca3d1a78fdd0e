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

#include "dbentities.h"

namespace FSC {

DbFolder::DbFolder(const EntityId &folderId, const std::string &folderPath, const std::string &folderName,
                   const std::optional<EntityId> &parentFolderId) :
    _folderId(folderId),
    _folderPath(folderPath),
    _folderName(folderName),
    _parentFolderId(parentFolderId) {}

DbFile::DbFile(const EntityId &fileId, const std::string &filePath, const std::string &fileName, const std::string &fileType,
               const EntityId &folderId, const std::optional<std::string> &fileHash) :
    _fileId(fileId),
    _filePath(filePath),
    _fileName(fileName),
    _fileType(fileType),
    _folderId(folderId),
    _fileHash(fileHash) {}

DbChunk::DbChunk(const EntityId &chunkId, const EntityId &fileId, int partNumber, const std::string &fingerprint,
                 const std::string &createdAt, std::optional<SyncTime> lastSynced) :
    _chunkId(chunkId),
    _fileId(fileId),
    _partNumber(partNumber),
    _fingerprint(fingerprint),
    _createdAt(createdAt),
    _lastSynced(lastSynced) {}

} // namespace FSC
