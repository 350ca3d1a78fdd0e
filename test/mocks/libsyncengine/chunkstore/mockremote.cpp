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

#include "mockremote.h"
#include "chunking/chunker.h"
#include "fingerprint/fingerprint.h"
#include "libcommonserver/utility/utility.h"

namespace FSC {

const std::string MockRemote::uploadUrlPrefix = "mock://upload/";

// 2024-01-01T00:00:00Z
static const SyncTime initialClockUs = 1704067200000000;
static const SyncTime handleLifetimeUs = 3600000000;

MockRemote::MockRemote() :
    _clockUs(initialClockUs) {}

SyncTime MockRemote::tick() {
    _clockUs += 1000000;
    return _clockUs;
}

SyncTime MockRemote::clock() const {
    const std::scoped_lock lock(_mutex);
    return _clockUs;
}

void MockRemote::setClock(const SyncTime clockUs) {
    const std::scoped_lock lock(_mutex);
    _clockUs = clockUs;
}

void MockRemote::resetCounters() {
    const std::scoped_lock lock(_mutex);
    _negotiateCount = 0;
    _uploadCount = 0;
    _downloadCount = 0;
    _confirmCount = 0;
    _registerFolderCount = 0;
    _fetchCount = 0;
}

void MockRemote::failNextConfirms(const int count, const ExitInfo &exitInfo) {
    _failConfirms = count;
    _confirmFailure = exitInfo;
}

ExitInfo MockRemote::negotiateUpload(const NegotiationRequest &request, UploadPlan &plan) {
    const std::scoped_lock lock(_mutex);
    _negotiateCount++;

    UploadSession session;
    session.request = request;

    plan = UploadPlan();
    plan.fileId = request.fileId;
    plan.uploadId = "upload_" + std::to_string(++_nextId);
    // Handles expire in wall clock time, like those of a real store
    const SyncTime expiresAtUs = Utility::currentSyncTime() + handleLifetimeUs;
    plan.expiresAt = Utility::syncTimeToIsoTime(expiresAtUs);

    for (int partNumber = 0; partNumber < static_cast<int>(request.fingerprints.size()); partNumber++) {
        PartPlan part;
        part.partNumber = partNumber;
        part.fingerprint = request.fingerprints[partNumber];
        part.chunkId = "chunk_" + std::to_string(++_nextId);
        session.chunkIds[partNumber] = part.chunkId;

        if (_objects.contains(part.fingerprint)) {
            part.disposition = PartDisposition::Exists;
        } else {
            part.disposition = PartDisposition::Upload;
            TransferHandle handle;
            handle.uploadId = plan.uploadId;
            handle.partNumber = partNumber;
            handle.url = uploadUrlPrefix + plan.uploadId + "/" + std::to_string(partNumber);
            handle.expiresAt = plan.expiresAt;
            handle.expiresAtUs = expiresAtUs;
            if (_expireHandles > 0) {
                // Already expired when the plan is received
                _expireHandles--;
                handle.expiresAtUs = 1;
            }
            part.handle = handle;
        }
        plan.parts.push_back(part);
    }

    _sessions[plan.uploadId] = std::move(session);
    return ExitCode::Ok;
}

ExitInfo MockRemote::uploadPart(const TransferHandle &handle, const std::string &bytes, UploadAck &ack) {
    const std::scoped_lock lock(_mutex);
    _uploadCount++;

    if (_rejectUploads > 0) {
        _rejectUploads--;
        return {ExitCode::BackError, ExitCause::TransferHandleExpired};
    }

    if (!_sessions.contains(handle.uploadId)) {
        return {ExitCode::BackError, ExitCause::HttpErr};
    }

    const std::string fingerprint = Fingerprint::compute(bytes);
    _objects[fingerprint] = bytes;
    ack.etag = "\"" + fingerprint.substr(0, 16) + "\"";
    return ExitCode::Ok;
}

bool MockRemote::fingerprintOfFailingPath(const std::string &fingerprint) const {
    for (const auto &[_, stored]: _files) {
        if (!_failingPaths.contains(stored.file.filePath)) continue;
        for (const auto &chunk: stored.file.chunks) {
            if (chunk.fingerprint == fingerprint) return true;
        }
    }
    return false;
}

ExitInfo MockRemote::downloadChunk(const ChunkLocator &locator, std::string &bytes) {
    const std::scoped_lock lock(_mutex);
    _downloadCount++;

    if (fingerprintOfFailingPath(locator.fingerprint)) {
        return {ExitCode::NetworkError, ExitCause::NetworkTimeout};
    }

    const auto it = _objects.find(locator.fingerprint);
    if (it == _objects.end()) {
        return {ExitCode::BackError, ExitCause::NotFound};
    }

    bytes = it->second;
    if (_corruptDownloads > 0) {
        _corruptDownloads--;
        if (bytes.empty()) {
            bytes = "x";
        } else {
            bytes[0] = static_cast<char>(bytes[0] ^ 0x5A);
        }
    }
    return ExitCode::Ok;
}

ExitInfo MockRemote::confirm(const ConfirmRequest &request, ConfirmResult &result) {
    const std::scoped_lock lock(_mutex);
    _confirmCount++;
    result = ConfirmResult();

    if (_failConfirms > 0) {
        _failConfirms--;
        return _confirmFailure;
    }

    const auto sessionIt = _sessions.find(request.uploadId);
    if (sessionIt == _sessions.end()) {
        return {ExitCode::BackError, ExitCause::ConfirmRejected};
    }

    for (const auto &fingerprint: _droppedOnConfirm) {
        _objects.erase(fingerprint);
    }
    _droppedOnConfirm.clear();

    for (const auto &chunk: request.chunks) {
        if (!_objects.contains(chunk.fingerprint)) {
            result.missingParts.push_back(chunk.partNumber);
        }
    }
    if (!result.missingParts.empty()) {
        return ExitCode::Ok;
    }

    const NegotiationRequest &negotiation = sessionIt->second.request;
    StoredFile stored;
    stored.file.fileId = request.fileId;
    stored.file.filePath = negotiation.filePath;
    stored.file.fileName = negotiation.fileName;
    stored.file.fileType = negotiation.fileType;
    stored.file.folderId = negotiation.folderId;
    stored.modifiedUs = tick();
    const std::string createdAt = Utility::syncTimeToIsoTime(stored.modifiedUs);
    for (const auto &chunk: request.chunks) {
        stored.file.chunks.push_back({chunk.chunkId, chunk.partNumber, chunk.fingerprint, createdAt});
    }

    // A path designates a single file
    for (auto it = _files.begin(); it != _files.end();) {
        if (it->first != request.fileId && it->second.file.filePath == negotiation.filePath) {
            it = _files.erase(it);
        } else {
            ++it;
        }
    }
    _files[request.fileId] = std::move(stored);
    _sessions.erase(sessionIt);

    result.success = true;
    result.confirmedChunks = static_cast<int>(request.chunks.size());
    return ExitCode::Ok;
}

ExitInfo MockRemote::registerFolder(const DbFolder &folder) {
    const std::scoped_lock lock(_mutex);
    _registerFolderCount++;
    _folders[folder.folderPath()] = folder;
    return ExitCode::Ok;
}

ExitInfo MockRemote::fetchChanges(const SyncCursor &cursor, SyncDelta &delta) {
    const std::scoped_lock lock(_mutex);
    _fetchCount++;
    delta = SyncDelta();

    if (_failFetches > 0) {
        _failFetches--;
        return {ExitCode::NetworkError, ExitCause::NetworkTimeout};
    }

    for (const auto &[_, stored]: _files) {
        if (!cursor.isSet() || stored.modifiedUs > cursor.lastSyncTimeUs) {
            delta.updatedFiles.push_back(stored.file);
        }
    }
    delta.upToDate = delta.updatedFiles.empty();
    delta.lastSyncTime = Utility::syncTimeToIsoTime(_clockUs);
    return ExitCode::Ok;
}

EntityId MockRemote::putRemoteFile(const std::string &filePath, const std::string &content, const uint64_t chunkSize,
                                   const EntityId &fileId /*= EntityId()*/) {
    std::vector<Chunk> chunks;
    (void) Chunker::chunk(content, chunkSize, chunks);

    const std::scoped_lock lock(_mutex);
    StoredFile stored;
    stored.file.fileId = fileId;
    if (stored.file.fileId.empty()) {
        // Keep the identifier of the file already at this path
        for (const auto &[id, existing]: _files) {
            if (existing.file.filePath == filePath) stored.file.fileId = id;
        }
    }
    if (stored.file.fileId.empty()) {
        stored.file.fileId = "file_" + std::to_string(++_nextId);
    }
    stored.file.filePath = filePath;
    stored.file.fileName = Utility::itemName(filePath);
    stored.file.fileType = Utility::fileTypeFromName(stored.file.fileName);
    stored.file.folderId = "folder_" + Utility::parentItemPath(filePath);
    stored.modifiedUs = tick();

    const std::string createdAt = Utility::syncTimeToIsoTime(stored.modifiedUs);
    for (const auto &chunk: chunks) {
        _objects[chunk.fingerprint] = chunk.bytes;
        stored.file.chunks.push_back({"chunk_" + std::to_string(++_nextId), chunk.partNumber, chunk.fingerprint, createdAt});
    }

    const EntityId id = stored.file.fileId;
    _files[id] = std::move(stored);
    return id;
}

void MockRemote::moveRemoteFile(const EntityId &fileId, const std::string &newFilePath) {
    const std::scoped_lock lock(_mutex);
    const auto it = _files.find(fileId);
    if (it == _files.end()) return;

    it->second.file.filePath = newFilePath;
    it->second.file.fileName = Utility::itemName(newFilePath);
    it->second.file.fileType = Utility::fileTypeFromName(it->second.file.fileName);
    it->second.file.folderId = "folder_" + Utility::parentItemPath(newFilePath);
    it->second.modifiedUs = tick();
}

void MockRemote::removeRemotePart(const EntityId &fileId, const int partNumber) {
    const std::scoped_lock lock(_mutex);
    const auto it = _files.find(fileId);
    if (it == _files.end()) return;

    auto &chunks = it->second.file.chunks;
    std::erase_if(chunks, [partNumber](const RemoteChunk &chunk) { return chunk.partNumber == partNumber; });
    it->second.modifiedUs = tick();
}

bool MockRemote::remoteFile(const EntityId &fileId, RemoteFile &file) const {
    const std::scoped_lock lock(_mutex);
    const auto it = _files.find(fileId);
    if (it == _files.end()) return false;
    file = it->second.file;
    return true;
}

bool MockRemote::remoteFileByPath(const std::string &filePath, RemoteFile &file) const {
    const std::scoped_lock lock(_mutex);
    for (const auto &[_, stored]: _files) {
        if (stored.file.filePath == filePath) {
            file = stored.file;
            return true;
        }
    }
    return false;
}

std::string MockRemote::remoteContent(const EntityId &fileId) const {
    const std::scoped_lock lock(_mutex);
    const auto it = _files.find(fileId);
    if (it == _files.end()) return {};

    std::map<int, std::string> parts;
    for (const auto &chunk: it->second.file.chunks) {
        const auto objectIt = _objects.find(chunk.fingerprint);
        parts[chunk.partNumber] = objectIt == _objects.end() ? std::string() : objectIt->second;
    }

    std::string content;
    for (const auto &[_, bytes]: parts) {
        content += bytes;
    }
    return content;
}

bool MockRemote::hasObject(const std::string &fingerprint) const {
    const std::scoped_lock lock(_mutex);
    return _objects.contains(fingerprint);
}

size_t MockRemote::objectCount() const {
    const std::scoped_lock lock(_mutex);
    return _objects.size();
}

bool MockRemote::hasFolder(const std::string &folderPath) const {
    const std::scoped_lock lock(_mutex);
    return _folders.contains(folderPath);
}

} // namespace FSC
