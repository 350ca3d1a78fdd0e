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

#include "chunkstorejson.h"
#include "jobs/network/networkjobsparams.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/jsonparserutility.h"
#include "libcommonserver/utility/utility.h"

#include <Poco/JSON/Array.h>

#include <sstream>

namespace FSC {

static const ExitInfo apiError = {ExitCode::BackError, ExitCause::ApiErr};

Poco::JSON::Object::Ptr ChunkStoreJson::toJson(const SyncCursor &cursor) {
    Poco::JSON::Object::Ptr obj = new Poco::JSON::Object;
    if (cursor.isSet()) {
        obj->set(lastSyncTimeKey, *cursor.lastSyncTime);
    } else {
        obj->set(lastSyncTimeKey, Poco::Dynamic::Var());
    }
    return obj;
}

Poco::JSON::Object::Ptr ChunkStoreJson::toJson(const NegotiationRequest &request) {
    Poco::JSON::Object::Ptr obj = new Poco::JSON::Object(Poco::JSON_PRESERVE_KEY_ORDER);
    obj->set(fileIdKey, request.fileId);
    obj->set(filePathKey, request.filePath);
    obj->set(fileNameKey, request.fileName);
    obj->set(fileTypeKey, request.fileType);
    obj->set(folderIdKey, request.folderId);
    obj->set(fileHashKey, request.fileHash);
    obj->set(chunkCountKey, static_cast<int>(request.fingerprints.size()));

    Poco::JSON::Array::Ptr fingerprints = new Poco::JSON::Array;
    for (const auto &fingerprint: request.fingerprints) {
        fingerprints->add(fingerprint);
    }
    obj->set(fingerprintsKey, fingerprints);
    return obj;
}

Poco::JSON::Object::Ptr ChunkStoreJson::toJson(const ConfirmRequest &request) {
    Poco::JSON::Object::Ptr obj = new Poco::JSON::Object(Poco::JSON_PRESERVE_KEY_ORDER);
    obj->set(fileIdKey, request.fileId);
    obj->set(uploadIdKey, request.uploadId);

    Poco::JSON::Array::Ptr chunks = new Poco::JSON::Array;
    for (const auto &chunk: request.chunks) {
        Poco::JSON::Object::Ptr chunkObj = new Poco::JSON::Object(Poco::JSON_PRESERVE_KEY_ORDER);
        chunkObj->set(chunkIdKey, chunk.chunkId);
        chunkObj->set(partNumberKey, chunk.partNumber);
        chunkObj->set(fingerprintKey, chunk.fingerprint);
        chunkObj->set(etagKey, chunk.etag);
        chunks->add(chunkObj);
    }
    obj->set(chunksKey, chunks);
    return obj;
}

Poco::JSON::Object::Ptr ChunkStoreJson::toJson(const DbFolder &folder) {
    Poco::JSON::Object::Ptr obj = new Poco::JSON::Object(Poco::JSON_PRESERVE_KEY_ORDER);
    obj->set(folderIdKey, folder.folderId());
    obj->set(folderPathKey, folder.folderPath());
    obj->set(folderNameKey, folder.folderName());
    if (folder.parentFolderId()) {
        obj->set(parentFolderIdKey, *folder.parentFolderId());
    } else {
        obj->set(parentFolderIdKey, Poco::Dynamic::Var());
    }
    return obj;
}

ExitInfo ChunkStoreJson::fromJson(const Poco::JSON::Object::Ptr obj, SyncDelta &delta) {
    delta = SyncDelta();
    if (!JsonParserUtility::extractValue(obj, upToDateKey, delta.upToDate)) return apiError;
    if (!JsonParserUtility::extractValue(obj, lastSyncTimeKey, delta.lastSyncTime)) return apiError;
    if (delta.lastSyncTime.empty()) {
        LOG_WARN(Log::instance()->getLogger(), "Sync response without " << lastSyncTimeKey);
        return apiError;
    }

    if (delta.upToDate) {
        return ExitCode::Ok;
    }

    const Poco::JSON::Array::Ptr files = JsonParserUtility::extractArrayObject(obj, updatedFilesKey);
    if (!files) return apiError;

    for (size_t i = 0; i < files->size(); i++) {
        RemoteFile file;
        if (const auto exitInfo = fromJson(files->getObject(static_cast<unsigned int>(i)), file); !exitInfo) {
            return exitInfo;
        }
        delta.updatedFiles.push_back(std::move(file));
    }
    return ExitCode::Ok;
}

ExitInfo ChunkStoreJson::fromJson(const Poco::JSON::Object::Ptr obj, RemoteFile &file) {
    if (!JsonParserUtility::extractValue(obj, fileIdKey, file.fileId)) return apiError;
    if (!JsonParserUtility::extractValue(obj, filePathKey, file.filePath)) return apiError;
    if (!JsonParserUtility::extractValue(obj, fileNameKey, file.fileName)) return apiError;
    if (!JsonParserUtility::extractValue(obj, fileTypeKey, file.fileType, false)) return apiError;
    if (!JsonParserUtility::extractValue(obj, folderIdKey, file.folderId, false)) return apiError;
    if (file.fileId.empty() || file.filePath.empty()) {
        LOG_WARN(Log::instance()->getLogger(), "Updated file without identifier or path");
        return apiError;
    }

    const Poco::JSON::Array::Ptr chunks = JsonParserUtility::extractArrayObject(obj, chunksKey);
    if (!chunks) return apiError;

    for (size_t i = 0; i < chunks->size(); i++) {
        RemoteChunk chunk;
        if (const auto exitInfo = fromJson(chunks->getObject(static_cast<unsigned int>(i)), chunk); !exitInfo) {
            return exitInfo;
        }
        file.chunks.push_back(std::move(chunk));
    }
    return ExitCode::Ok;
}

ExitInfo ChunkStoreJson::fromJson(const Poco::JSON::Object::Ptr obj, RemoteChunk &chunk) {
    if (!JsonParserUtility::extractValue(obj, chunkIdKey, chunk.chunkId)) return apiError;
    if (!JsonParserUtility::extractValue(obj, partNumberKey, chunk.partNumber)) return apiError;
    if (!JsonParserUtility::extractValue(obj, fingerprintKey, chunk.fingerprint)) return apiError;
    if (!JsonParserUtility::extractValue(obj, createdAtKey, chunk.createdAt, false)) return apiError;
    return ExitCode::Ok;
}

ExitInfo ChunkStoreJson::fromJson(const Poco::JSON::Object::Ptr obj, UploadPlan &plan) {
    plan = UploadPlan();
    if (!JsonParserUtility::extractValue(obj, fileIdKey, plan.fileId)) return apiError;
    if (!JsonParserUtility::extractValue(obj, uploadIdKey, plan.uploadId)) return apiError;
    if (!JsonParserUtility::extractValue(obj, expiresAtKey, plan.expiresAt, false)) return apiError;

    const Poco::JSON::Array::Ptr parts = JsonParserUtility::extractArrayObject(obj, partsKey);
    if (!parts) return apiError;

    for (size_t i = 0; i < parts->size(); i++) {
        PartPlan part;
        if (const auto exitInfo = fromJson(parts->getObject(static_cast<unsigned int>(i)), plan, part); !exitInfo) {
            return exitInfo;
        }
        plan.parts.push_back(std::move(part));
    }
    return ExitCode::Ok;
}

ExitInfo ChunkStoreJson::fromJson(const Poco::JSON::Object::Ptr obj, const UploadPlan &plan, PartPlan &part) {
    std::string status;
    if (!JsonParserUtility::extractValue(obj, partNumberKey, part.partNumber)) return apiError;
    if (!JsonParserUtility::extractValue(obj, fingerprintKey, part.fingerprint)) return apiError;
    if (!JsonParserUtility::extractValue(obj, chunkIdKey, part.chunkId)) return apiError;
    if (!JsonParserUtility::extractValue(obj, statusKey, status)) return apiError;

    if (status == statusExists) {
        part.disposition = PartDisposition::Exists;
        return ExitCode::Ok;
    }

    if (status != statusUpload) {
        LOG_WARN(Log::instance()->getLogger(), "Unknown part status: " << status);
        return apiError;
    }

    part.disposition = PartDisposition::Upload;
    TransferHandle handle;
    handle.uploadId = plan.uploadId;
    handle.partNumber = part.partNumber;
    handle.expiresAt = plan.expiresAt;
    if (!JsonParserUtility::extractValue(obj, uploadUrlKey, handle.url)) return apiError;
    if (!handle.expiresAt.empty() && !Utility::isoTimeToSyncTime(handle.expiresAt, handle.expiresAtUs)) {
        LOG_WARN(Log::instance()->getLogger(), "Unable to parse expiration time: " << handle.expiresAt);
        handle.expiresAtUs = 0;
    }
    part.handle = handle;
    return ExitCode::Ok;
}

ExitInfo ChunkStoreJson::fromJson(const Poco::JSON::Object::Ptr obj, ConfirmResult &result) {
    result = ConfirmResult();
    if (!JsonParserUtility::extractValue(obj, successKey, result.success)) return apiError;
    if (!JsonParserUtility::extractValue(obj, confirmedChunksKey, result.confirmedChunks, false)) return apiError;

    if (obj->has(missingPartsKey) && !obj->isNull(missingPartsKey)) {
        const Poco::JSON::Array::Ptr missingParts = JsonParserUtility::extractArrayObject(obj, missingPartsKey);
        if (!missingParts) return apiError;
        for (size_t i = 0; i < missingParts->size(); i++) {
            try {
                result.missingParts.push_back(missingParts->getElement<int>(static_cast<unsigned int>(i)));
            } catch (const Poco::Exception &e) {
                LOG_WARN(Log::instance()->getLogger(), "Invalid missing part: " << e.displayText());
                return apiError;
            }
        }
    }
    return ExitCode::Ok;
}

std::string ChunkStoreJson::stringify(const Poco::JSON::Object::Ptr obj) {
    std::ostringstream out;
    obj->stringify(out);
    return out.str();
}

} // namespace FSC
