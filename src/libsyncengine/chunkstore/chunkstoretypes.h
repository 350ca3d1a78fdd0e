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
#include <vector>

namespace FSC {

enum class PartDisposition { Exists, Upload };
std::string toString(PartDisposition e);

// Time-limited location where the bytes of one part must be sent
struct TransferHandle {
        std::string uploadId;
        int partNumber = 0;
        std::string url;
        std::string expiresAt;
        SyncTime expiresAtUs = 0; // 0 if the store did not give an expiration

        bool isExpired(SyncTime now) const { return expiresAtUs > 0 && now >= expiresAtUs; }
};

struct NegotiationRequest {
        EntityId fileId;
        std::string filePath;
        std::string fileName;
        std::string fileType;
        EntityId folderId;
        std::string fileHash; // Fingerprint of the part fingerprints
        std::vector<std::string> fingerprints; // In part order
};

struct PartPlan {
        int partNumber = 0;
        std::string fingerprint;
        EntityId chunkId;
        PartDisposition disposition = PartDisposition::Upload;
        std::optional<TransferHandle> handle; // Set for the parts to upload
};

struct UploadPlan {
        EntityId fileId;
        std::string uploadId;
        std::string expiresAt;
        std::vector<PartPlan> parts;
};

struct UploadAck {
        std::string etag;
};

struct ChunkLocator {
        std::string fingerprint;
        std::string url; // Optional direct location, the fingerprint is used otherwise
};

struct ConfirmedChunk {
        EntityId chunkId;
        int partNumber = 0;
        std::string fingerprint;
        std::string etag;
};

struct ConfirmRequest {
        EntityId fileId;
        std::string uploadId;
        std::vector<ConfirmedChunk> chunks; // Complete, ordered by part number
};

struct ConfirmResult {
        bool success = false;
        int confirmedChunks = 0;
        std::vector<int> missingParts;
};

struct RemoteChunk {
        EntityId chunkId;
        int partNumber = 0;
        std::string fingerprint;
        std::string createdAt;
};

struct RemoteFile {
        EntityId fileId;
        std::string filePath;
        std::string fileName;
        std::string fileType;
        EntityId folderId;
        std::vector<RemoteChunk> chunks; // Full current manifest
};

struct SyncDelta {
        bool upToDate = true;
        std::string lastSyncTime; // Server timestamp
        std::vector<RemoteFile> updatedFiles;
};

} // namespace FSC
