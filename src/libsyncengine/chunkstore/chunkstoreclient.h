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

#include "chunkstoretypes.h"
#include "db/dbentities.h"

namespace FSC {

/**
 * Access to the chunk and metadata store.
 * The implementations must allow concurrent calls: parts are transferred in parallel.
 */
class ChunkStoreClient {
    public:
        virtual ~ChunkStoreClient() = default;

        // For each fingerprint, the store answers "exists" (dedup hit) or hands out a transfer handle
        virtual ExitInfo negotiateUpload(const NegotiationRequest &request, UploadPlan &plan) = 0;

        // Safe to retry, the destination is keyed by the handle
        virtual ExitInfo uploadPart(const TransferHandle &handle, const std::string &bytes, UploadAck &ack) = 0;

        // The bytes are returned as received, the caller verifies them against the fingerprint
        virtual ExitInfo downloadChunk(const ChunkLocator &locator, std::string &bytes) = 0;

        // Commit the complete chunk manifest of a file
        virtual ExitInfo confirm(const ConfirmRequest &request, ConfirmResult &result) = 0;

        // Idempotent
        virtual ExitInfo registerFolder(const DbFolder &folder) = 0;
};

} // namespace FSC
