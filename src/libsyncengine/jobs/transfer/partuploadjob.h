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

#include "jobs/abstractjob.h"
#include "chunking/chunker.h"
#include "chunkstore/chunkstoreclient.h"

namespace FSC {

/**
 * Upload the bytes of one part to the location given by its transfer handle.
 * The bytes are read again from disk and must still match the negotiated fingerprint.
 */
class PartUploadJob : public AbstractJob {
    public:
        PartUploadJob(ChunkStoreClient &client, const SyncPath &localPath, const ChunkInfo &part, const TransferHandle &handle);

        inline const ChunkInfo &part() const { return _part; }
        inline const UploadAck &ack() const { return _ack; }

    protected:
        ExitInfo runJob() noexcept override;

    private:
        ChunkStoreClient &_client;
        SyncPath _localPath;
        ChunkInfo _part;
        TransferHandle _handle;
        UploadAck _ack;
};

} // namespace FSC
