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

#include "chunkstoreclient.h"
#include "syncremote.h"

#include <log4cplus/logger.h>

namespace FSC {

class AbstractNetworkJob;

/**
 * Chunk store reached over HTTP. Each call runs one network job synchronously in the calling thread.
 */
class HttpRemote : public ChunkStoreClient, public SyncRemote {
    public:
        explicit HttpRemote(const std::string &apiUrl);

        ExitInfo negotiateUpload(const NegotiationRequest &request, UploadPlan &plan) override;
        ExitInfo uploadPart(const TransferHandle &handle, const std::string &bytes, UploadAck &ack) override;
        ExitInfo downloadChunk(const ChunkLocator &locator, std::string &bytes) override;
        ExitInfo confirm(const ConfirmRequest &request, ConfirmResult &result) override;
        ExitInfo registerFolder(const DbFolder &folder) override;

        ExitInfo fetchChanges(const SyncCursor &cursor, SyncDelta &delta) override;

        inline const std::string &apiUrl() const { return _apiUrl; }

    private:
        ExitInfo runJob(AbstractNetworkJob &job, const std::string &operation);

        log4cplus::Logger _logger;
        std::string _apiUrl;
};

} // namespace FSC
