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

#include "partuploadjob.h"
#include "fingerprint/fingerprint.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/utility.h"

#include <log4cplus/loggingmacros.h>

namespace FSC {

PartUploadJob::PartUploadJob(ChunkStoreClient &client, const SyncPath &localPath, const ChunkInfo &part,
                             const TransferHandle &handle) :
    _client(client),
    _localPath(localPath),
    _part(part),
    _handle(handle) {}

ExitInfo PartUploadJob::runJob() noexcept {
    if (_handle.isExpired(Utility::currentSyncTime())) {
        LOG_INFO(_logger, "Transfer handle of part " << _part.partNumber << " expired at " << _handle.expiresAt);
        return {ExitCode::BackError, ExitCause::TransferHandleExpired};
    }

    std::string bytes;
    if (const auto exitInfo = Chunker::readPart(_localPath, _part, bytes); !exitInfo) {
        LOG_WARN(_logger, "Unable to read part " << _part.partNumber << " of " << Utility::formatSyncPath(_localPath) << " : "
                                                 << exitInfo);
        return exitInfo;
    }

    if (Fingerprint::compute(bytes) != _part.fingerprint) {
        LOG_INFO(_logger, "Part " << _part.partNumber << " of " << Utility::formatSyncPath(_localPath)
                                  << " changed since it was chunked");
        return {ExitCode::DataError, ExitCause::FileModified};
    }

    if (const auto exitInfo = _client.uploadPart(_handle, bytes, _ack); !exitInfo) {
        return exitInfo;
    }

    if (isExtendedLog()) {
        LOG_DEBUG(_logger, "Part " << _part.partNumber << " of " << Utility::formatSyncPath(_localPath) << " uploaded, etag="
                                   << _ack.etag);
    }
    return ExitCode::Ok;
}

} // namespace FSC
