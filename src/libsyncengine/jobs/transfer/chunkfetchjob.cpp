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

#include "chunkfetchjob.h"
#include "fingerprint/fingerprint.h"
#include "libcommonserver/log/log.h"

#include <log4cplus/loggingmacros.h>

namespace FSC {

ChunkFetchJob::ChunkFetchJob(ChunkStoreClient &client, ChunkCache &cache, const ChunkLocator &locator,
                             const int maxIntegrityRetries) :
    _client(client),
    _cache(cache),
    _locator(locator),
    _maxIntegrityRetries(maxIntegrityRetries) {}

ExitInfo ChunkFetchJob::runJob() noexcept {
    for (_attempts = 1; _attempts <= _maxIntegrityRetries + 1; _attempts++) {
        if (isAborted()) {
            return {ExitCode::OperationCanceled, ExitCause::OperationCanceled};
        }

        std::string bytes;
        if (const auto exitInfo = _client.downloadChunk(_locator, bytes); !exitInfo) {
            LOG_WARN(_logger, "Unable to download chunk " << _locator.fingerprint << " : " << exitInfo);
            return exitInfo;
        }

        if (const std::string fingerprint = Fingerprint::compute(bytes); fingerprint != _locator.fingerprint) {
            LOG_WARN(_logger, "Integrity check failed for chunk " << _locator.fingerprint << " (received " << fingerprint
                                                                   << "), attempt " << _attempts);
            continue;
        }

        if (const auto exitInfo = _cache.put(_locator.fingerprint, bytes); !exitInfo) {
            LOG_WARN(_logger, "Unable to cache chunk " << _locator.fingerprint << " : " << exitInfo);
            return exitInfo;
        }
        return ExitCode::Ok;
    }

    _attempts--;
    LOG_ERROR(_logger, "Chunk " << _locator.fingerprint << " rejected after " << _attempts << " attempts");
    return {ExitCode::DataError, ExitCause::IntegrityCheckFailed};
}

} // namespace FSC
