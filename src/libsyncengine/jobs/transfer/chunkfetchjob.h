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
#include "cache/chunkcache.h"
#include "chunkstore/chunkstoreclient.h"

namespace FSC {

/**
 * Download a chunk, verify it against its fingerprint and store it in the chunk cache.
 * Bytes that do not match are never accepted: the chunk is fetched again, up to maxIntegrityRetries times.
 */
class ChunkFetchJob : public AbstractJob {
    public:
        ChunkFetchJob(ChunkStoreClient &client, ChunkCache &cache, const ChunkLocator &locator, int maxIntegrityRetries);

        inline const ChunkLocator &locator() const { return _locator; }
        inline int attempts() const { return _attempts; }

    protected:
        ExitInfo runJob() noexcept override;

    private:
        ChunkStoreClient &_client;
        ChunkCache &_cache;
        ChunkLocator _locator;
        int _maxIntegrityRetries = 0;
        int _attempts = 0;
};

} // namespace FSC
