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

#include <log4cplus/logger.h>

#include <mutex>
#include <string>

namespace FSC {

/**
 * Local storage for the chunk payloads fetched during a sync round, addressed by fingerprint.
 * A payload is verified against its fingerprint when read back, a corrupted entry is dropped.
 */
class ChunkCache {
    public:
        explicit ChunkCache(const SyncPath &cacheDir);

        ExitInfo init();

        ExitInfo put(const std::string &fingerprint, const std::string &bytes);
        ExitInfo get(const std::string &fingerprint, std::string &bytes, bool &found);
        bool contains(const std::string &fingerprint);
        void remove(const std::string &fingerprint);

        // Remove every cached payload
        ExitInfo clear();

        inline const SyncPath &cacheDir() const { return _cacheDir; }

    private:
        SyncPath entryPath(const std::string &fingerprint) const;

        log4cplus::Logger _logger;
        SyncPath _cacheDir;
        std::mutex _mutex;
};

} // namespace FSC
