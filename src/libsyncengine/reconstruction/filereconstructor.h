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

#include <string>
#include <vector>

namespace FSC {

struct ManifestEntry {
        int partNumber = 0;
        std::string fingerprint;
};

// Provider of the bytes of a part, from the chunk cache or from a slice of an existing file
class ChunkSource {
    public:
        virtual ~ChunkSource() = default;
        virtual ExitInfo chunkBytes(int partNumber, const std::string &fingerprint, std::string &bytes) = 0;
};

/**
 * Rebuild a file from its ordered chunk manifest.
 * The content is written to a temporary file in the target directory, then renamed over the target. On any failure
 * the temporary file is removed and the target is left untouched.
 */
class FileReconstructor {
    public:
        FileReconstructor();

        ExitInfo reconstruct(const SyncPath &target, const std::vector<ManifestEntry> &manifest, ChunkSource &source);

        //! Sort the manifest by part number and check that the parts are exactly 0..N-1.
        /*!
          \return DataError/ManifestGap if a part is missing or duplicated.
        */
        static ExitInfo orderManifest(const std::vector<ManifestEntry> &manifest, std::vector<ManifestEntry> &ordered);

        static const std::string tmpFilePrefix;
        static const std::string tmpFileSuffix;

    private:
        ExitInfo writeParts(const SyncPath &tmpPath, const std::vector<ManifestEntry> &manifest, ChunkSource &source);

        log4cplus::Logger _logger;
};

} // namespace FSC
