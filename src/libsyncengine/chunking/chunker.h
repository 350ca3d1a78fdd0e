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

#include <cstdint>
#include <string>
#include <vector>

namespace FSC {

struct Chunk {
        int partNumber = 0;
        std::string bytes;
        std::string fingerprint;
};

// Location of a part inside a file, the bytes stay on disk
struct ChunkInfo {
        int partNumber = 0;
        uint64_t offset = 0;
        uint64_t size = 0;
        std::string fingerprint;
};

/**
 * Fixed-size chunking. Every chunk holds exactly chunkSize bytes except the last one, which holds the remainder.
 * Part numbers start at 0 and are contiguous. An empty input gives no chunk.
 *
 * Boundaries are fixed offsets, not content-defined: inserting a single byte near the start of a file changes the
 * fingerprint of every following chunk.
 */
class Chunker {
    public:
        static ExitInfo chunk(const std::string &bytes, uint64_t chunkSize, std::vector<Chunk> &chunks);

        // Streaming variant, the file is read once and never held in memory as a whole
        static ExitInfo scanFile(const SyncPath &path, uint64_t chunkSize, std::vector<ChunkInfo> &parts);
        // Same, and computes the whole-file fingerprint during the same pass
        static ExitInfo scanFile(const SyncPath &path, uint64_t chunkSize, std::vector<ChunkInfo> &parts,
                                 std::string &fileHash);

        static ExitInfo readPart(const SyncPath &path, const ChunkInfo &part, std::string &bytes);

        static uint64_t partCount(uint64_t fileSize, uint64_t chunkSize);

    private:
        static log4cplus::Logger logger();
};

} // namespace FSC
