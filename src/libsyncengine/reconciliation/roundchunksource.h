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

#include "cache/chunkcache.h"
#include "reconstruction/filereconstructor.h"

#include <unordered_map>

namespace FSC {

/**
 * Bytes of the parts of one file during a sync round: a slice of a local file when an identical chunk is already on
 * disk, the chunk cache otherwise.
 */
class RoundChunkSource : public ChunkSource {
    public:
        explicit RoundChunkSource(ChunkCache &cache);

        void addSlice(int partNumber, const SyncPath &path, uint64_t offset, uint64_t size);
        bool hasSlice(int partNumber) const { return _slices.contains(partNumber); }

        ExitInfo chunkBytes(int partNumber, const std::string &fingerprint, std::string &bytes) override;

    private:
        struct Slice {
                SyncPath path;
                uint64_t offset = 0;
                uint64_t size = 0;
        };

        ChunkCache &_cache;
        std::unordered_map<int, Slice> _slices;
};

} // namespace FSC
