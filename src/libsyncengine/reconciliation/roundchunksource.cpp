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

#include "roundchunksource.h"
#include "libcommonserver/io/iohelper.h"

namespace FSC {

RoundChunkSource::RoundChunkSource(ChunkCache &cache) :
    _cache(cache) {}

void RoundChunkSource::addSlice(const int partNumber, const SyncPath &path, const uint64_t offset, const uint64_t size) {
    _slices.insert_or_assign(partNumber, Slice{path, offset, size});
}

ExitInfo RoundChunkSource::chunkBytes(const int partNumber, const std::string &fingerprint, std::string &bytes) {
    if (const auto it = _slices.find(partNumber); it != _slices.end()) {
        return IoHelper::readFileRange(it->second.path, it->second.offset, it->second.size, bytes);
    }

    bool found = false;
    if (const auto exitInfo = _cache.get(fingerprint, bytes, found); !exitInfo) {
        return exitInfo;
    }
    if (!found) {
        return {ExitCode::DataError, ExitCause::NotFound};
    }
    return ExitCode::Ok;
}

} // namespace FSC
