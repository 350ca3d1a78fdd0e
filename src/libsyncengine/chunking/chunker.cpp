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

#include "chunker.h"
#include "fingerprint/fingerprint.h"
#include "libcommonserver/io/iohelper.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/utility.h"

#include <fstream>

namespace FSC {

log4cplus::Logger Chunker::logger() {
    return Log::instance()->getLogger();
}

uint64_t Chunker::partCount(uint64_t fileSize, uint64_t chunkSize) {
    if (chunkSize == 0) return 0;
    return (fileSize + chunkSize - 1) / chunkSize;
}

ExitInfo Chunker::chunk(const std::string &bytes, uint64_t chunkSize, std::vector<Chunk> &chunks) {
    chunks.clear();
    if (chunkSize == 0) {
        LOG_WARN(logger(), "Invalid chunk size 0");
        return {ExitCode::LogicError, ExitCause::InvalidArgument};
    }

    chunks.reserve(partCount(bytes.size(), chunkSize));
    int partNumber = 0;
    for (uint64_t offset = 0; offset < bytes.size(); offset += chunkSize) {
        Chunk chunk;
        chunk.partNumber = partNumber++;
        chunk.bytes = bytes.substr(offset, chunkSize);
        chunk.fingerprint = Fingerprint::compute(chunk.bytes);
        chunks.push_back(std::move(chunk));
    }

    return ExitCode::Ok;
}

ExitInfo Chunker::scanFile(const SyncPath &path, uint64_t chunkSize, std::vector<ChunkInfo> &parts) {
    std::string fileHash;
    return scanFile(path, chunkSize, parts, fileHash);
}

ExitInfo Chunker::scanFile(const SyncPath &path, uint64_t chunkSize, std::vector<ChunkInfo> &parts, std::string &fileHash) {
    parts.clear();
    fileHash.clear();
    if (chunkSize == 0) {
        LOG_WARN(logger(), "Invalid chunk size 0");
        return {ExitCode::LogicError, ExitCause::InvalidArgument};
    }

    std::ifstream is;
    if (const ExitInfo exitInfo = IoHelper::openFile(path, is); !exitInfo) {
        return exitInfo;
    }

    Fingerprint::Builder fileHashBuilder;
    std::string buffer(chunkSize, '\0');
    uint64_t offset = 0;
    int partNumber = 0;
    while (is) {
        is.read(buffer.data(), static_cast<std::streamsize>(chunkSize));
        if (is.bad()) {
            LOG_WARN(logger(), "Error while reading " << Utility::formatSyncPath(path));
            return {ExitCode::SystemError, ExitCause::FileAccessError};
        }

        const auto readSize = static_cast<uint64_t>(is.gcount());
        if (readSize == 0) break;

        ChunkInfo part;
        part.partNumber = partNumber++;
        part.offset = offset;
        part.size = readSize;
        part.fingerprint = Fingerprint::compute(buffer.data(), readSize);
        fileHashBuilder.update(buffer.data(), readSize);
        parts.push_back(std::move(part));

        offset += readSize;
    }

    fileHash = fileHashBuilder.finalize();
    return ExitCode::Ok;
}

ExitInfo Chunker::readPart(const SyncPath &path, const ChunkInfo &part, std::string &bytes) {
    return IoHelper::readFileRange(path, part.offset, part.size, bytes);
}

} // namespace FSC
