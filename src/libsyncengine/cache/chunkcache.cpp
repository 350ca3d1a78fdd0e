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

#include "chunkcache.h"
#include "fingerprint/fingerprint.h"
#include "libcommon/utility/utility.h"
#include "libcommonserver/io/iohelper.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/utility.h"

#include <vector>

namespace FSC {

ChunkCache::ChunkCache(const SyncPath &cacheDir) :
    _logger(Log::instance()->getLogger()),
    _cacheDir(cacheDir) {}

ExitInfo ChunkCache::init() {
    const std::scoped_lock lock(_mutex);

    IoError ioError = IoError::Success;
    if (!IoHelper::createDirectory(_cacheDir, true, ioError) && ioError != IoError::FileExists) {
        LOG_WARN(_logger, "Unable to create cache directory " << Utility::formatIoError(_cacheDir, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }

    return ExitCode::Ok;
}

SyncPath ChunkCache::entryPath(const std::string &fingerprint) const {
    return _cacheDir / fingerprint.substr(0, 2) / fingerprint;
}

ExitInfo ChunkCache::put(const std::string &fingerprint, const std::string &bytes) {
    if (!Fingerprint::isValid(fingerprint)) {
        LOG_WARN(_logger, "Invalid fingerprint " << fingerprint);
        return {ExitCode::LogicError, ExitCause::InvalidArgument};
    }

    const std::scoped_lock lock(_mutex);

    const SyncPath path = entryPath(fingerprint);
    IoError ioError = IoError::Success;
    if (!IoHelper::createDirectory(path.parent_path(), true, ioError) && ioError != IoError::FileExists) {
        LOG_WARN(_logger, "Unable to create cache directory " << Utility::formatIoError(path.parent_path(), ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }

    // Write aside then rename, a reader never sees a partial payload
    const SyncPath tmpPath = path.parent_path() / (fingerprint + "." + CommonUtility::generateRandomStringAlphaNum() + ".tmp");
    if (!IoHelper::writeFile(tmpPath, bytes, ioError)) {
        LOG_WARN(_logger, "Unable to write cache entry " << Utility::formatIoError(tmpPath, ioError));
        (void) IoHelper::deleteItem(tmpPath, ioError);
        return IoHelper::ioError2ExitInfo(ioError);
    }

    if (!IoHelper::renameItem(tmpPath, path, ioError)) {
        LOG_WARN(_logger, "Unable to move cache entry " << Utility::formatIoError(path, ioError));
        IoError deleteError = IoError::Success;
        (void) IoHelper::deleteItem(tmpPath, deleteError);
        return IoHelper::ioError2ExitInfo(ioError);
    }

    return ExitCode::Ok;
}

ExitInfo ChunkCache::get(const std::string &fingerprint, std::string &bytes, bool &found) {
    bytes.clear();
    found = false;
    if (!Fingerprint::isValid(fingerprint)) {
        return ExitCode::Ok;
    }

    const std::scoped_lock lock(_mutex);

    const SyncPath path = entryPath(fingerprint);
    bool exists = false;
    IoError ioError = IoError::Success;
    if (!IoHelper::checkIfPathExists(path, exists, ioError)) {
        LOG_WARN(_logger, "Error in IoHelper::checkIfPathExists: " << Utility::formatIoError(path, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }
    if (!exists) {
        return ExitCode::Ok;
    }

    uint64_t size = 0;
    if (!IoHelper::getFileSize(path, size, ioError)) {
        LOG_WARN(_logger, "Error in IoHelper::getFileSize: " << Utility::formatIoError(path, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }

    if (const ExitInfo exitInfo = IoHelper::readFileRange(path, 0, size, bytes); !exitInfo) {
        LOG_WARN(_logger, "Unable to read cache entry " << Utility::formatSyncPath(path) << " : " << exitInfo);
        return exitInfo;
    }

    if (Fingerprint::compute(bytes) != fingerprint) {
        LOG_WARN(_logger, "Corrupted cache entry " << fingerprint << ", removing it");
        bytes.clear();
        (void) IoHelper::deleteItem(path, ioError);
        return ExitCode::Ok;
    }

    found = true;
    return ExitCode::Ok;
}

bool ChunkCache::contains(const std::string &fingerprint) {
    if (!Fingerprint::isValid(fingerprint)) {
        return false;
    }

    const std::scoped_lock lock(_mutex);

    bool exists = false;
    IoError ioError = IoError::Success;
    return IoHelper::checkIfPathExists(entryPath(fingerprint), exists, ioError) && exists;
}

void ChunkCache::remove(const std::string &fingerprint) {
    if (!Fingerprint::isValid(fingerprint)) {
        return;
    }

    const std::scoped_lock lock(_mutex);

    IoError ioError = IoError::Success;
    if (!IoHelper::deleteItem(entryPath(fingerprint), ioError)) {
        LOG_DEBUG(_logger, "Unable to remove cache entry " << fingerprint << " : " << Utility::formatIoError(ioError));
    }
}

ExitInfo ChunkCache::clear() {
    const std::scoped_lock lock(_mutex);

    IoError ioError = IoError::Success;
    IoHelper::DirectoryIterator dirIt;
    if (!IoHelper::getDirectoryIterator(_cacheDir, false, ioError, dirIt)) {
        if (ioError == IoError::NoSuchFileOrDirectory) {
            return ExitCode::Ok;
        }
        LOG_WARN(_logger, "Unable to list cache directory " << Utility::formatIoError(_cacheDir, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }

    std::vector<SyncPath> entries;
    DirectoryEntry entry;
    bool endOfDirectory = false;
    while (dirIt.next(entry, endOfDirectory, ioError) && !endOfDirectory) {
        entries.push_back(entry.path());
    }
    if (ioError != IoError::Success) {
        LOG_WARN(_logger, "Error while listing cache directory " << Utility::formatIoError(_cacheDir, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }

    ExitInfo exitInfo = ExitCode::Ok;
    for (const auto &path: entries) {
        if (!IoHelper::deleteItem(path, ioError)) {
            LOG_WARN(_logger, "Unable to remove " << Utility::formatIoError(path, ioError));
            exitInfo = IoHelper::ioError2ExitInfo(ioError);
        }
    }

    return exitInfo;
}

} // namespace FSC
