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
#include "folderwatcher.h"
#include "folderwatcher_linux.h"
#include "libcommon/utility/utility.h"
#include "libcommonserver/io/iohelper.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/utility.h"
#include "reconstruction/filereconstructor.h"
#include "requests/parameterscache.h"

#include <log4cplus/loggingmacros.h>

namespace FSC {

std::unique_ptr<FolderWatcher> FolderWatcher::create(SyncEventQueue &eventQueue, const SyncPath &rootFolder) {
    return std::make_unique<FolderWatcher_linux>(eventQueue, rootFolder);
}

FolderWatcher::FolderWatcher(SyncEventQueue &eventQueue, const SyncPath &rootFolder) :
    _logger(Log::instance()->getLogger()),
    _rootFolder(rootFolder),
    _eventQueue(eventQueue) {}

void FolderWatcher::start() {
    LOG_DEBUG(_logger, "Watching " << Utility::formatSyncPath(_rootFolder));
    _stop = false;
    _ready = false;
    _exitInfo = ExitCode::Ok;

    _thread = std::make_unique<std::thread>([this] {
        watch();
        log4cplus::threadCleanup();
    });
}

void FolderWatcher::stop() {
    _stop = true;
    if (_thread && _thread->joinable()) _thread->join();
    _thread.reset();

    releaseResources();
    _ready = false;
    LOG_DEBUG(_logger, "Stopped watching " << Utility::formatSyncPath(_rootFolder));
}

bool FolderWatcher::isIgnored(const SyncPath &path) {
    const std::string name = path.filename().string();
    return CommonUtility::startsWith(name, FileReconstructor::tmpFilePrefix) &&
           CommonUtility::endsWith(name, FileReconstructor::tmpFileSuffix);
}

void FolderWatcher::changeDetected(const SyncPath &path, const SyncEventType type) {
    if (isIgnored(path)) return;

    const std::string itemPath = Utility::toItemPath(_rootFolder, path);
    if (ParametersCache::isExtendedLogEnabled()) {
        LOG_DEBUG(_logger, type << " on " << itemPath);
    }
    (void) _eventQueue.push({type, itemPath});
}

ExitInfo FolderWatcher::scanExistingItems() {
    int fileCount = 0;
    int folderCount = 0;
    if (const ExitInfo exitInfo = reportTree(_rootFolder, fileCount, folderCount); !exitInfo) {
        return exitInfo;
    }

    LOG_INFO(_logger, "Initial scan of " << Utility::formatSyncPath(_rootFolder) << " : " << fileCount << " files, "
                                         << folderCount << " folders");
    return ExitCode::Ok;
}

ExitInfo FolderWatcher::reportTree(const SyncPath &dir, int &fileCount, int &folderCount) {
    IoHelper::DirectoryIterator dirIt;
    IoError ioError = IoError::Success;
    if (!IoHelper::getDirectoryIterator(dir, true, ioError, dirIt)) {
        LOG_WARN(_logger, "Unable to list " << Utility::formatIoError(dir, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }

    DirectoryEntry entry;
    bool endOfDir = false;
    while (dirIt.next(entry, endOfDir, ioError) && !endOfDir) {
        if (entry.is_symlink()) continue;

        if (entry.is_directory()) {
            changeDetected(entry.path(), SyncEventType::FolderCreated);
            ++folderCount;
        } else if (entry.is_regular_file() && !isIgnored(entry.path())) {
            changeDetected(entry.path(), SyncEventType::FileChanged);
            ++fileCount;
        }
    }

    if (ioError != IoError::Success) {
        LOG_WARN(_logger, "Listing interrupted: " << Utility::formatIoError(dir, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }
    return ExitCode::Ok;
}

} // namespace FSC
