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
#include "folderwatcher_linux.h"
#include "libcommon/log/sentry/handler.h"
#include "libcommon/utility/utility.h"
#include "libcommonserver/io/iohelper.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/utility.h"

#include <log4cplus/loggingmacros.h>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace FSC {

namespace {
constexpr int pollTimeoutMs = 100;
constexpr uint32_t watchMask = IN_CLOSE_WRITE | IN_MOVE | IN_CREATE | IN_DELETE | IN_DELETE_SELF | IN_MOVE_SELF |
                               IN_ONLYDIR | IN_DONT_FOLLOW;
} // namespace

FolderWatcher_linux::FolderWatcher_linux(SyncEventQueue &eventQueue, const SyncPath &rootFolder) :
    FolderWatcher(eventQueue, rootFolder) {}

FolderWatcher_linux::~FolderWatcher_linux() {
    closeDescriptor();
}

void FolderWatcher_linux::watch() {
    _inotifyFd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (_inotifyFd == -1) {
        LOG_WARN(_logger, "inotify_init1 failed: " << strerror(errno));
        setExitInfo({ExitCode::SystemError, ExitCause::Unknown});
        return;
    }

    if (const ExitInfo exitInfo = watchTree(_rootFolder); !exitInfo) {
        setExitInfo(exitInfo);
        return;
    }
    _ready = true;

    alignas(inotify_event) char buffer[64 * 1024];
    pollfd pfd{_inotifyFd, POLLIN, 0};
    while (!_stop) {
        const int nfds = poll(&pfd, 1, pollTimeoutMs);
        if (nfds == 0 || (nfds == -1 && errno == EINTR)) continue;
        if (nfds == -1) {
            LOG_WARN(_logger, "poll failed: " << strerror(errno));
            setExitInfo({ExitCode::SystemError, ExitCause::Unknown});
            break;
        }

        const ssize_t len = read(_inotifyFd, buffer, sizeof(buffer));
        if (len == -1) {
            if (errno != EAGAIN && errno != EINTR) LOG_WARN(_logger, "read on inotify descriptor failed: " << strerror(errno));
            continue;
        }

        for (ssize_t offset = 0; offset < len && !_stop;) {
            const auto *event = reinterpret_cast<const inotify_event *>(buffer + offset);
            offset += static_cast<ssize_t>(sizeof(inotify_event) + event->len);

            if (event->mask & IN_Q_OVERFLOW) {
                LOG_WARN(_logger, "inotify queue overflow, rescanning");
                int fileCount = 0;
                int folderCount = 0;
                (void) reportTree(_rootFolder, fileCount, folderCount);
                continue;
            }
            if (!handleEvent(event->wd, event->mask, event->len ? event->name : "")) {
                _ready = false;
                return;
            }
        }
    }
}

bool FolderWatcher_linux::handleEvent(const int wd, const uint32_t mask, const char *name) {
    const auto it = _watchToPath.find(wd);
    if (it == _watchToPath.end()) return true;

    const SyncPath path = *name ? it->second / name : it->second;
    if (isIgnored(path)) return true;

    const bool isDir = mask & IN_ISDIR;
    if (mask & (IN_MOVED_FROM | IN_DELETE)) {
        if (isDir) removeWatchesBelow(path);
        return true;
    }

    if (isDir && (mask & (IN_CREATE | IN_MOVED_TO))) {
        changeDetected(path, SyncEventType::FolderCreated);
        if (const ExitInfo exitInfo = watchTree(path); !exitInfo) {
            setExitInfo(exitInfo);
            return false;
        }
        // Items written before the new watches existed
        int fileCount = 0;
        int folderCount = 0;
        (void) reportTree(path, fileCount, folderCount);
    } else if (!isDir && (mask & (IN_CLOSE_WRITE | IN_MOVED_TO))) {
        changeDetected(path, SyncEventType::FileChanged);
    }
    return true;
}

ExitInfo FolderWatcher_linux::watchTree(const SyncPath &dir) {
    if (const ExitInfo exitInfo = addWatch(dir); !exitInfo) return exitInfo;

    IoHelper::DirectoryIterator dirIt;
    IoError ioError = IoError::Success;
    if (!IoHelper::getDirectoryIterator(dir, true, ioError, dirIt)) {
        // Gone in the meantime
        if (ioError == IoError::NoSuchFileOrDirectory) return ExitCode::Ok;
        LOG_WARN(_logger, "Unable to list " << Utility::formatIoError(dir, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }

    DirectoryEntry entry;
    bool endOfDir = false;
    while (dirIt.next(entry, endOfDir, ioError) && !endOfDir) {
        if (!entry.is_directory() || entry.is_symlink()) continue;
        if (const ExitInfo exitInfo = addWatch(entry.path()); !exitInfo) return exitInfo;
    }
    return ExitCode::Ok;
}

ExitInfo FolderWatcher_linux::addWatch(const SyncPath &dir) {
    if (_pathToWatch.contains(dir)) return ExitCode::Ok;

    const int wd = inotify_add_watch(_inotifyFd, dir.c_str(), watchMask);
    if (wd == -1) {
        switch (errno) {
            case ENOENT:
            case ENOTDIR:
                return ExitCode::Ok;
            case ENOMEM:
                LOG_ERROR(_logger, "inotify_add_watch: out of memory");
                return {ExitCode::SystemError, ExitCause::NotEnoughMemory};
            case ENOSPC:
                LOG_ERROR(_logger, "inotify watch limit reached, see fs.inotify.max_user_watches");
                return {ExitCode::SystemError, ExitCause::NotEnoughINotifyWatches};
            default:
                LOG_WARN(_logger, "inotify_add_watch failed on " << Utility::formatSyncPath(dir) << " : " << strerror(errno)
                                                                 << ", folder not watched");
                return ExitCode::Ok;
        }
    }

    _watchToPath.insert_or_assign(wd, dir);
    _pathToWatch.insert_or_assign(dir, wd);
    return ExitCode::Ok;
}

void FolderWatcher_linux::removeWatchesBelow(const SyncPath &dir) {
    // std::map keeps a folder and its descendants contiguous, starting at the folder itself
    const std::string prefix = dir.string() + "/";
    auto it = _pathToWatch.lower_bound(dir);
    while (it != _pathToWatch.end() && (it->first == dir || CommonUtility::startsWith(it->first.string(), prefix))) {
        const int wd = it->second;
        // EINVAL: the kernel already dropped the watch of a deleted folder
        if (inotify_rm_watch(_inotifyFd, wd) == -1 && errno != EINVAL) {
            LOG_ERROR(_logger, "inotify_rm_watch failed: " << strerror(errno));
            sentry::Handler::captureMessage(sentry::Level::Error, "FolderWatcher_linux::removeWatchesBelow",
                                            "inotify_rm_watch failed, errno=" + std::to_string(errno));
        }
        (void) _watchToPath.erase(wd);
        it = _pathToWatch.erase(it);
    }
}

void FolderWatcher_linux::releaseResources() {
    closeDescriptor();
    _watchToPath.clear();
    _pathToWatch.clear();
}

void FolderWatcher_linux::closeDescriptor() {
    if (_inotifyFd == -1) return;
    (void) close(_inotifyFd);
    _inotifyFd = -1;
}

} // namespace FSC
