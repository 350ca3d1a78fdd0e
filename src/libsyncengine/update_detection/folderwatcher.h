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
#include "syncpal/synceventqueue.h"

#include <log4cplus/logger.h>

#include <atomic>
#include <memory>
#include <thread>

namespace FSC {

/**
 * Watch the sync directory recursively and feed the local channel of the event queue.
 * Files are reported once written or moved in, directories when created or moved in.
 * Removals are not reported.
 */
class FolderWatcher {
    public:
        static std::unique_ptr<FolderWatcher> create(SyncEventQueue &eventQueue, const SyncPath &rootFolder);

        virtual ~FolderWatcher() = default;

        void start();
        void stop();
        bool isReady() const { return _ready; }
        //! Ok unless the watching thread gave up.
        ExitInfo exitInfo() const { return _exitInfo; }

        //! Queue an event for every folder and file already present below the root.
        ExitInfo scanExistingItems();

        //! Temporary files of the file reconstructor.
        static bool isIgnored(const SyncPath &path);

    protected:
        FolderWatcher(SyncEventQueue &eventQueue, const SyncPath &rootFolder);

        //! Runs on the watcher thread until _stop is set.
        virtual void watch() = 0;
        //! Called once the watcher thread has returned.
        virtual void releaseResources() = 0;

        void changeDetected(const SyncPath &path, SyncEventType type);
        //! Report every item below `dir`, parents first.
        ExitInfo reportTree(const SyncPath &dir, int &fileCount, int &folderCount);
        void setExitInfo(const ExitInfo &exitInfo) { _exitInfo = exitInfo; }

        log4cplus::Logger _logger;
        const SyncPath _rootFolder;
        std::atomic_bool _stop{false};
        std::atomic_bool _ready{false};

    private:
        SyncEventQueue &_eventQueue;
        std::unique_ptr<std::thread> _thread;
        ExitInfo _exitInfo = ExitCode::Ok;
};

} // namespace FSC
