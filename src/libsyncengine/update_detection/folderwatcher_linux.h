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

#include "folderwatcher.h"

#include <map>
#include <unordered_map>

namespace FSC {

//! inotify backend. inotify is not recursive: one watch is kept per directory of the tree.
class FolderWatcher_linux : public FolderWatcher {
    public:
        FolderWatcher_linux(SyncEventQueue &eventQueue, const SyncPath &rootFolder);
        ~FolderWatcher_linux() override;

    protected:
        void watch() override;
        void releaseResources() override;

    private:
        //! False when the watch should stop.
        bool handleEvent(int wd, uint32_t mask, const char *name);
        ExitInfo watchTree(const SyncPath &dir);
        ExitInfo addWatch(const SyncPath &dir);
        void removeWatchesBelow(const SyncPath &dir);
        void closeDescriptor();

        int _inotifyFd = -1;
        std::unordered_map<int, SyncPath> _watchToPath;
        std::map<SyncPath, int> _pathToWatch;
};

} // namespace FSC
