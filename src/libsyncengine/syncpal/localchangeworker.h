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

#include "isyncworker.h"
#include "synceventqueue.h"
#include "upload/uploadcoordinator.h"

#include <map>

namespace FSC {

/**
 * Drain the local channel of the event queue: upload the changed files and register the created folders.
 * A file whose upload failed on a transient error or was refused by the server is queued again after a growing delay,
 * capped at the sync interval.
 */
class LocalChangeWorker : public ISyncWorker {
    public:
        LocalChangeWorker(SyncEventQueue &eventQueue, UploadCoordinator &uploadCoordinator, const std::string &name);

        ExitInfo processEvent(const SyncEvent &event);

        // Handle every pending local event in the calling thread
        void processPendingEvents();

        inline size_t deferredCount() const { return _deferredPaths.size(); }

    protected:
        ExitCode execute() override;

    private:
        struct DeferredUpload {
                std::chrono::steady_clock::time_point dueTime;
                int attempts = 0;
        };

        static bool isWorthRetrying(const ExitInfo &exitInfo);
        void deferUpload(const std::string &itemPath);
        void requeueDueUploads();

        SyncEventQueue &_eventQueue;
        UploadCoordinator &_uploadCoordinator;
        std::map<std::string, DeferredUpload> _deferredPaths;

        friend class TestLocalChangeWorker;
};

} // namespace FSC
