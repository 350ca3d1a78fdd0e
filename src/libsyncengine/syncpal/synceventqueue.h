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

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>

namespace FSC {

struct SyncEvent {
        SyncEventType type = SyncEventType::FileChanged;
        std::string itemPath; // Empty for SyncRoundDue
};

/**
 * The channels between the folder watcher and the workers.
 *
 * The local channel carries "file changed" and "folder created" events in arrival order. An event for a path that is
 * still pending is merged into it. The round channel holds at most one pending "sync round due" event.
 */
class SyncEventQueue {
    public:
        SyncEventQueue() = default;
        SyncEventQueue(SyncEventQueue const &) = delete;
        void operator=(SyncEventQueue const &) = delete;

        // Return false if the event was merged into a pending one or if the queue is closed
        bool push(const SyncEvent &event);

        // Wait for an event of the local channel. Return false on timeout or if the queue is closed.
        bool popLocalEvent(SyncEvent &event, std::chrono::milliseconds timeout);

        // Wait for a "sync round due" event. Return false on timeout or if the queue is closed.
        bool popRoundDue(std::chrono::milliseconds timeout);

        size_t localEventCount() const;
        bool isRoundDue() const;

        // Wake up every waiting consumer, the queue accepts no more events
        void close();
        inline bool isClosed() const { return _closed; }

    private:
        mutable std::mutex _mutex;
        std::condition_variable _localCv;
        std::condition_variable _roundCv;
        std::deque<SyncEvent> _localEvents;
        std::unordered_set<std::string> _pendingFilePaths;
        std::unordered_set<std::string> _pendingFolderPaths;
        bool _roundDue = false;
        std::atomic_bool _closed{false};
};

} // namespace FSC
