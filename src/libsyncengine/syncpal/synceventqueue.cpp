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

#include "synceventqueue.h"

namespace FSC {

bool SyncEventQueue::push(const SyncEvent &event) {
    {
        const std::scoped_lock lock(_mutex);
        if (_closed) return false;

        switch (event.type) {
            case SyncEventType::SyncRoundDue:
                if (_roundDue) return false;
                _roundDue = true;
                break;
            case SyncEventType::FileChanged:
                if (!_pendingFilePaths.insert(event.itemPath).second) return false;
                _localEvents.push_back(event);
                break;
            case SyncEventType::FolderCreated:
                if (!_pendingFolderPaths.insert(event.itemPath).second) return false;
                _localEvents.push_back(event);
                break;
        }
    }

    if (event.type == SyncEventType::SyncRoundDue) {
        _roundCv.notify_one();
    } else {
        _localCv.notify_one();
    }
    return true;
}

bool SyncEventQueue::popLocalEvent(SyncEvent &event, const std::chrono::milliseconds timeout) {
    std::unique_lock lock(_mutex);
    if (!_localCv.wait_for(lock, timeout, [this] { return _closed || !_localEvents.empty(); })) {
        return false;
    }
    if (_closed) return false;

    event = std::move(_localEvents.front());
    _localEvents.pop_front();
    if (event.type == SyncEventType::FileChanged) {
        _pendingFilePaths.erase(event.itemPath);
    } else {
        _pendingFolderPaths.erase(event.itemPath);
    }
    return true;
}

bool SyncEventQueue::popRoundDue(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(_mutex);
    if (!_roundCv.wait_for(lock, timeout, [this] { return _closed || _roundDue; })) {
        return false;
    }
    if (_closed) return false;

    _roundDue = false;
    return true;
}

size_t SyncEventQueue::localEventCount() const {
    const std::scoped_lock lock(_mutex);
    return _localEvents.size();
}

bool SyncEventQueue::isRoundDue() const {
    const std::scoped_lock lock(_mutex);
    return _roundDue;
}

void SyncEventQueue::close() {
    {
        const std::scoped_lock lock(_mutex);
        _closed = true;
    }
    _localCv.notify_all();
    _roundCv.notify_all();
}

} // namespace FSC
