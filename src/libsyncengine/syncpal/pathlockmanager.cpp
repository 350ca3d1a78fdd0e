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

#include "pathlockmanager.h"

#include <algorithm>

namespace FSC {

PathLockManager::PathLock::PathLock(PathLockManager *manager, std::vector<std::string> &&paths) :
    _manager(manager),
    _paths(std::move(paths)) {}

PathLockManager::PathLock::~PathLock() {
    unlock();
}

PathLockManager::PathLock::PathLock(PathLock &&other) noexcept :
    _manager(other._manager),
    _paths(std::move(other._paths)) {
    other._manager = nullptr;
    other._paths.clear();
}

PathLockManager::PathLock &PathLockManager::PathLock::operator=(PathLock &&other) noexcept {
    if (this != &other) {
        unlock();
        _manager = other._manager;
        _paths = std::move(other._paths);
        other._manager = nullptr;
        other._paths.clear();
    }
    return *this;
}

void PathLockManager::PathLock::unlock() {
    if (!_manager) return;

    // Release in reverse acquisition order
    for (auto it = _paths.rbegin(); it != _paths.rend(); ++it) {
        _manager->release(*it);
    }
    _paths.clear();
    _manager = nullptr;
}

PathLockManager::PathLock PathLockManager::lock(const std::string &path) {
    acquire(path);
    return PathLock(this, {path});
}

PathLockManager::PathLock PathLockManager::lock(const std::string &path1, const std::string &path2) {
    if (path1 == path2) {
        return lock(path1);
    }

    std::vector<std::string> paths = {std::min(path1, path2), std::max(path1, path2)};
    acquire(paths[0]);
    acquire(paths[1]);
    return PathLock(this, std::move(paths));
}

bool PathLockManager::isLocked(const std::string &path) const {
    const std::scoped_lock lock(_mutex);
    return _lockedPaths.contains(path);
}

void PathLockManager::acquire(const std::string &path) {
    std::unique_lock lock(_mutex);
    const auto threadId = std::this_thread::get_id();
    _cv.wait(lock, [this, &path, &threadId]() {
        const auto it = _lockedPaths.find(path);
        return it == _lockedPaths.end() || it->second.threadId == threadId;
    });

    auto &owner = _lockedPaths[path];
    owner.threadId = threadId;
    owner.count++;
}

void PathLockManager::release(const std::string &path) {
    {
        const std::scoped_lock lock(_mutex);
        const auto it = _lockedPaths.find(path);
        if (it == _lockedPaths.end()) return;

        if (--it->second.count > 0) return;
        _lockedPaths.erase(it);
    }
    _cv.notify_all();
}

} // namespace FSC
