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

#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace FSC {

/**
 * Per-path single flight: at most one upload or reconciliation touches a given file path at a time.
 * A lock is owned by a thread and may be taken again by the same thread.
 */
class PathLockManager {
    public:
        class PathLock {
            public:
                PathLock() = default;
                ~PathLock();
                PathLock(PathLock &&other) noexcept;
                PathLock &operator=(PathLock &&other) noexcept;
                PathLock(const PathLock &) = delete;
                PathLock &operator=(const PathLock &) = delete;

                void unlock();
                inline bool ownsLock() const { return _manager != nullptr; }

            private:
                friend class PathLockManager;
                PathLock(PathLockManager *manager, std::vector<std::string> &&paths);

                PathLockManager *_manager = nullptr;
                std::vector<std::string> _paths;
        };

        PathLockManager() = default;
        PathLockManager(PathLockManager const &) = delete;
        void operator=(PathLockManager const &) = delete;

        // Block until the path is free
        [[nodiscard]] PathLock lock(const std::string &path);

        // Lock two paths (move), always in lexicographic order
        [[nodiscard]] PathLock lock(const std::string &path1, const std::string &path2);

        bool isLocked(const std::string &path) const;

    private:
        struct Owner {
                std::thread::id threadId;
                int count = 0;
        };

        void acquire(const std::string &path);
        void release(const std::string &path);

        mutable std::mutex _mutex;
        std::condition_variable _cv;
        std::unordered_map<std::string, Owner> _lockedPaths;
};

} // namespace FSC
