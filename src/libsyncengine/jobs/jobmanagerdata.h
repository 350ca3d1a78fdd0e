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

#include "abstractjob.h"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace FSC {

/**
 * @brief Thread safe bookkeeping of the JobManager: the FIFO of jobs waiting for a thread and the jobs running.
 * A job is "managed" from queue() until erase().
 */
class JobManagerData {
    public:
        void queue(std::shared_ptr<AbstractJob> job);
        //! Put back a job that could not be started, ahead of the others.
        void requeue(std::shared_ptr<AbstractJob> job);
        std::shared_ptr<AbstractJob> pop();
        bool hasQueuedJob() const;

        bool isManaged(UniqueId jobId) const;
        bool addToRunningJobs(UniqueId jobId);
        void erase(UniqueId jobId);
        //! Block until the job is no longer managed.
        void waitUntilErased(UniqueId jobId) const;

        std::unordered_set<UniqueId> runningJobs() const;
        std::shared_ptr<AbstractJob> getJob(UniqueId jobId) const;

        void clear();

    private:
        std::unordered_map<UniqueId, std::shared_ptr<AbstractJob>> _managedJobs;
        std::deque<std::shared_ptr<AbstractJob>> _queuedJobs;
        std::unordered_set<UniqueId> _runningJobs;
        mutable std::mutex _mutex;
        mutable std::condition_variable _erased;
};

} // namespace FSC
