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

#include "jobmanagerdata.h"

#include <log4cplus/logger.h>

#include <Poco/ThreadPool.h>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace FSC {

/**
 * Runs chunk transfer jobs on a Poco thread pool, in the order they were queued.
 * A dispatcher thread, started with the first job, hands queued jobs to free pool threads.
 */
class JobManager {
    public:
        //! `nbThread` is clamped to [2, 16].
        explicit JobManager(int nbThread);
        ~JobManager();
        JobManager(const JobManager &) = delete;
        JobManager &operator=(const JobManager &) = delete;

        void stop();
        //! Stop dispatching, wait for the running jobs and forget the queued ones.
        void clear();

        void queueAsyncJob(std::shared_ptr<AbstractJob> job) noexcept;

        bool isJobFinished(UniqueId jobId) const;
        std::shared_ptr<AbstractJob> getJob(UniqueId jobId) const;

        //! Block until every given job has finished. The jobs must have been queued.
        void waitForJobs(const std::vector<std::shared_ptr<AbstractJob>> &jobs) const;

        void setPoolCapacity(int nbThread);
        int poolCapacity() const { return _maxNbThread; }

    private:
        void startDispatcherIfNeeded();
        void run() noexcept;
        //! False when no pool thread was free.
        bool startJob(const std::shared_ptr<AbstractJob> &job);
        void onJobDone(UniqueId jobId);
        void wakeUp();

        JobManagerData _data;
        std::atomic_bool _stop{false};
        int _maxNbThread{0};
        Poco::ThreadPool _threadPool;

        std::mutex _wakeUpMutex;
        std::condition_variable _wakeUpCondition;
        bool _wakeUpPending{false};
        std::unique_ptr<std::thread> _dispatcher;

        log4cplus::Logger _logger;

        friend class TestJobManager;
};

} // namespace FSC
