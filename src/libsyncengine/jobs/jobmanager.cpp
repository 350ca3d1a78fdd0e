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
#include "jobmanager.h"
#include "libcommonserver/log/log.h"

#include <Poco/Exception.h>

#include <algorithm>
#include <chrono>
#include <functional>

namespace FSC {

namespace {
constexpr int threadPoolMinCapacity = 2;
constexpr int threadPoolMaxCapacity = 16;
// A finished job calls back before its pool thread is idle again
constexpr std::chrono::milliseconds dispatchRecheckDelay{20};
} // namespace

JobManager::JobManager(const int nbThread) :
    _threadPool(threadPoolMinCapacity, threadPoolMaxCapacity),
    _logger(Log::instance()->getLogger()) {
    setPoolCapacity(nbThread);
}

JobManager::~JobManager() {
    clear();
}

void JobManager::stop() {
    _stop = true;
    wakeUp();
}

void JobManager::clear() {
    stop();
    if (_dispatcher) {
        if (_dispatcher->joinable()) _dispatcher->join();
        _dispatcher.reset();
    }
    _threadPool.joinAll();

    _data.clear();
    _stop = false;
}

void JobManager::queueAsyncJob(std::shared_ptr<AbstractJob> job) noexcept {
    job->setMainCallback(std::bind_front(&JobManager::onJobDone, this));
    _data.queue(std::move(job));
    startDispatcherIfNeeded();
    wakeUp();
}

bool JobManager::isJobFinished(const UniqueId jobId) const {
    return !_data.isManaged(jobId);
}

std::shared_ptr<AbstractJob> JobManager::getJob(const UniqueId jobId) const {
    return _data.getJob(jobId);
}

void JobManager::waitForJobs(const std::vector<std::shared_ptr<AbstractJob>> &jobs) const {
    for (const auto &job: jobs) {
        _data.waitUntilErased(job->jobId());
    }
}

void JobManager::setPoolCapacity(const int nbThread) {
    // Poco::ThreadPool refuses a capacity below its minimum
    _maxNbThread = std::clamp(nbThread, threadPoolMinCapacity, threadPoolMaxCapacity);
    _threadPool.addCapacity(_maxNbThread - _threadPool.capacity());
    LOG_DEBUG(_logger, "Job pool capacity set to " << _maxNbThread);
}

void JobManager::startDispatcherIfNeeded() {
    const std::scoped_lock lock(_wakeUpMutex);
    if (!_dispatcher) {
        _dispatcher = std::make_unique<std::thread>(&JobManager::run, this);
    }
}

void JobManager::wakeUp() {
    {
        const std::scoped_lock lock(_wakeUpMutex);
        _wakeUpPending = true;
    }
    _wakeUpCondition.notify_one();
}

void JobManager::run() noexcept {
    std::unique_lock lock(_wakeUpMutex);
    while (!_stop) {
        // Without a wake-up, the queue is retried once the delay is over
        (void) _wakeUpCondition.wait_for(lock, dispatchRecheckDelay, [this] { return _stop || _wakeUpPending; });
        _wakeUpPending = false;
        lock.unlock();

        while (!_stop) {
            const auto job = _data.pop();
            if (!job) break;
            if (!startJob(job)) {
                _data.requeue(job);
                break;
            }
        }

        lock.lock();
    }
}

bool JobManager::startJob(const std::shared_ptr<AbstractJob> &job) {
    if (job->isAborted()) {
        LOG_DEBUG(_logger, "Job " << job->jobId() << " aborted before it started");
        _data.erase(job->jobId());
        return true;
    }

    try {
        (void) _data.addToRunningJobs(job->jobId());
        _threadPool.start(*job);
        if (job->isExtendedLog()) LOG_DEBUG(_logger, "Job " << job->jobId() << " started");
        return true;
    } catch (const Poco::NoThreadAvailableException &) {
        return false;
    } catch (const Poco::Exception &e) {
        LOG_WARN(_logger, "Unable to start job " << job->jobId() << ": " << e.displayText());
        _data.erase(job->jobId());
        return true;
    }
}

void JobManager::onJobDone(const UniqueId jobId) {
    _data.erase(jobId);
    wakeUp();
}

} // namespace FSC
