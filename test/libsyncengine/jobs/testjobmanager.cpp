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

#include "testjobmanager.h"
#include "jobs/jobmanager.h"
#include "libcommonserver/utility/utility.h"

#include <chrono>

namespace FSC {

TestJobManager::SleepJob::SleepJob(const unsigned int durationMs, const ExitInfo result, std::atomic_int *concurrentJobs,
                                   std::atomic_int *maxConcurrentJobs) :
    _durationMs(durationMs),
    _result(result),
    _concurrentJobs(concurrentJobs),
    _maxConcurrentJobs(maxConcurrentJobs) {}

ExitInfo TestJobManager::SleepJob::runJob() noexcept {
    if (_concurrentJobs) {
        const int current = ++(*_concurrentJobs);
        int max = _maxConcurrentJobs->load();
        while (current > max && !_maxConcurrentJobs->compare_exchange_weak(max, current)) {
        }
    }

    Utility::msleep(_durationMs);

    if (_concurrentJobs) {
        --(*_concurrentJobs);
    }
    return _result;
}

void TestJobManager::setUp() {
    start();
    _jobManager = std::make_unique<JobManager>(4);
    _finishedJobs.clear();
}

void TestJobManager::tearDown() {
    _jobManager->stop();
    _jobManager->clear();
    _jobManager.reset();
    stop();
}

void TestJobManager::callback(const UniqueId jobId) {
    const std::scoped_lock lock(_mutex);
    (void) _finishedJobs.insert(jobId);
}

void TestJobManager::testRunSynchronously() {
    SleepJob okJob(0, ExitCode::Ok);
    CPPUNIT_ASSERT(okJob.runSynchronously());
    CPPUNIT_ASSERT(okJob.exitInfo());
    CPPUNIT_ASSERT(!okJob.isRunning());

    SleepJob failingJob(0, {ExitCode::NetworkError, ExitCause::NetworkTimeout});
    const ExitInfo exitInfo = failingJob.runSynchronously();
    CPPUNIT_ASSERT(exitInfo == ExitInfo(ExitCode::NetworkError, ExitCause::NetworkTimeout));

    // Every job gets its own identifier
    CPPUNIT_ASSERT(okJob.jobId() != failingJob.jobId());
}

void TestJobManager::testAbortBeforeStart() {
    SleepJob job(0, ExitCode::Ok);
    job.abort();
    CPPUNIT_ASSERT(job.isAborted());
    CPPUNIT_ASSERT(job.runSynchronously() == ExitInfo(ExitCode::OperationCanceled, ExitCause::OperationCanceled));
}

void TestJobManager::testWithoutCallback() {
    std::vector<std::shared_ptr<AbstractJob>> jobs;
    for (int i = 0; i < 20; i++) {
        const ExitInfo result = i % 2 ? ExitInfo(ExitCode::Ok) : ExitInfo(ExitCode::DataError, ExitCause::IntegrityCheckFailed);
        jobs.push_back(std::make_shared<SleepJob>(5, result));
        _jobManager->queueAsyncJob(jobs.back());
    }

    _jobManager->waitForJobs(jobs);

    for (size_t i = 0; i < jobs.size(); i++) {
        CPPUNIT_ASSERT(_jobManager->isJobFinished(jobs[i]->jobId()));
        CPPUNIT_ASSERT(!_jobManager->getJob(jobs[i]->jobId()));
        CPPUNIT_ASSERT_EQUAL(i % 2 == 1, static_cast<bool>(jobs[i]->exitInfo()));
    }
    CPPUNIT_ASSERT(!_jobManager->_data.hasQueuedJob());
    CPPUNIT_ASSERT(_jobManager->_data.runningJobs().empty());
}

void TestJobManager::testWithCallback() {
    std::vector<std::shared_ptr<AbstractJob>> jobs;
    for (int i = 0; i < 10; i++) {
        auto job = std::make_shared<SleepJob>(5, ExitCode::Ok);
        job->setAdditionalCallback(std::bind_front(&TestJobManager::callback, this));
        jobs.push_back(job);
        _jobManager->queueAsyncJob(job);
    }

    _jobManager->waitForJobs(jobs);

    const std::scoped_lock lock(_mutex);
    CPPUNIT_ASSERT_EQUAL(jobs.size(), _finishedJobs.size());
    for (const auto &job: jobs) {
        CPPUNIT_ASSERT(_finishedJobs.contains(job->jobId()));
    }
}

void TestJobManager::testPoolCapacity() {
    // The capacity is clamped to the pool bounds
    _jobManager->setPoolCapacity(0);
    CPPUNIT_ASSERT_EQUAL(2, _jobManager->poolCapacity());
    _jobManager->setPoolCapacity(100);
    CPPUNIT_ASSERT_EQUAL(16, _jobManager->poolCapacity());
    _jobManager->setPoolCapacity(3);
    CPPUNIT_ASSERT_EQUAL(3, _jobManager->poolCapacity());

    std::atomic_int concurrentJobs = 0;
    std::atomic_int maxConcurrentJobs = 0;
    std::vector<std::shared_ptr<AbstractJob>> jobs;
    for (int i = 0; i < 12; i++) {
        jobs.push_back(std::make_shared<SleepJob>(20, ExitCode::Ok, &concurrentJobs, &maxConcurrentJobs));
        _jobManager->queueAsyncJob(jobs.back());
    }

    const auto start = std::chrono::steady_clock::now();
    _jobManager->waitForJobs(jobs);
    CPPUNIT_ASSERT_MESSAGE("Jobs have not finished in 30 seconds",
                           std::chrono::steady_clock::now() - start < std::chrono::seconds(30));

    CPPUNIT_ASSERT(maxConcurrentJobs.load() >= 1);
    CPPUNIT_ASSERT(maxConcurrentJobs.load() <= 3);
}

} // namespace FSC
