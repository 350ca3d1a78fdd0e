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

#include "testincludes.h"
#include "test_utility/testbase.h"
#include "jobs/abstractjob.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_set>

namespace FSC {

class JobManager;

class TestJobManager : public CppUnit::TestFixture, public TestBase {
        CPPUNIT_TEST_SUITE(TestJobManager);
        CPPUNIT_TEST(testRunSynchronously);
        CPPUNIT_TEST(testAbortBeforeStart);
        CPPUNIT_TEST(testWithoutCallback);
        CPPUNIT_TEST(testWithCallback);
        CPPUNIT_TEST(testPoolCapacity);
        CPPUNIT_TEST_SUITE_END();

    public:
        void setUp() override;
        void tearDown() override;

    protected:
        void testRunSynchronously();
        void testAbortBeforeStart();
        void testWithoutCallback();
        void testWithCallback();
        void testPoolCapacity();

    private:
        class SleepJob : public AbstractJob {
            public:
                SleepJob(unsigned int durationMs, ExitInfo result, std::atomic_int *concurrentJobs = nullptr,
                         std::atomic_int *maxConcurrentJobs = nullptr);

            protected:
                ExitInfo runJob() noexcept override;

            private:
                unsigned int _durationMs = 0;
                ExitInfo _result;
                std::atomic_int *_concurrentJobs = nullptr;
                std::atomic_int *_maxConcurrentJobs = nullptr;
        };

        void callback(UniqueId jobId);

        std::unique_ptr<JobManager> _jobManager;
        std::mutex _mutex;
        std::unordered_set<UniqueId> _finishedJobs;
};

} // namespace FSC
