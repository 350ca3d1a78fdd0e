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
#include "test_utility/localtemporarydirectory.h"
#include "mocks/libsyncengine/chunkstore/mockremote.h"
#include "syncpal/syncroundworker.h"

#include <memory>

namespace FSC {

class TestSyncRoundWorker : public CppUnit::TestFixture, public TestBase {
        CPPUNIT_TEST_SUITE(TestSyncRoundWorker);
        CPPUNIT_TEST(testRunRound);
        CPPUNIT_TEST(testOverlappingRoundSkipped);
        CPPUNIT_TEST(testRoundAtStartUp);
        CPPUNIT_TEST_SUITE_END();

    public:
        void setUp() override;
        void tearDown() override;

    protected:
        void testRunRound();
        void testOverlappingRoundSkipped();
        void testRoundAtStartUp();

    private:
        std::unique_ptr<LocalTemporaryDirectory> _tempDir;
        SyncPath _syncRoot;
        std::shared_ptr<SyncDb> _syncDb;
        std::unique_ptr<MockRemote> _remote;
        std::unique_ptr<ChunkCache> _cache;
        std::unique_ptr<PathLockManager> _pathLockManager;
        std::unique_ptr<SyncReconciler> _reconciler;
        std::unique_ptr<SyncEventQueue> _eventQueue;
        std::unique_ptr<SyncRoundWorker> _worker;
};

} // namespace FSC
