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
#include "upload/uploadcoordinator.h"

#include <memory>

namespace FSC {

class TestUploadCoordinator : public CppUnit::TestFixture, public TestBase {
        CPPUNIT_TEST_SUITE(TestUploadCoordinator);
        CPPUNIT_TEST(testUpload);
        CPPUNIT_TEST(testUnchanged);
        CPPUNIT_TEST(testModified);
        CPPUNIT_TEST(testDeduplication);
        CPPUNIT_TEST(testSharedPartsInFile);
        CPPUNIT_TEST(testHandleExpired);
        CPPUNIT_TEST(testRenegotiationLimit);
        CPPUNIT_TEST(testConfirmRetry);
        CPPUNIT_TEST(testConfirmFailure);
        CPPUNIT_TEST(testMissingParts);
        CPPUNIT_TEST(testFolderRegistration);
        CPPUNIT_TEST(testMissingFile);
        CPPUNIT_TEST(testParallelTransfer);
        CPPUNIT_TEST(testLargeFile);
        CPPUNIT_TEST_SUITE_END();

    public:
        void setUp() override;
        void tearDown() override;

    protected:
        void testUpload();
        void testUnchanged();
        void testModified();
        void testDeduplication();
        void testSharedPartsInFile();
        void testHandleExpired();
        void testRenegotiationLimit();
        void testConfirmRetry();
        void testConfirmFailure();
        void testMissingParts();
        void testFolderRegistration();
        void testMissingFile();
        void testParallelTransfer();
        void testLargeFile();

    private:
        void writeSyncFile(const std::string &itemPath, const std::string &content) const;
        // Check that the local DB and the store agree on the file
        void checkCommitted(const std::string &itemPath, const UploadResult &result, const std::string &content) const;

        std::unique_ptr<LocalTemporaryDirectory> _tempDir;
        SyncPath _syncRoot;
        std::shared_ptr<SyncDb> _syncDb;
        std::unique_ptr<MockRemote> _remote;
        std::unique_ptr<PathLockManager> _pathLockManager;
        std::unique_ptr<UploadCoordinator> _coordinator;
};

} // namespace FSC
