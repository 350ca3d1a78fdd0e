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
#include "db/syncdb.h"

#include <memory>

namespace FSC {

class TestSyncDb : public CppUnit::TestFixture, public TestBase {
        CPPUNIT_TEST_SUITE(TestSyncDb);
        CPPUNIT_TEST(testRootFolder);
        CPPUNIT_TEST(testFolders);
        CPPUNIT_TEST(testFiles);
        CPPUNIT_TEST(testRecords);
        CPPUNIT_TEST(testCommitFile);
        CPPUNIT_TEST(testCommitFileRollback);
        CPPUNIT_TEST(testCommitFileReplacedId);
        CPPUNIT_TEST(testChunkLocations);
        CPPUNIT_TEST(testCursor);
        CPPUNIT_TEST_SUITE_END();

    public:
        void setUp() override;
        void tearDown() override;

    protected:
        void testRootFolder();
        void testFolders();
        void testFiles();
        void testRecords();
        void testCommitFile();
        void testCommitFileRollback();
        void testCommitFileReplacedId();
        void testChunkLocations();
        void testCursor();

    private:
        DbFile makeFile(const EntityId &fileId, const std::string &filePath, const std::string &hash) const;
        std::vector<DbChunk> makeChunks(const EntityId &fileId, const std::vector<std::string> &fingerprints) const;

        std::unique_ptr<LocalTemporaryDirectory> _tempDir;
        std::unique_ptr<SyncDb> _testObj;
        EntityId _rootId;
};

} // namespace FSC
