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

#include "testio.h"
#include "test_utility/localtemporarydirectory.h"
#include "test_utility/testhelpers.h"

#include <set>

using namespace CppUnit;

namespace FSC {

void TestIo::testCheckIfPathExists() {
    const LocalTemporaryDirectory temporaryDirectory("TestIo");
    const SyncPath filePath = temporaryDirectory.path() / "file.txt";

    bool exists = true;
    IoError ioError = IoError::Unknown;
    CPPUNIT_ASSERT(IoHelper::checkIfPathExists(filePath, exists, ioError));
    CPPUNIT_ASSERT(!exists);
    CPPUNIT_ASSERT_EQUAL(IoError::Success, ioError);

    testhelpers::writeFile(filePath, "content");
    CPPUNIT_ASSERT(IoHelper::checkIfPathExists(filePath, exists, ioError));
    CPPUNIT_ASSERT(exists);
    CPPUNIT_ASSERT_EQUAL(IoError::Success, ioError);

    bool isDirectory = true;
    CPPUNIT_ASSERT(IoHelper::checkIfIsDirectory(filePath, isDirectory, ioError));
    CPPUNIT_ASSERT(!isDirectory);
    CPPUNIT_ASSERT(IoHelper::checkIfIsDirectory(temporaryDirectory.path(), isDirectory, ioError));
    CPPUNIT_ASSERT(isDirectory);
}

void TestIo::testGetFileSize() {
    const LocalTemporaryDirectory temporaryDirectory("TestIo");
    const SyncPath filePath = temporaryDirectory.path() / "file.bin";
    testhelpers::writeFile(filePath, testhelpers::generateBytes(12345));

    uint64_t size = 0;
    IoError ioError = IoError::Unknown;
    CPPUNIT_ASSERT(IoHelper::getFileSize(filePath, size, ioError));
    CPPUNIT_ASSERT_EQUAL(IoError::Success, ioError);
    CPPUNIT_ASSERT_EQUAL(uint64_t(12345), size);

    // A directory has no file size
    CPPUNIT_ASSERT(!IoHelper::getFileSize(temporaryDirectory.path(), size, ioError));
    CPPUNIT_ASSERT_EQUAL(IoError::IsADirectory, ioError);

    // A missing file is an expected error
    CPPUNIT_ASSERT(IoHelper::getFileSize(temporaryDirectory.path() / "missing", size, ioError));
    CPPUNIT_ASSERT_EQUAL(IoError::NoSuchFileOrDirectory, ioError);
}

void TestIo::testCreateDirectory() {
    const LocalTemporaryDirectory temporaryDirectory("TestIo");
    const SyncPath dirPath = temporaryDirectory.path() / "a";

    IoError ioError = IoError::Unknown;
    CPPUNIT_ASSERT(IoHelper::createDirectory(dirPath, false, ioError));
    CPPUNIT_ASSERT_EQUAL(IoError::Success, ioError);

    CPPUNIT_ASSERT(!IoHelper::createDirectory(dirPath, false, ioError));
    CPPUNIT_ASSERT_EQUAL(IoError::FileExists, ioError);

    // Missing parents
    CPPUNIT_ASSERT(!IoHelper::createDirectory(temporaryDirectory.path() / "b" / "c", false, ioError));
    CPPUNIT_ASSERT_EQUAL(IoError::NoSuchFileOrDirectory, ioError);
    CPPUNIT_ASSERT(IoHelper::createDirectory(temporaryDirectory.path() / "b" / "c", true, ioError));
    CPPUNIT_ASSERT(std::filesystem::is_directory(temporaryDirectory.path() / "b" / "c"));
}

void TestIo::testRenameAndDeleteItem() {
    const LocalTemporaryDirectory temporaryDirectory("TestIo");
    const SyncPath sourcePath = temporaryDirectory.path() / "source.txt";
    const SyncPath destinationPath = temporaryDirectory.path() / "destination.txt";
    testhelpers::writeFile(sourcePath, "moved");

    IoError ioError = IoError::Unknown;
    CPPUNIT_ASSERT(IoHelper::renameItem(sourcePath, destinationPath, ioError));
    CPPUNIT_ASSERT(!std::filesystem::exists(sourcePath));
    CPPUNIT_ASSERT_EQUAL(std::string("moved"), testhelpers::readFile(destinationPath));

    // The destination is replaced
    testhelpers::writeFile(sourcePath, "replaced");
    CPPUNIT_ASSERT(IoHelper::renameItem(sourcePath, destinationPath, ioError));
    CPPUNIT_ASSERT_EQUAL(std::string("replaced"), testhelpers::readFile(destinationPath));

    CPPUNIT_ASSERT(!IoHelper::renameItem(sourcePath, destinationPath, ioError));
    CPPUNIT_ASSERT_EQUAL(IoError::NoSuchFileOrDirectory, ioError);

    CPPUNIT_ASSERT(IoHelper::deleteItem(destinationPath, ioError));
    CPPUNIT_ASSERT(!std::filesystem::exists(destinationPath));
}

void TestIo::testDirectoryIterator() {
    const LocalTemporaryDirectory temporaryDirectory("TestIo");
    const SyncPath &root = temporaryDirectory.path();
    std::filesystem::create_directories(root / "dir1" / "dir2");
    testhelpers::writeFile(root / "file0", "0");
    testhelpers::writeFile(root / "dir1" / "file1", "1");
    testhelpers::writeFile(root / "dir1" / "dir2" / "file2", "2");

    auto listItems = [&root](bool recursive) {
        std::set<SyncPath> items;
        IoError ioError = IoError::Unknown;
        IoHelper::DirectoryIterator it;
        CPPUNIT_ASSERT(IoHelper::getDirectoryIterator(root, recursive, ioError, it));

        DirectoryEntry entry;
        bool endOfDirectory = false;
        while (it.next(entry, endOfDirectory, ioError) && !endOfDirectory) {
            items.insert(entry.path().lexically_relative(root));
        }
        CPPUNIT_ASSERT_EQUAL(IoError::Success, ioError);
        CPPUNIT_ASSERT(endOfDirectory);
        return items;
    };

    const std::set<SyncPath> items = listItems(false);
    CPPUNIT_ASSERT_EQUAL(size_t(2), items.size());
    CPPUNIT_ASSERT(items.contains("dir1"));
    CPPUNIT_ASSERT(items.contains("file0"));

    const std::set<SyncPath> recursiveItems = listItems(true);
    CPPUNIT_ASSERT_EQUAL(size_t(5), recursiveItems.size());
    CPPUNIT_ASSERT(recursiveItems.contains(SyncPath("dir1") / "dir2" / "file2"));

    IoError ioError = IoError::Unknown;
    IoHelper::DirectoryIterator it;
    CPPUNIT_ASSERT(!IoHelper::getDirectoryIterator(root / "missing", true, ioError, it));
    CPPUNIT_ASSERT_EQUAL(IoError::NoSuchFileOrDirectory, ioError);
}

void TestIo::testReadFileRange() {
    const LocalTemporaryDirectory temporaryDirectory("TestIo");
    const SyncPath filePath = temporaryDirectory.path() / "file.bin";
    const std::string content = testhelpers::generateBytes(1000);
    testhelpers::writeFile(filePath, content);

    std::string bytes;
    CPPUNIT_ASSERT(IoHelper::readFileRange(filePath, 0, 100, bytes));
    CPPUNIT_ASSERT(bytes == content.substr(0, 100));

    CPPUNIT_ASSERT(IoHelper::readFileRange(filePath, 900, 100, bytes));
    CPPUNIT_ASSERT(bytes == content.substr(900));

    // Beyond the end of the file
    const ExitInfo exitInfo = IoHelper::readFileRange(filePath, 950, 100, bytes);
    CPPUNIT_ASSERT_EQUAL(ExitCode::DataError, exitInfo.code());
    CPPUNIT_ASSERT_EQUAL(ExitCause::FileModified, exitInfo.cause());
    CPPUNIT_ASSERT(bytes.empty());

    const ExitInfo missingExitInfo = IoHelper::readFileRange(temporaryDirectory.path() / "missing", 0, 10, bytes);
    CPPUNIT_ASSERT_EQUAL(ExitCode::SystemError, missingExitInfo.code());
    CPPUNIT_ASSERT_EQUAL(ExitCause::NotFound, missingExitInfo.cause());
}

void TestIo::testIoError2ExitInfo() {
    CPPUNIT_ASSERT(IoHelper::ioError2ExitInfo(IoError::Success));
    CPPUNIT_ASSERT_EQUAL(ExitCause::FileAccessError, IoHelper::ioError2ExitInfo(IoError::AccessDenied).cause());
    CPPUNIT_ASSERT_EQUAL(ExitCause::NotFound, IoHelper::ioError2ExitInfo(IoError::NoSuchFileOrDirectory).cause());
    CPPUNIT_ASSERT_EQUAL(ExitCause::NotEnoughDiskSpace, IoHelper::ioError2ExitInfo(IoError::DiskFull).cause());
    CPPUNIT_ASSERT_EQUAL(ExitCode::SystemError, IoHelper::ioError2ExitInfo(IoError::Unknown).code());
}

} // namespace FSC
