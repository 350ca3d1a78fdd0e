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

#include "testfilereconstructor.h"
#include "test_utility/testhelpers.h"
#include "chunking/chunker.h"
#include "libcommon/utility/utility.h"

#include <algorithm>

namespace FSC {

ExitInfo TestFileReconstructor::MapChunkSource::chunkBytes(int partNumber, const std::string & /*fingerprint*/,
                                                           std::string &bytes) {
    calls++;
    const auto it = parts.find(partNumber);
    if (it == parts.end()) {
        return {ExitCode::DataError, ExitCause::NotFound};
    }
    bytes = it->second;
    return ExitCode::Ok;
}

void TestFileReconstructor::setUp() {
    start();
    _tempDir = std::make_unique<LocalTemporaryDirectory>("TestFileReconstructor");
}

void TestFileReconstructor::tearDown() {
    _tempDir.reset();
    stop();
}

std::vector<ManifestEntry> TestFileReconstructor::prepare(const std::string &content, const uint64_t chunkSize,
                                                          MapChunkSource &source) const {
    std::vector<Chunk> chunks;
    (void) Chunker::chunk(content, chunkSize, chunks);

    std::vector<ManifestEntry> manifest;
    for (const auto &chunk: chunks) {
        source.parts[chunk.partNumber] = chunk.bytes;
        manifest.push_back({chunk.partNumber, chunk.fingerprint});
    }
    return manifest;
}

size_t TestFileReconstructor::tmpFileCount() const {
    size_t count = 0;
    for (const auto &entry: std::filesystem::directory_iterator(_tempDir->path())) {
        const std::string name = entry.path().filename().string();
        if (CommonUtility::startsWith(name, FileReconstructor::tmpFilePrefix) &&
            CommonUtility::endsWith(name, FileReconstructor::tmpFileSuffix)) {
            count++;
        }
    }
    return count;
}

void TestFileReconstructor::testReconstruct() {
    const std::string content = testhelpers::generateBytes(10000, 11);
    MapChunkSource source;
    std::vector<ManifestEntry> manifest = prepare(content, 1024, source);
    CPPUNIT_ASSERT_EQUAL(size_t(10), manifest.size());

    // The manifest order does not matter
    std::reverse(manifest.begin(), manifest.end());

    const SyncPath target = _tempDir->path() / "file.bin";
    FileReconstructor reconstructor;
    CPPUNIT_ASSERT(reconstructor.reconstruct(target, manifest, source));
    CPPUNIT_ASSERT(testhelpers::readFile(target) == content);
    CPPUNIT_ASSERT_EQUAL(10, source.calls);
    CPPUNIT_ASSERT_EQUAL(size_t(0), tmpFileCount());

    // An existing file is replaced
    const std::string newContent = testhelpers::generateBytes(3000, 12);
    MapChunkSource newSource;
    CPPUNIT_ASSERT(reconstructor.reconstruct(target, prepare(newContent, 1024, newSource), newSource));
    CPPUNIT_ASSERT(testhelpers::readFile(target) == newContent);
}

void TestFileReconstructor::testOrderManifest() {
    const std::vector<ManifestEntry> manifest = {{2, "c"}, {0, "a"}, {1, "b"}};
    std::vector<ManifestEntry> ordered;
    CPPUNIT_ASSERT(FileReconstructor::orderManifest(manifest, ordered));
    CPPUNIT_ASSERT_EQUAL(size_t(3), ordered.size());
    for (int i = 0; i < 3; i++) {
        CPPUNIT_ASSERT_EQUAL(i, ordered[i].partNumber);
    }
    CPPUNIT_ASSERT_EQUAL(std::string("a"), ordered[0].fingerprint);

    // Duplicated part
    const ExitInfo exitInfo = FileReconstructor::orderManifest({{0, "a"}, {0, "a"}, {1, "b"}}, ordered);
    CPPUNIT_ASSERT_EQUAL(ExitCause::ManifestGap, exitInfo.cause());
}

void TestFileReconstructor::testManifestGap() {
    const std::string content = testhelpers::generateBytes(5000, 13);
    const SyncPath target = _tempDir->path() / "file.bin";
    testhelpers::writeFile(target, "previous content");

    MapChunkSource source;
    std::vector<ManifestEntry> manifest = prepare(content, 1024, source);
    manifest.erase(manifest.begin() + 2);

    FileReconstructor reconstructor;
    const ExitInfo exitInfo = reconstructor.reconstruct(target, manifest, source);
    CPPUNIT_ASSERT_EQUAL(ExitCode::DataError, exitInfo.code());
    CPPUNIT_ASSERT_EQUAL(ExitCause::ManifestGap, exitInfo.cause());

    // Nothing was read, nothing was written
    CPPUNIT_ASSERT_EQUAL(0, source.calls);
    CPPUNIT_ASSERT_EQUAL(std::string("previous content"), testhelpers::readFile(target));
    CPPUNIT_ASSERT_EQUAL(size_t(0), tmpFileCount());
}

void TestFileReconstructor::testIntegrityFailure() {
    const std::string content = testhelpers::generateBytes(5000, 14);
    const SyncPath target = _tempDir->path() / "file.bin";
    testhelpers::writeFile(target, "previous content");

    MapChunkSource source;
    const std::vector<ManifestEntry> manifest = prepare(content, 1024, source);
    source.parts[3][0] = static_cast<char>(source.parts[3][0] ^ 0x01);

    FileReconstructor reconstructor;
    const ExitInfo exitInfo = reconstructor.reconstruct(target, manifest, source);
    CPPUNIT_ASSERT_EQUAL(ExitCode::DataError, exitInfo.code());
    CPPUNIT_ASSERT_EQUAL(ExitCause::IntegrityCheckFailed, exitInfo.cause());

    // The target is left untouched and the partial content is removed
    CPPUNIT_ASSERT_EQUAL(std::string("previous content"), testhelpers::readFile(target));
    CPPUNIT_ASSERT_EQUAL(size_t(0), tmpFileCount());
}

void TestFileReconstructor::testMissingChunk() {
    const std::string content = testhelpers::generateBytes(5000, 15);
    const SyncPath target = _tempDir->path() / "file.bin";

    MapChunkSource source;
    const std::vector<ManifestEntry> manifest = prepare(content, 1024, source);
    source.parts.erase(4);

    FileReconstructor reconstructor;
    const ExitInfo exitInfo = reconstructor.reconstruct(target, manifest, source);
    CPPUNIT_ASSERT_EQUAL(ExitCause::NotFound, exitInfo.cause());
    CPPUNIT_ASSERT(!std::filesystem::exists(target));
    CPPUNIT_ASSERT_EQUAL(size_t(0), tmpFileCount());
}

void TestFileReconstructor::testEmptyManifest() {
    const SyncPath target = _tempDir->path() / "empty.txt";
    MapChunkSource source;

    FileReconstructor reconstructor;
    CPPUNIT_ASSERT(reconstructor.reconstruct(target, {}, source));
    CPPUNIT_ASSERT(std::filesystem::exists(target));
    CPPUNIT_ASSERT_EQUAL(uintmax_t(0), std::filesystem::file_size(target));
}

} // namespace FSC
