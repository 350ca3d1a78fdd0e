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

#include "testchunker.h"
#include "test_utility/localtemporarydirectory.h"
#include "test_utility/testhelpers.h"
#include "chunking/chunker.h"
#include "fingerprint/fingerprint.h"

namespace FSC {

static const uint64_t mebibyte = 1024 * 1024;

void TestChunker::testChunkBoundaries() {
    // 12 MiB with 5 MiB chunks: 5 + 5 + 2
    const std::string content = testhelpers::generateBytes(12 * mebibyte);
    std::vector<Chunk> chunks;
    CPPUNIT_ASSERT(Chunker::chunk(content, 5 * mebibyte, chunks));
    CPPUNIT_ASSERT_EQUAL(size_t(3), chunks.size());
    CPPUNIT_ASSERT_EQUAL(size_t(5 * mebibyte), chunks[0].bytes.size());
    CPPUNIT_ASSERT_EQUAL(size_t(5 * mebibyte), chunks[1].bytes.size());
    CPPUNIT_ASSERT_EQUAL(size_t(2 * mebibyte), chunks[2].bytes.size());

    std::string concatenated;
    for (size_t i = 0; i < chunks.size(); i++) {
        CPPUNIT_ASSERT_EQUAL(static_cast<int>(i), chunks[i].partNumber);
        CPPUNIT_ASSERT_EQUAL(Fingerprint::compute(chunks[i].bytes), chunks[i].fingerprint);
        concatenated += chunks[i].bytes;
    }
    CPPUNIT_ASSERT(concatenated == content);

    // Exact multiple of the chunk size
    CPPUNIT_ASSERT(Chunker::chunk(std::string(20, 'a'), 10, chunks));
    CPPUNIT_ASSERT_EQUAL(size_t(2), chunks.size());
    CPPUNIT_ASSERT_EQUAL(chunks[0].fingerprint, chunks[1].fingerprint);

    CPPUNIT_ASSERT_EQUAL(uint64_t(3), Chunker::partCount(12 * mebibyte, 5 * mebibyte));
    CPPUNIT_ASSERT_EQUAL(uint64_t(2), Chunker::partCount(20, 10));
    CPPUNIT_ASSERT_EQUAL(uint64_t(0), Chunker::partCount(0, 10));

    const ExitInfo exitInfo = Chunker::chunk(content, 0, chunks);
    CPPUNIT_ASSERT_EQUAL(ExitCode::LogicError, exitInfo.code());
}

void TestChunker::testEmptyInput() {
    std::vector<Chunk> chunks(1);
    CPPUNIT_ASSERT(Chunker::chunk(std::string(), 1024, chunks));
    CPPUNIT_ASSERT(chunks.empty());

    const LocalTemporaryDirectory temporaryDirectory("TestChunker");
    const SyncPath filePath = temporaryDirectory.path() / "empty";
    testhelpers::writeFile(filePath, std::string());

    std::vector<ChunkInfo> parts;
    std::string fileHash;
    CPPUNIT_ASSERT(Chunker::scanFile(filePath, 1024, parts, fileHash));
    CPPUNIT_ASSERT(parts.empty());
    CPPUNIT_ASSERT_EQUAL(Fingerprint::compute(std::string()), fileHash);
}

void TestChunker::testDeterminism() {
    const std::string content = testhelpers::generateBytes(100000, 42);
    std::vector<Chunk> chunks1;
    std::vector<Chunk> chunks2;
    CPPUNIT_ASSERT(Chunker::chunk(content, 4096, chunks1));
    CPPUNIT_ASSERT(Chunker::chunk(content, 4096, chunks2));
    CPPUNIT_ASSERT_EQUAL(chunks1.size(), chunks2.size());
    for (size_t i = 0; i < chunks1.size(); i++) {
        CPPUNIT_ASSERT_EQUAL(chunks1[i].fingerprint, chunks2[i].fingerprint);
    }

    // Fixed boundaries: a change in the first chunk leaves the following ones untouched
    std::string modified = content;
    modified[0] = static_cast<char>(modified[0] ^ 0xFF);
    std::vector<Chunk> chunks3;
    CPPUNIT_ASSERT(Chunker::chunk(modified, 4096, chunks3));
    CPPUNIT_ASSERT(chunks1[0].fingerprint != chunks3[0].fingerprint);
    for (size_t i = 1; i < chunks1.size(); i++) {
        CPPUNIT_ASSERT_EQUAL(chunks1[i].fingerprint, chunks3[i].fingerprint);
    }
}

void TestChunker::testScanFile() {
    const LocalTemporaryDirectory temporaryDirectory("TestChunker");
    const SyncPath filePath = temporaryDirectory.path() / "file.bin";
    const std::string content = testhelpers::generateBytes(10000, 7);
    testhelpers::writeFile(filePath, content);

    std::vector<ChunkInfo> parts;
    std::string fileHash;
    CPPUNIT_ASSERT(Chunker::scanFile(filePath, 4096, parts, fileHash));
    CPPUNIT_ASSERT_EQUAL(size_t(3), parts.size());
    CPPUNIT_ASSERT_EQUAL(Fingerprint::compute(content), fileHash);

    std::vector<Chunk> chunks;
    CPPUNIT_ASSERT(Chunker::chunk(content, 4096, chunks));
    for (size_t i = 0; i < parts.size(); i++) {
        CPPUNIT_ASSERT_EQUAL(chunks[i].partNumber, parts[i].partNumber);
        CPPUNIT_ASSERT_EQUAL(uint64_t(i * 4096), parts[i].offset);
        CPPUNIT_ASSERT_EQUAL(uint64_t(chunks[i].bytes.size()), parts[i].size);
        CPPUNIT_ASSERT_EQUAL(chunks[i].fingerprint, parts[i].fingerprint);
    }
    CPPUNIT_ASSERT_EQUAL(uint64_t(10000 - 2 * 4096), parts[2].size);

    const ExitInfo exitInfo = Chunker::scanFile(temporaryDirectory.path() / "missing", 4096, parts);
    CPPUNIT_ASSERT_EQUAL(ExitCode::SystemError, exitInfo.code());
    CPPUNIT_ASSERT_EQUAL(ExitCause::NotFound, exitInfo.cause());
}

void TestChunker::testReadPart() {
    const LocalTemporaryDirectory temporaryDirectory("TestChunker");
    const SyncPath filePath = temporaryDirectory.path() / "file.bin";
    const std::string content = testhelpers::generateBytes(5000, 3);
    testhelpers::writeFile(filePath, content);

    std::vector<ChunkInfo> parts;
    CPPUNIT_ASSERT(Chunker::scanFile(filePath, 2048, parts));
    CPPUNIT_ASSERT_EQUAL(size_t(3), parts.size());

    std::string bytes;
    CPPUNIT_ASSERT(Chunker::readPart(filePath, parts[1], bytes));
    CPPUNIT_ASSERT(bytes == content.substr(2048, 2048));

    // The file was truncated after the scan
    testhelpers::writeFile(filePath, content.substr(0, 3000));
    const ExitInfo exitInfo = Chunker::readPart(filePath, parts[2], bytes);
    CPPUNIT_ASSERT_EQUAL(ExitCode::DataError, exitInfo.code());
    CPPUNIT_ASSERT_EQUAL(ExitCause::FileModified, exitInfo.cause());
}

void TestChunker::testFingerprint() {
    // Known SHA-256 digest
    CPPUNIT_ASSERT_EQUAL(std::string("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"),
                         Fingerprint::compute("abc"));
    CPPUNIT_ASSERT_EQUAL(Fingerprint::length, Fingerprint::compute("abc").size());

    Fingerprint::Builder builder;
    builder.update("a");
    builder.update("bc");
    CPPUNIT_ASSERT_EQUAL(Fingerprint::compute("abc"), builder.finalize());

    CPPUNIT_ASSERT(Fingerprint::isValid(Fingerprint::compute("abc")));
    CPPUNIT_ASSERT(!Fingerprint::isValid("abc"));
    CPPUNIT_ASSERT(!Fingerprint::isValid(std::string(64, 'g')));
    CPPUNIT_ASSERT(!Fingerprint::isValid(std::string(64, 'A')));

    const std::vector<std::string> fingerprints = {Fingerprint::compute("a"), Fingerprint::compute("b")};
    CPPUNIT_ASSERT_EQUAL(Fingerprint::compute(fingerprints[0] + fingerprints[1]), Fingerprint::combine(fingerprints));
}

} // namespace FSC
