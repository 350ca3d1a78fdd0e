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

#include "testparameters.h"
#include "test_utility/testhelpers.h"
#include "libparms/parametersloader.h"

#include <cstdlib>

namespace FSC {

static const char *envVariables[] = {"FIRESYNC_SYNC_DIR",       "FIRESYNC_CACHE_DIR",   "FIRESYNC_DB_PATH",
                                     "FIRESYNC_API_URL",        "FIRESYNC_CHUNK_SIZE",  "FIRESYNC_SYNC_INTERVAL",
                                     "FIRESYNC_REQUEST_TIMEOUT", "FIRESYNC_MAX_RETRIES", "FIRESYNC_LOG_LEVEL",
                                     "FIRESYNC_SENTRY_DSN"};

void TestParameters::setUp() {
    _tempDir = std::make_unique<LocalTemporaryDirectory>("TestParameters");
    for (const char *name: envVariables) {
        (void) unsetenv(name);
    }
}

void TestParameters::tearDown() {
    for (const char *name: envVariables) {
        (void) unsetenv(name);
    }
    _tempDir.reset();
}

SyncPath TestParameters::writeConfig(const std::string &content) const {
    const SyncPath path = _tempDir->path() / "firesync.json";
    testhelpers::writeFile(path, content);
    return path;
}

void TestParameters::testDefaults() {
    const Parameters parameters;
    CPPUNIT_ASSERT_EQUAL(uint64_t(5 * 1024 * 1024), parameters.chunkSize());
    CPPUNIT_ASSERT_EQUAL(120, parameters.syncIntervalSec());
    CPPUNIT_ASSERT_EQUAL(30, parameters.requestTimeoutSec());
    CPPUNIT_ASSERT_EQUAL(3, parameters.maxRetries());
    CPPUNIT_ASSERT_EQUAL(4, parameters.transferParallelJobs());
    CPPUNIT_ASSERT_EQUAL(std::string("http://localhost:8000/api"), parameters.apiUrl());
    CPPUNIT_ASSERT_EQUAL(std::string(".firesync.db"), parameters.dbPath().filename().string());
    CPPUNIT_ASSERT_EQUAL(LogLevel::Info, parameters.logLevel());
    CPPUNIT_ASSERT(parameters.useLog());
    CPPUNIT_ASSERT(!parameters.extendedLog());
    CPPUNIT_ASSERT(parameters.sentryDsn().empty());
}

void TestParameters::testLoadMissingFile() {
    Parameters parameters;
    const ExitInfo exitInfo = ParametersLoader::load(_tempDir->path() / "missing.json", parameters);
    CPPUNIT_ASSERT_EQUAL(ExitCode::SystemError, exitInfo.code());
    CPPUNIT_ASSERT_EQUAL(ExitCause::NotFound, exitInfo.cause());

    // Untouched
    CPPUNIT_ASSERT_EQUAL(Parameters::chunkSizeDefault, parameters.chunkSize());
}

void TestParameters::testLoad() {
    const SyncPath path = writeConfig(R"({
        "syncDir": "/data/sync",
        "apiUrl": "https://store.example.com/api",
        "chunkSize": 1048576,
        "syncIntervalSec": 30,
        "transferParallelJobs": 8,
        "logLevel": "debug",
        "extendedLog": true
    })");

    Parameters parameters;
    CPPUNIT_ASSERT(ParametersLoader::load(path, parameters));
    CPPUNIT_ASSERT_EQUAL(SyncPath("/data/sync"), parameters.syncDir());
    CPPUNIT_ASSERT_EQUAL(std::string("https://store.example.com/api"), parameters.apiUrl());
    CPPUNIT_ASSERT_EQUAL(uint64_t(1048576), parameters.chunkSize());
    CPPUNIT_ASSERT_EQUAL(30, parameters.syncIntervalSec());
    CPPUNIT_ASSERT_EQUAL(8, parameters.transferParallelJobs());
    CPPUNIT_ASSERT_EQUAL(LogLevel::Debug, parameters.logLevel());
    CPPUNIT_ASSERT(parameters.extendedLog());

    // Absent keys keep their default value
    CPPUNIT_ASSERT_EQUAL(30, parameters.requestTimeoutSec());
    CPPUNIT_ASSERT_EQUAL(3, parameters.maxConfirmAttempts());
}

void TestParameters::testLoadInvalid() {
    Parameters parameters;

    ExitInfo exitInfo = ParametersLoader::load(writeConfig("{ not json"), parameters);
    CPPUNIT_ASSERT_EQUAL(ExitCode::DataError, exitInfo.code());
    CPPUNIT_ASSERT_EQUAL(ExitCause::InvalidArgument, exitInfo.cause());

    exitInfo = ParametersLoader::load(writeConfig(R"({"logLevel": "verbose"})"), parameters);
    CPPUNIT_ASSERT_EQUAL(ExitCode::DataError, exitInfo.code());

    exitInfo = ParametersLoader::load(writeConfig(R"({"chunkSize": 0})"), parameters);
    CPPUNIT_ASSERT_EQUAL(ExitCode::DataError, exitInfo.code());

    exitInfo = ParametersLoader::load(writeConfig(R"({"maxRetries": "many"})"), parameters);
    CPPUNIT_ASSERT_EQUAL(ExitCode::DataError, exitInfo.code());
}

void TestParameters::testSaveAndLoad() {
    Parameters parameters;
    parameters.setSyncDir("/data/FireSync");
    parameters.setCacheDir("/data/cache");
    parameters.setChunkSize(4096);
    parameters.setMaxIntegrityRetries(5);
    parameters.setLogLevel(LogLevel::Error);
    parameters.setSentryDsn("https://key@sentry.example.com/1");

    const SyncPath path = _tempDir->path() / "sub" / "firesync.json";
    CPPUNIT_ASSERT(ParametersLoader::save(path, parameters));

    Parameters loaded;
    CPPUNIT_ASSERT(ParametersLoader::load(path, loaded));
    CPPUNIT_ASSERT_EQUAL(parameters.syncDir(), loaded.syncDir());
    CPPUNIT_ASSERT_EQUAL(parameters.cacheDir(), loaded.cacheDir());
    CPPUNIT_ASSERT_EQUAL(uint64_t(4096), loaded.chunkSize());
    CPPUNIT_ASSERT_EQUAL(5, loaded.maxIntegrityRetries());
    CPPUNIT_ASSERT_EQUAL(LogLevel::Error, loaded.logLevel());
    CPPUNIT_ASSERT_EQUAL(parameters.sentryDsn(), loaded.sentryDsn());
}

void TestParameters::testApplyEnvironment() {
    Parameters parameters;
    (void) setenv("FIRESYNC_SYNC_DIR", "/env/sync", 1);
    (void) setenv("FIRESYNC_API_URL", "http://env:9000/api", 1);
    (void) setenv("FIRESYNC_CHUNK_SIZE", "65536", 1);
    (void) setenv("FIRESYNC_SYNC_INTERVAL", "15", 1);
    (void) setenv("FIRESYNC_LOG_LEVEL", "Warning", 1);
    CPPUNIT_ASSERT(ParametersLoader::applyEnvironment(parameters));

    CPPUNIT_ASSERT_EQUAL(SyncPath("/env/sync"), parameters.syncDir());
    CPPUNIT_ASSERT_EQUAL(std::string("http://env:9000/api"), parameters.apiUrl());
    CPPUNIT_ASSERT_EQUAL(uint64_t(65536), parameters.chunkSize());
    CPPUNIT_ASSERT_EQUAL(15, parameters.syncIntervalSec());
    CPPUNIT_ASSERT_EQUAL(LogLevel::Warning, parameters.logLevel());

    (void) setenv("FIRESYNC_CHUNK_SIZE", "0", 1);
    CPPUNIT_ASSERT_EQUAL(ExitCode::DataError, ParametersLoader::applyEnvironment(parameters).code());
    (void) unsetenv("FIRESYNC_CHUNK_SIZE");

    (void) setenv("FIRESYNC_SYNC_INTERVAL", "soon", 1);
    CPPUNIT_ASSERT_EQUAL(ExitCode::DataError, ParametersLoader::applyEnvironment(parameters).code());
}

void TestParameters::testLogLevelFromString() {
    LogLevel logLevel = LogLevel::Info;
    CPPUNIT_ASSERT(ParametersLoader::logLevelFromString("DEBUG", logLevel));
    CPPUNIT_ASSERT_EQUAL(LogLevel::Debug, logLevel);
    CPPUNIT_ASSERT(ParametersLoader::logLevelFromString("3", logLevel));
    CPPUNIT_ASSERT_EQUAL(LogLevel::Error, logLevel);
    CPPUNIT_ASSERT(!ParametersLoader::logLevelFromString("7", logLevel));
    CPPUNIT_ASSERT(!ParametersLoader::logLevelFromString("chatty", logLevel));
}

} // namespace FSC
