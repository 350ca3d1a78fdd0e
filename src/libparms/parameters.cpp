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

#include "parameters.h"
#include "libcommon/utility/utility.h"

#define DEFAULT_API_URL "http://localhost:8000/api"
#define DEFAULT_CHUNK_SIZE (5 * 1024 * 1024)
#define DEFAULT_SYNC_INTERVAL 120 // s
#define DEFAULT_REQUEST_TIMEOUT 30 // s
#define DEFAULT_TRANSFER_PARALLEL_JOBS 4

namespace FSC {

const uint64_t Parameters::chunkSizeDefault = DEFAULT_CHUNK_SIZE;
const int Parameters::syncIntervalSecDefault = DEFAULT_SYNC_INTERVAL;
const int Parameters::transferParallelJobsDefault = DEFAULT_TRANSFER_PARALLEL_JOBS;

Parameters::Parameters() :
    _syncDir(SyncPath(CommonUtility::envVarValue("HOME")) / FS_APPLICATION_NAME),
    _cacheDir(CommonUtility::getAppSupportDir() / "cache"),
    _dbPath(CommonUtility::getAppSupportDir() / ".firesync.db"),
    _apiUrl(DEFAULT_API_URL),
    _chunkSize(DEFAULT_CHUNK_SIZE),
    _syncIntervalSec(DEFAULT_SYNC_INTERVAL),
    _requestTimeoutSec(DEFAULT_REQUEST_TIMEOUT),
    _maxRetries(3),
    _retryBackoffMs(1000),
    _maxConfirmAttempts(3),
    _confirmBackoffMs(500),
    _maxRenegotiations(3),
    _maxIntegrityRetries(2),
    _transferParallelJobs(DEFAULT_TRANSFER_PARALLEL_JOBS),
    _useLog(true),
    _logLevel(LogLevel::Info),
    _extendedLog(false),
    _sentryDsn(std::string()) {}

} // namespace FSC
