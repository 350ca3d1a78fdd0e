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

#include "libcommon/utility/types.h"

#include <cstdint>
#include <string>

namespace FSC {

class Parameters {
    public:
        Parameters();

        inline const SyncPath &syncDir() const { return _syncDir; }
        inline void setSyncDir(const SyncPath &syncDir) { _syncDir = syncDir; }

        inline const SyncPath &cacheDir() const { return _cacheDir; }
        inline void setCacheDir(const SyncPath &cacheDir) { _cacheDir = cacheDir; }

        inline const SyncPath &dbPath() const { return _dbPath; }
        inline void setDbPath(const SyncPath &dbPath) { _dbPath = dbPath; }

        inline const std::string &apiUrl() const { return _apiUrl; }
        inline void setApiUrl(const std::string &apiUrl) { _apiUrl = apiUrl; }

        inline uint64_t chunkSize() const { return _chunkSize; }
        inline void setChunkSize(uint64_t chunkSize) { _chunkSize = chunkSize; }

        inline int syncIntervalSec() const { return _syncIntervalSec; }
        inline void setSyncIntervalSec(int syncIntervalSec) { _syncIntervalSec = syncIntervalSec; }

        inline int requestTimeoutSec() const { return _requestTimeoutSec; }
        inline void setRequestTimeoutSec(int requestTimeoutSec) { _requestTimeoutSec = requestTimeoutSec; }

        inline int maxRetries() const { return _maxRetries; }
        inline void setMaxRetries(int maxRetries) { _maxRetries = maxRetries; }

        inline int retryBackoffMs() const { return _retryBackoffMs; }
        inline void setRetryBackoffMs(int retryBackoffMs) { _retryBackoffMs = retryBackoffMs; }

        inline int maxConfirmAttempts() const { return _maxConfirmAttempts; }
        inline void setMaxConfirmAttempts(int maxConfirmAttempts) { _maxConfirmAttempts = maxConfirmAttempts; }

        inline int confirmBackoffMs() const { return _confirmBackoffMs; }
        inline void setConfirmBackoffMs(int confirmBackoffMs) { _confirmBackoffMs = confirmBackoffMs; }

        inline int maxRenegotiations() const { return _maxRenegotiations; }
        inline void setMaxRenegotiations(int maxRenegotiations) { _maxRenegotiations = maxRenegotiations; }

        inline int maxIntegrityRetries() const { return _maxIntegrityRetries; }
        inline void setMaxIntegrityRetries(int maxIntegrityRetries) { _maxIntegrityRetries = maxIntegrityRetries; }

        inline int transferParallelJobs() const { return _transferParallelJobs; }
        inline void setTransferParallelJobs(int transferParallelJobs) { _transferParallelJobs = transferParallelJobs; }

        inline bool useLog() const { return _useLog; }
        inline void setUseLog(bool useLog) { _useLog = useLog; }

        inline LogLevel logLevel() const { return _logLevel; }
        inline void setLogLevel(LogLevel logLevel) { _logLevel = logLevel; }

        inline bool extendedLog() const { return _extendedLog; }
        inline void setExtendedLog(bool extendedLog) { _extendedLog = extendedLog; }

        inline const std::string &sentryDsn() const { return _sentryDsn; }
        inline void setSentryDsn(const std::string &sentryDsn) { _sentryDsn = sentryDsn; }

        static const uint64_t chunkSizeDefault;
        static const int syncIntervalSecDefault;
        static const int transferParallelJobsDefault;

    private:
        SyncPath _syncDir;
        SyncPath _cacheDir;
        SyncPath _dbPath;
        std::string _apiUrl;
        uint64_t _chunkSize;
        int _syncIntervalSec;
        int _requestTimeoutSec;
        int _maxRetries;
        int _retryBackoffMs; // Base delay, doubled on each retry
        int _maxConfirmAttempts;
        int _confirmBackoffMs;
        int _maxRenegotiations;
        int _maxIntegrityRetries;
        int _transferParallelJobs;
        bool _useLog;
        LogLevel _logLevel;
        bool _extendedLog;
        std::string _sentryDsn;
};

} // namespace FSC
