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
#include "abstractjob.h"
#include "libcommonserver/log/log.h"
#include "requests/parameterscache.h"

#include <log4cplus/loggingmacros.h>

namespace FSC {

std::atomic<UniqueId> AbstractJob::_lastJobId{0};

AbstractJob::AbstractJob() :
    _logger(Log::instance()->getLogger()),
    _jobId(++_lastJobId),
    _isExtendedLog(ParametersCache::isExtendedLogEnabled()) {
    if (_isExtendedLog) LOG_DEBUG(_logger, "Job " << _jobId << " created");
}

AbstractJob::~AbstractJob() {
    if (_isExtendedLog) LOG_DEBUG(_logger, "Job " << _jobId << " destroyed");
    // Pool threads outlive their jobs
    log4cplus::threadCleanup();
}

void AbstractJob::setAdditionalCallback(const Callback &callback) {
    const std::scoped_lock lock(_additionalCallbackMutex);
    _additionalCallback = callback;
}

ExitInfo AbstractJob::runSynchronously() {
    run();
    return _exitInfo;
}

void AbstractJob::abort() {
    if (_isExtendedLog) LOG_DEBUG(_logger, "Abort requested for job " << _jobId);
    _abort = true;
}

void AbstractJob::run() {
    _isRunning = true;
    _exitInfo = isAborted() ? ExitInfo(ExitCode::OperationCanceled, ExitCause::OperationCanceled) : runJob();
    _isRunning = false;

    notifyDone();
    // The main callback may have released the last reference on this job
}

void AbstractJob::notifyDone() {
    {
        const std::scoped_lock lock(_additionalCallbackMutex);
        if (_additionalCallback) _additionalCallback(_jobId);
    }

    if (const auto mainCallback = _mainCallback) mainCallback(_jobId);
}

} // namespace FSC
