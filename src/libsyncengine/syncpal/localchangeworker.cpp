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

#include "localchangeworker.h"
#include "libcommon/utility/utility.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/utility.h"
#include "reconstruction/filereconstructor.h"
#include "requests/parameterscache.h"

#include <log4cplus/loggingmacros.h>

#include <algorithm>

namespace FSC {

LocalChangeWorker::LocalChangeWorker(SyncEventQueue &eventQueue, UploadCoordinator &uploadCoordinator, const std::string &name) :
    ISyncWorker(name),
    _eventQueue(eventQueue),
    _uploadCoordinator(uploadCoordinator) {}

ExitCode LocalChangeWorker::execute() {
    while (!stopAsked()) {
        requeueDueUploads();

        SyncEvent event;
        if (!_eventQueue.popLocalEvent(event, loopPeriod)) {
            if (_eventQueue.isClosed()) break;
            continue;
        }

        (void) processEvent(event);
    }

    return ExitCode::Ok;
}

void LocalChangeWorker::processPendingEvents() {
    SyncEvent event;
    while (_eventQueue.popLocalEvent(event, std::chrono::milliseconds(0))) {
        (void) processEvent(event);
    }
}

ExitInfo LocalChangeWorker::processEvent(const SyncEvent &event) {
    switch (event.type) {
        case SyncEventType::FolderCreated: {
            DbFolder folder;
            const ExitInfo exitInfo = _uploadCoordinator.registerFolderChain(event.itemPath, folder);
            if (!exitInfo) {
                LOG_WARN(_logger, "Unable to register folder " << event.itemPath << " : " << exitInfo);
            }
            return exitInfo;
        }
        case SyncEventType::FileChanged: {
            const std::string name = Utility::itemName(event.itemPath);
            if (CommonUtility::startsWith(name, FileReconstructor::tmpFilePrefix) &&
                CommonUtility::endsWith(name, FileReconstructor::tmpFileSuffix)) {
                return ExitCode::Ok;
            }

            UploadResult result;
            const ExitInfo exitInfo = _uploadCoordinator.upload(event.itemPath, result);
            if (!exitInfo && isWorthRetrying(exitInfo)) {
                deferUpload(event.itemPath);
                return exitInfo;
            }

            _deferredPaths.erase(event.itemPath);
            if (exitInfo.cause() == ExitCause::FileModified) {
                // The end of the write triggers a new event
                LOG_DEBUG(_logger, "Upload of " << event.itemPath << " postponed");
            }
            return exitInfo;
        }
        case SyncEventType::SyncRoundDue:
            break;
    }

    LOG_WARN(_logger, "Unexpected event " << event.type << " on the local channel");
    return {ExitCode::LogicError, ExitCause::InvalidArgument};
}

bool LocalChangeWorker::isWorthRetrying(const ExitInfo &exitInfo) {
    if (exitInfo.isRecoverable()) return true;

    // The server refused this run, a fresh one may go through
    return exitInfo.code() == ExitCode::BackError &&
           (exitInfo.cause() == ExitCause::ConfirmRejected || exitInfo.cause() == ExitCause::NegotiationConflict ||
            exitInfo.cause() == ExitCause::TransferHandleExpired);
}

void LocalChangeWorker::deferUpload(const std::string &itemPath) {
    const Parameters &parameters = ParametersCache::instance()->parameters();

    DeferredUpload &deferred = _deferredPaths[itemPath];
    deferred.attempts++;
    const int64_t maxDelayMs = static_cast<int64_t>(parameters.syncIntervalSec()) * 1000;
    const int64_t delayMs =
            std::min(static_cast<int64_t>(parameters.retryBackoffMs()) << std::min(deferred.attempts - 1, 16), maxDelayMs);
    deferred.dueTime = std::chrono::steady_clock::now() + std::chrono::milliseconds(delayMs);

    LOG_INFO(_logger, "Upload of " << itemPath << " will be retried in " << delayMs << " ms");
}

void LocalChangeWorker::requeueDueUploads() {
    const auto now = std::chrono::steady_clock::now();
    for (auto &[itemPath, deferred]: _deferredPaths) {
        if (deferred.dueTime > now) continue;

        (void) _eventQueue.push({SyncEventType::FileChanged, itemPath});
        // Not due again before the next failure
        deferred.dueTime = std::chrono::steady_clock::time_point::max();
    }
}

} // namespace FSC
