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

#include "syncroundworker.h"
#include "libcommonserver/log/log.h"
#include "requests/parameterscache.h"

#include <log4cplus/loggingmacros.h>

namespace FSC {

SyncRoundWorker::SyncRoundWorker(SyncEventQueue &eventQueue, SyncReconciler &reconciler, const std::string &name) :
    ISyncWorker(name),
    _eventQueue(eventQueue),
    _reconciler(reconciler) {}

ExitCode SyncRoundWorker::execute() {
    // The first round runs at start-up
    auto nextRoundTime = std::chrono::steady_clock::now();
    while (!stopAsked()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= nextRoundTime) {
            if (!_eventQueue.push({SyncEventType::SyncRoundDue, ""})) {
                LOG_INFO(_logger, "A sync round is still pending, round skipped");
                _skippedRounds++;
            }
            const int intervalSec = ParametersCache::instance()->parameters().syncIntervalSec();
            nextRoundTime = now + std::chrono::seconds(intervalSec);
        }

        if (!_eventQueue.popRoundDue(loopPeriod)) {
            if (_eventQueue.isClosed()) break;
            continue;
        }

        RoundReport report;
        bool skipped = false;
        (void) runRound(report, skipped);
    }

    return ExitCode::Ok;
}

ExitInfo SyncRoundWorker::runRound(RoundReport &report, bool &skipped) {
    skipped = false;

    const std::unique_lock lock(_roundMutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        LOG_INFO(_logger, "A sync round is already running, round skipped");
        _skippedRounds++;
        skipped = true;
        return ExitCode::Ok;
    }

    const ExitInfo exitInfo = _reconciler.syncOnce(report);
    if (!exitInfo) {
        LOG_WARN(_logger, "Sync round failed : " << exitInfo);
    }
    _completedRounds++;
    return exitInfo;
}

} // namespace FSC
