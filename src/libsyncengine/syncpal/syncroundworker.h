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

#include "isyncworker.h"
#include "synceventqueue.h"
#include "reconciliation/syncreconciler.h"

#include <mutex>

namespace FSC {

/**
 * Emit a "sync round due" event every syncIntervalSec seconds and run the Sync Reconciler on each of them.
 * Rounds never overlap: a round requested while another one runs is skipped.
 */
class SyncRoundWorker : public ISyncWorker {
    public:
        SyncRoundWorker(SyncEventQueue &eventQueue, SyncReconciler &reconciler, const std::string &name);

        // Run a round in the calling thread, unless one is already running
        ExitInfo runRound(RoundReport &report, bool &skipped);

        inline int completedRounds() const { return _completedRounds; }
        inline int skippedRounds() const { return _skippedRounds; }

    protected:
        ExitCode execute() override;

    private:
        SyncEventQueue &_eventQueue;
        SyncReconciler &_reconciler;
        std::mutex _roundMutex;
        std::atomic_int _completedRounds{0};
        std::atomic_int _skippedRounds{0};

        friend class TestSyncRoundWorker;
};

} // namespace FSC
