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
#include "isyncworker.h"
#include "libcommonserver/log/log.h"

#include <log4cplus/loggingmacros.h>

namespace FSC {

ISyncWorker::ISyncWorker(const std::string &name) :
    _logger(Log::instance()->getLogger()),
    _name(name) {}

ISyncWorker::~ISyncWorker() {
    stop();
    waitForExit();
}

void ISyncWorker::start() {
    if (_isRunning) {
        LOG_DEBUG(_logger, _name << " already running");
        return;
    }
    // Join the thread of a previous run
    waitForExit();

    _stopAsked = false;
    _exitCode = ExitCode::Unknown;
    _isRunning = true;
    _thread = std::make_unique<std::thread>(&ISyncWorker::threadMain, this);
}

void ISyncWorker::stop() {
    if (!_isRunning || _stopAsked) return;

    LOG_DEBUG(_logger, "Stopping " << _name);
    _stopAsked = true;
}

void ISyncWorker::waitForExit() {
    if (_thread && _thread->joinable()) _thread->join();
    _thread.reset();
}

void ISyncWorker::threadMain() {
    LOG_DEBUG(_logger, _name << " started");

    const ExitCode exitCode = execute();
    if (exitCode == ExitCode::Ok) {
        LOG_DEBUG(_logger, _name << " stopped");
    } else {
        LOG_WARN(_logger, _name << " exited with " << exitCode);
    }

    _exitCode = exitCode;
    _isRunning = false;
    log4cplus::threadCleanup();
}

} // namespace FSC
