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

#include <log4cplus/logger.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace FSC {

/**
 * A named background loop on its own thread.
 * Subclasses implement execute(), which must poll stopAsked() at least every loopPeriod.
 */
class ISyncWorker {
    public:
        explicit ISyncWorker(const std::string &name);
        virtual ~ISyncWorker();
        ISyncWorker(const ISyncWorker &) = delete;
        ISyncWorker &operator=(const ISyncWorker &) = delete;

        void start();
        //! Ask the loop to stop. Does not wait.
        void stop();
        void waitForExit();

        const std::string &name() const { return _name; }
        bool isRunning() const { return _isRunning; }
        bool stopAsked() const { return _stopAsked; }
        ExitCode exitCode() const { return _exitCode; }

    protected:
        static constexpr std::chrono::milliseconds loopPeriod{100};

        virtual ExitCode execute() = 0;

        log4cplus::Logger _logger;

    private:
        void threadMain();

        const std::string _name;
        std::unique_ptr<std::thread> _thread;
        std::atomic_bool _stopAsked{false};
        std::atomic_bool _isRunning{false};
        std::atomic<ExitCode> _exitCode{ExitCode::Unknown};
};

} // namespace FSC
