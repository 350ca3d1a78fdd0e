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

#include <Poco/Runnable.h>

#include <log4cplus/logger.h>

#include <atomic>
#include <functional>
#include <mutex>

namespace FSC {

/**
 * @brief Unit of work run either inline with runSynchronously() or on the JobManager pool.
 * Subclasses implement runJob() and poll isAborted() in long loops.
 */
class AbstractJob : public Poco::Runnable {
    public:
        using Callback = std::function<void(UniqueId)>;

        AbstractJob();
        ~AbstractJob() override;

        ExitInfo runSynchronously();

        //! Reserved to the JobManager.
        void setMainCallback(const Callback &callback) { _mainCallback = callback; }
        //! Called with the job id once the job is done, before the JobManager releases it.
        void setAdditionalCallback(const Callback &callback);

        ExitInfo exitInfo() const { return _exitInfo; }
        UniqueId jobId() const { return _jobId; }
        bool isExtendedLog() const { return _isExtendedLog; }
        bool isRunning() const { return _isRunning; }

        virtual void abort();
        bool isAborted() const { return _abort; }

    protected:
        void run() final;
        virtual ExitInfo runJob() noexcept = 0;

        log4cplus::Logger _logger;
        ExitInfo _exitInfo;

    private:
        void notifyDone();

        static std::atomic<UniqueId> _lastJobId;

        const UniqueId _jobId;
        const bool _isExtendedLog;
        std::atomic_bool _isRunning{false};
        std::atomic_bool _abort{false};

        Callback _mainCallback;
        std::mutex _additionalCallbackMutex;
        Callback _additionalCallback;
};

} // namespace FSC
