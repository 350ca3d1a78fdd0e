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

#include <log4cplus/logger.h>
#include <log4cplus/loggingmacros.h>
#include <log4cplus/tstring.h>

#include "libcommon/log/sentry/handler.h"
#include "libcommon/log/customlogstreams.h"
#include "libcommon/utility/types.h"

#include <memory>
#include <string>

namespace FSC {

// Release builds leave a breadcrumb for every line so that a Sentry report comes with its context
#ifdef NDEBUG
#define FS_LOG_BREADCRUMB(level, message) FSC::sentry::Handler::addBreadcrumb(level, message)
#else
#define FS_LOG_BREADCRUMB(level, message) (void) 0
#endif

#define FS_LOG_AT(logger, logEvent, log4cplusMacro, sentryLevel)        \
    {                                                                   \
        CustomLogStream customLogStream_;                               \
        customLogStream_ << logEvent;                                   \
        const std::string customLogStreamStr_ = customLogStream_.str(); \
        FS_LOG_BREADCRUMB(sentryLevel, customLogStreamStr_);            \
        log4cplusMacro(logger, customLogStreamStr_.c_str());            \
    }

#define LOG_DEBUG(logger, logEvent) FS_LOG_AT(logger, logEvent, LOG4CPLUS_DEBUG, FSC::sentry::Level::Debug)
#define LOG_INFO(logger, logEvent) FS_LOG_AT(logger, logEvent, LOG4CPLUS_INFO, FSC::sentry::Level::Info)
#define LOG_WARN(logger, logEvent) FS_LOG_AT(logger, logEvent, LOG4CPLUS_WARN, FSC::sentry::Level::Warning)
#define LOG_ERROR(logger, logEvent) FS_LOG_AT(logger, logEvent, LOG4CPLUS_ERROR, FSC::sentry::Level::Error)

#define LOG_FATAL(logger, logEvent)                                                                              \
    {                                                                                                            \
        CustomLogStream customLogStream_;                                                                        \
        customLogStream_ << logEvent;                                                                            \
        const std::string customLogStreamStr_ = customLogStream_.str();                                          \
        FSC::sentry::Handler::captureMessage(FSC::sentry::Level::Fatal, "Log fatal error", customLogStreamStr_); \
        LOG4CPLUS_FATAL(logger, customLogStreamStr_.c_str());                                                    \
    }

//! Process-wide log4cplus logger writing to a rolling file.
class Log {
    public:
        ~Log();
        //! The first call, with a file path, creates the logger. Later calls return it.
        static std::shared_ptr<Log> instance(const log4cplus::tstring &filePath = log4cplus::tstring());
        static bool isSet() { return _instance != nullptr; }

        Log(const Log &) = delete;
        Log &operator=(const Log &) = delete;

        log4cplus::Logger getLogger() const { return _logger; }
        //! Apply the configured level. `useLog == false` silences everything.
        bool configure(bool useLog, LogLevel logLevel);
        const SyncPath &getLogFilePath() const { return _filePath; }

        static const log4cplus::tstring instanceName;
        static const log4cplus::tstring rfPattern;
        static constexpr int rfMaxBackupIdx = 4;

    private:
        explicit Log(const log4cplus::tstring &filePath);

        static std::shared_ptr<Log> _instance;
        log4cplus::Logger _logger;
        SyncPath _filePath;

        friend class TestLog;
};

} // namespace FSC
