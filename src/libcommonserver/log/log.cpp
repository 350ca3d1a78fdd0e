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
#include "log.h"
#include "libcommon/utility/utility.h"

#include <log4cplus/fileappender.h>
#include <log4cplus/layout.h>

#include <iostream>

namespace FSC {

const log4cplus::tstring Log::instanceName = LOG4CPLUS_TEXT("Main");
const log4cplus::tstring Log::rfPattern = LOG4CPLUS_TEXT("%D{%Y-%m-%d %H:%M:%S:%q} [%-0.-1p] (%t) %b:%L - %m%n");

std::shared_ptr<Log> Log::_instance;

namespace {

log4cplus::LogLevel toLog4cplusLevel(const LogLevel logLevel) {
    switch (logLevel) {
        case LogLevel::Debug:
            return log4cplus::DEBUG_LOG_LEVEL;
        case LogLevel::Info:
            return log4cplus::INFO_LOG_LEVEL;
        case LogLevel::Warning:
            return log4cplus::WARN_LOG_LEVEL;
        case LogLevel::Error:
            return log4cplus::ERROR_LOG_LEVEL;
        case LogLevel::Fatal:
            return log4cplus::FATAL_LOG_LEVEL;
    }
    return log4cplus::INFO_LOG_LEVEL;
}

} // namespace

Log::~Log() {
    log4cplus::Logger::shutdown();
}

std::shared_ptr<Log> Log::instance(const log4cplus::tstring &filePath) {
    if (_instance || filePath.empty()) return _instance;

    try {
        _instance = std::shared_ptr<Log>(new Log(filePath));
    } catch (const std::exception &e) {
        // Nowhere else to report it
        std::cerr << "Unable to set up logging in " << LOG4CPLUS_TSTRING_TO_STRING(filePath) << ": " << e.what()
                  << std::endl;
    }
    return _instance;
}

bool Log::configure(const bool useLog, const LogLevel logLevel) {
    _logger.setLogLevel(useLog ? toLog4cplusLevel(logLevel) : log4cplus::OFF_LOG_LEVEL);
    return true;
}

Log::Log(const log4cplus::tstring &filePath) :
    _filePath(LOG4CPLUS_TSTRING_TO_STRING(filePath)) {
    if (_filePath.has_parent_path()) {
        std::error_code ec;
        (void) std::filesystem::create_directories(_filePath.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("cannot create " + _filePath.parent_path().string() + ": " + ec.message());
        }
    }

    log4cplus::SharedAppenderPtr appender(
            new log4cplus::RollingFileAppender(filePath, CommonUtility::logMaxSize, rfMaxBackupIdx, true, true));
    appender->setName(LOG4CPLUS_TEXT("RollingFileAppender"));
    appender->setLayout(std::make_unique<log4cplus::PatternLayout>(rfPattern));

    _logger = log4cplus::Logger::getInstance(instanceName);
    _logger.setLogLevel(log4cplus::TRACE_LOG_LEVEL);
    _logger.addAppender(appender);

    LOG_INFO(_logger, FS_APPLICATION_NAME << " " << FS_VERSION_STRING << " logging to " << _filePath.string());
}

} // namespace FSC
