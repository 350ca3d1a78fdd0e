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

#include "parametersloader.h"
#include "libcommon/utility/utility.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/jsonparserutility.h"
#include "libcommonserver/utility/utility.h"

#include <Poco/Exception.h>
#include <Poco/JSON/Parser.h>
#include <Poco/NumberParser.h>

#include <fstream>
#include <sstream>

#define CONFIG_FILE_NAME "firesync.json"

static const std::string syncDirKey = "syncDir";
static const std::string cacheDirKey = "cacheDir";
static const std::string dbPathKey = "dbPath";
static const std::string apiUrlKey = "apiUrl";
static const std::string chunkSizeKey = "chunkSize";
static const std::string syncIntervalSecKey = "syncIntervalSec";
static const std::string requestTimeoutSecKey = "requestTimeoutSec";
static const std::string maxRetriesKey = "maxRetries";
static const std::string retryBackoffMsKey = "retryBackoffMs";
static const std::string maxConfirmAttemptsKey = "maxConfirmAttempts";
static const std::string confirmBackoffMsKey = "confirmBackoffMs";
static const std::string maxRenegotiationsKey = "maxRenegotiations";
static const std::string maxIntegrityRetriesKey = "maxIntegrityRetries";
static const std::string transferParallelJobsKey = "transferParallelJobs";
static const std::string useLogKey = "useLog";
static const std::string logLevelKey = "logLevel";
static const std::string extendedLogKey = "extendedLog";
static const std::string sentryDsnKey = "sentryDsn";

namespace FSC {

namespace {

template<typename T, typename Setter>
bool readOptional(const Poco::JSON::Object::Ptr obj, const std::string &key, Setter setter) {
    if (!obj->has(key) || obj->isNull(key)) return true;

    T value;
    if (!JsonParserUtility::extractValue(obj, key, value)) {
        return false;
    }
    setter(value);
    return true;
}

bool parseInt(const std::string &str, int &value) {
    return Poco::NumberParser::tryParse(str, value);
}

} // namespace

log4cplus::Logger ParametersLoader::logger() {
    return Log::isSet() ? Log::instance()->getLogger() : log4cplus::Logger::getInstance(Log::instanceName);
}

SyncPath ParametersLoader::defaultConfigPath() {
    return CommonUtility::getAppSupportDir() / CONFIG_FILE_NAME;
}

bool ParametersLoader::logLevelFromString(const std::string &str, LogLevel &logLevel) {
    const std::string lowerStr = CommonUtility::toLower(str);
    for (const auto level: {LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error, LogLevel::Fatal}) {
        if (CommonUtility::toLower(toString(level)) == lowerStr) {
            logLevel = level;
            return true;
        }
    }

    int value = 0;
    if (parseInt(str, value) && value >= enumClassToInt(LogLevel::Debug) && value <= enumClassToInt(LogLevel::Fatal)) {
        logLevel = intToEnumClass<LogLevel>(value);
        return true;
    }

    return false;
}

ExitInfo ParametersLoader::load(const SyncPath &path, Parameters &parameters) {
    std::ifstream is(path);
    if (!is.is_open()) {
        bool exists = false;
        std::error_code ec;
        exists = std::filesystem::exists(path, ec);
        if (!exists && !ec) {
            LOG_DEBUG(logger(), "Configuration file not found " << Utility::formatSyncPath(path));
            return {ExitCode::SystemError, ExitCause::NotFound};
        }
        LOG_WARN(logger(), "Unable to open configuration file " << Utility::formatSyncPath(path));
        return {ExitCode::SystemError, ExitCause::FileAccessError};
    }

    Poco::JSON::Object::Ptr obj;
    try {
        Poco::JSON::Parser parser;
        obj = parser.parse(is).extract<Poco::JSON::Object::Ptr>();
    } catch (const Poco::Exception &e) {
        LOG_WARN(logger(), "Invalid configuration file " << Utility::formatSyncPath(path) << " : " << e.displayText());
        return {ExitCode::DataError, ExitCause::InvalidArgument};
    }

    if (!obj) {
        LOG_WARN(logger(), "Configuration file " << Utility::formatSyncPath(path) << " is not a JSON object");
        return {ExitCode::DataError, ExitCause::InvalidArgument};
    }

    if (const ExitInfo exitInfo = fromJson(obj, parameters); !exitInfo) {
        LOG_WARN(logger(), "Error in ParametersLoader::fromJson for " << Utility::formatSyncPath(path) << " : " << exitInfo);
        return exitInfo;
    }

    LOG_INFO(logger(), "Configuration loaded from " << Utility::formatSyncPath(path));
    return ExitCode::Ok;
}

ExitInfo ParametersLoader::save(const SyncPath &path, const Parameters &parameters) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            LOG_WARN(logger(), "Unable to create configuration directory: " << Utility::formatStdError(path.parent_path(), ec));
            return {ExitCode::SystemError, ExitCause::FileAccessError};
        }
    }

    std::ofstream os(path, std::ios::trunc);
    if (!os.is_open()) {
        LOG_WARN(logger(), "Unable to write configuration file " << Utility::formatSyncPath(path));
        return {ExitCode::SystemError, ExitCause::FileAccessError};
    }

    toJson(parameters)->stringify(os, 4);
    os.close();
    if (os.fail()) {
        LOG_WARN(logger(), "Error while writing configuration file " << Utility::formatSyncPath(path));
        return {ExitCode::SystemError, ExitCause::FileAccessError};
    }

    return ExitCode::Ok;
}

ExitInfo ParametersLoader::applyEnvironment(Parameters &parameters) {
    bool isSet = false;
    std::string value = CommonUtility::envVarValue("FIRESYNC_SYNC_DIR", isSet);
    if (isSet && !value.empty()) parameters.setSyncDir(value);

    value = CommonUtility::envVarValue("FIRESYNC_CACHE_DIR", isSet);
    if (isSet && !value.empty()) parameters.setCacheDir(value);

    value = CommonUtility::envVarValue("FIRESYNC_DB_PATH", isSet);
    if (isSet && !value.empty()) parameters.setDbPath(value);

    value = CommonUtility::envVarValue("FIRESYNC_API_URL", isSet);
    if (isSet && !value.empty()) parameters.setApiUrl(value);

    value = CommonUtility::envVarValue("FIRESYNC_CHUNK_SIZE", isSet);
    if (isSet) {
        Poco::UInt64 chunkSize = 0;
        if (!Poco::NumberParser::tryParseUnsigned64(value, chunkSize) || chunkSize == 0) {
            LOG_WARN(logger(), "Invalid FIRESYNC_CHUNK_SIZE value: " << value);
            return {ExitCode::DataError, ExitCause::InvalidArgument};
        }
        parameters.setChunkSize(chunkSize);
    }

    value = CommonUtility::envVarValue("FIRESYNC_SYNC_INTERVAL", isSet);
    if (isSet) {
        int interval = 0;
        if (!parseInt(value, interval) || interval <= 0) {
            LOG_WARN(logger(), "Invalid FIRESYNC_SYNC_INTERVAL value: " << value);
            return {ExitCode::DataError, ExitCause::InvalidArgument};
        }
        parameters.setSyncIntervalSec(interval);
    }

    value = CommonUtility::envVarValue("FIRESYNC_REQUEST_TIMEOUT", isSet);
    if (isSet) {
        int timeout = 0;
        if (!parseInt(value, timeout) || timeout <= 0) {
            LOG_WARN(logger(), "Invalid FIRESYNC_REQUEST_TIMEOUT value: " << value);
            return {ExitCode::DataError, ExitCause::InvalidArgument};
        }
        parameters.setRequestTimeoutSec(timeout);
    }

    value = CommonUtility::envVarValue("FIRESYNC_MAX_RETRIES", isSet);
    if (isSet) {
        int retries = 0;
        if (!parseInt(value, retries) || retries < 1) {
            LOG_WARN(logger(), "Invalid FIRESYNC_MAX_RETRIES value: " << value);
            return {ExitCode::DataError, ExitCause::InvalidArgument};
        }
        parameters.setMaxRetries(retries);
    }

    value = CommonUtility::envVarValue("FIRESYNC_LOG_LEVEL", isSet);
    if (isSet) {
        LogLevel logLevel = LogLevel::Info;
        if (!logLevelFromString(value, logLevel)) {
            LOG_WARN(logger(), "Invalid FIRESYNC_LOG_LEVEL value: " << value);
            return {ExitCode::DataError, ExitCause::InvalidArgument};
        }
        parameters.setLogLevel(logLevel);
    }

    value = CommonUtility::envVarValue("FIRESYNC_SENTRY_DSN", isSet);
    if (isSet) parameters.setSentryDsn(value);

    return ExitCode::Ok;
}

ExitInfo ParametersLoader::fromJson(const Poco::JSON::Object::Ptr obj, Parameters &parameters) {
    bool ok = true;
    ok &= readOptional<std::string>(obj, syncDirKey, [&](const std::string &v) { parameters.setSyncDir(v); });
    ok &= readOptional<std::string>(obj, cacheDirKey, [&](const std::string &v) { parameters.setCacheDir(v); });
    ok &= readOptional<std::string>(obj, dbPathKey, [&](const std::string &v) { parameters.setDbPath(v); });
    ok &= readOptional<std::string>(obj, apiUrlKey, [&](const std::string &v) { parameters.setApiUrl(v); });
    ok &= readOptional<Poco::UInt64>(obj, chunkSizeKey, [&](Poco::UInt64 v) { parameters.setChunkSize(v); });
    ok &= readOptional<int>(obj, syncIntervalSecKey, [&](int v) { parameters.setSyncIntervalSec(v); });
    ok &= readOptional<int>(obj, requestTimeoutSecKey, [&](int v) { parameters.setRequestTimeoutSec(v); });
    ok &= readOptional<int>(obj, maxRetriesKey, [&](int v) { parameters.setMaxRetries(v); });
    ok &= readOptional<int>(obj, retryBackoffMsKey, [&](int v) { parameters.setRetryBackoffMs(v); });
    ok &= readOptional<int>(obj, maxConfirmAttemptsKey, [&](int v) { parameters.setMaxConfirmAttempts(v); });
    ok &= readOptional<int>(obj, confirmBackoffMsKey, [&](int v) { parameters.setConfirmBackoffMs(v); });
    ok &= readOptional<int>(obj, maxRenegotiationsKey, [&](int v) { parameters.setMaxRenegotiations(v); });
    ok &= readOptional<int>(obj, maxIntegrityRetriesKey, [&](int v) { parameters.setMaxIntegrityRetries(v); });
    ok &= readOptional<int>(obj, transferParallelJobsKey, [&](int v) { parameters.setTransferParallelJobs(v); });
    ok &= readOptional<bool>(obj, useLogKey, [&](bool v) { parameters.setUseLog(v); });
    ok &= readOptional<bool>(obj, extendedLogKey, [&](bool v) { parameters.setExtendedLog(v); });
    ok &= readOptional<std::string>(obj, sentryDsnKey, [&](const std::string &v) { parameters.setSentryDsn(v); });

    std::string logLevelStr;
    if (obj->has(logLevelKey) && !obj->isNull(logLevelKey)) {
        LogLevel logLevel = LogLevel::Info;
        if (!JsonParserUtility::extractValue(obj, logLevelKey, logLevelStr) || !logLevelFromString(logLevelStr, logLevel)) {
            LOG_WARN(logger(), "Invalid log level: " << logLevelStr);
            ok = false;
        } else {
            parameters.setLogLevel(logLevel);
        }
    }

    if (!ok) {
        return {ExitCode::DataError, ExitCause::InvalidArgument};
    }

    if (parameters.chunkSize() == 0) {
        LOG_WARN(logger(), "Chunk size must be positive");
        return {ExitCode::DataError, ExitCause::InvalidArgument};
    }

    return ExitCode::Ok;
}

Poco::JSON::Object::Ptr ParametersLoader::toJson(const Parameters &parameters) {
    Poco::JSON::Object::Ptr obj = new Poco::JSON::Object(Poco::JSON_PRESERVE_KEY_ORDER);
    obj->set(syncDirKey, parameters.syncDir().string());
    obj->set(cacheDirKey, parameters.cacheDir().string());
    obj->set(dbPathKey, parameters.dbPath().string());
    obj->set(apiUrlKey, parameters.apiUrl());
    obj->set(chunkSizeKey, static_cast<Poco::UInt64>(parameters.chunkSize()));
    obj->set(syncIntervalSecKey, parameters.syncIntervalSec());
    obj->set(requestTimeoutSecKey, parameters.requestTimeoutSec());
    obj->set(maxRetriesKey, parameters.maxRetries());
    obj->set(retryBackoffMsKey, parameters.retryBackoffMs());
    obj->set(maxConfirmAttemptsKey, parameters.maxConfirmAttempts());
    obj->set(confirmBackoffMsKey, parameters.confirmBackoffMs());
    obj->set(maxRenegotiationsKey, parameters.maxRenegotiations());
    obj->set(maxIntegrityRetriesKey, parameters.maxIntegrityRetries());
    obj->set(transferParallelJobsKey, parameters.transferParallelJobs());
    obj->set(useLogKey, parameters.useLog());
    obj->set(logLevelKey, toString(parameters.logLevel()));
    obj->set(extendedLogKey, parameters.extendedLog());
    obj->set(sentryDsnKey, parameters.sentryDsn());
    return obj;
}

} // namespace FSC
