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

#include "appserver.h"
#include "libcommon/log/sentry/handler.h"
#include "libcommon/utility/utility.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/utility.h"
#include "libparms/parametersloader.h"
#include "libsyncengine/requests/parameterscache.h"
#include "libsyncengine/syncpal/syncpal.h"

#include <Poco/Util/HelpFormatter.h>
#include <Poco/Util/Option.h>
#include <Poco/Util/OptionCallback.h>

#include <log4cplus/loggingmacros.h>

#include <iostream>

namespace FSC {

void AppServer::defineOptions(Poco::Util::OptionSet &options) {
    ServerApplication::defineOptions(options);

    options.addOption(Poco::Util::Option("help", "h", "Display this help.").required(false).repeatable(false));
    options.addOption(Poco::Util::Option("config", "c", "Load the configuration from <file>.")
                              .required(false)
                              .repeatable(false)
                              .argument("file"));
    options.addOption(Poco::Util::Option("sync-dir", "s", "Synchronize the directory <dir>.")
                              .required(false)
                              .repeatable(false)
                              .argument("dir"));
    options.addOption(Poco::Util::Option("api-url", "a", "Use the chunk store API at <url>.")
                              .required(false)
                              .repeatable(false)
                              .argument("url"));
    options.addOption(Poco::Util::Option("once", "o", "Upload the local changes, run one sync round and exit.")
                              .required(false)
                              .repeatable(false));
}

void AppServer::handleOption(const std::string &name, const std::string &value) {
    ServerApplication::handleOption(name, value);

    if (name == "help") {
        _helpAsked = true;
        stopOptionsProcessing();
    } else if (name == "config") {
        _configPath = value;
    } else if (name == "sync-dir") {
        _syncDir = value;
    } else if (name == "api-url") {
        _apiUrl = value;
    } else if (name == "once") {
        _onceAsked = true;
    }
}

void AppServer::showHelp() const {
    Poco::Util::HelpFormatter helpFormatter(options());
    helpFormatter.setCommand(commandName());
    helpFormatter.setUsage("[OPTIONS]");
    helpFormatter.setHeader(std::string(FS_APPLICATION_NAME) + " " + FS_VERSION_STRING +
                            ", chunked file synchronization client.");
    helpFormatter.format(std::cout);
}

int AppServer::main(const std::vector<std::string> &) {
    if (_helpAsked) {
        showHelp();
        return EXIT_OK;
    }

    if (!initLogging()) {
        return EXIT_CANTCREAT;
    }

    Parameters parameters;
    if (!initParameters(parameters)) {
        return EXIT_CONFIG;
    }

    sentry::Handler::init(AppType::Server, parameters.sentryDsn());

    const int exitCode = _onceAsked ? runOnce(parameters) : runDaemon(parameters);
    LOG_INFO(Log::instance()->getLogger(), FS_APPLICATION_NAME << " stopped with exit code " << exitCode);
    return exitCode;
}

bool AppServer::initLogging() {
    const SyncPath logFilePath = CommonUtility::getAppSupportDir() / "logs" / (std::string(FS_APPLICATION_NAME) + ".log");
    try {
        (void) Log::instance(logFilePath.string());
    } catch (const std::runtime_error &e) {
        std::cerr << "Unable to initialize the logger: " << e.what() << std::endl;
        return false;
    }

    LOG_INFO(Log::instance()->getLogger(), FS_APPLICATION_NAME << " " << FS_VERSION_STRING << " starting");
    return true;
}

bool AppServer::initParameters(Parameters &parameters) {
    const log4cplus::Logger logger = Log::instance()->getLogger();

    const SyncPath configPath = _configPath.empty() ? ParametersLoader::defaultConfigPath() : _configPath;
    if (const auto exitInfo = ParametersLoader::load(configPath, parameters); !exitInfo) {
        if (exitInfo.cause() != ExitCause::NotFound || !_configPath.empty()) {
            LOG_ERROR(logger, "Unable to load the configuration " << Utility::formatSyncPath(configPath) << " : " << exitInfo);
            std::cerr << "Unable to load the configuration " << configPath << std::endl;
            return false;
        }
        LOG_INFO(logger, "No configuration file, default parameters used");
    }

    if (const auto exitInfo = ParametersLoader::applyEnvironment(parameters); !exitInfo) {
        LOG_ERROR(logger, "Invalid environment override : " << exitInfo);
        std::cerr << "Invalid environment override" << std::endl;
        return false;
    }

    // The command line wins over the file and the environment
    if (!_syncDir.empty()) parameters.setSyncDir(_syncDir);
    if (!_apiUrl.empty()) parameters.setApiUrl(_apiUrl);

    ParametersCache::instance()->setParameters(parameters);

    LOG_INFO(logger, "Sync directory: " << Utility::formatSyncPath(parameters.syncDir()) << ", API: " << parameters.apiUrl()
                                        << ", chunk size: " << parameters.chunkSize());
    return true;
}

int AppServer::runOnce(Parameters &parameters) {
    SyncPal syncPal(parameters.syncDir(), parameters.dbPath(), parameters.cacheDir(), parameters.apiUrl());
    if (const auto exitInfo = syncPal.init(); !exitInfo) {
        LOG_ERROR(Log::instance()->getLogger(), "Error in SyncPal::init : " << exitInfo);
        return EXIT_SOFTWARE;
    }

    RoundReport report;
    if (const auto exitInfo = syncPal.syncOnce(report); !exitInfo) {
        LOG_ERROR(Log::instance()->getLogger(), "Sync failed : " << exitInfo);
        std::cerr << "Sync failed, " << report.failedPaths.size() << " files not reconciled" << std::endl;
        return EXIT_TEMPFAIL;
    }

    std::cout << "Sync done: " << report.reconciledFiles << " files reconciled, " << report.downloadedChunks
              << " chunks downloaded" << std::endl;
    return EXIT_OK;
}

int AppServer::runDaemon(Parameters &parameters) {
    SyncPal syncPal(parameters.syncDir(), parameters.dbPath(), parameters.cacheDir(), parameters.apiUrl());
    if (const auto exitInfo = syncPal.init(); !exitInfo) {
        LOG_ERROR(Log::instance()->getLogger(), "Error in SyncPal::init : " << exitInfo);
        return EXIT_SOFTWARE;
    }

    if (const auto exitInfo = syncPal.start(); !exitInfo) {
        LOG_ERROR(Log::instance()->getLogger(), "Error in SyncPal::start : " << exitInfo);
        return EXIT_SOFTWARE;
    }

    waitForTerminationRequest();
    syncPal.stop();
    return EXIT_OK;
}

} // namespace FSC
