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
#include "handler.h"
#include "libcommon/utility/utility.h"

#include <climits>
#include <iostream>

namespace FSC {

std::string toString(const sentry::Level level) {
    switch (level) {
        case sentry::Level::Debug:
            return "debug";
        case sentry::Level::Info:
            return "info";
        case sentry::Level::Warning:
            return "warning";
        case sentry::Level::Error:
            return "error";
        case sentry::Level::Fatal:
            return "fatal";
    }
    return "unknown";
}

namespace sentry {

std::shared_ptr<Handler> Handler::_instance;
AppType Handler::_appType = AppType::None;

Handler::~Handler() {
    if (_isSentryActivated) sentry_close();
}

std::shared_ptr<Handler> Handler::instance() {
    if (!_instance) {
        // Never initialised: a deactivated handler
        _instance = std::shared_ptr<Handler>(new Handler());
    }
    return _instance;
}

void Handler::init(const AppType appType, const std::string &dsn, const int breadCrumbsSize) {
    if (_instance && _instance->_isSentryActivated) return;

    _instance = std::shared_ptr<Handler>(new Handler());
    _appType = appType;
    if (appType == AppType::None || dsn.empty()) return;

    sentry_options_t *options = sentry_options_new();
    sentry_options_set_dsn(options, dsn.c_str());

    const SyncPath databasePath =
            CommonUtility::getAppSupportDir() / (appType == AppType::Test ? ".sentry-native-test" : ".sentry-native");
    sentry_options_set_database_path(options, databasePath.c_str());
    sentry_options_set_release(options, FS_APPLICATION_NAME "@" FS_VERSION_STRING);
    sentry_options_set_max_breadcrumbs(options, static_cast<size_t>(breadCrumbsSize));

    bool isSet = false;
    const std::string environment = CommonUtility::envVarValue("FIRESYNC_SENTRY_ENVIRONMENT", isSet);
#ifdef NDEBUG
    const std::string defaultEnvironment = "production";
#else
    const std::string defaultEnvironment = "dev";
#endif
    // Custom environments are prefixed so that they can never pass for production
    sentry_options_set_environment(options, isSet ? ("dev_" + environment).c_str() : defaultEnvironment.c_str());

    if (const int res = sentry_init(options); res != 0) {
        std::cerr << "sentry_init failed with " << res << std::endl;
        return;
    }
    _instance->_isSentryActivated = true;
}

void Handler::addBreadcrumb(const Level level, const std::string &message) {
    if (!instance()->_isSentryActivated) return;

    sentry_value_t crumb = sentry_value_new_breadcrumb(nullptr, message.c_str());
    sentry_value_set_by_key(crumb, "level", sentry_value_new_string(toString(level).c_str()));
    sentry_add_breadcrumb(crumb);
}

void Handler::capture(Level level, const std::string &title, std::string message) {
    if (!_isSentryActivated) return;

    if (!admit(title + '\n' + message + '\n' + toString(level), level, message)) return;
    sendEventToSentry(level, title, message);
}

void Handler::sendEventToSentry(const Level level, const std::string &title, const std::string &message) const {
    sentry_capture_event(sentry_value_new_message_event(static_cast<sentry_level_t>(level), title.c_str(), message.c_str()));
}

bool Handler::admit(const std::string &key, Level &level, std::string &message) {
    const auto now = std::chrono::system_clock::now();
    const std::scoped_lock lock(_mutex);

    EventRecord &record = _events[key];
    if (record.captureCount == 0 || record.lastCapture + captureWindow <= now) {
        // First sighting, or quiet for long enough to start over
        record = EventRecord{now, now, 1};
        return true;
    }

    record.lastCapture = now;
    if (record.captureCount < UINT_MAX) ++record.captureCount;
    if (record.captureCount < maxCapturesBeforeRateLimit) {
        record.lastUpload = now;
        return true;
    }

    if (record.captureCount > maxCapturesBeforeRateLimit && record.lastUpload + rateLimitedUploadInterval > now) {
        return false;
    }

    record.lastUpload = now;
    message += " (rate limited after " + std::to_string(record.captureCount) + " captures";
    if (level != Level::Error && level != Level::Fatal) {
        message += ", escalated from " + toString(level);
        level = Level::Error;
    }
    message += ")";
    return true;
}

} // namespace sentry
} // namespace FSC
