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

#include <sentry.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace FSC {
namespace sentry {

// Kept out of types.h so that sentry.h stays out of it
enum class Level {
    Debug = SENTRY_LEVEL_DEBUG,
    Info = SENTRY_LEVEL_INFO,
    Warning = SENTRY_LEVEL_WARNING,
    Error = SENTRY_LEVEL_ERROR,
    Fatal = SENTRY_LEVEL_FATAL
};

} // namespace sentry

std::string toString(sentry::Level level);

namespace sentry {

class Handler {
    public:
        virtual ~Handler();
        static std::shared_ptr<Handler> instance();

        //! Sentry stays off, and every call below is a no-op, with an empty DSN or AppType::None.
        static void init(AppType appType, const std::string &dsn, int breadCrumbsSize = 100);

        /*!
         * Report a message. Identical messages are rate limited: once one has been seen `maxCapturesBeforeRateLimit`
         * times within `captureWindow`, it is uploaded at most once per `rateLimitedUploadInterval`, escalated to Error.
         */
        static void captureMessage(Level level, const std::string &title, const std::string &message) {
            instance()->capture(level, title, message);
        }

        static void addBreadcrumb(Level level, const std::string &message);

        static AppType appType() { return _appType; }
        [[nodiscard]] bool isSentryActivated() const { return _isSentryActivated; }

        static constexpr unsigned int maxCapturesBeforeRateLimit = 10;
        static constexpr std::chrono::minutes captureWindow{10};
        static constexpr std::chrono::seconds rateLimitedUploadInterval{60};

    protected:
        Handler() = default;
        virtual void sendEventToSentry(Level level, const std::string &title, const std::string &message) const;

    private:
        struct EventRecord {
                std::chrono::system_clock::time_point lastCapture;
                std::chrono::system_clock::time_point lastUpload;
                unsigned int captureCount = 0;
        };

        Handler(const Handler &) = delete;
        Handler &operator=(const Handler &) = delete;

        void capture(Level level, const std::string &title, std::string message);
        //! Update the record of this event and tell whether it should go out now.
        bool admit(const std::string &key, Level &level, std::string &message);

        static std::shared_ptr<Handler> _instance;
        static AppType _appType;

        bool _isSentryActivated = false;
        std::mutex _mutex;
        std::unordered_map<std::string, EventRecord> _events;
};

} // namespace sentry
} // namespace FSC
