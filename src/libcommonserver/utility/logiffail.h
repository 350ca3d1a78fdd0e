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

#include "libcommonserver/log/log.h"

#include <log4cplus/loggingmacros.h>

#include <string>

namespace FSC {

inline void logCheckFailure(const log4cplus::Logger &logger, const char *condition, const char *file, const int line,
                            const std::string &message = {}) {
    LOG_FATAL(logger, "Check failed: \"" << condition << "\" at " << file << ":" << line
                                         << (message.empty() ? "" : " : ") << message);
}

} // namespace FSC

// Log, and report to Sentry, a condition that should never be false. Execution goes on.
// Expects a `_logger` in scope.
#define LOG_IF_FAIL(condition, ...)                                                                  \
    do {                                                                                             \
        if (!(condition)) {                                                                          \
            FSC::logCheckFailure(_logger, #condition, __FILE__, __LINE__ __VA_OPT__(, ) __VA_ARGS__); \
        }                                                                                            \
    } while (false)
