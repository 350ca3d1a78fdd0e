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

#include "parameters.h"

#include <Poco/JSON/Object.h>

#include <log4cplus/logger.h>

namespace FSC {

/**
 * Reads and writes the JSON configuration file, and applies the FIRESYNC_* environment overrides.
 * Keys missing from the file keep their current value, unknown keys are ignored.
 */
class ParametersLoader {
    public:
        static ExitInfo load(const SyncPath &path, Parameters &parameters);
        static ExitInfo save(const SyncPath &path, const Parameters &parameters);
        static ExitInfo applyEnvironment(Parameters &parameters);

        static SyncPath defaultConfigPath();

        static bool logLevelFromString(const std::string &str, LogLevel &logLevel);

    private:
        static ExitInfo fromJson(const Poco::JSON::Object::Ptr obj, Parameters &parameters);
        static Poco::JSON::Object::Ptr toJson(const Parameters &parameters);

        static log4cplus::Logger logger();
};

} // namespace FSC
