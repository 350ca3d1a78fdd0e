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

#include "types.h"

#include <string>

namespace FSC {

struct CommonUtility {
        static constexpr int logMaxSize = 500 * 1024 * 1024;

        static std::string generateRandomStringAlphaNum(int length = 10);

        //! "FireSync / <version> (<system> <release>)", sent with every request.
        static const std::string &userAgentString();
        static const std::string &currentVersion();

        static std::string toLower(const std::string &str);
        static bool startsWith(const std::string &str, const std::string &prefix);
        static bool endsWith(const std::string &str, const std::string &suffix);

        //! ~/.config/FireSync, created on first use. Empty if it cannot be created.
        static SyncPath getAppSupportDir();

        static std::string envVarValue(const std::string &name);
        static std::string envVarValue(const std::string &name, bool &isSet);
};

} // namespace FSC
