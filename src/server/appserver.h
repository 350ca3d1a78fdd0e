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

#include "libparms/parameters.h"

#include <Poco/Util/OptionSet.h>
#include <Poco/Util/ServerApplication.h>

#include <string>
#include <vector>

namespace FSC {

class AppServer : public Poco::Util::ServerApplication {
    public:
        AppServer() = default;

        inline bool helpAsked() const { return _helpAsked; }
        inline bool onceAsked() const { return _onceAsked; }

    protected:
        void defineOptions(Poco::Util::OptionSet &options) override;
        void handleOption(const std::string &name, const std::string &value) override;
        int main(const std::vector<std::string> &args) override;

    private:
        bool initLogging();
        bool initParameters(Parameters &parameters);
        void showHelp() const;
        int runOnce(Parameters &parameters);
        int runDaemon(Parameters &parameters);

        SyncPath _configPath;
        SyncPath _syncDir;
        std::string _apiUrl;
        bool _helpAsked = false;
        bool _onceAsked = false;
};

} // namespace FSC
