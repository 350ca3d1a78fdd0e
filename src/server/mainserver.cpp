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

#include <Poco/Exception.h>

#include <sys/resource.h>

#include <algorithm>
#include <cerrno>
#include <iostream>

namespace {

constexpr rlim_t wantedOpenFiles = 0x100000;

// One inotify watch per folder and one socket per transfer job
void raiseOpenFilesLimit() {
    rlimit limit{};
    if (getrlimit(RLIMIT_NOFILE, &limit) != 0 || limit.rlim_cur >= wantedOpenFiles) return;

    limit.rlim_cur = std::min(wantedOpenFiles, limit.rlim_max);
    if (setrlimit(RLIMIT_NOFILE, &limit) != 0) {
        std::cerr << "setrlimit(RLIMIT_NOFILE) failed, errno=" << errno << std::endl;
    }
}

} // namespace

int main(int argc, char **argv) {
    raiseOpenFilesLimit();

    FSC::AppServer app;
    try {
        return app.run(argc, argv);
    } catch (const Poco::Exception &e) {
        std::cerr << FS_APPLICATION_NAME << " error: " << e.displayText() << std::endl;
        return Poco::Util::Application::EXIT_SOFTWARE;
    } catch (const std::exception &e) {
        std::cerr << FS_APPLICATION_NAME << " error: " << e.what() << std::endl;
        return Poco::Util::Application::EXIT_SOFTWARE;
    }
}
