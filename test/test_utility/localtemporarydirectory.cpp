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
#include "localtemporarydirectory.h"

#include <stdlib.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace FSC {

LocalTemporaryDirectory::LocalTemporaryDirectory(const std::string &testName) {
    std::string pattern = (std::filesystem::temp_directory_path() / ("firesync_" + testName + "_XXXXXX")).string();
    if (!mkdtemp(pattern.data())) {
        throw std::runtime_error("mkdtemp failed for " + pattern + " : " + strerror(errno));
    }
    _path = std::filesystem::canonical(pattern);
}

LocalTemporaryDirectory::~LocalTemporaryDirectory() {
    std::error_code ec;
    (void) std::filesystem::remove_all(_path, ec);
    if (ec) std::cerr << "Unable to remove " << _path << " : " << ec.message() << std::endl;
}

} // namespace FSC
