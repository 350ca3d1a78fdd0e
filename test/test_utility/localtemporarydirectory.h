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

#include <string>

namespace FSC {

//! Fresh directory below the system temporary directory, removed with its content on destruction.
class LocalTemporaryDirectory {
    public:
        /// @throw std::runtime_error
        explicit LocalTemporaryDirectory(const std::string &testName);
        ~LocalTemporaryDirectory();

        LocalTemporaryDirectory(const LocalTemporaryDirectory &) = delete;
        LocalTemporaryDirectory &operator=(const LocalTemporaryDirectory &) = delete;

        const SyncPath &path() const { return _path; }

    private:
        SyncPath _path;
};

} // namespace FSC
