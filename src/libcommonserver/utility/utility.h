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
#include <system_error>

namespace FSC {

struct Utility {
        static void msleep(int msec);

        static std::string formatStdError(const std::error_code &ec);
        static std::string formatStdError(const SyncPath &path, const std::error_code &ec);
        static std::string formatIoError(IoError ioError);
        static std::string formatIoError(const SyncPath &path, IoError ioError);
        static std::string formatSyncPath(const SyncPath &path);

        //! Parse an ISO-8601 timestamp issued by the server.
        /*!
          \param isoTime is the timestamp string, e.g. "2024-05-02T10:11:12.123456Z" or "2024-05-02T10:11:12+00:00".
          \param time is set with the number of microseconds since epoch (UTC).
          \return true if the string could be parsed, false otherwise.
        */
        static bool isoTimeToSyncTime(const std::string &isoTime, SyncTime &time);
        static std::string syncTimeToIsoTime(SyncTime time);
        static SyncTime currentSyncTime();

        // Random (version 4) UUID, used as identifier of the entities created locally
        static std::string generateUuid();

        // Convert a canonical item path ("/a/b.txt") into a location below the sync root and back
        static SyncPath toLocalPath(const SyncPath &syncRoot, const std::string &itemPath);
        static std::string toItemPath(const SyncPath &syncRoot, const SyncPath &localPath);
        static std::string parentItemPath(const std::string &itemPath);
        static std::string itemName(const std::string &itemPath);
        static std::string fileTypeFromName(const std::string &fileName);
};

} // namespace FSC
