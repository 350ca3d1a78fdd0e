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

#include <optional>
#include <string>

namespace FSC {

/**
 * Position up to which remote changes have been durably reconciled.
 * The token is an exact prior server timestamp and is sent back verbatim, the parsed time is only used for ordering.
 */
struct SyncCursor {
        std::optional<std::string> lastSyncTime;
        SyncTime lastSyncTimeUs = 0;

        inline bool isSet() const { return lastSyncTime.has_value(); }

        // Build a cursor from a server issued timestamp. Return false if the timestamp cannot be parsed.
        static bool fromServerTime(const std::string &serverTime, SyncCursor &cursor);

        // True if this cursor designates an earlier point than other. An unset cursor precedes any set cursor.
        bool isBefore(const SyncCursor &other) const;

        bool operator==(const SyncCursor &other) const = default;
};

} // namespace FSC
