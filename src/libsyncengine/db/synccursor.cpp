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

#include "synccursor.h"
#include "libcommonserver/utility/utility.h"

namespace FSC {

bool SyncCursor::fromServerTime(const std::string &serverTime, SyncCursor &cursor) {
    SyncTime time = 0;
    if (!Utility::isoTimeToSyncTime(serverTime, time)) {
        return false;
    }

    cursor.lastSyncTime = serverTime;
    cursor.lastSyncTimeUs = time;
    return true;
}

bool SyncCursor::isBefore(const SyncCursor &other) const {
    if (!other.isSet()) return false;
    if (!isSet()) return true;
    return lastSyncTimeUs < other.lastSyncTimeUs;
}

} // namespace FSC
