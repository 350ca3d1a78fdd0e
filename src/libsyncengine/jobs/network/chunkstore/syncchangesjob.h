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

#include "jobs/network/abstractnetworkjob.h"
#include "chunkstore/chunkstoretypes.h"
#include "db/synccursor.h"

namespace FSC {

// Poll the files having chunks created after the cursor
class SyncChangesJob : public AbstractNetworkJob {
    public:
        SyncChangesJob(const std::string &apiUrl, const SyncCursor &cursor);

        inline const SyncDelta &delta() const { return _delta; }

    protected:
        ExitInfo handleResponse(std::istream &is) override;

    private:
        std::string getUrl() override;
        ExitInfo setData() override;
        std::string getContentType() override;

        std::string _apiUrl;
        SyncCursor _cursor;
        SyncDelta _delta;
};

} // namespace FSC
