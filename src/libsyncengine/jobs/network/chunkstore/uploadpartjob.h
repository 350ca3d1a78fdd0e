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

namespace FSC {

// Send the bytes of one part to its presigned location
class UploadPartJob : public AbstractNetworkJob {
    public:
        UploadPartJob(const TransferHandle &handle, const std::string &bytes);

        inline const UploadAck &ack() const { return _ack; }

    protected:
        ExitInfo handleResponse(std::istream &is) override;
        ExitInfo handleError(Poco::Net::HTTPResponse::HTTPStatus status, const std::string &replyBody) override;

    private:
        std::string getUrl() override;
        std::string getContentType() override;

        TransferHandle _handle;
        UploadAck _ack;
};

} // namespace FSC
