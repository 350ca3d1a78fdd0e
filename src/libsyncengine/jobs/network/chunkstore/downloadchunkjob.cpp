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

#include "downloadchunkjob.h"
#include "jobs/network/networkjobsparams.h"
#include "libcommonserver/log/log.h"

#include <Poco/Net/HTTPRequest.h>

namespace FSC {

DownloadChunkJob::DownloadChunkJob(const std::string &apiUrl, const ChunkLocator &locator) :
    _apiUrl(apiUrl),
    _locator(locator) {
    _httpMethod = Poco::Net::HTTPRequest::HTTP_GET;
}

std::string DownloadChunkJob::getUrl() {
    if (!_locator.url.empty()) {
        return _locator.url;
    }
    return _apiUrl + chunksEndpoint + "/" + _locator.fingerprint;
}

ExitInfo DownloadChunkJob::handleResponse(std::istream &is) {
    return handleOctetStreamResponse(is);
}

ExitInfo DownloadChunkJob::handleError(const Poco::Net::HTTPResponse::HTTPStatus status, const std::string &replyBody) {
    if (!_locator.url.empty() &&
        (status == Poco::Net::HTTPResponse::HTTP_FORBIDDEN || status == Poco::Net::HTTPResponse::HTTP_GONE)) {
        LOG_INFO(_logger, "Download location of chunk " << _locator.fingerprint << " expired");
        return {ExitCode::BackError, ExitCause::TransferHandleExpired};
    }
    return AbstractNetworkJob::handleError(status, replyBody);
}

} // namespace FSC
