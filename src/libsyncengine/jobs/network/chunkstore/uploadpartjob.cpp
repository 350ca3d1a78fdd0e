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

#include "uploadpartjob.h"
#include "jobs/network/networkjobsparams.h"
#include "libcommonserver/log/log.h"

#include <Poco/Net/HTTPRequest.h>

namespace FSC {

UploadPartJob::UploadPartJob(const TransferHandle &handle, const std::string &bytes) :
    _handle(handle) {
    _httpMethod = Poco::Net::HTTPRequest::HTTP_PUT;
    _data = bytes;
}

std::string UploadPartJob::getUrl() {
    return _handle.url;
}

std::string UploadPartJob::getContentType() {
    return mimeTypeOctetStream;
}

ExitInfo UploadPartJob::handleResponse(std::istream &is) {
    (void) readBody(is);

    _ack.etag = httpResponse().get(etagHeader, "");
    if (_ack.etag.empty()) {
        LOG_WARN(_logger, "No ETag received for part " << _handle.partNumber << " of upload " << _handle.uploadId);
    }
    return ExitCode::Ok;
}

ExitInfo UploadPartJob::handleError(const Poco::Net::HTTPResponse::HTTPStatus status, const std::string &replyBody) {
    if (status == Poco::Net::HTTPResponse::HTTP_FORBIDDEN || status == Poco::Net::HTTPResponse::HTTP_GONE) {
        LOG_INFO(_logger, "Transfer handle of part " << _handle.partNumber << " of upload " << _handle.uploadId
                                                     << " expired");
        return {ExitCode::BackError, ExitCause::TransferHandleExpired};
    }
    return AbstractNetworkJob::handleError(status, replyBody);
}

} // namespace FSC
