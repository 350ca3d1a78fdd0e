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

#include "confirmuploadjob.h"
#include "chunkstorejson.h"
#include "jobs/network/networkjobsparams.h"
#include "libcommonserver/log/log.h"

#include <Poco/Net/HTTPRequest.h>

namespace FSC {

ConfirmUploadJob::ConfirmUploadJob(const std::string &apiUrl, const ConfirmRequest &request) :
    _apiUrl(apiUrl),
    _request(request) {
    _httpMethod = Poco::Net::HTTPRequest::HTTP_POST;
}

std::string ConfirmUploadJob::getUrl() {
    return _apiUrl + confirmEndpoint;
}

ExitInfo ConfirmUploadJob::setData() {
    _data = ChunkStoreJson::stringify(ChunkStoreJson::toJson(_request));
    return ExitCode::Ok;
}

std::string ConfirmUploadJob::getContentType() {
    return mimeTypeJson;
}

ExitInfo ConfirmUploadJob::handleResponse(std::istream &is) {
    if (const auto exitInfo = handleJsonResponse(is); !exitInfo) {
        return exitInfo;
    }
    return ChunkStoreJson::fromJson(jsonRes(), _result);
}

ExitInfo ConfirmUploadJob::handleError(const Poco::Net::HTTPResponse::HTTPStatus status, const std::string &replyBody) {
    if (status == Poco::Net::HTTPResponse::HTTP_CONFLICT) {
        LOG_WARN(_logger, "Confirmation of upload " << _request.uploadId << " rejected : " << replyBody);
        return {ExitCode::BackError, ExitCause::ConfirmRejected};
    }
    return AbstractNetworkJob::handleError(status, replyBody);
}

} // namespace FSC
