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

#include "negotiateuploadjob.h"
#include "chunkstorejson.h"
#include "jobs/network/networkjobsparams.h"
#include "libcommonserver/log/log.h"

#include <Poco/Net/HTTPRequest.h>

namespace FSC {

NegotiateUploadJob::NegotiateUploadJob(const std::string &apiUrl, const NegotiationRequest &request) :
    _apiUrl(apiUrl),
    _request(request) {
    _httpMethod = Poco::Net::HTTPRequest::HTTP_POST;
}

std::string NegotiateUploadJob::getUrl() {
    return _apiUrl + negotiateEndpoint;
}

ExitInfo NegotiateUploadJob::setData() {
    _data = ChunkStoreJson::stringify(ChunkStoreJson::toJson(_request));
    return ExitCode::Ok;
}

std::string NegotiateUploadJob::getContentType() {
    return mimeTypeJson;
}

ExitInfo NegotiateUploadJob::handleResponse(std::istream &is) {
    if (const auto exitInfo = handleJsonResponse(is); !exitInfo) {
        return exitInfo;
    }
    return ChunkStoreJson::fromJson(jsonRes(), _plan);
}

ExitInfo NegotiateUploadJob::handleError(const Poco::Net::HTTPResponse::HTTPStatus status, const std::string &replyBody) {
    if (status == Poco::Net::HTTPResponse::HTTP_CONFLICT) {
        LOG_WARN(_logger, "Negotiation conflict for file " << _request.filePath << " : " << replyBody);
        return {ExitCode::BackError, ExitCause::NegotiationConflict};
    }
    return AbstractNetworkJob::handleError(status, replyBody);
}

} // namespace FSC
