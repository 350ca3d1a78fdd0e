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

#include "createfolderjob.h"
#include "chunkstorejson.h"
#include "jobs/network/networkjobsparams.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/jsonparserutility.h"

#include <Poco/Net/HTTPRequest.h>

namespace FSC {

CreateFolderJob::CreateFolderJob(const std::string &apiUrl, const DbFolder &folder) :
    _apiUrl(apiUrl),
    _folder(folder) {
    _httpMethod = Poco::Net::HTTPRequest::HTTP_POST;
}

std::string CreateFolderJob::getUrl() {
    return _apiUrl + foldersEndpoint;
}

ExitInfo CreateFolderJob::setData() {
    _data = ChunkStoreJson::stringify(ChunkStoreJson::toJson(_folder));
    return ExitCode::Ok;
}

std::string CreateFolderJob::getContentType() {
    return mimeTypeJson;
}

ExitInfo CreateFolderJob::handleResponse(std::istream &is) {
    if (const auto exitInfo = handleJsonResponse(is); !exitInfo) {
        return exitInfo;
    }

    bool success = true;
    if (!JsonParserUtility::extractValue(jsonRes(), successKey, success, false)) {
        return {ExitCode::BackError, ExitCause::ApiErr};
    }
    if (!success) {
        LOG_WARN(_logger, "Folder " << _folder.folderPath() << " not registered");
        return {ExitCode::BackError, ExitCause::ApiErr};
    }
    return ExitCode::Ok;
}

ExitInfo CreateFolderJob::handleError(const Poco::Net::HTTPResponse::HTTPStatus status, const std::string &replyBody) {
    if (status == Poco::Net::HTTPResponse::HTTP_CONFLICT) {
        // Already registered
        LOG_DEBUG(_logger, "Folder " << _folder.folderPath() << " already exists");
        return ExitCode::Ok;
    }
    return AbstractNetworkJob::handleError(status, replyBody);
}

} // namespace FSC
