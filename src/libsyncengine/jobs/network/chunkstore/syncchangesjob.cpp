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

#include "syncchangesjob.h"
#include "chunkstorejson.h"
#include "jobs/network/networkjobsparams.h"

#include <Poco/Net/HTTPRequest.h>

namespace FSC {

SyncChangesJob::SyncChangesJob(const std::string &apiUrl, const SyncCursor &cursor) :
    _apiUrl(apiUrl),
    _cursor(cursor) {
    _httpMethod = Poco::Net::HTTPRequest::HTTP_POST;
}

std::string SyncChangesJob::getUrl() {
    return _apiUrl + syncEndpoint;
}

ExitInfo SyncChangesJob::setData() {
    _data = ChunkStoreJson::stringify(ChunkStoreJson::toJson(_cursor));
    return ExitCode::Ok;
}

std::string SyncChangesJob::getContentType() {
    return mimeTypeJson;
}

ExitInfo SyncChangesJob::handleResponse(std::istream &is) {
    if (const auto exitInfo = handleJsonResponse(is); !exitInfo) {
        return exitInfo;
    }
    return ChunkStoreJson::fromJson(jsonRes(), _delta);
}

} // namespace FSC
