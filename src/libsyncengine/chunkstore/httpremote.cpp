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

#include "httpremote.h"
#include "jobs/network/chunkstore/confirmuploadjob.h"
#include "jobs/network/chunkstore/createfolderjob.h"
#include "jobs/network/chunkstore/downloadchunkjob.h"
#include "jobs/network/chunkstore/negotiateuploadjob.h"
#include "jobs/network/chunkstore/syncchangesjob.h"
#include "jobs/network/chunkstore/uploadpartjob.h"
#include "libcommon/utility/utility.h"
#include "libcommonserver/log/log.h"

#include <log4cplus/loggingmacros.h>

namespace FSC {

HttpRemote::HttpRemote(const std::string &apiUrl) :
    _logger(Log::instance()->getLogger()),
    _apiUrl(apiUrl) {
    // Endpoints are appended to the API URL
    while (CommonUtility::endsWith(_apiUrl, "/")) {
        _apiUrl.pop_back();
    }
}

ExitInfo HttpRemote::negotiateUpload(const NegotiationRequest &request, UploadPlan &plan) {
    NegotiateUploadJob job(_apiUrl, request);
    if (const auto exitInfo = runJob(job, "negotiateUpload"); !exitInfo) {
        return exitInfo;
    }
    plan = job.plan();
    return ExitCode::Ok;
}

ExitInfo HttpRemote::uploadPart(const TransferHandle &handle, const std::string &bytes, UploadAck &ack) {
    UploadPartJob job(handle, bytes);
    if (const auto exitInfo = runJob(job, "uploadPart"); !exitInfo) {
        return exitInfo;
    }
    ack = job.ack();
    return ExitCode::Ok;
}

ExitInfo HttpRemote::downloadChunk(const ChunkLocator &locator, std::string &bytes) {
    DownloadChunkJob job(_apiUrl, locator);
    if (const auto exitInfo = runJob(job, "downloadChunk"); !exitInfo) {
        return exitInfo;
    }
    bytes = job.responseBody();
    return ExitCode::Ok;
}

ExitInfo HttpRemote::confirm(const ConfirmRequest &request, ConfirmResult &result) {
    ConfirmUploadJob job(_apiUrl, request);
    if (const auto exitInfo = runJob(job, "confirm"); !exitInfo) {
        return exitInfo;
    }
    result = job.result();
    return ExitCode::Ok;
}

ExitInfo HttpRemote::registerFolder(const DbFolder &folder) {
    CreateFolderJob job(_apiUrl, folder);
    return runJob(job, "registerFolder");
}

ExitInfo HttpRemote::fetchChanges(const SyncCursor &cursor, SyncDelta &delta) {
    SyncChangesJob job(_apiUrl, cursor);
    if (const auto exitInfo = runJob(job, "fetchChanges"); !exitInfo) {
        return exitInfo;
    }
    delta = job.delta();
    return ExitCode::Ok;
}

ExitInfo HttpRemote::runJob(AbstractNetworkJob &job, const std::string &operation) {
    const ExitInfo exitInfo = job.runSynchronously();
    if (!exitInfo) {
        LOG_WARN(_logger, "Error in HttpRemote::" << operation << " : " << exitInfo);
    }
    return exitInfo;
}

} // namespace FSC
