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

#include "uploadcoordinator.h"
#include "fingerprint/fingerprint.h"
#include "jobs/jobmanager.h"
#include "jobs/transfer/partuploadjob.h"
#include "libcommonserver/io/iohelper.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/utility.h"
#include "requests/parameterscache.h"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <unordered_map>

namespace FSC {

UploadCoordinator::UploadCoordinator(std::shared_ptr<SyncDb> syncDb, ChunkStoreClient &client,
                                     PathLockManager &pathLockManager, const SyncPath &syncRoot,
                                     JobManager *jobManager /*= nullptr*/) :
    _logger(Log::instance()->getLogger()),
    _syncDb(syncDb),
    _client(client),
    _pathLockManager(pathLockManager),
    _syncRoot(syncRoot),
    _jobManager(jobManager) {}

ExitInfo UploadCoordinator::upload(const std::string &itemPath, UploadResult &result) {
    result = UploadResult();

    const auto pathLock = _pathLockManager.lock(itemPath);

    UploadRun run;
    run.itemPath = itemPath;
    run.localPath = Utility::toLocalPath(_syncRoot, itemPath);

    LOG_DEBUG(_logger, "Upload of " << itemPath << " started");

    while (run.state != UploadState::Done && run.state != UploadState::Failed) {
        const UploadState previousState = run.state;
        ExitInfo exitInfo = ExitCode::Ok;
        switch (run.state) {
            case UploadState::Chunking:
                exitInfo = chunking(run);
                break;
            case UploadState::Negotiating:
                exitInfo = negotiating(run);
                break;
            case UploadState::Transferring:
                exitInfo = transferring(run);
                break;
            case UploadState::Confirming:
                exitInfo = confirming(run);
                break;
            case UploadState::Done:
            case UploadState::Failed:
                break;
        }

        if (!exitInfo) {
            run.exitInfo = exitInfo;
            run.state = UploadState::Failed;
        }

        if (ParametersCache::isExtendedLogEnabled()) {
            LOG_DEBUG(_logger, "Upload of " << itemPath << " : " << previousState << " -> " << run.state);
        }
    }

    result.outcome = run.outcome;
    result.finalState = run.state;
    result.fileId = run.fileId;
    result.partCount = static_cast<int>(run.parts.size());
    result.renegotiations = run.renegotiations;
    result.confirmAttempts = run.confirmAttempts;
    for (const auto &[_, part]: run.parts) {
        if (part.deduplicated) {
            result.deduplicatedParts++;
        } else if (part.status != PartStatus::Pending) {
            result.uploadedParts++;
        }
    }

    if (run.state == UploadState::Failed) {
        LOG_WARN(_logger, "Upload of " << itemPath << " failed : " << run.exitInfo);
        return run.exitInfo;
    }

    LOG_INFO(_logger, "Upload of " << itemPath << " done : " << run.outcome << ", " << result.partCount << " parts, "
                                   << result.deduplicatedParts << " deduplicated");
    return ExitCode::Ok;
}

ExitInfo UploadCoordinator::chunking(UploadRun &run) {
    bool exists = false;
    IoError ioError = IoError::Success;
    if (!IoHelper::checkIfPathExists(run.localPath, exists, ioError)) {
        LOG_WARN(_logger, "Error in IoHelper::checkIfPathExists: " << Utility::formatIoError(run.localPath, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }
    if (!exists) {
        LOG_INFO(_logger, "File " << Utility::formatSyncPath(run.localPath) << " no longer exists");
        return {ExitCode::SystemError, ExitCause::NotFound};
    }

    bool isDirectory = false;
    if (!IoHelper::checkIfIsDirectory(run.localPath, isDirectory, ioError)) {
        LOG_WARN(_logger, "Error in IoHelper::checkIfIsDirectory: " << Utility::formatIoError(run.localPath, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }
    if (isDirectory) {
        LOG_WARN(_logger, "Item " << run.itemPath << " is a directory");
        return {ExitCode::LogicError, ExitCause::InvalidArgument};
    }

    const uint64_t chunkSize = ParametersCache::instance()->parameters().chunkSize();
    std::vector<ChunkInfo> parts;
    if (const auto exitInfo = Chunker::scanFile(run.localPath, chunkSize, parts, run.fileHash); !exitInfo) {
        return exitInfo;
    }

    DbFile dbFile;
    bool found = false;
    if (!_syncDb->selectFileByPath(run.itemPath, dbFile, found)) {
        LOG_WARN(_logger, "Error in SyncDb::selectFileByPath");
        return {ExitCode::DbError, ExitCause::DbAccessError};
    }

    if (found) {
        run.fileId = dbFile.fileId();
        if (dbFile.fileHash() && *dbFile.fileHash() == run.fileHash) {
            LOG_DEBUG(_logger, "File " << run.itemPath << " unchanged");
            run.outcome = UploadOutcome::Unchanged;
            run.state = UploadState::Done;
            return ExitCode::Ok;
        }
    } else {
        run.fileId = Utility::generateUuid();
    }

    std::vector<std::string> fingerprints;
    for (auto &part: parts) {
        fingerprints.push_back(part.fingerprint);
        PartState partState;
        partState.info = std::move(part);
        run.parts.emplace(partState.info.partNumber, std::move(partState));
    }
    run.masterFingerprint = Fingerprint::combine(fingerprints);

    run.state = UploadState::Negotiating;
    return ExitCode::Ok;
}

ExitInfo UploadCoordinator::negotiating(UploadRun &run) {
    if (run.folder.folderId().empty()) {
        if (const auto exitInfo = registerFolderChain(Utility::parentItemPath(run.itemPath), run.folder); !exitInfo) {
            return exitInfo;
        }
    }

    NegotiationRequest request;
    request.fileId = run.fileId;
    request.filePath = run.itemPath;
    request.fileName = Utility::itemName(run.itemPath);
    request.fileType = Utility::fileTypeFromName(request.fileName);
    request.folderId = run.folder.folderId();
    request.fileHash = run.masterFingerprint;
    for (const auto &[_, part]: run.parts) {
        request.fingerprints.push_back(part.info.fingerprint);
    }

    UploadPlan plan;
    if (const auto exitInfo = _client.negotiateUpload(request, plan); !exitInfo) {
        LOG_WARN(_logger, "Negotiation failed for " << run.itemPath << " : " << exitInfo);
        return exitInfo;
    }

    if (const auto exitInfo = validatePlan(request, plan); !exitInfo) {
        return exitInfo;
    }

    run.uploadId = plan.uploadId;
    for (const auto &partPlan: plan.parts) {
        PartState &part = run.parts.at(partPlan.partNumber);
        part.chunkId = partPlan.chunkId;
        if (part.status != PartStatus::Pending) {
            // Already sent before a renegotiation
            continue;
        }

        if (partPlan.disposition == PartDisposition::Exists) {
            part.status = PartStatus::Uploaded;
            part.deduplicated = true;
            part.handle.reset();
        } else {
            part.handle = partPlan.handle;
        }
    }

    run.state = UploadState::Transferring;
    return ExitCode::Ok;
}

ExitInfo UploadCoordinator::validatePlan(const NegotiationRequest &request, const UploadPlan &plan) const {
    const ExitInfo conflict = {ExitCode::BackError, ExitCause::NegotiationConflict};

    if (plan.parts.size() != request.fingerprints.size()) {
        LOG_WARN(_logger, "Negotiation plan for " << request.filePath << " has " << plan.parts.size() << " parts instead of "
                                                  << request.fingerprints.size());
        return conflict;
    }

    std::vector<bool> seen(request.fingerprints.size(), false);
    for (const auto &part: plan.parts) {
        if (part.partNumber < 0 || part.partNumber >= static_cast<int>(request.fingerprints.size()) || seen[part.partNumber]) {
            LOG_WARN(_logger, "Negotiation plan for " << request.filePath << " has an unexpected part " << part.partNumber);
            return conflict;
        }
        seen[part.partNumber] = true;

        if (part.fingerprint != request.fingerprints[part.partNumber]) {
            LOG_WARN(_logger, "Negotiation plan for " << request.filePath << " changed the fingerprint of part "
                                                      << part.partNumber);
            return conflict;
        }

        if (part.disposition == PartDisposition::Upload && (!part.handle || part.handle->url.empty())) {
            LOG_WARN(_logger, "Negotiation plan for " << request.filePath << " has no transfer handle for part "
                                                      << part.partNumber);
            return conflict;
        }
    }

    return ExitCode::Ok;
}

void UploadCoordinator::inheritSharedParts(UploadRun &run) {
    std::unordered_map<std::string, const PartState *> sentParts;
    for (const auto &[_, part]: run.parts) {
        if (part.status != PartStatus::Pending && !part.deduplicated) {
            (void) sentParts.try_emplace(part.info.fingerprint, &part);
        }
    }

    for (auto &[_, part]: run.parts) {
        if (part.status != PartStatus::Pending) continue;
        if (const auto it = sentParts.find(part.info.fingerprint); it != sentParts.end()) {
            part.status = PartStatus::Uploaded;
            part.deduplicated = true;
            part.etag = it->second->etag;
            part.handle.reset();
        }
    }
}

ExitInfo UploadCoordinator::transferring(UploadRun &run) {
    // Parts sharing a fingerprint inside the file are sent once
    inheritSharedParts(run);

    std::vector<std::shared_ptr<PartUploadJob>> jobs;
    std::unordered_set<std::string> queuedFingerprints;
    for (auto &[_, part]: run.parts) {
        if (part.status != PartStatus::Pending) continue;
        if (!queuedFingerprints.insert(part.info.fingerprint).second) continue;
        if (!part.handle) {
            LOG_WARN(_logger, "No transfer handle for part " << part.info.partNumber << " of " << run.itemPath);
            return {ExitCode::LogicError, ExitCause::Unknown};
        }
        jobs.push_back(std::make_shared<PartUploadJob>(_client, run.localPath, part.info, *part.handle));
    }

    const Parameters &parameters = ParametersCache::instance()->parameters();
    if (_jobManager && parameters.transferParallelJobs() > 1 && jobs.size() > 1) {
        std::vector<std::shared_ptr<AbstractJob>> queuedJobs;
        for (const auto &job: jobs) {
            _jobManager->queueAsyncJob(job);
            queuedJobs.push_back(job);
        }
        _jobManager->waitForJobs(queuedJobs);
    } else {
        for (const auto &job: jobs) {
            const ExitInfo exitInfo = job->runSynchronously();
            if (!exitInfo && exitInfo.cause() != ExitCause::TransferHandleExpired) {
                break;
            }
        }
    }

    bool handleExpired = false;
    ExitInfo failure = ExitCode::Ok;
    for (const auto &job: jobs) {
        const ExitInfo exitInfo = job->exitInfo();
        if (exitInfo) {
            PartState &part = run.parts.at(job->part().partNumber);
            part.status = PartStatus::Uploaded;
            part.etag = job->ack().etag;
            part.handle.reset();
        } else if (exitInfo.cause() == ExitCause::TransferHandleExpired) {
            handleExpired = true;
        } else if (failure || failure.code() == ExitCode::Unknown) {
            // Keep the first error of a job that actually ran
            failure = exitInfo;
        }
    }

    // Followers of the parts just sent
    inheritSharedParts(run);

    if (!failure) {
        if (failure.cause() == ExitCause::FileModified) {
            LOG_INFO(_logger, "File " << run.itemPath << " modified during upload");
        }
        return failure;
    }

    if (handleExpired) {
        if (!renegotiate(run, "transfer handle expired")) {
            return {ExitCode::BackError, ExitCause::TransferHandleExpired};
        }
        return ExitCode::Ok;
    }

    run.state = UploadState::Confirming;
    return ExitCode::Ok;
}

bool UploadCoordinator::renegotiate(UploadRun &run, const std::string &reason) {
    const int maxRenegotiations = ParametersCache::instance()->parameters().maxRenegotiations();
    if (run.renegotiations >= maxRenegotiations) {
        LOG_WARN(_logger, "Upload of " << run.itemPath << " : " << reason << ", renegotiation limit reached");
        return false;
    }

    run.renegotiations++;
    LOG_INFO(_logger, "Upload of " << run.itemPath << " : " << reason << ", renegotiating (" << run.renegotiations << "/"
                                   << maxRenegotiations << ")");
    for (auto &[_, part]: run.parts) {
        part.handle.reset();
    }
    run.state = UploadState::Negotiating;
    return true;
}

ExitInfo UploadCoordinator::confirming(UploadRun &run) {
    ConfirmRequest request;
    request.fileId = run.fileId;
    request.uploadId = run.uploadId;
    for (const auto &[partNumber, part]: run.parts) {
        request.chunks.push_back({part.chunkId, partNumber, part.info.fingerprint, part.etag});
    }

    const Parameters &parameters = ParametersCache::instance()->parameters();
    const int maxAttempts = std::max(parameters.maxConfirmAttempts(), 1);
    for (int attempt = 0; attempt < maxAttempts; attempt++) {
        if (attempt > 0) {
            Utility::msleep(parameters.confirmBackoffMs() * (1 << std::min(attempt - 1, 16)));
        }
        run.confirmAttempts++;

        ConfirmResult result;
        const ExitInfo exitInfo = _client.confirm(request, result);
        if (exitInfo && result.success) {
            return commit(run);
        }

        if (exitInfo && !result.missingParts.empty()) {
            for (const int partNumber: result.missingParts) {
                if (const auto it = run.parts.find(partNumber); it != run.parts.end()) {
                    it->second.status = PartStatus::Pending;
                    it->second.deduplicated = false;
                    it->second.etag.clear();
                }
            }
            if (!renegotiate(run, std::to_string(result.missingParts.size()) + " parts missing")) {
                return {ExitCode::BackError, ExitCause::ConfirmRejected};
            }
            return ExitCode::Ok;
        }

        if (!exitInfo && !exitInfo.isRecoverable() && exitInfo.cause() != ExitCause::ConfirmRejected) {
            return exitInfo;
        }

        LOG_INFO(_logger, "Confirmation of " << run.itemPath << " refused (attempt " << attempt + 1 << "/" << maxAttempts
                                             << ") : " << exitInfo);
    }

    return {ExitCode::BackError, ExitCause::ConfirmRejected};
}

ExitInfo UploadCoordinator::commit(UploadRun &run) {
    const std::string fileName = Utility::itemName(run.itemPath);
    const DbFile dbFile(run.fileId, run.itemPath, fileName, Utility::fileTypeFromName(fileName), run.folder.folderId(),
                        run.fileHash);

    const SyncTime now = Utility::currentSyncTime();
    std::vector<DbChunk> dbChunks;
    for (const auto &[partNumber, part]: run.parts) {
        dbChunks.emplace_back(part.chunkId, run.fileId, partNumber, part.info.fingerprint, std::string(), now);
    }

    if (!_syncDb->commitFile(dbFile, dbChunks)) {
        LOG_WARN(_logger, "Error in SyncDb::commitFile for " << run.itemPath);
        return {ExitCode::DbError, ExitCause::DbAccessError};
    }

    for (auto &[_, part]: run.parts) {
        part.status = PartStatus::Confirmed;
    }
    run.outcome = UploadOutcome::Uploaded;
    run.state = UploadState::Done;
    return ExitCode::Ok;
}

ExitInfo UploadCoordinator::registerFolderChain(const std::string &folderPath, DbFolder &folder) {
    bool found = false;
    if (!_syncDb->selectFolderByPath(folderPath, folder, found)) {
        LOG_WARN(_logger, "Error in SyncDb::selectFolderByPath");
        return {ExitCode::DbError, ExitCause::DbAccessError};
    }

    if (folderPath == SyncDb::rootFolderPath) {
        if (!found) {
            LOG_WARN(_logger, "Root folder not found");
            return {ExitCode::DbError, ExitCause::DbEntryNotFound};
        }
        return ExitCode::Ok;
    }

    {
        const std::scoped_lock lock(_registeredFoldersMutex);
        if (found && _registeredFolders.contains(folderPath)) {
            return ExitCode::Ok;
        }
    }

    DbFolder parentFolder;
    if (const auto exitInfo = registerFolderChain(Utility::parentItemPath(folderPath), parentFolder); !exitInfo) {
        return exitInfo;
    }

    if (!found) {
        folder = DbFolder(Utility::generateUuid(), folderPath, Utility::itemName(folderPath), parentFolder.folderId());
    }

    if (const auto exitInfo = _client.registerFolder(folder); !exitInfo) {
        LOG_WARN(_logger, "Unable to register folder " << folderPath << " : " << exitInfo);
        return exitInfo;
    }

    if (!found && !_syncDb->upsertFolder(folder)) {
        LOG_WARN(_logger, "Error in SyncDb::upsertFolder");
        return {ExitCode::DbError, ExitCause::DbAccessError};
    }

    const std::scoped_lock lock(_registeredFoldersMutex);
    _registeredFolders.insert(folderPath);
    return ExitCode::Ok;
}

} // namespace FSC
