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

#include "syncreconciler.h"
#include "roundchunksource.h"
#include "fingerprint/fingerprint.h"
#include "jobs/jobmanager.h"
#include "jobs/transfer/chunkfetchjob.h"
#include "libcommonserver/io/iohelper.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/utility.h"
#include "requests/parameterscache.h"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <unordered_set>

namespace FSC {

static const int maxLockAttempts = 3;

SyncReconciler::SyncReconciler(std::shared_ptr<SyncDb> syncDb, SyncRemote &remote, ChunkStoreClient &client,
                               ChunkCache &cache, PathLockManager &pathLockManager, const SyncPath &syncRoot,
                               JobManager *jobManager /*= nullptr*/) :
    _logger(Log::instance()->getLogger()),
    _syncDb(syncDb),
    _remote(remote),
    _client(client),
    _cache(cache),
    _pathLockManager(pathLockManager),
    _syncRoot(syncRoot),
    _jobManager(jobManager) {}

ExitInfo SyncReconciler::runRound(const SyncCursor &in, SyncCursor &out, RoundReport &report) {
    report = RoundReport();
    out = in;

    LOG_DEBUG(_logger, "Sync round started from " << (in.isSet() ? *in.lastSyncTime : std::string("the beginning")));

    SyncDelta delta;
    if (const auto exitInfo = _remote.fetchChanges(in, delta); !exitInfo) {
        LOG_WARN(_logger, "Unable to fetch the remote changes : " << exitInfo);
        return exitInfo;
    }

    SyncCursor serverCursor;
    if (!SyncCursor::fromServerTime(delta.lastSyncTime, serverCursor)) {
        LOG_WARN(_logger, "Invalid server time: " << delta.lastSyncTime);
        return {ExitCode::BackError, ExitCause::ApiErr};
    }

    report.upToDate = delta.upToDate;
    if (delta.upToDate) {
        out = advanceCursor(in, serverCursor);
        LOG_DEBUG(_logger, "Sync round done, already up to date");
        return ExitCode::Ok;
    }

    report.updatedFiles = static_cast<int>(delta.updatedFiles.size());
    ExitInfo firstFailure = ExitCode::Ok;
    for (const auto &remoteFile: delta.updatedFiles) {
        if (const auto exitInfo = reconcileFile(remoteFile, report); !exitInfo) {
            LOG_WARN(_logger, "Unable to reconcile " << remoteFile.filePath << " : " << exitInfo);
            report.failedPaths.push_back(remoteFile.filePath);
            if (firstFailure) {
                firstFailure = exitInfo;
            }
            continue;
        }
        report.reconciledFiles++;
    }

    // Chunks are only kept for the duration of a round
    if (const auto exitInfo = _cache.clear(); !exitInfo) {
        LOG_WARN(_logger, "Unable to clear the chunk cache : " << exitInfo);
    }

    if (!firstFailure) {
        LOG_WARN(_logger, "Sync round incomplete, " << report.failedPaths.size() << " files failed, cursor kept");
        return firstFailure;
    }

    out = advanceCursor(in, serverCursor);
    LOG_INFO(_logger, "Sync round done : " << report.reconciledFiles << " files, " << report.downloadedChunks
                                           << " chunks downloaded, " << report.reusedChunks << " reused");
    return ExitCode::Ok;
}

ExitInfo SyncReconciler::syncOnce(RoundReport &report) {
    SyncCursor cursor;
    bool found = false;
    if (!_syncDb->loadCursor(cursor, found)) {
        LOG_WARN(_logger, "Error in SyncDb::loadCursor");
        return {ExitCode::DbError, ExitCause::DbAccessError};
    }

    SyncCursor newCursor;
    const ExitInfo exitInfo = runRound(cursor, newCursor, report);

    if (newCursor != cursor && !_syncDb->storeCursor(newCursor)) {
        LOG_WARN(_logger, "Error in SyncDb::storeCursor");
        return {ExitCode::DbError, ExitCause::DbAccessError};
    }

    return exitInfo;
}

SyncCursor SyncReconciler::advanceCursor(const SyncCursor &in, const SyncCursor &serverCursor) const {
    if (serverCursor.isBefore(in)) {
        LOG_WARN(_logger, "Server time " << *serverCursor.lastSyncTime << " is before the cursor " << *in.lastSyncTime
                                         << ", cursor kept");
        return in;
    }
    return serverCursor;
}

ExitInfo SyncReconciler::reconcileFile(const RemoteFile &remoteFile, RoundReport &report) {
    std::vector<ManifestEntry> manifest;
    for (const auto &chunk: remoteFile.chunks) {
        if (!Fingerprint::isValid(chunk.fingerprint)) {
            LOG_WARN(_logger, "Invalid fingerprint for part " << chunk.partNumber << " of " << remoteFile.filePath);
            return {ExitCode::BackError, ExitCause::ApiErr};
        }
        manifest.push_back({chunk.partNumber, chunk.fingerprint});
    }

    std::vector<ManifestEntry> orderedManifest;
    if (const auto exitInfo = FileReconstructor::orderManifest(manifest, orderedManifest); !exitInfo) {
        LOG_WARN(_logger, "Incomplete chunk manifest for " << remoteFile.filePath);
        return exitInfo;
    }

    // Find the local rows, lock their paths and check that the file did not move in the meantime
    DbFile pathFile;
    bool pathFound = false;
    DbFile idFile;
    bool idFound = false;
    std::optional<std::string> movedFromPath;
    PathLockManager::PathLock pathLock;
    for (int attempt = 0; attempt < maxLockAttempts; attempt++) {
        if (!_syncDb->selectFileById(remoteFile.fileId, idFile, idFound)) {
            LOG_WARN(_logger, "Error in SyncDb::selectFileById");
            return {ExitCode::DbError, ExitCause::DbAccessError};
        }

        movedFromPath.reset();
        if (idFound && idFile.filePath() != remoteFile.filePath) {
            movedFromPath = idFile.filePath();
        }
        auto candidateLock = movedFromPath ? _pathLockManager.lock(*movedFromPath, remoteFile.filePath)
                                           : _pathLockManager.lock(remoteFile.filePath);

        DbFile lockedIdFile;
        bool lockedIdFound = false;
        if (!_syncDb->selectFileById(remoteFile.fileId, lockedIdFile, lockedIdFound) ||
            !_syncDb->selectFileByPath(remoteFile.filePath, pathFile, pathFound)) {
            LOG_WARN(_logger, "Error in SyncDb::selectFile");
            return {ExitCode::DbError, ExitCause::DbAccessError};
        }

        if (lockedIdFound == idFound && (!idFound || lockedIdFile.filePath() == idFile.filePath())) {
            idFile = lockedIdFile;
            pathLock = std::move(candidateLock);
            break;
        }
    }

    if (!pathLock.ownsLock()) {
        LOG_WARN(_logger, "File " << remoteFile.filePath << " keeps moving, reconciliation postponed");
        return {ExitCode::SystemError, ExitCause::FileAccessError};
    }

    DbFolder folder;
    if (const auto exitInfo = ensureFolderChain(Utility::parentItemPath(remoteFile.filePath), remoteFile.folderId, folder);
        !exitInfo) {
        return exitInfo;
    }

    if (movedFromPath) {
        if (const auto exitInfo = moveLocalFile(*movedFromPath, remoteFile.filePath); !exitInfo) {
            return exitInfo;
        }
    }

    std::vector<DbChunk> localChunks;
    if (idFound && !_syncDb->selectChunks(idFile.fileId(), localChunks)) {
        LOG_WARN(_logger, "Error in SyncDb::selectChunks");
        return {ExitCode::DbError, ExitCause::DbAccessError};
    }

    const SyncPath localPath = Utility::toLocalPath(_syncRoot, remoteFile.filePath);

    // Content already known locally, only the metadata is refreshed
    bool sameContent = idFound && localChunks.size() == orderedManifest.size();
    for (size_t index = 0; sameContent && index < localChunks.size(); index++) {
        const auto chunkIt = std::find_if(localChunks.begin(), localChunks.end(), [&](const DbChunk &chunk) {
            return chunk.partNumber() == orderedManifest[index].partNumber;
        });
        sameContent = chunkIt != localChunks.end() && chunkIt->fingerprint() == orderedManifest[index].fingerprint;
    }
    bool exists = false;
    IoError ioError = IoError::Success;
    if (!IoHelper::checkIfPathExists(localPath, exists, ioError)) {
        LOG_WARN(_logger, "Error in IoHelper::checkIfPathExists: " << Utility::formatIoError(localPath, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }

    std::optional<std::string> fileHash = idFound ? idFile.fileHash() : std::nullopt;
    if (!sameContent || !exists) {
        RoundChunkSource source(_cache);
        std::vector<std::string> toDownload;
        if (const auto exitInfo = resolveParts(remoteFile, orderedManifest, localChunks, movedFromPath, source, toDownload);
            !exitInfo) {
            return exitInfo;
        }

        for (const auto &entry: orderedManifest) {
            if (std::find(toDownload.begin(), toDownload.end(), entry.fingerprint) == toDownload.end()) {
                report.reusedChunks++;
            }
        }

        if (!toDownload.empty()) {
            if (const auto exitInfo = downloadChunks(toDownload); !exitInfo) {
                return exitInfo;
            }
            report.downloadedChunks += static_cast<int>(toDownload.size());
        }

        if (const auto exitInfo = _reconstructor.reconstruct(localPath, orderedManifest, source); !exitInfo) {
            return exitInfo;
        }

        std::string digest;
        if (const auto exitInfo = Fingerprint::computeFile(localPath, digest); !exitInfo) {
            return exitInfo;
        }
        fileHash = digest;
    } else {
        LOG_DEBUG(_logger, "Content of " << remoteFile.filePath << " already up to date");
    }

    const DbFile dbFile(remoteFile.fileId, remoteFile.filePath, remoteFile.fileName, remoteFile.fileType,
                        folder.folderId(), fileHash);
    std::vector<DbChunk> dbChunks;
    const SyncTime now = Utility::currentSyncTime();
    for (const auto &chunk: remoteFile.chunks) {
        dbChunks.emplace_back(chunk.chunkId, remoteFile.fileId, chunk.partNumber, chunk.fingerprint, chunk.createdAt, now);
    }

    std::optional<EntityId> replacedFileId;
    if (pathFound && pathFile.fileId() != remoteFile.fileId) {
        replacedFileId = pathFile.fileId();
    }

    if (!_syncDb->commitFile(dbFile, dbChunks, replacedFileId)) {
        LOG_WARN(_logger, "Error in SyncDb::commitFile for " << remoteFile.filePath);
        return {ExitCode::DbError, ExitCause::DbAccessError};
    }

    LOG_DEBUG(_logger, "File " << remoteFile.filePath << " reconciled");
    return ExitCode::Ok;
}

ExitInfo SyncReconciler::moveLocalFile(const std::string &fromItemPath, const std::string &toItemPath) {
    const SyncPath fromPath = Utility::toLocalPath(_syncRoot, fromItemPath);
    const SyncPath toPath = Utility::toLocalPath(_syncRoot, toItemPath);

    bool exists = false;
    IoError ioError = IoError::Success;
    if (!IoHelper::checkIfPathExists(fromPath, exists, ioError)) {
        LOG_WARN(_logger, "Error in IoHelper::checkIfPathExists: " << Utility::formatIoError(fromPath, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }
    if (!exists) {
        LOG_INFO(_logger, "File " << Utility::formatSyncPath(fromPath) << " not found locally, nothing to move");
        return ExitCode::Ok;
    }

    if (!IoHelper::renameItem(fromPath, toPath, ioError)) {
        LOG_WARN(_logger, "Error in IoHelper::renameItem: " << Utility::formatIoError(fromPath, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }

    LOG_INFO(_logger, "File moved from " << fromItemPath << " to " << toItemPath);
    return ExitCode::Ok;
}

ExitInfo SyncReconciler::resolveParts(const RemoteFile &remoteFile, const std::vector<ManifestEntry> &manifest,
                                      const std::vector<DbChunk> &localChunks,
                                      const std::optional<std::string> &movedFromPath, RoundChunkSource &source,
                                      std::vector<std::string> &toDownload) {
    toDownload.clear();
    std::unordered_set<std::string> missingFingerprints;

    for (const auto &entry: manifest) {
        if (_cache.contains(entry.fingerprint)) continue;

        // A part of the previous version of the file
        bool resolved = false;
        for (const auto &chunk: localChunks) {
            if (chunk.fingerprint() == entry.fingerprint &&
                findSlice(remoteFile.filePath, chunk.partNumber(), entry.fingerprint, source, entry.partNumber)) {
                resolved = true;
                break;
            }
        }
        if (resolved) continue;

        // A part of any other synced file
        std::vector<std::pair<std::string, int>> locations;
        if (!_syncDb->selectChunkLocations(entry.fingerprint, locations)) {
            LOG_WARN(_logger, "Error in SyncDb::selectChunkLocations");
            return {ExitCode::DbError, ExitCause::DbAccessError};
        }
        for (const auto &[filePath, partNumber]: locations) {
            const std::string &itemPath = movedFromPath && filePath == *movedFromPath ? remoteFile.filePath : filePath;
            if (findSlice(itemPath, partNumber, entry.fingerprint, source, entry.partNumber)) {
                resolved = true;
                break;
            }
        }
        if (resolved) continue;

        if (missingFingerprints.insert(entry.fingerprint).second) {
            toDownload.push_back(entry.fingerprint);
        }
    }

    if (ParametersCache::isExtendedLogEnabled()) {
        LOG_DEBUG(_logger, remoteFile.filePath << " : " << manifest.size() << " parts, " << toDownload.size()
                                               << " chunks to download");
    }
    return ExitCode::Ok;
}

bool SyncReconciler::findSlice(const std::string &itemPath, const int partNumber, const std::string &fingerprint,
                               RoundChunkSource &source, const int targetPartNumber) {
    const SyncPath localPath = Utility::toLocalPath(_syncRoot, itemPath);

    uint64_t fileSize = 0;
    IoError ioError = IoError::Success;
    if (!IoHelper::getFileSize(localPath, fileSize, ioError) || ioError != IoError::Success) {
        return false;
    }

    const uint64_t chunkSize = ParametersCache::instance()->parameters().chunkSize();
    const uint64_t offset = static_cast<uint64_t>(partNumber) * chunkSize;
    if (offset >= fileSize) {
        return false;
    }
    const uint64_t sliceSize = std::min(chunkSize, fileSize - offset);

    std::string bytes;
    if (!IoHelper::readFileRange(localPath, offset, sliceSize, bytes)) {
        return false;
    }

    // The local file may have been edited since its last sync
    if (Fingerprint::compute(bytes) != fingerprint) {
        return false;
    }

    source.addSlice(targetPartNumber, localPath, offset, sliceSize);
    return true;
}

ExitInfo SyncReconciler::downloadChunks(const std::vector<std::string> &fingerprints) {
    const Parameters &parameters = ParametersCache::instance()->parameters();

    std::vector<std::shared_ptr<ChunkFetchJob>> jobs;
    for (const auto &fingerprint: fingerprints) {
        jobs.push_back(std::make_shared<ChunkFetchJob>(_client, _cache, ChunkLocator{fingerprint, ""},
                                                       parameters.maxIntegrityRetries()));
    }

    if (_jobManager && parameters.transferParallelJobs() > 1 && jobs.size() > 1) {
        std::vector<std::shared_ptr<AbstractJob>> queuedJobs;
        for (const auto &job: jobs) {
            _jobManager->queueAsyncJob(job);
            queuedJobs.push_back(job);
        }
        _jobManager->waitForJobs(queuedJobs);
    } else {
        for (const auto &job: jobs) {
            if (!job->runSynchronously()) {
                break;
            }
        }
    }

    for (const auto &job: jobs) {
        if (const ExitInfo exitInfo = job->exitInfo(); !exitInfo) {
            LOG_WARN(_logger, "Unable to download chunk " << job->locator().fingerprint << " : " << exitInfo);
            return exitInfo;
        }
    }

    return ExitCode::Ok;
}

ExitInfo SyncReconciler::ensureFolderChain(const std::string &folderPath, const EntityId &folderId, DbFolder &folder) {
    if (folderPath == SyncDb::rootFolderPath) {
        if (!_syncDb->rootFolder(folder)) {
            LOG_WARN(_logger, "Error in SyncDb::rootFolder");
            return {ExitCode::DbError, ExitCause::DbAccessError};
        }
        return ExitCode::Ok;
    }

    bool found = false;
    if (!_syncDb->selectFolderByPath(folderPath, folder, found)) {
        LOG_WARN(_logger, "Error in SyncDb::selectFolderByPath");
        return {ExitCode::DbError, ExitCause::DbAccessError};
    }

    if (!found) {
        // Intermediate folders are not described by the delta
        DbFolder parentFolder;
        if (const auto exitInfo = ensureFolderChain(Utility::parentItemPath(folderPath), Utility::generateUuid(), parentFolder);
            !exitInfo) {
            return exitInfo;
        }

        folder = DbFolder(folderId.empty() ? Utility::generateUuid() : folderId, folderPath, Utility::itemName(folderPath),
                          parentFolder.folderId());
        if (!_syncDb->upsertFolder(folder)) {
            LOG_WARN(_logger, "Error in SyncDb::upsertFolder");
            return {ExitCode::DbError, ExitCause::DbAccessError};
        }
    }

    const SyncPath localPath = Utility::toLocalPath(_syncRoot, folderPath);
    IoError ioError = IoError::Success;
    if (!IoHelper::createDirectory(localPath, false, ioError) && ioError != IoError::FileExists) {
        LOG_WARN(_logger, "Error in IoHelper::createDirectory: " << Utility::formatIoError(localPath, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }

    return ExitCode::Ok;
}

} // namespace FSC
