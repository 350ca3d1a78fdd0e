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

#include "filereconstructor.h"
#include "fingerprint/fingerprint.h"
#include "libcommon/utility/utility.h"
#include "libcommonserver/io/iohelper.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/utility.h"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <cerrno>
#include <fstream>

namespace FSC {

const std::string FileReconstructor::tmpFilePrefix = ".firesync_";
const std::string FileReconstructor::tmpFileSuffix = ".tmp";

FileReconstructor::FileReconstructor() :
    _logger(Log::instance()->getLogger()) {}

ExitInfo FileReconstructor::orderManifest(const std::vector<ManifestEntry> &manifest, std::vector<ManifestEntry> &ordered) {
    ordered = manifest;
    std::sort(ordered.begin(), ordered.end(),
              [](const ManifestEntry &e1, const ManifestEntry &e2) { return e1.partNumber < e2.partNumber; });

    for (size_t i = 0; i < ordered.size(); i++) {
        if (ordered[i].partNumber != static_cast<int>(i)) {
            return {ExitCode::DataError, ExitCause::ManifestGap};
        }
    }
    return ExitCode::Ok;
}

ExitInfo FileReconstructor::reconstruct(const SyncPath &target, const std::vector<ManifestEntry> &manifest,
                                        ChunkSource &source) {
    std::vector<ManifestEntry> ordered;
    if (const auto exitInfo = orderManifest(manifest, ordered); !exitInfo) {
        LOG_WARN(_logger, "Incomplete chunk manifest for " << Utility::formatSyncPath(target) << " (" << manifest.size()
                                                           << " parts)");
        return exitInfo;
    }

    const SyncPath tmpPath =
            target.parent_path() / (tmpFilePrefix + CommonUtility::generateRandomStringAlphaNum(10) + tmpFileSuffix);

    ExitInfo exitInfo = writeParts(tmpPath, ordered, source);
    if (exitInfo) {
        if (IoError ioError = IoError::Success; !IoHelper::renameItem(tmpPath, target, ioError)) {
            LOG_WARN(_logger, "Unable to replace " << Utility::formatIoError(target, ioError));
            exitInfo = IoHelper::ioError2ExitInfo(ioError);
        }
    }

    if (!exitInfo) {
        if (IoError ioError = IoError::Success; !IoHelper::deleteItem(tmpPath, ioError)) {
            LOG_WARN(_logger, "Unable to remove temporary file " << Utility::formatIoError(tmpPath, ioError));
        }
        return exitInfo;
    }

    LOG_DEBUG(_logger, "File " << Utility::formatSyncPath(target) << " rebuilt from " << ordered.size() << " parts");
    return ExitCode::Ok;
}

ExitInfo FileReconstructor::writeParts(const SyncPath &tmpPath, const std::vector<ManifestEntry> &manifest,
                                       ChunkSource &source) {
    std::ofstream output(tmpPath, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        const IoError ioError = IoHelper::posixError2ioError(errno);
        LOG_WARN(_logger, "Unable to create " << Utility::formatIoError(tmpPath, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }

    for (const auto &entry: manifest) {
        std::string bytes;
        if (const auto exitInfo = source.chunkBytes(entry.partNumber, entry.fingerprint, bytes); !exitInfo) {
            LOG_WARN(_logger, "Bytes of part " << entry.partNumber << " unavailable : " << exitInfo);
            return exitInfo;
        }

        if (Fingerprint::compute(bytes) != entry.fingerprint) {
            LOG_WARN(_logger, "Integrity check failed for part " << entry.partNumber << " (" << entry.fingerprint << ")");
            return {ExitCode::DataError, ExitCause::IntegrityCheckFailed};
        }

        output.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!output) {
            const IoError ioError = IoHelper::posixError2ioError(errno);
            LOG_WARN(_logger, "Unable to write " << Utility::formatIoError(tmpPath, ioError));
            return IoHelper::ioError2ExitInfo(ioError);
        }
    }

    output.flush();
    output.close();
    if (output.fail()) {
        const IoError ioError = IoHelper::posixError2ioError(errno);
        LOG_WARN(_logger, "Unable to flush " << Utility::formatIoError(tmpPath, ioError));
        return IoHelper::ioError2ExitInfo(ioError);
    }

    return ExitCode::Ok;
}

} // namespace FSC
