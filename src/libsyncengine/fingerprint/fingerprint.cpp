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

#include "fingerprint.h"
#include "libcommonserver/io/iohelper.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/utility.h"

#include <Poco/DigestEngine.h>

#include <fstream>

#define READ_BUFFER_SIZE (512 * 1024)

namespace FSC {

Fingerprint::Builder::Builder() :
    _engine(Poco::SHA2Engine::SHA_256) {}

void Fingerprint::Builder::update(const char *data, size_t size) {
    if (size == 0) return;
    _engine.update(data, static_cast<unsigned>(size));
}

std::string Fingerprint::Builder::finalize() {
    return Poco::DigestEngine::digestToHex(_engine.digest());
}

std::string Fingerprint::compute(const char *data, size_t size) {
    Builder builder;
    builder.update(data, size);
    return builder.finalize();
}

ExitInfo Fingerprint::computeFile(const SyncPath &path, std::string &digest) {
    digest.clear();

    std::ifstream is;
    if (const ExitInfo exitInfo = IoHelper::openFile(path, is); !exitInfo) {
        return exitInfo;
    }

    Builder builder;
    std::vector<char> buffer(READ_BUFFER_SIZE);
    while (is) {
        is.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (is.bad()) {
            LOG_WARN(Log::instance()->getLogger(), "Error while reading " << Utility::formatSyncPath(path));
            return {ExitCode::SystemError, ExitCause::FileAccessError};
        }
        builder.update(buffer.data(), static_cast<size_t>(is.gcount()));
    }

    digest = builder.finalize();
    return ExitCode::Ok;
}

std::string Fingerprint::combine(const std::vector<std::string> &partFingerprints) {
    Builder builder;
    for (const auto &fingerprint: partFingerprints) {
        builder.update(fingerprint);
    }
    return builder.finalize();
}

bool Fingerprint::isValid(const std::string &fingerprint) {
    if (fingerprint.size() != length) return false;
    for (const char c: fingerprint) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

} // namespace FSC
