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

#pragma once

#include "libcommon/utility/types.h"

#include <Poco/SHA2Engine.h>

#include <string>
#include <vector>

namespace FSC {

/**
 * Content identity of a byte span: the lowercase hexadecimal SHA-256 digest (64 characters).
 * Identical bytes give identical fingerprints whatever the device, file name or path.
 */
class Fingerprint {
    public:
        static constexpr size_t length = 64;

        class Builder {
            public:
                Builder();

                void update(const char *data, size_t size);
                void update(const std::string &bytes) { update(bytes.data(), bytes.size()); }
                std::string finalize();

            private:
                Poco::SHA2Engine _engine;
        };

        static std::string compute(const char *data, size_t size);
        static std::string compute(const std::string &bytes) { return compute(bytes.data(), bytes.size()); }

        // Whole-file digest, computed without loading the file in memory
        static ExitInfo computeFile(const SyncPath &path, std::string &digest);

        // Fingerprint of the concatenated part fingerprints, in part order
        static std::string combine(const std::vector<std::string> &partFingerprints);

        static bool isValid(const std::string &fingerprint);
};

} // namespace FSC
