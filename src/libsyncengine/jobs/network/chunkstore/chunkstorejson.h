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

#include "chunkstore/chunkstoretypes.h"
#include "db/dbentities.h"
#include "db/synccursor.h"

#include <Poco/JSON/Object.h>

namespace FSC {

/**
 * Wire format of the chunk store API.
 * The parsing functions return BackError/ApiErr when a mandatory field is missing or badly typed.
 */
struct ChunkStoreJson {
        static Poco::JSON::Object::Ptr toJson(const SyncCursor &cursor);
        static Poco::JSON::Object::Ptr toJson(const NegotiationRequest &request);
        static Poco::JSON::Object::Ptr toJson(const ConfirmRequest &request);
        static Poco::JSON::Object::Ptr toJson(const DbFolder &folder);

        static ExitInfo fromJson(const Poco::JSON::Object::Ptr obj, SyncDelta &delta);
        static ExitInfo fromJson(const Poco::JSON::Object::Ptr obj, UploadPlan &plan);
        static ExitInfo fromJson(const Poco::JSON::Object::Ptr obj, ConfirmResult &result);

        static std::string stringify(const Poco::JSON::Object::Ptr obj);

    private:
        static ExitInfo fromJson(const Poco::JSON::Object::Ptr obj, RemoteFile &file);
        static ExitInfo fromJson(const Poco::JSON::Object::Ptr obj, RemoteChunk &chunk);
        static ExitInfo fromJson(const Poco::JSON::Object::Ptr obj, const UploadPlan &plan, PartPlan &part);
};

} // namespace FSC
