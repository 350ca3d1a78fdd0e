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

#include "dbentities.h"

#include <variant>

namespace FSC {

// Closed set of metadata kinds. Code handling any entity switches on entityKind().
using MetadataRecord = std::variant<DbFolder, DbFile, DbChunk>;

inline EntityKind entityKind(const MetadataRecord &record) {
    return std::visit([](const auto &entity) { return std::decay_t<decltype(entity)>::kind; }, record);
}

// Identity of the record: folder_id, file_id or chunk_id
inline const EntityId &entityId(const MetadataRecord &record) {
    switch (entityKind(record)) {
        case EntityKind::Folder:
            return std::get<DbFolder>(record).folderId();
        case EntityKind::File:
            return std::get<DbFile>(record).fileId();
        case EntityKind::Chunk:
            return std::get<DbChunk>(record).chunkId();
    }
    return std::get<DbChunk>(record).chunkId(); // Unreachable
}

// Canonical path of the record. Chunks have none.
inline std::string entityPath(const MetadataRecord &record) {
    switch (entityKind(record)) {
        case EntityKind::Folder:
            return std::get<DbFolder>(record).folderPath();
        case EntityKind::File:
            return std::get<DbFile>(record).filePath();
        case EntityKind::Chunk:
            break;
    }
    return {};
}

} // namespace FSC
