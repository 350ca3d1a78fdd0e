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

#include <string>

namespace FSC {

/*
 * Static string
 */
// Content types
static const std::string mimeTypeJson = "application/json";
static const std::string mimeTypeOctetStream = "application/octet-stream";

// Headers
static const std::string etagHeader = "ETag";

// Endpoints, relative to the API URL
static const std::string syncEndpoint = "/sync";
static const std::string negotiateEndpoint = "/files/negotiate";
static const std::string confirmEndpoint = "/files/confirm";
static const std::string foldersEndpoint = "/folders";
static const std::string chunksEndpoint = "/chunks";

// Keys
static const std::string lastSyncTimeKey = "last_sync_time";
static const std::string upToDateKey = "up_to_date";
static const std::string updatedFilesKey = "updated_files";

static const std::string fileIdKey = "file_id";
static const std::string filePathKey = "file_path";
static const std::string fileNameKey = "file_name";
static const std::string fileTypeKey = "file_type";
static const std::string fileHashKey = "file_hash";
static const std::string folderIdKey = "folder_id";
static const std::string folderPathKey = "folder_path";
static const std::string folderNameKey = "folder_name";
static const std::string parentFolderIdKey = "parent_folder_id";

static const std::string chunksKey = "chunks";
static const std::string chunkIdKey = "chunk_id";
static const std::string chunkCountKey = "chunk_count";
static const std::string partNumberKey = "part_number";
static const std::string fingerprintKey = "fingerprint";
static const std::string fingerprintsKey = "fingerprints";
static const std::string createdAtKey = "created_at";
static const std::string etagKey = "etag";

static const std::string uploadIdKey = "upload_id";
static const std::string expiresAtKey = "expires_at";
static const std::string partsKey = "parts";
static const std::string statusKey = "status";
static const std::string uploadUrlKey = "upload_url";

static const std::string successKey = "success";
static const std::string confirmedChunksKey = "confirmed_chunks";
static const std::string missingPartsKey = "missing_parts";

// Values
static const std::string statusExists = "exists";
static const std::string statusUpload = "upload";

} // namespace FSC
