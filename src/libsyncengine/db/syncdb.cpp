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

#include "syncdb.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/logiffail.h"
#include "libcommonserver/utility/utility.h"

#include <sqlite3.h>

//
// sync_cursor
//
#define CREATE_SYNC_CURSOR_TABLE_ID "create_sync_cursor"
#define CREATE_SYNC_CURSOR_TABLE                          \
    "CREATE TABLE IF NOT EXISTS sync_cursor("             \
    "id INTEGER PRIMARY KEY CHECK(id = 0),"               \
    "last_sync_time TEXT,"                                \
    "last_sync_time_us INTEGER);"

#define UPSERT_SYNC_CURSOR_REQUEST_ID "upsert_sync_cursor"
#define UPSERT_SYNC_CURSOR_REQUEST                                          \
    "INSERT INTO sync_cursor (id, last_sync_time, last_sync_time_us) "      \
    "VALUES (0, ?1, ?2) "                                                   \
    "ON CONFLICT(id) DO UPDATE SET last_sync_time=excluded.last_sync_time, " \
    "last_sync_time_us=excluded.last_sync_time_us;"

#define SELECT_SYNC_CURSOR_REQUEST_ID "select_sync_cursor"
#define SELECT_SYNC_CURSOR_REQUEST              \
    "SELECT last_sync_time, last_sync_time_us " \
    "FROM sync_cursor WHERE id=0;"

//
// folders
//
#define CREATE_FOLDERS_TABLE_ID "create_folders"
#define CREATE_FOLDERS_TABLE                  \
    "CREATE TABLE IF NOT EXISTS folders("     \
    "folder_id TEXT PRIMARY KEY,"             \
    "folder_path TEXT NOT NULL UNIQUE,"       \
    "folder_name TEXT NOT NULL,"              \
    "parent_folder_id TEXT);"

#define UPSERT_FOLDER_REQUEST_ID "upsert_folder"
#define UPSERT_FOLDER_REQUEST                                                          \
    "INSERT INTO folders (folder_id, folder_path, folder_name, parent_folder_id) "     \
    "VALUES (?1, ?2, ?3, ?4) "                                                         \
    "ON CONFLICT(folder_id) DO UPDATE SET folder_path=excluded.folder_path, "          \
    "folder_name=excluded.folder_name, parent_folder_id=excluded.parent_folder_id;"

#define SELECT_FOLDER_BY_PATH_REQUEST_ID "select_folder_by_path"
#define SELECT_FOLDER_BY_PATH_REQUEST                                  \
    "SELECT folder_id, folder_path, folder_name, parent_folder_id "    \
    "FROM folders WHERE folder_path=?1;"

#define SELECT_FOLDER_BY_ID_REQUEST_ID "select_folder_by_id"
#define SELECT_FOLDER_BY_ID_REQUEST                                    \
    "SELECT folder_id, folder_path, folder_name, parent_folder_id "    \
    "FROM folders WHERE folder_id=?1;"

//
// files
//
#define CREATE_FILES_TABLE_ID "create_files"
#define CREATE_FILES_TABLE              \
    "CREATE TABLE IF NOT EXISTS files(" \
    "file_id TEXT PRIMARY KEY,"         \
    "file_path TEXT NOT NULL UNIQUE,"   \
    "file_name TEXT NOT NULL,"          \
    "file_type TEXT NOT NULL,"          \
    "folder_id TEXT NOT NULL,"          \
    "file_hash TEXT);"

#define UPSERT_FILE_REQUEST_ID "upsert_file"
#define UPSERT_FILE_REQUEST                                                                                 \
    "INSERT INTO files (file_id, file_path, file_name, file_type, folder_id, file_hash) "                   \
    "VALUES (?1, ?2, ?3, ?4, ?5, ?6) "                                                                      \
    "ON CONFLICT(file_id) DO UPDATE SET file_path=excluded.file_path, file_name=excluded.file_name, "       \
    "file_type=excluded.file_type, folder_id=excluded.folder_id, file_hash=excluded.file_hash;"

#define UPDATE_FILE_ID_REQUEST_ID "update_file_id"
#define UPDATE_FILE_ID_REQUEST "UPDATE files SET file_id=?1 WHERE file_id=?2;"

#define DELETE_FILE_REQUEST_ID "delete_file"
#define DELETE_FILE_REQUEST "DELETE FROM files WHERE file_id=?1;"

#define SELECT_FILE_BY_PATH_REQUEST_ID "select_file_by_path"
#define SELECT_FILE_BY_PATH_REQUEST                                               \
    "SELECT file_id, file_path, file_name, file_type, folder_id, file_hash "      \
    "FROM files WHERE file_path=?1;"

#define SELECT_FILE_BY_ID_REQUEST_ID "select_file_by_id"
#define SELECT_FILE_BY_ID_REQUEST                                                 \
    "SELECT file_id, file_path, file_name, file_type, folder_id, file_hash "      \
    "FROM files WHERE file_id=?1;"

#define SELECT_ALL_FILES_REQUEST_ID "select_all_files"
#define SELECT_ALL_FILES_REQUEST                                                  \
    "SELECT file_id, file_path, file_name, file_type, folder_id, file_hash "      \
    "FROM files ORDER BY file_path;"

//
// chunks
//
#define CREATE_CHUNKS_TABLE_ID "create_chunks"
#define CREATE_CHUNKS_TABLE                                                                       \
    "CREATE TABLE IF NOT EXISTS chunks("                                                          \
    "chunk_id TEXT NOT NULL,"                                                                     \
    "file_id TEXT NOT NULL REFERENCES files(file_id) ON DELETE CASCADE ON UPDATE CASCADE,"        \
    "part_number INTEGER NOT NULL,"                                                               \
    "fingerprint TEXT NOT NULL,"                                                                  \
    "created_at TEXT,"                                                                            \
    "last_synced INTEGER,"                                                                        \
    "PRIMARY KEY (chunk_id, file_id),"                                                            \
    "UNIQUE (file_id, part_number));"

#define CREATE_CHUNKS_TABLE_IDX1_ID "create_chunks1"
#define CREATE_CHUNKS_TABLE_IDX1 "CREATE INDEX IF NOT EXISTS chunks1 ON chunks(fingerprint);"

#define INSERT_CHUNK_REQUEST_ID "insert_chunk"
#define INSERT_CHUNK_REQUEST                                                                      \
    "INSERT INTO chunks (chunk_id, file_id, part_number, fingerprint, created_at, last_synced) "  \
    "VALUES (?1, ?2, ?3, ?4, ?5, ?6);"

#define UPSERT_CHUNK_REQUEST_ID "upsert_chunk"
#define UPSERT_CHUNK_REQUEST                                                                          \
    "INSERT INTO chunks (chunk_id, file_id, part_number, fingerprint, created_at, last_synced) "      \
    "VALUES (?1, ?2, ?3, ?4, ?5, ?6) "                                                                \
    "ON CONFLICT(chunk_id, file_id) DO UPDATE SET part_number=excluded.part_number, "                 \
    "fingerprint=excluded.fingerprint, created_at=excluded.created_at, last_synced=excluded.last_synced;"

#define DELETE_CHUNKS_BY_FILE_REQUEST_ID "delete_chunks_by_file"
#define DELETE_CHUNKS_BY_FILE_REQUEST "DELETE FROM chunks WHERE file_id=?1;"

#define SELECT_CHUNKS_BY_FILE_REQUEST_ID "select_chunks_by_file"
#define SELECT_CHUNKS_BY_FILE_REQUEST                                                     \
    "SELECT chunk_id, file_id, part_number, fingerprint, created_at, last_synced "        \
    "FROM chunks WHERE file_id=?1 "                                                       \
    "ORDER BY part_number;"

#define SELECT_CHUNK_LOCATIONS_REQUEST_ID "select_chunk_locations"
#define SELECT_CHUNK_LOCATIONS_REQUEST                                     \
    "SELECT files.file_path, chunks.part_number "                          \
    "FROM chunks INNER JOIN files ON chunks.file_id=files.file_id "        \
    "WHERE chunks.fingerprint=?1;"

namespace FSC {

const std::string SyncDb::rootFolderPath = "/";

static dbtype optionalValue(const std::optional<std::string> &value) {
    return value ? dbtype(*value) : dbtype(std::monostate());
}

SyncDb::SyncDb(const std::filesystem::path &dbPath, const std::string &version) :
    Db(dbPath) {
    if (!checkConnect(version)) {
        throw std::runtime_error("Cannot open DB!");
    }

    LOG_INFO(_logger, "SyncDb initialization done: dbPath=" << Utility::formatSyncPath(dbPath));
}

bool SyncDb::execCreateRequest(const char *requestId, const char *query, bool &retry) {
    int errId = 0;
    std::string error;

    if (!createAndPrepareRequest(requestId, query)) return false;
    if (!queryExec(requestId, errId, error)) {
        // In certain situations the io error can be avoided by switching to the DELETE journal mode
        if (_journalMode != "DELETE" && errId == SQLITE_IOERR && extendedErrorCode() == SQLITE_IOERR_SHMMAP) {
            LOG_WARN(_logger, "IO error SHMMAP on table creation, attempting with DELETE journal mode");
            _journalMode = "DELETE";
            queryFree(requestId);
            retry = true;
            return false;
        }

        queryFree(requestId);
        return sqlFail(requestId, error);
    }
    queryFree(requestId);

    return true;
}

bool SyncDb::create(bool &retry) {
    if (!execCreateRequest(CREATE_SYNC_CURSOR_TABLE_ID, CREATE_SYNC_CURSOR_TABLE, retry)) return false;
    if (!execCreateRequest(CREATE_FOLDERS_TABLE_ID, CREATE_FOLDERS_TABLE, retry)) return false;
    if (!execCreateRequest(CREATE_FILES_TABLE_ID, CREATE_FILES_TABLE, retry)) return false;
    if (!execCreateRequest(CREATE_CHUNKS_TABLE_ID, CREATE_CHUNKS_TABLE, retry)) return false;
    if (!execCreateRequest(CREATE_CHUNKS_TABLE_IDX1_ID, CREATE_CHUNKS_TABLE_IDX1, retry)) return false;

    return true;
}

bool SyncDb::prepare() {
    // Sync cursor
    if (!createAndPrepareRequest(UPSERT_SYNC_CURSOR_REQUEST_ID, UPSERT_SYNC_CURSOR_REQUEST)) return false;
    if (!createAndPrepareRequest(SELECT_SYNC_CURSOR_REQUEST_ID, SELECT_SYNC_CURSOR_REQUEST)) return false;

    // Folders
    if (!createAndPrepareRequest(UPSERT_FOLDER_REQUEST_ID, UPSERT_FOLDER_REQUEST)) return false;
    if (!createAndPrepareRequest(SELECT_FOLDER_BY_PATH_REQUEST_ID, SELECT_FOLDER_BY_PATH_REQUEST)) return false;
    if (!createAndPrepareRequest(SELECT_FOLDER_BY_ID_REQUEST_ID, SELECT_FOLDER_BY_ID_REQUEST)) return false;

    // Files
    if (!createAndPrepareRequest(UPSERT_FILE_REQUEST_ID, UPSERT_FILE_REQUEST)) return false;
    if (!createAndPrepareRequest(UPDATE_FILE_ID_REQUEST_ID, UPDATE_FILE_ID_REQUEST)) return false;
    if (!createAndPrepareRequest(DELETE_FILE_REQUEST_ID, DELETE_FILE_REQUEST)) return false;
    if (!createAndPrepareRequest(SELECT_FILE_BY_PATH_REQUEST_ID, SELECT_FILE_BY_PATH_REQUEST)) return false;
    if (!createAndPrepareRequest(SELECT_FILE_BY_ID_REQUEST_ID, SELECT_FILE_BY_ID_REQUEST)) return false;
    if (!createAndPrepareRequest(SELECT_ALL_FILES_REQUEST_ID, SELECT_ALL_FILES_REQUEST)) return false;

    // Chunks
    if (!createAndPrepareRequest(INSERT_CHUNK_REQUEST_ID, INSERT_CHUNK_REQUEST)) return false;
    if (!createAndPrepareRequest(UPSERT_CHUNK_REQUEST_ID, UPSERT_CHUNK_REQUEST)) return false;
    if (!createAndPrepareRequest(DELETE_CHUNKS_BY_FILE_REQUEST_ID, DELETE_CHUNKS_BY_FILE_REQUEST)) return false;
    if (!createAndPrepareRequest(SELECT_CHUNKS_BY_FILE_REQUEST_ID, SELECT_CHUNKS_BY_FILE_REQUEST)) return false;
    if (!createAndPrepareRequest(SELECT_CHUNK_LOCATIONS_REQUEST_ID, SELECT_CHUNK_LOCATIONS_REQUEST)) return false;

    if (!initData()) {
        LOG_WARN(_logger, "Error in SyncDb::initData");
        return false;
    }

    return true;
}

bool SyncDb::upgrade(const std::string &fromVersion, const std::string &toVersion) {
    // The schema has not changed since the first version
    LOG_DEBUG(_logger, "Upgrade " << dbType() << " DB from " << fromVersion << " to " << toVersion);
    return true;
}

bool SyncDb::initData() {
    const std::scoped_lock lock(_mutex);

    DbFolder root;
    bool found = false;
    if (!selectFolderNoLock(SELECT_FOLDER_BY_PATH_REQUEST_ID, rootFolderPath, root, found)) {
        return false;
    }
    if (found) {
        return true;
    }

    root = DbFolder(Utility::generateUuid(), rootFolderPath, std::string(), std::nullopt);
    if (!upsertFolderNoLock(root)) {
        LOG_WARN(_logger, "Unable to insert the root folder");
        return false;
    }

    return true;
}

//
// Folders
//
bool SyncDb::upsertFolder(const DbFolder &folder) {
    const std::scoped_lock lock(_mutex);
    return upsertFolderNoLock(folder);
}

bool SyncDb::upsertFolderNoLock(const DbFolder &folder) {
    int errId = 0;
    std::string error;

    LOG_IF_FAIL(queryResetAndClearBindings(UPSERT_FOLDER_REQUEST_ID));
    LOG_IF_FAIL(queryBindValue(UPSERT_FOLDER_REQUEST_ID, 1, folder.folderId()));
    LOG_IF_FAIL(queryBindValue(UPSERT_FOLDER_REQUEST_ID, 2, folder.folderPath()));
    LOG_IF_FAIL(queryBindValue(UPSERT_FOLDER_REQUEST_ID, 3, folder.folderName()));
    LOG_IF_FAIL(queryBindValue(UPSERT_FOLDER_REQUEST_ID, 4, optionalValue(folder.parentFolderId())));
    if (!queryExec(UPSERT_FOLDER_REQUEST_ID, errId, error)) {
        LOG_WARN(_logger, "Error running query: " << UPSERT_FOLDER_REQUEST_ID << " - " << error);
        return false;
    }

    return true;
}

bool SyncDb::selectFolderByPath(const std::string &folderPath, DbFolder &folder, bool &found) {
    const std::scoped_lock lock(_mutex);
    return selectFolderNoLock(SELECT_FOLDER_BY_PATH_REQUEST_ID, folderPath, folder, found);
}

bool SyncDb::selectFolderById(const EntityId &folderId, DbFolder &folder, bool &found) {
    const std::scoped_lock lock(_mutex);
    return selectFolderNoLock(SELECT_FOLDER_BY_ID_REQUEST_ID, folderId, folder, found);
}

bool SyncDb::rootFolder(DbFolder &folder) {
    bool found = false;
    if (!selectFolderByPath(rootFolderPath, folder, found)) {
        return false;
    }
    if (!found) {
        LOG_WARN(_logger, "Root folder not found");
        return false;
    }
    return true;
}

bool SyncDb::selectFolderNoLock(const char *requestId, const std::string &key, DbFolder &folder, bool &found) {
    LOG_IF_FAIL(queryResetAndClearBindings(requestId));
    LOG_IF_FAIL(queryBindValue(requestId, 1, key));
    if (!queryNext(requestId, found)) {
        LOG_WARN(_logger, "Error getting query result: " << requestId);
        return false;
    }
    if (!found) {
        return true;
    }

    std::string folderId;
    LOG_IF_FAIL(queryStringValue(requestId, 0, folderId));
    std::string folderPath;
    LOG_IF_FAIL(queryStringValue(requestId, 1, folderPath));
    std::string folderName;
    LOG_IF_FAIL(queryStringValue(requestId, 2, folderName));

    bool isNull = false;
    std::optional<EntityId> parentFolderId;
    LOG_IF_FAIL(queryIsNullValue(requestId, 3, isNull));
    if (!isNull) {
        std::string parentId;
        LOG_IF_FAIL(queryStringValue(requestId, 3, parentId));
        parentFolderId = parentId;
    }

    folder = DbFolder(folderId, folderPath, folderName, parentFolderId);
    LOG_IF_FAIL(queryResetAndClearBindings(requestId));

    return true;
}

//
// Files
//
bool SyncDb::upsertFile(const DbFile &file) {
    const std::scoped_lock lock(_mutex);
    return upsertFileNoLock(file);
}

bool SyncDb::upsertFileNoLock(const DbFile &file) {
    int errId = 0;
    std::string error;

    LOG_IF_FAIL(queryResetAndClearBindings(UPSERT_FILE_REQUEST_ID));
    LOG_IF_FAIL(queryBindValue(UPSERT_FILE_REQUEST_ID, 1, file.fileId()));
    LOG_IF_FAIL(queryBindValue(UPSERT_FILE_REQUEST_ID, 2, file.filePath()));
    LOG_IF_FAIL(queryBindValue(UPSERT_FILE_REQUEST_ID, 3, file.fileName()));
    LOG_IF_FAIL(queryBindValue(UPSERT_FILE_REQUEST_ID, 4, file.fileType()));
    LOG_IF_FAIL(queryBindValue(UPSERT_FILE_REQUEST_ID, 5, file.folderId()));
    LOG_IF_FAIL(queryBindValue(UPSERT_FILE_REQUEST_ID, 6, optionalValue(file.fileHash())));
    if (!queryExec(UPSERT_FILE_REQUEST_ID, errId, error)) {
        LOG_WARN(_logger, "Error running query: " << UPSERT_FILE_REQUEST_ID << " - " << error);
        return false;
    }

    return true;
}

bool SyncDb::updateFileIdNoLock(const EntityId &oldFileId, const EntityId &newFileId) {
    int errId = 0;
    std::string error;

    LOG_IF_FAIL(queryResetAndClearBindings(UPDATE_FILE_ID_REQUEST_ID));
    LOG_IF_FAIL(queryBindValue(UPDATE_FILE_ID_REQUEST_ID, 1, newFileId));
    LOG_IF_FAIL(queryBindValue(UPDATE_FILE_ID_REQUEST_ID, 2, oldFileId));
    if (!queryExec(UPDATE_FILE_ID_REQUEST_ID, errId, error)) {
        LOG_WARN(_logger, "Error running query: " << UPDATE_FILE_ID_REQUEST_ID << " - " << error);
        return false;
    }

    return true;
}

bool SyncDb::deleteFileNoLock(const EntityId &fileId) {
    int errId = 0;
    std::string error;

    LOG_IF_FAIL(queryResetAndClearBindings(DELETE_FILE_REQUEST_ID));
    LOG_IF_FAIL(queryBindValue(DELETE_FILE_REQUEST_ID, 1, fileId));
    if (!queryExec(DELETE_FILE_REQUEST_ID, errId, error)) {
        LOG_WARN(_logger, "Error running query: " << DELETE_FILE_REQUEST_ID << " - " << error);
        return false;
    }

    return true;
}

bool SyncDb::selectFileByPath(const std::string &filePath, DbFile &file, bool &found) {
    const std::scoped_lock lock(_mutex);
    return selectFileNoLock(SELECT_FILE_BY_PATH_REQUEST_ID, filePath, file, found);
}

bool SyncDb::selectFileById(const EntityId &fileId, DbFile &file, bool &found) {
    const std::scoped_lock lock(_mutex);
    return selectFileNoLock(SELECT_FILE_BY_ID_REQUEST_ID, fileId, file, found);
}

void SyncDb::readFileRow(const char *requestId, DbFile &file) {
    std::string fileId;
    LOG_IF_FAIL(queryStringValue(requestId, 0, fileId));
    std::string filePath;
    LOG_IF_FAIL(queryStringValue(requestId, 1, filePath));
    std::string fileName;
    LOG_IF_FAIL(queryStringValue(requestId, 2, fileName));
    std::string fileType;
    LOG_IF_FAIL(queryStringValue(requestId, 3, fileType));
    std::string folderId;
    LOG_IF_FAIL(queryStringValue(requestId, 4, folderId));

    bool isNull = false;
    std::optional<std::string> fileHash;
    LOG_IF_FAIL(queryIsNullValue(requestId, 5, isNull));
    if (!isNull) {
        std::string hash;
        LOG_IF_FAIL(queryStringValue(requestId, 5, hash));
        fileHash = hash;
    }

    file = DbFile(fileId, filePath, fileName, fileType, folderId, fileHash);
}

bool SyncDb::selectFileNoLock(const char *requestId, const std::string &key, DbFile &file, bool &found) {
    LOG_IF_FAIL(queryResetAndClearBindings(requestId));
    LOG_IF_FAIL(queryBindValue(requestId, 1, key));
    if (!queryNext(requestId, found)) {
        LOG_WARN(_logger, "Error getting query result: " << requestId);
        return false;
    }
    if (!found) {
        return true;
    }

    readFileRow(requestId, file);
    LOG_IF_FAIL(queryResetAndClearBindings(requestId));

    return true;
}

bool SyncDb::selectAllFiles(std::vector<DbFile> &files) {
    const std::scoped_lock lock(_mutex);

    files.clear();
    LOG_IF_FAIL(queryResetAndClearBindings(SELECT_ALL_FILES_REQUEST_ID));
    bool found = false;
    for (;;) {
        if (!queryNext(SELECT_ALL_FILES_REQUEST_ID, found)) {
            LOG_WARN(_logger, "Error getting query result: " << SELECT_ALL_FILES_REQUEST_ID);
            return false;
        }
        if (!found) {
            break;
        }

        DbFile file;
        readFileRow(SELECT_ALL_FILES_REQUEST_ID, file);
        files.push_back(file);
    }

    return true;
}

//
// Chunks
//
bool SyncDb::upsertChunk(const DbChunk &chunk) {
    const std::scoped_lock lock(_mutex);
    return upsertChunkNoLock(chunk);
}

void SyncDb::bindChunk(const char *requestId, const DbChunk &chunk) {
    LOG_IF_FAIL(queryResetAndClearBindings(requestId));
    LOG_IF_FAIL(queryBindValue(requestId, 1, chunk.chunkId()));
    LOG_IF_FAIL(queryBindValue(requestId, 2, chunk.fileId()));
    LOG_IF_FAIL(queryBindValue(requestId, 3, chunk.partNumber()));
    LOG_IF_FAIL(queryBindValue(requestId, 4, chunk.fingerprint()));
    LOG_IF_FAIL(queryBindValue(requestId, 5, chunk.createdAt()));
    LOG_IF_FAIL(queryBindValue(requestId, 6, chunk.lastSynced() ? dbtype(*chunk.lastSynced()) : dbtype(std::monostate())));
}

bool SyncDb::upsertChunkNoLock(const DbChunk &chunk) {
    int errId = 0;
    std::string error;

    bindChunk(UPSERT_CHUNK_REQUEST_ID, chunk);
    if (!queryExec(UPSERT_CHUNK_REQUEST_ID, errId, error)) {
        LOG_WARN(_logger, "Error running query: " << UPSERT_CHUNK_REQUEST_ID << " - " << error);
        return false;
    }

    return true;
}

bool SyncDb::insertChunkNoLock(const DbChunk &chunk) {
    int errId = 0;
    std::string error;

    bindChunk(INSERT_CHUNK_REQUEST_ID, chunk);
    if (!queryExec(INSERT_CHUNK_REQUEST_ID, errId, error)) {
        LOG_WARN(_logger, "Error running query: " << INSERT_CHUNK_REQUEST_ID << " - " << error);
        return false;
    }

    return true;
}

bool SyncDb::deleteChunksNoLock(const EntityId &fileId) {
    int errId = 0;
    std::string error;

    LOG_IF_FAIL(queryResetAndClearBindings(DELETE_CHUNKS_BY_FILE_REQUEST_ID));
    LOG_IF_FAIL(queryBindValue(DELETE_CHUNKS_BY_FILE_REQUEST_ID, 1, fileId));
    if (!queryExec(DELETE_CHUNKS_BY_FILE_REQUEST_ID, errId, error)) {
        LOG_WARN(_logger, "Error running query: " << DELETE_CHUNKS_BY_FILE_REQUEST_ID << " - " << error);
        return false;
    }

    return true;
}

bool SyncDb::selectChunks(const EntityId &fileId, std::vector<DbChunk> &chunks) {
    const std::scoped_lock lock(_mutex);

    chunks.clear();
    LOG_IF_FAIL(queryResetAndClearBindings(SELECT_CHUNKS_BY_FILE_REQUEST_ID));
    LOG_IF_FAIL(queryBindValue(SELECT_CHUNKS_BY_FILE_REQUEST_ID, 1, fileId));
    bool found = false;
    for (;;) {
        if (!queryNext(SELECT_CHUNKS_BY_FILE_REQUEST_ID, found)) {
            LOG_WARN(_logger, "Error getting query result: " << SELECT_CHUNKS_BY_FILE_REQUEST_ID);
            return false;
        }
        if (!found) {
            break;
        }

        std::string chunkId;
        LOG_IF_FAIL(queryStringValue(SELECT_CHUNKS_BY_FILE_REQUEST_ID, 0, chunkId));
        std::string chunkFileId;
        LOG_IF_FAIL(queryStringValue(SELECT_CHUNKS_BY_FILE_REQUEST_ID, 1, chunkFileId));
        int partNumber = 0;
        LOG_IF_FAIL(queryIntValue(SELECT_CHUNKS_BY_FILE_REQUEST_ID, 2, partNumber));
        std::string fingerprint;
        LOG_IF_FAIL(queryStringValue(SELECT_CHUNKS_BY_FILE_REQUEST_ID, 3, fingerprint));
        std::string createdAt;
        LOG_IF_FAIL(queryStringValue(SELECT_CHUNKS_BY_FILE_REQUEST_ID, 4, createdAt));

        bool isNull = false;
        std::optional<SyncTime> lastSynced;
        LOG_IF_FAIL(queryIsNullValue(SELECT_CHUNKS_BY_FILE_REQUEST_ID, 5, isNull));
        if (!isNull) {
            int64_t value = 0;
            LOG_IF_FAIL(queryInt64Value(SELECT_CHUNKS_BY_FILE_REQUEST_ID, 5, value));
            lastSynced = value;
        }

        chunks.emplace_back(chunkId, chunkFileId, partNumber, fingerprint, createdAt, lastSynced);
    }

    return true;
}

bool SyncDb::selectChunkLocations(const std::string &fingerprint, std::vector<std::pair<std::string, int>> &locations) {
    const std::scoped_lock lock(_mutex);

    locations.clear();
    LOG_IF_FAIL(queryResetAndClearBindings(SELECT_CHUNK_LOCATIONS_REQUEST_ID));
    LOG_IF_FAIL(queryBindValue(SELECT_CHUNK_LOCATIONS_REQUEST_ID, 1, fingerprint));
    bool found = false;
    for (;;) {
        if (!queryNext(SELECT_CHUNK_LOCATIONS_REQUEST_ID, found)) {
            LOG_WARN(_logger, "Error getting query result: " << SELECT_CHUNK_LOCATIONS_REQUEST_ID);
            return false;
        }
        if (!found) {
            break;
        }

        std::string filePath;
        LOG_IF_FAIL(queryStringValue(SELECT_CHUNK_LOCATIONS_REQUEST_ID, 0, filePath));
        int partNumber = 0;
        LOG_IF_FAIL(queryIntValue(SELECT_CHUNK_LOCATIONS_REQUEST_ID, 1, partNumber));
        locations.emplace_back(filePath, partNumber);
    }

    return true;
}

bool SyncDb::commitFile(const DbFile &file, const std::vector<DbChunk> &chunks,
                        const std::optional<EntityId> &replacedFileId /*= std::nullopt*/) {
    const std::scoped_lock lock(_mutex);

    if (!startTransaction()) {
        LOG_WARN(_logger, "Unable to start a transaction for " << file.filePath());
        return false;
    }

    if (replacedFileId && *replacedFileId != file.fileId()) {
        DbFile existingFile;
        bool found = false;
        if (!selectFileNoLock(SELECT_FILE_BY_ID_REQUEST_ID, file.fileId(), existingFile, found)) {
            (void) rollbackTransaction();
            return false;
        }

        // The chunk rows follow through ON UPDATE CASCADE and ON DELETE CASCADE
        const bool ok = found ? deleteFileNoLock(*replacedFileId) : updateFileIdNoLock(*replacedFileId, file.fileId());
        if (!ok) {
            (void) rollbackTransaction();
            return false;
        }
    }

    if (!upsertFileNoLock(file)) {
        (void) rollbackTransaction();
        return false;
    }

    if (!deleteChunksNoLock(file.fileId())) {
        (void) rollbackTransaction();
        return false;
    }

    for (const auto &chunk: chunks) {
        if (chunk.fileId() != file.fileId()) {
            LOG_WARN(_logger, "Chunk " << chunk.chunkId() << " does not belong to file " << file.fileId());
            (void) rollbackTransaction();
            return false;
        }

        if (!insertChunkNoLock(chunk)) {
            (void) rollbackTransaction();
            return false;
        }
    }

    if (!commitTransaction()) {
        (void) rollbackTransaction();
        return false;
    }

    return true;
}

bool SyncDb::upsertRecord(const MetadataRecord &record) {
    switch (entityKind(record)) {
        case EntityKind::Folder:
            return upsertFolder(std::get<DbFolder>(record));
        case EntityKind::File:
            return upsertFile(std::get<DbFile>(record));
        case EntityKind::Chunk:
            return upsertChunk(std::get<DbChunk>(record));
    }

    LOG_WARN(_logger, "Unknown entity kind for record " << entityId(record));
    return false;
}

//
// Sync cursor
//
bool SyncDb::loadCursor(SyncCursor &cursor, bool &found) {
    const std::scoped_lock lock(_mutex);

    cursor = SyncCursor();
    LOG_IF_FAIL(queryResetAndClearBindings(SELECT_SYNC_CURSOR_REQUEST_ID));
    if (!queryNext(SELECT_SYNC_CURSOR_REQUEST_ID, found)) {
        LOG_WARN(_logger, "Error getting query result: " << SELECT_SYNC_CURSOR_REQUEST_ID);
        return false;
    }
    if (!found) {
        return true;
    }

    bool isNull = false;
    LOG_IF_FAIL(queryIsNullValue(SELECT_SYNC_CURSOR_REQUEST_ID, 0, isNull));
    if (!isNull) {
        std::string lastSyncTime;
        LOG_IF_FAIL(queryStringValue(SELECT_SYNC_CURSOR_REQUEST_ID, 0, lastSyncTime));
        int64_t lastSyncTimeUs = 0;
        LOG_IF_FAIL(queryInt64Value(SELECT_SYNC_CURSOR_REQUEST_ID, 1, lastSyncTimeUs));
        cursor.lastSyncTime = lastSyncTime;
        cursor.lastSyncTimeUs = lastSyncTimeUs;
    }
    LOG_IF_FAIL(queryResetAndClearBindings(SELECT_SYNC_CURSOR_REQUEST_ID));

    return true;
}

bool SyncDb::storeCursor(const SyncCursor &cursor) {
    const std::scoped_lock lock(_mutex);

    int errId = 0;
    std::string error;

    LOG_IF_FAIL(queryResetAndClearBindings(UPSERT_SYNC_CURSOR_REQUEST_ID));
    LOG_IF_FAIL(queryBindValue(UPSERT_SYNC_CURSOR_REQUEST_ID, 1, optionalValue(cursor.lastSyncTime)));
    LOG_IF_FAIL(queryBindValue(UPSERT_SYNC_CURSOR_REQUEST_ID, 2, static_cast<int64_t>(cursor.lastSyncTimeUs)));
    if (!queryExec(UPSERT_SYNC_CURSOR_REQUEST_ID, errId, error)) {
        LOG_WARN(_logger, "Error running query: " << UPSERT_SYNC_CURSOR_REQUEST_ID << " - " << error);
        return false;
    }

    return true;
}

} // namespace FSC
