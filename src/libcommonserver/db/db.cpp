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
#include "db.h"
#include "libcommonserver/io/iohelper.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/logiffail.h"
#include "libcommonserver/utility/utility.h"

#include <sqlite3.h>

#include <array>
#include <utility>

namespace FSC {

namespace {

constexpr const char *sqliteVersionId = "db_sqlite_version";
constexpr const char *tableExistsId = "db_table_exists";
constexpr const char *createVersionId = "db_create_version";
constexpr const char *insertVersionId = "db_insert_version";
constexpr const char *updateVersionId = "db_update_version";
constexpr const char *selectVersionId = "db_select_version";

} // namespace

Db::Db(const std::filesystem::path &dbPath) :
    _logger(Log::instance()->getLogger()),
    _sqliteDb(std::make_shared<SqliteDb>()),
    _dbPath(dbPath) {}

Db::~Db() {
    close();
}

bool Db::exists() {
    const std::scoped_lock lock(_mutex);
    if (_dbPath.empty()) return false;

    bool exists = false;
    if (IoError ioError = IoError::Success; !IoHelper::checkIfPathExists(_dbPath, exists, ioError)) {
        LOG_WARN(_logger, "Unable to check " << Utility::formatIoError(_dbPath, ioError));
        return false;
    }
    return exists;
}

void Db::close() {
    if (!_sqliteDb || !_sqliteDb->isOpened()) return;

    const std::scoped_lock lock(_mutex);
    LOG_DEBUG(_logger, "Closing " << dbType() << " DB " << Utility::formatSyncPath(_dbPath));
    (void) commitTransaction();
    _sqliteDb->close();
}

bool Db::queryResetAndClearBindings(const std::string &id) {
    return _sqliteDb->queryResetAndClearBindings(id);
}

bool Db::queryBindValue(const std::string &id, const int index, const dbtype &value) {
    return _sqliteDb->queryBindValue(id, index, value);
}

bool Db::queryExec(const std::string &id, int &errId, std::string &error) {
    const bool ok = _sqliteDb->queryExec(id, errId, error);
    LOG_IF_FAIL(_sqliteDb->queryResetAndClearBindings(id));
    return ok;
}

bool Db::queryNext(const std::string &id, bool &hasData) {
    const bool ok = _sqliteDb->queryNext(id, hasData);
    // Leave the statement positioned on the row while there is one to read
    if (!ok || !hasData) {
        LOG_IF_FAIL(_sqliteDb->queryResetAndClearBindings(id));
    }
    return ok;
}

bool Db::queryIntValue(const std::string &id, const int index, int &value) const {
    return _sqliteDb->queryIntValue(id, index, value);
}

bool Db::queryInt64Value(const std::string &id, const int index, int64_t &value) const {
    return _sqliteDb->queryInt64Value(id, index, value);
}

bool Db::queryStringValue(const std::string &id, const int index, std::string &value) const {
    return _sqliteDb->queryStringValue(id, index, value);
}

bool Db::queryIsNullValue(const std::string &id, const int index, bool &isNull) {
    return _sqliteDb->queryIsNullValue(id, index, isNull);
}

void Db::queryFree(const std::string &id) {
    _sqliteDb->queryFree(id);
}

int Db::extendedErrorCode() const {
    return _sqliteDb->extendedErrorCode();
}

bool Db::init(const std::string &version) {
    if (!createAndPrepareRequest(tableExistsId, "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?1;")) return false;

    bool hasVersionTable = false;
    if (!tableExists("version", hasVersionTable)) return false;

    if (!hasVersionTable) {
        LOG_INFO(_logger, "Create " << dbType() << " DB version " << version);
        if (!runOnce(createVersionId, "CREATE TABLE IF NOT EXISTS version(value TEXT);")) return false;
        if (!writeVersion(version, true)) return false;

        bool retry = false;
        if (!create(retry)) {
            if (!retry) {
                LOG_WARN(_logger, "Unable to create the " << dbType() << " DB schema");
                return false;
            }
            // The derived class changed a connection setting, reopen and start over
            LOG_INFO(_logger, "Reopening the " << dbType() << " DB before retrying");
            _sqliteDb->close();
            return checkConnect(version) && init(version);
        }
    } else {
        bool found = false;
        if (!readVersion(_fromVersion, found)) return false;
        if (!found) {
            LOG_WARN(_logger, "The version table of the " << dbType() << " DB is empty");
            return false;
        }

        if (_fromVersion != version) {
            LOG_INFO(_logger, "Upgrade " << dbType() << " DB from " << _fromVersion << " to " << version);
            if (!upgrade(_fromVersion, version) || !writeVersion(version, false)) return false;
        }
    }

    if (!prepare()) {
        LOG_WARN(_logger, "Unable to prepare the " << dbType() << " DB statements");
        return false;
    }
    return true;
}

bool Db::startTransaction() {
    if (_transaction) {
        LOG_DEBUG(_logger, "A transaction is already running");
        return false;
    }
    if (!_sqliteDb->startTransaction()) {
        LOG_WARN(_logger, "BEGIN failed: " << _sqliteDb->error());
        return false;
    }
    _transaction = true;
    return true;
}

bool Db::commitTransaction() {
    if (!_transaction) return true;

    if (!_sqliteDb->commit()) {
        LOG_WARN(_logger, "COMMIT failed: " << _sqliteDb->error());
        return false;
    }
    _transaction = false;
    return true;
}

bool Db::rollbackTransaction() {
    if (!_transaction) return false;

    if (!_sqliteDb->rollback()) {
        LOG_WARN(_logger, "ROLLBACK failed: " << _sqliteDb->error());
        return false;
    }
    _transaction = false;
    return true;
}

bool Db::sqlFail(const std::string &log, const std::string &error) {
    (void) rollbackTransaction();
    LOG_WARN(_logger, "SQL error in " << log << ": " << error);
    return false;
}

bool Db::checkConnect(const std::string & /*version*/) {
    if (_sqliteDb->isOpened()) {
        // An open handle says nothing about the file still being there
        bool exists = false;
        if (IoError ioError = IoError::Success; !IoHelper::checkIfPathExists(_dbPath, exists, ioError) || !exists) {
            LOG_WARN(_logger, "DB file is gone: " << Utility::formatIoError(_dbPath, ioError));
            close();
            return false;
        }
        return true;
    }

    if (_dbPath.empty()) {
        LOG_WARN(_logger, "No DB path");
        return false;
    }

    if (!_sqliteDb->openOrCreateReadWrite(_dbPath)) {
        LOG_WARN(_logger, "Unable to open " << Utility::formatSyncPath(_dbPath) << ": " << _sqliteDb->error());
        return false;
    }

    return applyPragmas();
}

bool Db::applyPragmas() {
    if (!createAndPrepareRequest(sqliteVersionId, "SELECT sqlite_version();")) return false;
    bool hasData = false;
    std::string sqliteVersion;
    const bool ok = queryNext(sqliteVersionId, hasData) && hasData && queryStringValue(sqliteVersionId, 0, sqliteVersion);
    queryFree(sqliteVersionId);
    if (!ok) {
        LOG_WARN(_logger, "Unable to read the SQLite version");
        return false;
    }
    LOG_DEBUG(_logger, "SQLite " << sqliteVersion << ", journal mode " << _journalMode);

    // NORMAL is only corruption-safe with a write-ahead log
    const std::string synchronous = _journalMode == "WAL" ? "NORMAL" : "FULL";
    const std::array<std::pair<std::string, std::string>, 5> pragmas{{
            {"db_locking_mode", "PRAGMA locking_mode=NORMAL;"},
            {"db_journal_mode", "PRAGMA journal_mode=" + _journalMode + ";"},
            {"db_synchronous", "PRAGMA synchronous=" + synchronous + ";"},
            {"db_case_sensitive_like", "PRAGMA case_sensitive_like=ON;"},
            {"db_foreign_keys", "PRAGMA foreign_keys=ON;"},
    }};

    for (const auto &[id, sql]: pragmas) {
        if (!createAndPrepareRequest(id.c_str(), sql.c_str())) return false;
        bool unused = false;
        const bool stepped = queryNext(id, unused);
        queryFree(id);
        if (!stepped) {
            LOG_WARN(_logger, "Unable to run " << sql);
            return false;
        }
    }
    return true;
}

bool Db::createAndPrepareRequest(const char *requestId, const char *query) {
    if (!_sqliteDb->queryCreate(requestId)) {
        LOG_FATAL(_logger, "Unable to create query " << requestId);
        return false;
    }

    int errId = 0;
    if (std::string error; !_sqliteDb->queryPrepare(requestId, query, false, errId, error)) {
        queryFree(requestId);
        return sqlFail(requestId, error);
    }
    return true;
}

bool Db::runOnce(const char *requestId, const char *query) {
    if (!createAndPrepareRequest(requestId, query)) return false;

    int errId = 0;
    std::string error;
    const bool ok = queryExec(requestId, errId, error);
    queryFree(requestId);
    return ok || sqlFail(requestId, error);
}

bool Db::tableExists(const std::string &tableName, bool &exist) {
    const std::scoped_lock lock(_mutex);

    LOG_IF_FAIL(queryResetAndClearBindings(tableExistsId));
    LOG_IF_FAIL(queryBindValue(tableExistsId, 1, tableName));
    if (!queryNext(tableExistsId, exist)) {
        LOG_WARN(_logger, "Unable to look up table " << tableName);
        return false;
    }
    LOG_IF_FAIL(queryResetAndClearBindings(tableExistsId));
    return true;
}

bool Db::readVersion(std::string &version, bool &found) {
    if (!createAndPrepareRequest(selectVersionId, "SELECT value FROM version;")) return false;

    const std::scoped_lock lock(_mutex);
    const bool ok = queryNext(selectVersionId, found);
    if (ok && found) {
        LOG_IF_FAIL(queryStringValue(selectVersionId, 0, version));
    }
    queryFree(selectVersionId);
    if (!ok) LOG_WARN(_logger, "Unable to read the " << dbType() << " DB version");
    return ok;
}

bool Db::writeVersion(const std::string &version, const bool firstTime) {
    const char *requestId = firstTime ? insertVersionId : updateVersionId;
    const char *query = firstTime ? "INSERT INTO version (value) VALUES (?1);" : "UPDATE version SET value=?1;";
    if (!createAndPrepareRequest(requestId, query)) return false;

    const std::scoped_lock lock(_mutex);
    int errId = 0;
    std::string error;
    LOG_IF_FAIL(queryBindValue(requestId, 1, version));
    const bool ok = queryExec(requestId, errId, error) && (firstTime || _sqliteDb->numRowsAffected() == 1);
    queryFree(requestId);
    if (!ok) LOG_WARN(_logger, "Unable to store the " << dbType() << " DB version " << version << ": " << error);
    return ok;
}

} // namespace FSC
