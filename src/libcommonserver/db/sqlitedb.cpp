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
#include "sqlitedb.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/logiffail.h"
#include "libcommonserver/utility/utility.h"

#include <sqlite3.h>

namespace FSC {

namespace {
constexpr int busyTimeoutMs = 5000;
constexpr const char *quickCheckId = "sqlitedb_quick_check";
} // namespace

SqliteDb::SqliteDb() :
    _logger(Log::instance()->getLogger()) {}

SqliteDb::~SqliteDb() {
    close();
}

bool SqliteDb::openOrCreateReadWrite(const std::filesystem::path &dbPath) {
    if (isOpened()) return true;
    if (!open(dbPath)) return false;

    bool canRecreate = true;
    if (isConsistent(canRecreate)) return true;

    close();
    if (!canRecreate) {
        LOG_WARN(_logger, "Unable to check " << Utility::formatSyncPath(dbPath) << ", giving up");
        return false;
    }

    // Everything in there can be pulled again from the server
    LOG_FATAL(_logger, "Corrupted DB " << Utility::formatSyncPath(dbPath) << ", recreating it");
    if (std::error_code ec; !std::filesystem::remove(dbPath, ec)) {
        LOG_WARN(_logger, "Unable to remove " << Utility::formatStdError(dbPath, ec));
        return false;
    }
    return open(dbPath);
}

void SqliteDb::close() {
    if (!isOpened()) return;

    // Statements must be finalized before the connection goes
    _statements.clear();
    _sqlite3Db.reset();
}

bool SqliteDb::open(const std::filesystem::path &dbPath) {
    sqlite3 *db = nullptr;
    _errId = sqlite3_open_v2(dbPath.string().c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                             nullptr);
    _sqlite3Db.reset(db, sqlite3_close);
    if (_errId != SQLITE_OK || !_sqlite3Db) {
        _error = db ? sqlite3_errmsg(db) : "out of memory";
        LOG_WARN(_logger, "Unable to open " << Utility::formatSyncPath(dbPath) << ": " << _errId << " " << _error
                                            << " (errno " << (db ? sqlite3_system_errno(db) : 0) << ")");
        close();
        return false;
    }

    sqlite3_busy_timeout(_sqlite3Db.get(), busyTimeoutMs);
    return true;
}

bool SqliteDb::execRaw(const char *sql) {
    if (!isOpened()) return false;

    _errId = sqlite3_exec(_sqlite3Db.get(), sql, nullptr, nullptr, nullptr);
    if (_errId != SQLITE_OK) {
        _error = sqlite3_errmsg(_sqlite3Db.get());
        return false;
    }
    return true;
}

bool SqliteDb::isConsistent(bool &canRecreate) {
    canRecreate = true;
    LOG_IF_FAIL(queryCreate(quickCheckId));

    // quick_check can fail with a disk IO error when disk space is low
    if (!queryPrepare(quickCheckId, "PRAGMA quick_check;", true, _errId, _error)) {
        queryFree(quickCheckId);
        canRecreate = _errId != SQLITE_CANTOPEN;
        return false;
    }

    bool hasData = false;
    std::string result;
    const bool ok = queryNext(quickCheckId, hasData) && hasData && queryStringValue(quickCheckId, 0, result);
    queryFree(quickCheckId);
    if (!ok || result != "ok") {
        LOG_WARN(_logger, "quick_check returned \"" << result << "\"");
        return false;
    }
    return true;
}

SqliteDb::Statement *SqliteDb::statement(const std::string &id) {
    const auto it = _statements.find(id);
    return it == _statements.end() ? nullptr : &it->second;
}

const SqliteDb::Statement *SqliteDb::rowStatement(const std::string &id) const {
    const auto it = _statements.find(id);
    if (it == _statements.end() || !it->second.hasRow) return nullptr;
    return &it->second;
}

bool SqliteDb::queryCreate(const std::string &id) {
    if (_statements.contains(id)) {
        LOG_WARN(_logger, "Query " << id << " already exists");
        return false;
    }
    _statements[id].query = std::make_unique<SqliteQuery>(_sqlite3Db);
    return true;
}

bool SqliteDb::queryPrepare(const std::string &id, const std::string &sql, const bool allowFailure, int &errId,
                            std::string &error) {
    Statement *stmt = statement(id);
    if (!stmt) return false;

    stmt->hasRow = false;
    stmt->prepared = stmt->query->prepare(sql, allowFailure) == SQLITE_OK;
    errId = stmt->query->errorId();
    error = stmt->query->error();
    return stmt->prepared;
}

bool SqliteDb::queryResetAndClearBindings(const std::string &id) {
    Statement *stmt = statement(id);
    if (!stmt) return false;

    stmt->query->resetAndClearBindings();
    stmt->hasRow = false;
    return true;
}

bool SqliteDb::queryBindValue(const std::string &id, const int index, const dbtype &value) {
    Statement *stmt = statement(id);
    return stmt && stmt->query->bindValue(index, value);
}

bool SqliteDb::queryExec(const std::string &id, int &errId, std::string &error) {
    Statement *stmt = statement(id);
    if (!stmt || !stmt->prepared) return false;

    const bool ok = stmt->query->exec();
    errId = stmt->query->errorId();
    error = stmt->query->error();
    return ok;
}

bool SqliteDb::queryNext(const std::string &id, bool &hasData) {
    hasData = false;
    Statement *stmt = statement(id);
    if (!stmt || !stmt->prepared) return false;

    const SqliteQuery::NextResult result = stmt->query->next();
    stmt->hasRow = result._hasData;
    hasData = result._hasData;
    return result._ok;
}

bool SqliteDb::queryIntValue(const std::string &id, const int index, int &value) const {
    const Statement *stmt = rowStatement(id);
    if (!stmt) return false;
    value = stmt->query->intValue(index);
    return true;
}

bool SqliteDb::queryInt64Value(const std::string &id, const int index, int64_t &value) const {
    const Statement *stmt = rowStatement(id);
    if (!stmt) return false;
    value = stmt->query->int64Value(index);
    return true;
}

bool SqliteDb::queryStringValue(const std::string &id, const int index, std::string &value) const {
    const Statement *stmt = rowStatement(id);
    if (!stmt) return false;
    value = stmt->query->stringValue(index);
    return true;
}

bool SqliteDb::queryIsNullValue(const std::string &id, const int index, bool &isNull) const {
    const Statement *stmt = rowStatement(id);
    if (!stmt) return false;
    isNull = stmt->query->nullValue(index);
    return true;
}

void SqliteDb::queryFree(const std::string &id) noexcept {
    (void) _statements.erase(id);
}

int SqliteDb::numRowsAffected() const {
    return sqlite3_changes(_sqlite3Db.get());
}

int SqliteDb::extendedErrorCode() const {
    return sqlite3_extended_errcode(_sqlite3Db.get());
}

} // namespace FSC
