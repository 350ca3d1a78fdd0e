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
#include "sqlitequery.h"
#include "libcommon/utility/utility.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/logiffail.h"
#include "libcommonserver/utility/utility.h"

#include <sqlite3.h>

namespace FSC {

namespace {

constexpr int busyRetryCount = 20;
constexpr int busyRetrySleepMs = 100;

bool isBusy(const int rc) {
    return rc == SQLITE_BUSY || rc == SQLITE_LOCKED;
}

std::string trimmed(const std::string &str) {
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    return str.substr(first, str.find_last_not_of(" \t\r\n") - first + 1);
}

template<class... Ts>
struct overloaded : Ts... {
        using Ts::operator()...;
};

} // namespace

SqliteQuery::SqliteQuery(std::shared_ptr<sqlite3> sqlite3Db) :
    _logger(Log::instance()->getLogger()),
    _sqlite3Db(std::move(sqlite3Db)) {}

int SqliteQuery::prepare(const std::string &sql, const bool allowFailure) {
    _sql = trimmed(sql);
    _stmt.reset();
    _errId = SQLITE_OK;
    if (_sql.empty()) return _errId;

    const std::string lower = CommonUtility::toLower(_sql);
    _returnsRows = CommonUtility::startsWith(lower, "select") || CommonUtility::startsWith(lower, "pragma");

    for (int attempt = 0;; ++attempt) {
        sqlite3_stmt *stmt = nullptr;
        _errId = sqlite3_prepare_v2(_sqlite3Db.get(), _sql.c_str(), -1, &stmt, nullptr);
        _stmt.reset(stmt, sqlite3_finalize);
        if (!isBusy(_errId) || attempt + 1 >= busyRetryCount) break;
        Utility::msleep(busyRetrySleepMs);
    }

    if (_errId != SQLITE_OK) {
        captureError("prepare");
        LOG_IF_FAIL(allowFailure, "Unexpected SQLite prepare failure");
    }
    return _errId;
}

void SqliteQuery::resetAndClearBindings() {
    if (!_stmt) return;
    (void) sqlite3_reset(_stmt.get());
    (void) sqlite3_clear_bindings(_stmt.get());
}

bool SqliteQuery::bindValue(const int index, const dbtype &value) {
    if (!_stmt) return false;

    sqlite3_stmt *stmt = _stmt.get();
    const int rc = std::visit(overloaded{
                                      [&](std::monostate) { return sqlite3_bind_null(stmt, index); },
                                      [&](int v) { return sqlite3_bind_int(stmt, index, v); },
                                      [&](int64_t v) { return sqlite3_bind_int64(stmt, index, v); },
                                      [&](double v) { return sqlite3_bind_double(stmt, index, v); },
                                      [&](const std::string &v) {
                                          return sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
                                      },
                              },
                              value);
    if (rc != SQLITE_OK) {
        LOG_WARN(_logger, "Unable to bind parameter " << index << " of " << _sql << ": " << rc);
        return false;
    }
    return true;
}

int SqliteQuery::step(const bool resetWhenLocked) {
    int rc = SQLITE_OK;
    for (int attempt = 0;; ++attempt) {
        rc = sqlite3_step(_stmt.get());
        if (!isBusy(rc) || attempt + 1 >= busyRetryCount) break;
        if (resetWhenLocked) (void) sqlite3_reset(_stmt.get());
        Utility::msleep(busyRetrySleepMs);
    }
    return rc;
}

bool SqliteQuery::exec() {
    if (_returnsRows) return false;
    if (!_stmt) {
        LOG_WARN(_logger, "Statement not prepared");
        return false;
    }

    _errId = step(true);
    if (_errId != SQLITE_DONE && _errId != SQLITE_ROW) {
        captureError("exec");
        if (_errId == SQLITE_IOERR) {
            LOG_WARN(_logger, "IOERR extended code " << sqlite3_extended_errcode(_sqlite3Db.get()));
        }
    }
    return _errId == SQLITE_DONE;
}

SqliteQuery::NextResult SqliteQuery::next() {
    // Only the first step of a cursor can be safely restarted
    const bool firstStep = !sqlite3_stmt_busy(_stmt.get());
    _errId = step(firstStep);

    NextResult result;
    result._hasData = _errId == SQLITE_ROW;
    result._ok = result._hasData || _errId == SQLITE_DONE;
    if (!result._ok) captureError("step");
    return result;
}

void SqliteQuery::captureError(const char *what) {
    _error = sqlite3_errmsg(_sqlite3Db.get());
    LOG_WARN(_logger, "SQLite " << what << " error " << _errId << " (" << _error << ") in " << _sql);
}

bool SqliteQuery::nullValue(const int index) const {
    return sqlite3_column_type(_stmt.get(), index) == SQLITE_NULL;
}

std::string SqliteQuery::stringValue(const int index) const {
    const auto *text = sqlite3_column_text(_stmt.get(), index);
    return text ? std::string(reinterpret_cast<const char *>(text)) : std::string();
}

int SqliteQuery::intValue(const int index) const {
    return sqlite3_column_int(_stmt.get(), index);
}

int64_t SqliteQuery::int64Value(const int index) const {
    return sqlite3_column_int64(_stmt.get(), index);
}

} // namespace FSC
