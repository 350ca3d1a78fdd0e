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

#include "sqlitequery.h"

#include <log4cplus/logger.h>

#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>

struct sqlite3;

namespace FSC {

//! SQLite connection plus its statements, looked up by id.
class SqliteDb {
    public:
        SqliteDb();
        ~SqliteDb();

        //! Open the file, creating it if needed. A file failing the consistency check is recreated.
        bool openOrCreateReadWrite(const std::filesystem::path &dbPath);
        bool isOpened() const { return _sqlite3Db != nullptr; }
        bool startTransaction() { return execRaw("BEGIN"); }
        bool commit() { return execRaw("COMMIT"); }
        bool rollback() { return execRaw("ROLLBACK"); }
        void close();

        bool queryCreate(const std::string &id);
        bool queryPrepare(const std::string &id, const std::string &sql, bool allowFailure, int &errId, std::string &error);
        bool queryResetAndClearBindings(const std::string &id);
        bool queryBindValue(const std::string &id, int index, const dbtype &value);
        bool queryExec(const std::string &id, int &errId, std::string &error);
        bool queryNext(const std::string &id, bool &hasData);
        bool queryIntValue(const std::string &id, int index, int &value) const;
        bool queryInt64Value(const std::string &id, int index, int64_t &value) const;
        bool queryStringValue(const std::string &id, int index, std::string &value) const;
        bool queryIsNullValue(const std::string &id, int index, bool &isNull) const;
        void queryFree(const std::string &id) noexcept;

        int numRowsAffected() const;
        inline int errorId() const { return _errId; }
        inline const std::string &error() const { return _error; }
        int extendedErrorCode() const;

    private:
        struct Statement {
                std::unique_ptr<SqliteQuery> query;
                bool prepared = false;
                bool hasRow = false;
        };

        log4cplus::Logger _logger;
        std::shared_ptr<sqlite3> _sqlite3Db;
        int _errId = 0;
        std::string _error;
        std::unordered_map<std::string, Statement> _statements;

        bool open(const std::filesystem::path &dbPath);
        bool execRaw(const char *sql);
        //! Run PRAGMA quick_check. `canRecreate` is false when the file could not even be read.
        bool isConsistent(bool &canRecreate);
        Statement *statement(const std::string &id);
        const Statement *rowStatement(const std::string &id) const;
};

} // namespace FSC
