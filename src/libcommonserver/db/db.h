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
#include "sqlitedb.h"

#include <log4cplus/logger.h>

#include <filesystem>
#include <memory>
#include <mutex>

namespace FSC {

/**
 * Base class of the SQLite databases. Owns the connection and the schema version row.
 * Derived classes create their tables in create(), their statements in prepare() and migrate in upgrade().
 */
class Db {
    public:
        explicit Db(const std::filesystem::path &dbPath);
        virtual ~Db();

        bool exists();
        std::filesystem::path dbPath() const { return _dbPath; }
        void close();

        bool queryResetAndClearBindings(const std::string &id);
        bool queryBindValue(const std::string &id, int index, const dbtype &value);
        bool queryExec(const std::string &id, int &errId, std::string &error);
        bool queryNext(const std::string &id, bool &hasData);
        bool queryIntValue(const std::string &id, int index, int &value) const;
        bool queryInt64Value(const std::string &id, int index, int64_t &value) const;
        bool queryStringValue(const std::string &id, int index, std::string &value) const;
        bool queryIsNullValue(const std::string &id, int index, bool &isNull);
        void queryFree(const std::string &id);
        int extendedErrorCode() const;

        //! Create or upgrade the schema to `version`, then prepare the statements.
        bool init(const std::string &version);

        virtual std::string dbType() const { return "Unknown"; }
        virtual bool create(bool &retry) = 0;
        virtual bool prepare() = 0;
        virtual bool upgrade(const std::string &fromVersion, const std::string &toVersion) = 0;

        //! Version found on disk when the database was opened, empty for a new one.
        const std::string &fromVersion() const { return _fromVersion; }
        bool tableExists(const std::string &tableName, bool &exist);

    protected:
        bool startTransaction();
        bool commitTransaction();
        bool rollbackTransaction();
        bool sqlFail(const std::string &log, const std::string &error);
        bool checkConnect(const std::string &version);
        bool createAndPrepareRequest(const char *requestId, const char *query);

        log4cplus::Logger _logger;
        std::shared_ptr<SqliteDb> _sqliteDb;
        std::filesystem::path _dbPath;
        std::mutex _mutex;
        bool _transaction = false;
        std::string _journalMode = "WAL";
        std::string _fromVersion;

    private:
        bool applyPragmas();
        bool readVersion(std::string &version, bool &found);
        bool writeVersion(const std::string &version, bool firstTime);
        bool runOnce(const char *requestId, const char *query);

        friend class TestDb;
};

} // namespace FSC
