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

#include "dbdefs.h"
#include "libcommon/utility/types.h"

#include <log4cplus/logger.h>

#include <memory>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace FSC {

//! One prepared statement. Busy and locked steps are retried for a short while.
class SqliteQuery {
    public:
        explicit SqliteQuery(std::shared_ptr<sqlite3> sqlite3Db);

        int prepare(const std::string &sql, bool allowFailure = false);
        void resetAndClearBindings();
        bool bindValue(int index, const dbtype &value);

        //! Run a statement that returns no row.
        bool exec();

        struct NextResult {
                bool _ok = false;
                bool _hasData = false;
        };
        NextResult next();

        bool nullValue(int index) const;
        std::string stringValue(int index) const;
        int intValue(int index) const;
        int64_t int64Value(int index) const;

        inline int errorId() const { return _errId; }
        inline const std::string &error() const { return _error; }

    private:
        log4cplus::Logger _logger;
        std::shared_ptr<sqlite3> _sqlite3Db;
        std::shared_ptr<sqlite3_stmt> _stmt;
        int _errId = 0;
        std::string _error;
        std::string _sql;
        bool _returnsRows = false;

        int step(bool resetWhenLocked);
        void captureError(const char *what);
};

} // namespace FSC
