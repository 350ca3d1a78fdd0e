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

#include "testtypes.h"
#include "libcommon/utility/types.h"
#include "libcommonserver/log/log.h"

#include <fstream>
#include <sstream>

namespace FSC {

void TestTypes::testStreamConversion() {
    CPPUNIT_ASSERT_EQUAL(std::string("Unknown (0)"), enumClassToStringWithCode(ExitCode::Unknown));
    CPPUNIT_ASSERT_EQUAL(std::string("Ok (1)"), enumClassToStringWithCode(ExitCode::Ok));
    CPPUNIT_ASSERT_EQUAL(std::string("Chunking"), toString(UploadState::Chunking));
    CPPUNIT_ASSERT_EQUAL(std::string("SyncRoundDue"), toString(SyncEventType::SyncRoundDue));
    CPPUNIT_ASSERT_EQUAL(ExitCode::DataError, intToEnumClass<ExitCode>(enumClassToInt(ExitCode::DataError)));

    std::ostringstream os;
    os << ExitInfo(ExitCode::Ok);
    CPPUNIT_ASSERT_EQUAL(std::string("code=Ok (1) cause=Unknown (0)"), os.str());

    // Test Logging of enum class
    LOG_WARN(Log::instance()->getLogger(), "Test log of enumClass: " << UploadState::Confirming);
    std::ifstream is(Log::instance()->getLogFilePath().string());

    // check that the last line of the log file contains the expected string
    std::string line;
    std::string previousLine;
    while (std::getline(is, line)) {
        previousLine = line;
    }
    CPPUNIT_ASSERT(previousLine.find("Test log of enumClass: Confirming") != std::string::npos);
}

void TestTypes::testExitInfo() {
    ExitInfo ei;
    CPPUNIT_ASSERT_EQUAL(ExitCode::Unknown, ei.code());
    CPPUNIT_ASSERT_EQUAL(ExitCause::Unknown, ei.cause());
    CPPUNIT_ASSERT(!ei);

    ei = ExitCode::Ok;
    CPPUNIT_ASSERT(ei);
    CPPUNIT_ASSERT(ei == ExitCode::Ok);
    CPPUNIT_ASSERT_EQUAL(ExitCause::Unknown, ei.cause());

    ei = {ExitCode::DataError, ExitCause::IntegrityCheckFailed};
    CPPUNIT_ASSERT(!ei);
    CPPUNIT_ASSERT(ei == ExitInfo(ExitCode::DataError, ExitCause::IntegrityCheckFailed));
    CPPUNIT_ASSERT(!(ei == ExitInfo(ExitCode::DataError, ExitCause::ManifestGap)));

    ei.setCause(ExitCause::ManifestGap);
    CPPUNIT_ASSERT_EQUAL(ExitCause::ManifestGap, ei.cause());
}

void TestTypes::testRecoverable() {
    CPPUNIT_ASSERT(ExitInfo(ExitCode::NetworkError, ExitCause::NetworkTimeout).isRecoverable());
    CPPUNIT_ASSERT(ExitInfo(ExitCode::RateLimited).isRecoverable());
    CPPUNIT_ASSERT(ExitInfo(ExitCode::BackError, ExitCause::Http5xx).isRecoverable());

    CPPUNIT_ASSERT(!ExitInfo(ExitCode::BackError, ExitCause::HttpErrForbidden).isRecoverable());
    CPPUNIT_ASSERT(!ExitInfo(ExitCode::DataError, ExitCause::IntegrityCheckFailed).isRecoverable());
    CPPUNIT_ASSERT(!ExitInfo(ExitCode::DbError, ExitCause::DbAccessError).isRecoverable());
    CPPUNIT_ASSERT(!ExitInfo(ExitCode::Ok).isRecoverable());
}

} // namespace FSC
