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

#include "utility.h"

#include <Poco/DateTime.h>
#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/DateTimeParser.h>
#include <Poco/Exception.h>
#include <Poco/Timestamp.h>
#include <Poco/UUIDGenerator.h>

#include <chrono>
#include <sstream>
#include <thread>

namespace FSC {

void Utility::msleep(int msec) {
    std::chrono::milliseconds dura(msec);
    std::this_thread::sleep_for(dura);
}

std::string Utility::formatStdError(const std::error_code &ec) {
    std::stringstream ss;
    ss << ec.message() << " (" << ec.value() << ")";
    return ss.str();
}

std::string Utility::formatStdError(const SyncPath &path, const std::error_code &ec) {
    std::stringstream ss;
    ss << "path='" << path.string() << "', err='" << formatStdError(ec) << "'";

    return ss.str();
}

std::string Utility::formatIoError(const IoError ioError) {
    return toString(ioError);
}

std::string Utility::formatIoError(const SyncPath &path, const IoError ioError) {
    std::stringstream ss;
    ss << "path='" << path.string() << "', err='" << formatIoError(ioError) << "'";

    return ss.str();
}

std::string Utility::formatSyncPath(const SyncPath &path) {
    std::stringstream ss;
    ss << "path='" << path.string() << "'";

    return ss.str();
}

bool Utility::isoTimeToSyncTime(const std::string &isoTime, SyncTime &time) {
    time = 0;
    if (isoTime.empty()) return false;

    int timeZoneDifferential = 0;
    Poco::DateTime dateTime;
    if (!Poco::DateTimeParser::tryParse(Poco::DateTimeFormat::ISO8601_FRAC_FORMAT, isoTime, dateTime,
                                        timeZoneDifferential) &&
        !Poco::DateTimeParser::tryParse(Poco::DateTimeFormat::ISO8601_FORMAT, isoTime, dateTime, timeZoneDifferential)) {
        return false;
    }

    dateTime.makeUTC(timeZoneDifferential);
    time = dateTime.timestamp().epochMicroseconds();
    return true;
}

std::string Utility::syncTimeToIsoTime(const SyncTime time) {
    const Poco::Timestamp timestamp(static_cast<Poco::Timestamp::TimeVal>(time));
    return Poco::DateTimeFormatter::format(timestamp, Poco::DateTimeFormat::ISO8601_FRAC_FORMAT);
}

SyncTime Utility::currentSyncTime() {
    return Poco::Timestamp().epochMicroseconds();
}

std::string Utility::generateUuid() {
    return Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
}

SyncPath Utility::toLocalPath(const SyncPath &syncRoot, const std::string &itemPath) {
    std::string relative = itemPath;
    while (!relative.empty() && relative.front() == '/') {
        relative.erase(0, 1);
    }
    return relative.empty() ? syncRoot : syncRoot / SyncPath(relative);
}

std::string Utility::toItemPath(const SyncPath &syncRoot, const SyncPath &localPath) {
    const SyncPath relative = localPath.lexically_relative(syncRoot);
    if (relative.empty() || relative == ".") return "/";

    std::string itemPath;
    for (const auto &part: relative) {
        itemPath += "/" + part.string();
    }
    return itemPath;
}

std::string Utility::parentItemPath(const std::string &itemPath) {
    const auto pos = itemPath.find_last_of('/');
    if (pos == std::string::npos || pos == 0) return "/";
    return itemPath.substr(0, pos);
}

std::string Utility::itemName(const std::string &itemPath) {
    const auto pos = itemPath.find_last_of('/');
    return pos == std::string::npos ? itemPath : itemPath.substr(pos + 1);
}

std::string Utility::fileTypeFromName(const std::string &fileName) {
    const auto pos = fileName.find_last_of('.');
    if (pos == std::string::npos || pos == 0 || pos + 1 == fileName.size()) return "unknown";
    return fileName.substr(pos + 1);
}

} // namespace FSC
