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

#include <algorithm>
#include <cstdlib>
#include <random>

#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace FSC {

namespace {

SyncPath homeDir() {
    if (const char *home = std::getenv("HOME"); home && *home) return home;
    if (const passwd *pw = getpwuid(getuid()); pw && pw->pw_dir) return pw->pw_dir;
    return {};
}

bool ensureDirectory(const SyncPath &dirPath) {
    std::error_code ec;
    if (std::filesystem::is_directory(dirPath, ec)) return true;
    (void) std::filesystem::create_directory(dirPath, ec);
    return !ec;
}

} // namespace

std::string CommonUtility::generateRandomStringAlphaNum(const int length) {
    static constexpr char alphabet[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);

    std::string result(static_cast<size_t>(std::max(length, 0)), '0');
    for (char &c: result) c = alphabet[pick(engine)];
    return result;
}

const std::string &CommonUtility::userAgentString() {
    static const std::string userAgent = [] {
        std::string platform = "Linux";
        if (utsname buf{}; uname(&buf) == 0) platform = std::string(buf.sysname) + " " + buf.release;
        return std::string(FS_APPLICATION_NAME) + " / " + FS_VERSION_STRING + " (" + platform + ")";
    }();
    return userAgent;
}

const std::string &CommonUtility::currentVersion() {
    static const std::string version(FS_VERSION_STRING);
    return version;
}

std::string CommonUtility::toLower(const std::string &str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](const unsigned char c) { return std::tolower(c); });
    return lower;
}

bool CommonUtility::startsWith(const std::string &str, const std::string &prefix) {
    return str.starts_with(prefix);
}

bool CommonUtility::endsWith(const std::string &str, const std::string &suffix) {
    return str.ends_with(suffix);
}

SyncPath CommonUtility::getAppSupportDir() {
    const SyncPath home = homeDir();
    if (home.empty()) return {};

    const SyncPath configDir = home / ".config";
    const SyncPath appDir = configDir / FS_APPLICATION_NAME;
    if (!ensureDirectory(configDir) || !ensureDirectory(appDir)) return {};
    return appDir;
}

std::string CommonUtility::envVarValue(const std::string &name) {
    bool isSet = false;
    return envVarValue(name, isSet);
}

std::string CommonUtility::envVarValue(const std::string &name, bool &isSet) {
    const char *value = std::getenv(name.c_str());
    isSet = value != nullptr;
    return isSet ? std::string(value) : std::string();
}

} // namespace FSC
