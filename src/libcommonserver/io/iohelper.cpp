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
#include "iohelper.h"
#include "libcommonserver/log/log.h"
#include "libcommonserver/utility/utility.h"

#include <cerrno>

namespace FSC {

log4cplus::Logger IoHelper::logger() {
    if (Log::isSet()) return Log::instance()->getLogger();
    return log4cplus::Logger::getInstance(Log::instanceName);
}

IoError IoHelper::posixError2ioError(const int error) noexcept {
    switch (error) {
        case 0:
            return IoError::Success;
        case EACCES:
        case EPERM:
        case EROFS:
            return IoError::AccessDenied;
        case EEXIST:
        case ENOTEMPTY:
            return IoError::FileExists;
        case EISDIR:
            return IoError::IsADirectory;
        case EINVAL:
            return IoError::InvalidArgument;
        case ENAMETOOLONG:
            return IoError::FileNameTooLong;
        case ENOENT:
        case ENOTDIR:
            return IoError::NoSuchFileOrDirectory;
        case ENOSPC:
        case EDQUOT:
            return IoError::DiskFull;
        case ERANGE:
            return IoError::ResultOutOfRange;
        case EXDEV:
            return IoError::CrossDeviceLink;
        default:
            return IoError::Unknown;
    }
}

// std::filesystem reports errno values through the generic category on Linux
IoError IoHelper::stdError2ioError(const std::error_code &ec) noexcept {
    return posixError2ioError(ec.value());
}

ExitInfo IoHelper::ioError2ExitInfo(const IoError ioError) noexcept {
    switch (ioError) {
        case IoError::Success:
            return ExitCode::Ok;
        case IoError::AccessDenied:
            return ExitInfo{ExitCode::SystemError, ExitCause::FileAccessError};
        case IoError::NoSuchFileOrDirectory:
            return ExitInfo{ExitCode::SystemError, ExitCause::NotFound};
        case IoError::DiskFull:
            return ExitInfo{ExitCode::SystemError, ExitCause::NotEnoughDiskSpace};
        case IoError::InvalidArgument:
        case IoError::FileNameTooLong:
            return ExitInfo{ExitCode::SystemError, ExitCause::InvalidArgument};
        default:
            return ExitInfo{ExitCode::SystemError, ExitCause::Unknown};
    }
}

bool IoHelper::isExpectedError(const IoError ioError) noexcept {
    return ioError == IoError::NoSuchFileOrDirectory || ioError == IoError::AccessDenied;
}

bool IoHelper::checkIfPathExists(const SyncPath &path, bool &exists, IoError &ioError) noexcept {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    ioError = stdError2ioError(ec);
    if (ioError == IoError::NoSuchFileOrDirectory) {
        // A missing item is an answer, not a failure
        exists = false;
        ioError = IoError::Success;
        return true;
    }

    exists = ioError == IoError::Success && status.type() != std::filesystem::file_type::not_found;
    return ioError == IoError::Success || isExpectedError(ioError);
}

bool IoHelper::checkIfIsDirectory(const SyncPath &path, bool &isDirectory, IoError &ioError) noexcept {
    std::error_code ec;
    isDirectory = std::filesystem::is_directory(path, ec);
    ioError = stdError2ioError(ec);
    if (ioError != IoError::Success) {
        isDirectory = false;
        return isExpectedError(ioError);
    }
    return true;
}

bool IoHelper::getFileSize(const SyncPath &path, uint64_t &size, IoError &ioError) {
    size = 0;

    bool isDirectory = false;
    if (!checkIfIsDirectory(path, isDirectory, ioError)) {
        LOG_WARN(logger(), "Unable to stat " << Utility::formatIoError(path, ioError));
        return false;
    }
    if (ioError != IoError::Success) return true;

    if (isDirectory) {
        ioError = IoError::IsADirectory;
        return false;
    }

    std::error_code ec;
    const auto fileSize = std::filesystem::file_size(path, ec);
    ioError = stdError2ioError(ec);
    if (ioError == IoError::Success) {
        size = static_cast<uint64_t>(fileSize);
        return true;
    }

    LOG_DEBUG(logger(), "No size for " << Utility::formatIoError(path, ioError));
    return isExpectedError(ioError);
}

bool IoHelper::createDirectory(const SyncPath &path, const bool recursive, IoError &ioError) noexcept {
    std::error_code ec;
    const bool created = recursive ? std::filesystem::create_directories(path, ec) : std::filesystem::create_directory(path, ec);
    ioError = stdError2ioError(ec);
    if (!created && ioError == IoError::Success) {
        ioError = IoError::FileExists;
    }
    return created;
}

bool IoHelper::renameItem(const SyncPath &sourcePath, const SyncPath &destinationPath, IoError &ioError) noexcept {
    std::error_code ec;
    std::filesystem::rename(sourcePath, destinationPath, ec);
    ioError = stdError2ioError(ec);
    return ioError == IoError::Success;
}

bool IoHelper::deleteItem(const SyncPath &path, IoError &ioError) noexcept {
    std::error_code ec;
    (void) std::filesystem::remove_all(path, ec);
    ioError = stdError2ioError(ec);
    return ioError == IoError::Success;
}

bool IoHelper::getDirectoryIterator(const SyncPath &path, const bool recursive, IoError &ioError,
                                    DirectoryIterator &iterator) noexcept {
    iterator = DirectoryIterator(path, recursive, ioError);
    return ioError == IoError::Success;
}

ExitInfo IoHelper::openFile(const SyncPath &path, std::ifstream &file) {
    if (file.is_open()) file.close();

    errno = 0;
    file.open(path, std::ios::binary);
    if (file.is_open()) return ExitCode::Ok;

    IoError ioError = errno ? posixError2ioError(errno) : IoError::Unknown;
    if (ioError == IoError::Unknown) {
        bool exists = false;
        if (checkIfPathExists(path, exists, ioError) && !exists) {
            ioError = IoError::NoSuchFileOrDirectory;
        }
    }

    if (!isExpectedError(ioError)) {
        LOG_WARN(logger(), "Unexpected read error for " << Utility::formatIoError(path, ioError));
    }
    return ioError2ExitInfo(ioError);
}

ExitInfo IoHelper::readFileRange(const SyncPath &path, const uint64_t offset, const uint64_t size, std::string &bytes) {
    bytes.clear();

    std::ifstream file;
    if (const ExitInfo exitInfo = openFile(path, file); !exitInfo) {
        return exitInfo;
    }

    std::string buffer(size, '\0');
    file.seekg(static_cast<std::streamoff>(offset));
    if (size > 0) {
        file.read(buffer.data(), static_cast<std::streamsize>(size));
    }
    if (file.bad() || static_cast<uint64_t>(file.gcount()) != size) {
        // Truncated since it was scanned
        return ExitInfo{ExitCode::DataError, ExitCause::FileModified};
    }

    bytes = std::move(buffer);
    return ExitCode::Ok;
}

bool IoHelper::writeFile(const SyncPath &path, const std::string &bytes, IoError &ioError) {
    errno = 0;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (file.is_open()) {
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        file.close();
    }

    if (!file.is_open() && !file.fail()) {
        ioError = IoError::Success;
        return true;
    }

    ioError = errno ? posixError2ioError(errno) : IoError::Unknown;
    LOG_DEBUG(logger(), "Write failed for " << Utility::formatIoError(path, ioError));
    return false;
}

IoHelper::DirectoryIterator::DirectoryIterator(const SyncPath &directoryPath, const bool recursive, IoError &ioError) :
    _recursive(recursive) {
    std::error_code ec;
    _it = std::filesystem::recursive_directory_iterator(directoryPath,
                                                        std::filesystem::directory_options::skip_permission_denied, ec);
    ioError = stdError2ioError(ec);
    _valid = ioError == IoError::Success;
}

bool IoHelper::DirectoryIterator::next(DirectoryEntry &nextEntry, bool &endOfDirectory, IoError &ioError) {
    endOfDirectory = false;
    ioError = IoError::Success;
    if (!_valid) {
        ioError = IoError::InvalidArgument;
        return false;
    }

    if (_started && _it != std::filesystem::recursive_directory_iterator()) {
        std::error_code ec;
        _it.increment(ec);
        if (ec) {
            ioError = stdError2ioError(ec);
            _valid = false;
            return false;
        }
    }
    _started = true;

    if (_it == std::filesystem::recursive_directory_iterator()) {
        endOfDirectory = true;
        return true;
    }

    if (!_recursive) _it.disable_recursion_pending();
    nextEntry = *_it;
    return true;
}

} // namespace FSC
