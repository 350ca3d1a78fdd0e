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

#include <log4cplus/logger.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace FSC {

struct IoHelper {
    public:
        class DirectoryIterator {
            public:
                DirectoryIterator(const SyncPath &directoryPath, bool recursive, IoError &ioError);

                DirectoryIterator() = default;
                //! Get the next directory entry.
                /*!
                  \param nextEntry is set with the next directory entry.
                  \param endOfDirectory is set to true when the iteration is over.
                  \param ioError holds the error returned when an underlying OS API call fails.
                  \return true if no error occurred, false otherwise.
                */
                bool next(DirectoryEntry &nextEntry, bool &endOfDirectory, IoError &ioError);

            private:
                bool _recursive = false;
                bool _started = false;
                bool _valid = false;
                std::filesystem::recursive_directory_iterator _it;
        };

        IoHelper() = default;

        static IoError posixError2ioError(int error) noexcept;
        static IoError stdError2ioError(const std::error_code &ec) noexcept;

        //! Map an IoError to the ExitInfo reported to the caller of a sync operation.
        static ExitInfo ioError2ExitInfo(IoError ioError) noexcept;

        //! Check if the item indicated by `path` exists.
        /*!
          \param path is the file system path of the item.
          \param exists is a boolean set with true if the item exists, false otherwise.
          \param ioError holds the error returned when an underlying OS API call fails.
          \return true if no unexpected error occurred, false otherwise.
        */
        static bool checkIfPathExists(const SyncPath &path, bool &exists, IoError &ioError) noexcept;

        //! Get the size of the file indicated by `path`, in bytes.
        [[nodiscard]] static bool getFileSize(const SyncPath &path, uint64_t &size, IoError &ioError);

        //! Check if the item indicated by `path` is a directory.
        static bool checkIfIsDirectory(const SyncPath &path, bool &isDirectory, IoError &ioError) noexcept;

        //! Create a directory located under the specified path.
        /*!
          \param path is the file system path of the directory to create.
          \param recursive is a boolean indicating whether the missing parent directories must be created too.
          \param ioError holds the error returned when an underlying OS API call fails. Set with FileExists if the directory
          was already there.
          \return true if the directory has been created.
        */
        static bool createDirectory(const SyncPath &path, bool recursive, IoError &ioError) noexcept;

        //! Replaces destinationPath if it exists. Both paths must be on the same file system.
        static bool renameItem(const SyncPath &sourcePath, const SyncPath &destinationPath, IoError &ioError) noexcept;
        static bool deleteItem(const SyncPath &path, IoError &ioError) noexcept;

        static bool getDirectoryIterator(const SyncPath &path, bool recursive, IoError &ioError,
                                         DirectoryIterator &iterator) noexcept;

        //! Open a file for binary reading.
        static ExitInfo openFile(const SyncPath &path, std::ifstream &file);

        //! Read `size` bytes at `offset` in the file indicated by `path`.
        static ExitInfo readFileRange(const SyncPath &path, uint64_t offset, uint64_t size, std::string &bytes);

        //! Write `bytes` to the file indicated by `path`, replacing its content.
        static bool writeFile(const SyncPath &path, const std::string &bytes, IoError &ioError);

        static bool isExpectedError(IoError ioError) noexcept;

    protected:
        static log4cplus::Logger logger();
};

} // namespace FSC
