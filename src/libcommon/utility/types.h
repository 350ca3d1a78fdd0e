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

#include <string>
#include <filesystem>
#include <ostream>
#include <type_traits>

namespace FSC {

using SyncTime = int64_t;  // Microseconds since epoch
using UniqueId = int64_t;
using EntityId = std::string;
using SyncPath = std::filesystem::path;
using SyncName = std::filesystem::path::string_type;
using DirectoryEntry = std::filesystem::directory_entry;

enum class AppType { None, Server, Test };

enum class EntityKind { Folder, File, Chunk };

enum class ExitCode {
    Unknown,
    Ok,
    NetworkError,
    DataError,    // Malformed or inconsistent content
    DbError,      // Local metadata store
    BackError,    // Rejected by the store
    SystemError,  // Local file system
    LogicError,   // Broken precondition
    RateLimited,  // 429 from the store, retry later
    OperationCanceled
};

enum class ExitCause {
    Unknown,
    DbAccessError,
    DbEntryNotFound,
    SyncDirDoesntExist,
    FileAccessError,
    NotFound,
    NotEnoughDiskSpace,
    NotEnoughMemory,
    NotEnoughINotifyWatches,
    HttpErr,
    HttpErrForbidden,
    Http5xx,
    ApiErr,
    NetworkTimeout,
    InvalidArgument,
    FileModified,           // The file content changed while it was being uploaded
    TransferHandleExpired,  // A presigned transfer location is no longer valid
    NegotiationConflict,
    ConfirmRejected,
    IntegrityCheckFailed,  // Bytes do not hash to the expected fingerprint
    ManifestGap,           // A part number is missing from a chunk manifest
    OperationCanceled
};

enum class UploadState { Chunking, Negotiating, Transferring, Confirming, Done, Failed };

enum class PartStatus { Pending, Uploaded, Confirmed };

enum class UploadOutcome { Unknown, Unchanged, Uploaded };

enum class SyncEventType { FileChanged, FolderCreated, SyncRoundDue };

enum class LogLevel { Debug = 0, Info, Warning, Error, Fatal };

enum class IoError {
    Success,
    AccessDenied,
    DiskFull,
    FileExists,
    FileNameTooLong,
    InvalidArgument,
    IsADirectory,
    NoSuchFileOrDirectory,
    ResultOutOfRange,
    CrossDeviceLink,
    Unknown
};

std::string toString(AppType e);
std::string toString(EntityKind e);
std::string toString(ExitCode e);
std::string toString(ExitCause e);
std::string toString(UploadState e);
std::string toString(PartStatus e);
std::string toString(UploadOutcome e);
std::string toString(SyncEventType e);
std::string toString(LogLevel e);
std::string toString(IoError e);

class ExitInfo {
    public:
        ExitInfo() = default;
        ExitInfo(const ExitCode code, const ExitCause cause) :
            _code(code),
            _cause(cause) {}
        ExitInfo(const ExitCode code) :  // NOLINT(google-explicit-constructor)
            _code(code) {}

        const ExitCode &code() const { return _code; }
        const ExitCause &cause() const { return _cause; }
        void setCode(const ExitCode code) { _code = code; }
        void setCause(const ExitCause cause) { _cause = cause; }

        explicit operator bool() const { return _code == ExitCode::Ok; }
        bool operator==(const ExitInfo &other) const { return _code == other._code && _cause == other._cause; }
        bool operator==(const ExitCode code) const { return _code == code; }

        // Transient failures that are worth another attempt later on
        bool isRecoverable() const {
            return _code == ExitCode::NetworkError || _code == ExitCode::RateLimited ||
                   (_code == ExitCode::BackError && _cause == ExitCause::Http5xx);
        }

    private:
        ExitCode _code = ExitCode::Unknown;
        ExitCause _cause = ExitCause::Unknown;
};

/*
 * Define operator and converter for enum class
 */

// Concepts
template <class C>  // Any enum class
concept EnumClass = std::is_enum_v<C>;

template <class C>  // Any enum class that can be converted to (and from) int
concept IntableEnum = EnumClass<C> && std::is_convertible_v<std::underlying_type_t<C>, int>;

template <class C>  // Any enum class with a toString overload
concept PrintableEnum = EnumClass<C> && requires(C e) {
    toString(e);
};

// Converters
template <IntableEnum C>
inline int enumClassToInt(C e) {
    return static_cast<int>(e);
}

template <IntableEnum C>
inline C intToEnumClass(int e) {
    return static_cast<C>(e);
}

// Stream Operator (toString)
template <PrintableEnum C>
std::string enumClassToStringWithCode(C e) {
    return toString(e) + " (" + std::to_string(enumClassToInt(e)) + ")";  // Example: "Ok (1)"
}

template <PrintableEnum C>
inline std::ostream &operator<<(std::ostream &os, C e) {
    return os << enumClassToStringWithCode(e);
}

inline std::ostream &operator<<(std::ostream &os, const ExitInfo &exitInfo) {
    return os << "code=" << exitInfo.code() << " cause=" << exitInfo.cause();
}

} // namespace FSC
