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

#include "types.h"

namespace FSC {

static const std::string noConversionStr("No conversion to string available");

std::string toString(const AppType e) {
    switch (e) {
        case AppType::None:
            return "None";
        case AppType::Server:
            return "Server";
        case AppType::Test:
            return "Test";
        default:
            return noConversionStr;
    }
}

std::string toString(const EntityKind e) {
    switch (e) {
        case EntityKind::Folder:
            return "Folder";
        case EntityKind::File:
            return "File";
        case EntityKind::Chunk:
            return "Chunk";
        default:
            return noConversionStr;
    }
}

std::string toString(const ExitCode e) {
    switch (e) {
        case ExitCode::Unknown:
            return "Unknown";
        case ExitCode::Ok:
            return "Ok";
        case ExitCode::NetworkError:
            return "NetworkError";
        case ExitCode::DataError:
            return "DataError";
        case ExitCode::DbError:
            return "DbError";
        case ExitCode::BackError:
            return "BackError";
        case ExitCode::SystemError:
            return "SystemError";
        case ExitCode::LogicError:
            return "LogicError";
        case ExitCode::RateLimited:
            return "RateLimited";
        case ExitCode::OperationCanceled:
            return "OperationCanceled";
        default:
            return noConversionStr;
    }
}

std::string toString(const ExitCause e) {
    switch (e) {
        case ExitCause::Unknown:
            return "Unknown";
        case ExitCause::DbAccessError:
            return "DbAccessError";
        case ExitCause::DbEntryNotFound:
            return "DbEntryNotFound";
        case ExitCause::SyncDirDoesntExist:
            return "SyncDirDoesntExist";
        case ExitCause::FileAccessError:
            return "FileAccessError";
        case ExitCause::NotFound:
            return "NotFound";
        case ExitCause::NotEnoughDiskSpace:
            return "NotEnoughDiskSpace";
        case ExitCause::NotEnoughMemory:
            return "NotEnoughMemory";
        case ExitCause::NotEnoughINotifyWatches:
            return "NotEnoughINotifyWatches";
        case ExitCause::HttpErr:
            return "HttpErr";
        case ExitCause::HttpErrForbidden:
            return "HttpErrForbidden";
        case ExitCause::Http5xx:
            return "Http5xx";
        case ExitCause::ApiErr:
            return "ApiErr";
        case ExitCause::NetworkTimeout:
            return "NetworkTimeout";
        case ExitCause::InvalidArgument:
            return "InvalidArgument";
        case ExitCause::FileModified:
            return "FileModified";
        case ExitCause::TransferHandleExpired:
            return "TransferHandleExpired";
        case ExitCause::NegotiationConflict:
            return "NegotiationConflict";
        case ExitCause::ConfirmRejected:
            return "ConfirmRejected";
        case ExitCause::IntegrityCheckFailed:
            return "IntegrityCheckFailed";
        case ExitCause::ManifestGap:
            return "ManifestGap";
        case ExitCause::OperationCanceled:
            return "OperationCanceled";
        default:
            return noConversionStr;
    }
}

std::string toString(const UploadState e) {
    switch (e) {
        case UploadState::Chunking:
            return "Chunking";
        case UploadState::Negotiating:
            return "Negotiating";
        case UploadState::Transferring:
            return "Transferring";
        case UploadState::Confirming:
            return "Confirming";
        case UploadState::Done:
            return "Done";
        case UploadState::Failed:
            return "Failed";
        default:
            return noConversionStr;
    }
}

std::string toString(const PartStatus e) {
    switch (e) {
        case PartStatus::Pending:
            return "Pending";
        case PartStatus::Uploaded:
            return "Uploaded";
        case PartStatus::Confirmed:
            return "Confirmed";
        default:
            return noConversionStr;
    }
}

std::string toString(const UploadOutcome e) {
    switch (e) {
        case UploadOutcome::Unknown:
            return "Unknown";
        case UploadOutcome::Unchanged:
            return "Unchanged";
        case UploadOutcome::Uploaded:
            return "Uploaded";
        default:
            return noConversionStr;
    }
}

std::string toString(const SyncEventType e) {
    switch (e) {
        case SyncEventType::FileChanged:
            return "FileChanged";
        case SyncEventType::FolderCreated:
            return "FolderCreated";
        case SyncEventType::SyncRoundDue:
            return "SyncRoundDue";
        default:
            return noConversionStr;
    }
}

std::string toString(const LogLevel e) {
    switch (e) {
        case LogLevel::Debug:
            return "Debug";
        case LogLevel::Info:
            return "Info";
        case LogLevel::Warning:
            return "Warning";
        case LogLevel::Error:
            return "Error";
        case LogLevel::Fatal:
            return "Fatal";
        default:
            return noConversionStr;
    }
}

std::string toString(const IoError e) {
    switch (e) {
        case IoError::Success:
            return "Success";
        case IoError::AccessDenied:
            return "AccessDenied";
        case IoError::DiskFull:
            return "DiskFull";
        case IoError::FileExists:
            return "FileExists";
        case IoError::FileNameTooLong:
            return "FileNameTooLong";
        case IoError::InvalidArgument:
            return "InvalidArgument";
        case IoError::IsADirectory:
            return "IsADirectory";
        case IoError::NoSuchFileOrDirectory:
            return "NoSuchFileOrDirectory";
        case IoError::ResultOutOfRange:
            return "ResultOutOfRange";
        case IoError::CrossDeviceLink:
            return "CrossDeviceLink";
        case IoError::Unknown:
            return "Unknown";
        default:
            return noConversionStr;
    }
}

}  // namespace FSC
