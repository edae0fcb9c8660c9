#pragma once
#include <stdexcept>
#include <string>
#include <utility>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace dumpsync {
//---------------------------------------------------------------------------
/// A local file could not be opened or read
class IOError : public std::runtime_error {
    public:
    using std::runtime_error::runtime_error;
};
//---------------------------------------------------------------------------
/// A record stream contains an invalid length prefix or a malformed document
class CorruptStreamError : public std::runtime_error {
    public:
    using std::runtime_error::runtime_error;
};
//---------------------------------------------------------------------------
/// A record stream ended in the middle of a record
class TruncatedStreamError : public std::runtime_error {
    public:
    using std::runtime_error::runtime_error;
};
//---------------------------------------------------------------------------
/// A chunk file could not be created or written
class ChunkWriteError : public std::runtime_error {
    public:
    using std::runtime_error::runtime_error;
};
//---------------------------------------------------------------------------
/// A connection could not be established or broke during a call, always retryable
class TransportError : public std::runtime_error {
    public:
    using std::runtime_error::runtime_error;
};
//---------------------------------------------------------------------------
/// The remote store rejected the credentials or the bucket is unknown
class AuthError : public std::runtime_error {
    public:
    using std::runtime_error::runtime_error;
};
//---------------------------------------------------------------------------
/// A data operation was issued before authentication
class NotAuthenticatedError : public std::runtime_error {
    public:
    NotAuthenticatedError() : std::runtime_error("Remote store is not authenticated!") {}
};
//---------------------------------------------------------------------------
/// A remote operation failed after all retries or with a non-retryable status
class RemoteOperationError : public std::runtime_error {
    /// The last underlying error message
    std::string _cause;

    public:
    /// The constructor
    RemoteOperationError(const std::string& message, std::string cause) : std::runtime_error(message + ": " + cause), _cause(std::move(cause)) {}
    /// Get the last underlying cause
    [[nodiscard]] const std::string& cause() const noexcept { return _cause; }
};
//---------------------------------------------------------------------------
/// A listing page failed, no partial listing is returned
class ListError : public RemoteOperationError {
    public:
    using RemoteOperationError::RemoteOperationError;
};
//---------------------------------------------------------------------------
/// An upload failed
class UploadError : public RemoteOperationError {
    public:
    using RemoteOperationError::RemoteOperationError;
};
//---------------------------------------------------------------------------
/// A download failed
class DownloadError : public RemoteOperationError {
    public:
    using RemoteOperationError::RemoteOperationError;
};
//---------------------------------------------------------------------------
/// The dump tool could not be started or exited with an error
class DumpError : public std::runtime_error {
    public:
    using std::runtime_error::runtime_error;
};
//---------------------------------------------------------------------------
/// The configuration is incomplete or invalid
class ConfigError : public std::runtime_error {
    public:
    using std::runtime_error::runtime_error;
};
//---------------------------------------------------------------------------
/// A run was stopped between two steps
class CancelledError : public std::runtime_error {
    public:
    CancelledError() : std::runtime_error("Backup run cancelled!") {}
};
//---------------------------------------------------------------------------
} // namespace dumpsync
