#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace dumpsync::cloud {
//---------------------------------------------------------------------------
/// The metadata of a stored object
struct RemoteObject {
    /// The object name
    std::string fileName;
    /// The remote id
    std::string fileId;
    /// The size in bytes
    uint64_t contentLength = 0;
    /// The sha1 as hex, "none" for objects uploaded in parts
    std::string contentSha1;
    /// The upload time in ms since epoch
    int64_t uploadTimestamp = 0;
};
//---------------------------------------------------------------------------
/// The credentials obtained by authentication
struct AuthSession {
    /// The bearer token
    std::string authorizationToken;
    /// The base url of the api calls
    std::string apiUrl;
    /// The base url of downloads
    std::string downloadUrl;
    /// The account
    std::string accountId;
    /// The bucket id
    std::string bucketId;
    /// The bucket name
    std::string bucketName;

    /// Are all fields required for data operations present
    [[nodiscard]] bool valid() const {
        return !authorizationToken.empty() && !apiUrl.empty() && !downloadUrl.empty() && !bucketId.empty();
    }
};
//---------------------------------------------------------------------------
/// The remote object store used by the backup
class RemoteStore {
    public:
    /// The destructor
    virtual ~RemoteStore() = default;

    /// Exchange the credentials for a session, throws AuthError
    virtual void authenticate() = 0;
    /// Is a session present
    [[nodiscard]] virtual bool isAuthenticated() const = 0;
    /// List all objects with the prefix, throws ListError and never returns partial listings
    [[nodiscard]] virtual std::vector<RemoteObject> listObjects(const std::string& prefix = "") = 0;
    /// Find an object with exactly the name
    [[nodiscard]] virtual std::optional<RemoteObject> findObject(const std::string& name) = 0;
    /// Upload a local file, throws UploadError
    virtual RemoteObject uploadObject(const std::string& localPath, const std::string& remoteName) = 0;
    /// Download an object into a local file, throws DownloadError
    virtual void downloadObject(const std::string& remoteName, const std::string& localPath) = 0;
};
//---------------------------------------------------------------------------
} // namespace dumpsync::cloud
