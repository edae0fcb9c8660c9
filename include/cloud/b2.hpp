#pragma once
#include "cloud/remote_store.hpp"
#include "network/http_client.hpp"
#include "network/http_request.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
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
namespace test {
class B2Tester;
}; // namespace test
//---------------------------------------------------------------------------
/// Implements the Backblaze B2 native api v2 requests and responses
class B2 {
    public:
    /// The settings
    struct Settings {
        /// The application key id
        std::string keyId;
        /// The application key
        std::string key;
        /// The bucket name
        std::string bucketName;
        /// The authorization endpoint
        std::string authUrl = "https://api.backblazeb2.com";
    };

    /// A request with its body
    struct Call {
        /// The request
        network::HttpRequest request;
        /// The body
        network::RequestBody body;
    };

    /// The target of an upload, valid for one upload at a time
    struct UploadTarget {
        /// The upload url
        std::string uploadUrl;
        /// The upload token
        std::string authorizationToken;
    };

    /// One page of a listing
    struct FilePage {
        /// The objects
        std::vector<RemoteObject> objects;
        /// The start of the next page
        std::optional<std::string> nextFileName;
    };

    /// A non-2xx answer of the api
    class Error : public std::runtime_error {
        /// The http status
        uint16_t _status;
        /// The b2 error code
        std::string _code;
        /// The requested wait time
        std::optional<std::chrono::milliseconds> _retryAfter;

        public:
        /// The constructor
        Error(uint16_t status, std::string code, const std::string& message, std::optional<std::chrono::milliseconds> retryAfter = std::nullopt);
        /// The http status
        [[nodiscard]] uint16_t status() const { return _status; }
        /// The b2 error code
        [[nodiscard]] const std::string& code() const { return _code; }
        /// The requested wait time
        [[nodiscard]] std::optional<std::chrono::milliseconds> retryAfter() const { return _retryAfter; }
        /// Does the token need a refresh
        [[nodiscard]] bool expiredAuth() const;
        /// Timeouts, rate limits and server errors can be retried
        [[nodiscard]] bool retryable() const;
    };

    /// The longest honored Retry-After, larger values are clamped
    static constexpr uint64_t maxRetryAfterSeconds = 24 * 60 * 60;
    /// The api path prefix
    static constexpr std::string_view apiPath = "/b2api/v2/";
    /// The content type that lets b2 detect the type
    static constexpr std::string_view autoContentType = "b2/x-auto";
    /// The maximum page size of a listing
    static constexpr uint32_t maxFileCount = 1000;

    private:
    /// The settings
    Settings _settings;

    /// Build an authorized json api call
    [[nodiscard]] Call apiCall(const AuthSession& session, std::string_view operation, const std::string& body) const;

    public:
    /// The constructor
    explicit B2(Settings settings) : _settings(std::move(settings)) {}
    /// Get the settings
    [[nodiscard]] const Settings& getSettings() const { return _settings; }

    /// Builds b2_authorize_account with basic credentials
    [[nodiscard]] Call authorizeAccount() const;
    /// Builds b2_list_buckets filtered by the bucket name
    [[nodiscard]] Call listBuckets(const AuthSession& session) const;
    /// Builds b2_list_file_names
    [[nodiscard]] Call listFileNames(const AuthSession& session, const std::string& prefix, const std::string& startFileName, uint32_t count = maxFileCount) const;
    /// Builds b2_get_upload_url
    [[nodiscard]] Call getUploadUrl(const AuthSession& session) const;
    /// Builds the upload of a whole file
    [[nodiscard]] Call uploadFile(const UploadTarget& target, const std::string& localPath, uint64_t size, const std::string& remoteName, const std::string& sha1) const;
    /// Builds b2_start_large_file
    [[nodiscard]] Call startLargeFile(const AuthSession& session, const std::string& remoteName) const;
    /// Builds b2_get_upload_part_url
    [[nodiscard]] Call getUploadPartUrl(const AuthSession& session, const std::string& fileId) const;
    /// Builds the upload of one part, part numbers start at 1
    [[nodiscard]] Call uploadPart(const UploadTarget& target, const std::string& localPath, uint64_t offset, uint64_t length, uint32_t partNumber, const std::string& sha1) const;
    /// Builds b2_finish_large_file with the ordered part digests
    [[nodiscard]] Call finishLargeFile(const AuthSession& session, const std::string& fileId, const std::vector<std::string>& partSha1s) const;
    /// Builds b2_cancel_large_file
    [[nodiscard]] Call cancelLargeFile(const AuthSession& session, const std::string& fileId) const;
    /// Builds the download by name
    [[nodiscard]] Call downloadFileByName(const AuthSession& session, const std::string& remoteName) const;

    /// Parse the authorization, the bucket is taken from the key restriction if it matches
    [[nodiscard]] AuthSession parseAuthorization(std::string_view content) const;
    /// Parse the bucket id of the configured bucket from a bucket listing
    [[nodiscard]] std::optional<std::string> parseBucketId(std::string_view content) const;
    /// Parse a page of file names
    [[nodiscard]] static FilePage parseFilePage(std::string_view content);
    /// Parse an upload url or upload part url answer
    [[nodiscard]] static UploadTarget parseUploadTarget(std::string_view content);
    /// Parse the file id of a started large file
    [[nodiscard]] static std::string parseFileId(std::string_view content);
    /// Parse the file info of an upload or finish answer
    [[nodiscard]] static RemoteObject parseRemoteObject(std::string_view content);
    /// Build the error of a non-2xx answer
    [[nodiscard]] static Error parseError(const network::HttpResult& result);

    friend test::B2Tester;
};
//---------------------------------------------------------------------------
} // namespace dumpsync::cloud
