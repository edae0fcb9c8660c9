#include "cloud/b2_store.hpp"
#include "utils/checksum.hpp"
#include "utils/errors.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>
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
using namespace std;
//---------------------------------------------------------------------------
template <typename Error, typename Function>
auto B2Store::withRetry(const string& what, Function&& attempt)
// Retry the attempt until it succeeds, fails permanently or the attempts are exhausted
{
    auto reauthenticated = false;
    for (unsigned attemptCount = 1;; attemptCount++) {
        string cause;
        optional<chrono::milliseconds> retryAfter;
        try {
            return attempt();
        } catch (const B2::Error& error) {
            if (error.expiredAuth()) {
                if (reauthenticated)
                    throw Error(what + " failed, the authorization expired again after re-authentication", error.what());
                reauthenticated = true;
                spdlog::warn("{}: authorization expired, re-authenticating", what);
                authenticate();
                // The retry after re-authentication is not counted
                attemptCount--;
                continue;
            }
            if (!error.retryable())
                throw Error(what + " failed", error.what());
            cause = error.what();
            retryAfter = error.retryAfter();
        } catch (const TransportError& error) {
            cause = error.what();
        } catch (const AuthError&) {
            throw;
        } catch (const NotAuthenticatedError&) {
            throw;
        } catch (const runtime_error& error) {
            throw Error(what + " failed", error.what());
        }

        if (attemptCount >= _backoff.maxRetries())
            throw Error(what + " failed after " + to_string(attemptCount) + " attempts", cause);
        auto delay = _backoff.nextDelay(attemptCount - 1);
        if (retryAfter)
            delay = min(max(delay, *retryAfter), _backoff.maxDelay());
        spdlog::warn("{} failed (attempt {}/{}): {}, retrying in {} ms", what, attemptCount, _backoff.maxRetries(), cause, delay.count());
        _sleeper.sleep(delay);
    }
}
//---------------------------------------------------------------------------
B2Store::B2Store(B2::Settings b2Settings, network::HttpClient& client, utils::Sleeper& sleeper, utils::BackoffPolicy backoff, Settings settings) : _b2(move(b2Settings)), _client(client), _sleeper(sleeper), _backoff(move(backoff)), _settings(settings)
// The constructor
{
    if (!_settings.partSize || _settings.singleShotThreshold < _settings.partSize)
        throw runtime_error("The part size must be positive and not above the single upload threshold!");
}
//---------------------------------------------------------------------------
const AuthSession& B2Store::session() const
// Get the session
{
    if (!_session)
        throw NotAuthenticatedError();
    return *_session;
}
//---------------------------------------------------------------------------
void B2Store::setSession(AuthSession session)
// Use an existing session
{
    if (!session.valid())
        throw AuthError("Incomplete session!");
    _session = move(session);
}
//---------------------------------------------------------------------------
network::HttpResult B2Store::perform(const B2::Call& call)
// Execute a call
{
    auto result = _client.execute(call.request, call.body);
    if (!network::HttpResponse::checkSuccess(result.response.code))
        throw B2::parseError(result);
    return result;
}
//---------------------------------------------------------------------------
void B2Store::authenticate()
// Exchange the key for a session and resolve the bucket
{
    _session.reset();
    auto authorize = [this](const B2::Call& call) {
        try {
            return perform(call);
        } catch (const runtime_error& error) {
            throw AuthError(string("Authorization failed: ") + error.what());
        }
    };

    AuthSession session;
    try {
        session = _b2.parseAuthorization(authorize(_b2.authorizeAccount()).content);
        if (session.bucketId.empty()) {
            auto bucketId = _b2.parseBucketId(authorize(_b2.listBuckets(session)).content);
            if (!bucketId)
                throw AuthError("Bucket " + _b2.getSettings().bucketName + " not found!");
            session.bucketId = move(*bucketId);
        }
    } catch (const AuthError&) {
        throw;
    } catch (const runtime_error& error) {
        throw AuthError(string("Authorization failed: ") + error.what());
    }
    spdlog::info("Authenticated with B2, bucket {} ({})", session.bucketName, session.bucketId);
    _session = move(session);
}
//---------------------------------------------------------------------------
vector<RemoteObject> B2Store::listObjects(const string& prefix)
// List all pages
{
    static_cast<void>(session());
    vector<RemoteObject> objects;
    string startFileName;
    while (true) {
        auto page = withRetry<ListError>("Listing of '" + prefix + "' at '" + startFileName + "'", [&] {
            return B2::parseFilePage(perform(_b2.listFileNames(session(), prefix, startFileName)).content);
        });
        move(page.objects.begin(), page.objects.end(), back_inserter(objects));
        if (!page.nextFileName)
            break;
        startFileName = move(*page.nextFileName);
    }
    spdlog::debug("Listed {} remote objects with prefix '{}'", objects.size(), prefix);
    return objects;
}
//---------------------------------------------------------------------------
optional<RemoteObject> B2Store::findObject(const string& name)
// List one entry starting at the name
{
    static_cast<void>(session());
    auto page = withRetry<ListError>("Lookup of " + name, [&] {
        return B2::parseFilePage(perform(_b2.listFileNames(session(), name, name, 1)).content);
    });
    if (!page.objects.empty() && page.objects.front().fileName == name)
        return page.objects.front();
    return nullopt;
}
//---------------------------------------------------------------------------
RemoteObject B2Store::uploadObject(const string& localPath, const string& remoteName)
// Upload a local file
{
    static_cast<void>(session());
    error_code ec;
    auto size = filesystem::file_size(localPath, ec);
    if (ec)
        throw UploadError("Upload of " + remoteName + " failed", "cannot stat " + localPath + ": " + ec.message());

    if (_settings.skipExisting) {
        optional<RemoteObject> existing;
        try {
            existing = findObject(remoteName);
        } catch (const ListError& error) {
            throw UploadError("Existence check of " + remoteName + " failed", error.cause());
        }
        if (existing) {
            spdlog::info("Skipping {}, already present", remoteName);
            return *existing;
        }
    }

    if (size <= _settings.singleShotThreshold)
        return uploadSingle(localPath, size, remoteName);
    return uploadLarge(localPath, size, remoteName);
}
//---------------------------------------------------------------------------
RemoteObject B2Store::uploadSingle(const string& localPath, uint64_t size, const string& remoteName)
// Upload with one request
{
    string sha1;
    try {
        sha1 = utils::fileSha1(localPath);
    } catch (const IOError& error) {
        throw UploadError("Upload of " + remoteName + " failed", error.what());
    }

    auto object = withRetry<UploadError>("Upload of " + remoteName, [&] {
        auto target = B2::parseUploadTarget(perform(_b2.getUploadUrl(session())).content);
        return B2::parseRemoteObject(perform(_b2.uploadFile(target, localPath, size, remoteName, sha1)).content);
    });
    spdlog::info("Uploaded {} ({} bytes)", remoteName, size);
    return object;
}
//---------------------------------------------------------------------------
RemoteObject B2Store::uploadLarge(const string& localPath, uint64_t size, const string& remoteName)
// Upload the parts in order and finish with the ordered digests
{
    auto fileId = withRetry<UploadError>("Start of large file " + remoteName, [&] {
        return B2::parseFileId(perform(_b2.startLargeFile(session(), remoteName)).content);
    });

    auto parts = (size + _settings.partSize - 1) / _settings.partSize;
    spdlog::info("Uploading {} ({} bytes) in {} parts", remoteName, size, parts);
    try {
        vector<string> partSha1s;
        partSha1s.reserve(parts);
        for (uint32_t partNumber = 1; partNumber <= parts; partNumber++) {
            auto offset = (partNumber - 1) * _settings.partSize;
            auto length = min(_settings.partSize, size - offset);
            auto sha1 = utils::fileSha1(localPath, offset, length);
            withRetry<UploadError>("Upload of part " + to_string(partNumber) + " of " + remoteName, [&] {
                auto target = B2::parseUploadTarget(perform(_b2.getUploadPartUrl(session(), fileId)).content);
                static_cast<void>(perform(_b2.uploadPart(target, localPath, offset, length, partNumber, sha1)));
            });
            partSha1s.push_back(move(sha1));
            spdlog::debug("Uploaded part {}/{} of {}", partNumber, parts, remoteName);
        }

        auto object = withRetry<UploadError>("Finish of large file " + remoteName, [&] {
            return B2::parseRemoteObject(perform(_b2.finishLargeFile(session(), fileId, partSha1s)).content);
        });
        spdlog::info("Uploaded {} ({} bytes)", remoteName, size);
        return object;
    } catch (const UploadError&) {
        cancelLargeFile(fileId);
        throw;
    } catch (const AuthError&) {
        cancelLargeFile(fileId);
        throw;
    } catch (const IOError& error) {
        cancelLargeFile(fileId);
        throw UploadError("Upload of " + remoteName + " failed", error.what());
    }
}
//---------------------------------------------------------------------------
void B2Store::cancelLargeFile(const string& fileId) noexcept
// Best-effort cancel of an unfinished large file
{
    try {
        static_cast<void>(perform(_b2.cancelLargeFile(session(), fileId)));
        spdlog::info("Cancelled large file {}", fileId);
    } catch (const exception& error) {
        spdlog::warn("Cancel of large file {} failed: {}", fileId, error.what());
    }
}
//---------------------------------------------------------------------------
void B2Store::downloadObject(const string& remoteName, const string& localPath)
// Download an object and verify its digest
{
    static_cast<void>(session());
    auto content = withRetry<DownloadError>("Download of " + remoteName, [&] {
        auto result = perform(_b2.downloadFileByName(session(), remoteName));
        auto expected = result.response.header("X-Bz-Content-Sha1");
        // Large files carry no whole-file digest
        if (expected && expected->size() == 40) {
            auto actual = utils::sha1Encode(reinterpret_cast<const uint8_t*>(result.content.data()), result.content.size());
            if (actual != *expected)
                throw TransportError("Checksum mismatch, expected " + string(*expected) + " got " + actual);
        }
        return move(result.content);
    });

    ofstream file(localPath, ios::binary | ios::trunc);
    if (!file.is_open())
        throw DownloadError("Download of " + remoteName + " failed", "cannot open " + localPath);
    file.write(content.data(), static_cast<streamsize>(content.size()));
    file.close();
    if (!file)
        throw DownloadError("Download of " + remoteName + " failed", "cannot write " + localPath);
    spdlog::info("Downloaded {} to {} ({} bytes)", remoteName, localPath, content.size());
}
//---------------------------------------------------------------------------
} // namespace dumpsync::cloud
