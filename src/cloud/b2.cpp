#include "cloud/b2.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <charconv>
#include <memory>
#include <json/json.h>
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
static Json::Value parseJson(string_view content)
// Parse a json answer, the root has to be an object
{
    Json::CharReaderBuilder builder;
    unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    string errors;
    if (!reader->parse(content.data(), content.data() + content.size(), &root, &errors))
        throw runtime_error("Invalid B2 response: " + errors);
    if (!root.isObject())
        throw runtime_error("Invalid B2 response: Expected a json object!");
    return root;
}
//---------------------------------------------------------------------------
static string writeJson(const Json::Value& value)
// Compact json
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}
//---------------------------------------------------------------------------
static string requireString(const Json::Value& object, const char* field)
// Get a mandatory string field
{
    const auto& value = object[field];
    if (!value.isString())
        throw runtime_error(string("Invalid B2 response: Missing ") + field + "!");
    return value.asString();
}
//---------------------------------------------------------------------------
B2::Error::Error(uint16_t status, string code, const string& message, optional<chrono::milliseconds> retryAfter) : runtime_error("B2 error " + to_string(status) + " " + code + ": " + message), _status(status), _code(move(code)), _retryAfter(retryAfter)
// The constructor
{}
//---------------------------------------------------------------------------
bool B2::Error::expiredAuth() const
// The token is outdated or was revoked
{
    return _status == network::HttpResponse::UNAUTHORIZED_401 && (_code == "expired_auth_token" || _code == "bad_auth_token");
}
//---------------------------------------------------------------------------
bool B2::Error::retryable() const
// Timeouts, rate limits and server errors
{
    return _status == network::HttpResponse::REQUEST_TIMEOUT_408 || _status == network::HttpResponse::TOO_MANY_REQUESTS_429 || _status >= network::HttpResponse::INTERNAL_SERVER_ERROR_500;
}
//---------------------------------------------------------------------------
B2::Call B2::apiCall(const AuthSession& session, string_view operation, const string& body) const
// Build an authorized api call
{
    Call call;
    call.request = network::HttpRequest::fromUrl(network::HttpRequest::Method::POST, session.apiUrl + string(apiPath) + string(operation));
    call.request.headers.emplace("Authorization", session.authorizationToken);
    call.request.headers.emplace("Content-Type", "application/json");
    call.body = network::RequestBody::memory(body);
    return call;
}
//---------------------------------------------------------------------------
B2::Call B2::authorizeAccount() const
// Builds b2_authorize_account
{
    Call call;
    call.request = network::HttpRequest::fromUrl(network::HttpRequest::Method::GET, _settings.authUrl + string(apiPath) + "b2_authorize_account");
    auto credentials = _settings.keyId + ":" + _settings.key;
    call.request.headers.emplace("Authorization", "Basic " + utils::base64Encode(reinterpret_cast<const uint8_t*>(credentials.data()), credentials.size()));
    return call;
}
//---------------------------------------------------------------------------
B2::Call B2::listBuckets(const AuthSession& session) const
// Builds b2_list_buckets
{
    Json::Value body;
    body["accountId"] = session.accountId;
    body["bucketName"] = _settings.bucketName;
    return apiCall(session, "b2_list_buckets", writeJson(body));
}
//---------------------------------------------------------------------------
B2::Call B2::listFileNames(const AuthSession& session, const string& prefix, const string& startFileName, uint32_t count) const
// Builds b2_list_file_names
{
    Json::Value body;
    body["bucketId"] = session.bucketId;
    body["maxFileCount"] = count;
    if (!prefix.empty())
        body["prefix"] = prefix;
    if (!startFileName.empty())
        body["startFileName"] = startFileName;
    return apiCall(session, "b2_list_file_names", writeJson(body));
}
//---------------------------------------------------------------------------
B2::Call B2::getUploadUrl(const AuthSession& session) const
// Builds b2_get_upload_url
{
    Json::Value body;
    body["bucketId"] = session.bucketId;
    return apiCall(session, "b2_get_upload_url", writeJson(body));
}
//---------------------------------------------------------------------------
B2::Call B2::uploadFile(const UploadTarget& target, const string& localPath, uint64_t size, const string& remoteName, const string& sha1) const
// Builds the upload of a whole file
{
    Call call;
    call.request = network::HttpRequest::fromUrl(network::HttpRequest::Method::POST, target.uploadUrl);
    call.request.headers.emplace("Authorization", target.authorizationToken);
    call.request.headers.emplace("Content-Type", string(autoContentType));
    call.request.headers.emplace("X-Bz-File-Name", utils::encodeUrlPath(remoteName));
    call.request.headers.emplace("X-Bz-Content-Sha1", sha1);
    call.body = network::RequestBody::file(localPath, 0, size);
    return call;
}
//---------------------------------------------------------------------------
B2::Call B2::startLargeFile(const AuthSession& session, const string& remoteName) const
// Builds b2_start_large_file
{
    Json::Value body;
    body["bucketId"] = session.bucketId;
    body["fileName"] = remoteName;
    body["contentType"] = string(autoContentType);
    return apiCall(session, "b2_start_large_file", writeJson(body));
}
//---------------------------------------------------------------------------
B2::Call B2::getUploadPartUrl(const AuthSession& session, const string& fileId) const
// Builds b2_get_upload_part_url
{
    Json::Value body;
    body["fileId"] = fileId;
    return apiCall(session, "b2_get_upload_part_url", writeJson(body));
}
//---------------------------------------------------------------------------
B2::Call B2::uploadPart(const UploadTarget& target, const string& localPath, uint64_t offset, uint64_t length, uint32_t partNumber, const string& sha1) const
// Builds the upload of one part
{
    Call call;
    call.request = network::HttpRequest::fromUrl(network::HttpRequest::Method::POST, target.uploadUrl);
    call.request.headers.emplace("Authorization", target.authorizationToken);
    call.request.headers.emplace("X-Bz-Part-Number", to_string(partNumber));
    call.request.headers.emplace("X-Bz-Content-Sha1", sha1);
    call.body = network::RequestBody::file(localPath, offset, length);
    return call;
}
//---------------------------------------------------------------------------
B2::Call B2::finishLargeFile(const AuthSession& session, const string& fileId, const vector<string>& partSha1s) const
// Builds b2_finish_large_file
{
    Json::Value body;
    body["fileId"] = fileId;
    auto& sha1Array = body["partSha1Array"] = Json::Value(Json::arrayValue);
    for (auto& sha1 : partSha1s)
        sha1Array.append(sha1);
    return apiCall(session, "b2_finish_large_file", writeJson(body));
}
//---------------------------------------------------------------------------
B2::Call B2::cancelLargeFile(const AuthSession& session, const string& fileId) const
// Builds b2_cancel_large_file
{
    Json::Value body;
    body["fileId"] = fileId;
    return apiCall(session, "b2_cancel_large_file", writeJson(body));
}
//---------------------------------------------------------------------------
B2::Call B2::downloadFileByName(const AuthSession& session, const string& remoteName) const
// Builds the download by name
{
    Call call;
    call.request = network::HttpRequest::fromUrl(network::HttpRequest::Method::GET, session.downloadUrl + "/file/" + utils::encodeUrlPath(session.bucketName) + "/" + utils::encodeUrlPath(remoteName));
    call.request.headers.emplace("Authorization", session.authorizationToken);
    return call;
}
//---------------------------------------------------------------------------
AuthSession B2::parseAuthorization(string_view content) const
// Parse the authorization
{
    auto root = parseJson(content);
    AuthSession session;
    session.authorizationToken = requireString(root, "authorizationToken");
    session.apiUrl = requireString(root, "apiUrl");
    session.downloadUrl = requireString(root, "downloadUrl");
    session.accountId = requireString(root, "accountId");
    session.bucketName = _settings.bucketName;

    // Keys restricted to one bucket carry its id
    const auto& allowed = root["allowed"];
    if (allowed.isObject() && allowed["bucketName"].isString() && allowed["bucketId"].isString() && allowed["bucketName"].asString() == _settings.bucketName)
        session.bucketId = allowed["bucketId"].asString();
    return session;
}
//---------------------------------------------------------------------------
optional<string> B2::parseBucketId(string_view content) const
// Find the configured bucket
{
    auto root = parseJson(content);
    for (const auto& bucket : root["buckets"]) {
        if (bucket["bucketName"].isString() && bucket["bucketName"].asString() == _settings.bucketName)
            return requireString(bucket, "bucketId");
    }
    return nullopt;
}
//---------------------------------------------------------------------------
static RemoteObject toRemoteObject(const Json::Value& file)
// Map the b2 file info
{
    RemoteObject object;
    object.fileName = requireString(file, "fileName");
    if (file["fileId"].isString())
        object.fileId = file["fileId"].asString();
    if (file["contentLength"].isUInt64())
        object.contentLength = file["contentLength"].asUInt64();
    if (file["contentSha1"].isString())
        object.contentSha1 = file["contentSha1"].asString();
    if (file["uploadTimestamp"].isInt64())
        object.uploadTimestamp = file["uploadTimestamp"].asInt64();
    return object;
}
//---------------------------------------------------------------------------
B2::FilePage B2::parseFilePage(string_view content)
// Parse a page of file names
{
    auto root = parseJson(content);
    const auto& files = root["files"];
    if (!files.isArray())
        throw runtime_error("Invalid B2 response: Missing files!");
    FilePage page;
    page.objects.reserve(files.size());
    for (const auto& file : files)
        page.objects.push_back(toRemoteObject(file));
    if (root["nextFileName"].isString())
        page.nextFileName = root["nextFileName"].asString();
    return page;
}
//---------------------------------------------------------------------------
B2::UploadTarget B2::parseUploadTarget(string_view content)
// Parse an upload url
{
    auto root = parseJson(content);
    return {requireString(root, "uploadUrl"), requireString(root, "authorizationToken")};
}
//---------------------------------------------------------------------------
string B2::parseFileId(string_view content)
// Parse the file id
{
    return requireString(parseJson(content), "fileId");
}
//---------------------------------------------------------------------------
RemoteObject B2::parseRemoteObject(string_view content)
// Parse the file info
{
    return toRemoteObject(parseJson(content));
}
//---------------------------------------------------------------------------
B2::Error B2::parseError(const network::HttpResult& result)
// Build the error from the json error body, falls back to the status line
{
    auto status = result.response.code;
    string code = "unknown";
    string message = result.response.reason;
    Json::CharReaderBuilder builder;
    unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    string errors;
    if (reader->parse(result.content.data(), result.content.data() + result.content.size(), &root, &errors) && root.isObject()) {
        if (root["code"].isString())
            code = root["code"].asString();
        if (root["message"].isString())
            message = root["message"].asString();
    }

    optional<chrono::milliseconds> retryAfter;
    if (auto header = result.response.header("Retry-After")) {
        uint64_t seconds = 0;
        auto parsed = from_chars(header->data(), header->data() + header->size(), seconds);
        if (parsed.ec == errc() && parsed.ptr == header->data() + header->size())
            retryAfter = chrono::seconds(min(seconds, maxRetryAfterSeconds));
    }
    return Error(status, move(code), message, retryAfter);
}
//---------------------------------------------------------------------------
} // namespace dumpsync::cloud
