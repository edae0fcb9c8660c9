#include "cloud/b2_store.hpp"
#include "cloud/fake_http_client.hpp"
#include "utils/checksum.hpp"
#include "utils/errors.hpp"
#include "utils/utils.hpp"
#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace dumpsync::cloud::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
const string uploadUrl = "{\"uploadUrl\":\"https://pod-000-1000-00.backblaze.com/b2api/v2/b2_upload_file/bucket-id/upload\",\"authorizationToken\":\"upload-token\"}";
const string uploadPartUrl = "{\"uploadUrl\":\"https://pod-000-1000-00.backblaze.com/b2api/v2/b2_upload_part/file-id/upload_part\",\"authorizationToken\":\"part-token\"}";
const string emptyPage = "{\"files\":[],\"nextFileName\":null}";
//---------------------------------------------------------------------------
/// A store with fast retries
struct Fixture {
    FakeHttpClient client;
    RecordingSleeper sleeper;
    B2Store store;

    explicit Fixture(unsigned maxRetries = 5, B2Store::Settings settings = B2Store::Settings())
        : store({"key-id", "secret", "bucket"}, client, sleeper, utils::BackoffPolicy({chrono::milliseconds(10), chrono::milliseconds(1000), maxRetries}, 7), settings) {}

    /// Authenticate through the fake
    void authenticate() {
        client.script("b2_authorize_account", authorization("token-1"));
        store.authenticate();
    }
};
//---------------------------------------------------------------------------
/// A file with the given size
string createFile(const string& name, uint64_t size) {
    auto path = (filesystem::temp_directory_path() / ("dumpsync_" + name)).string();
    ofstream out(path, ios::binary | ios::trunc);
    for (uint64_t i = 0; i < size; i++)
        out.put(static_cast<char>('a' + i % 26));
    return path;
}
//---------------------------------------------------------------------------
/// The content of a file
string readFile(const string& path) {
    ifstream in(path, ios::binary);
    stringstream content;
    content << in.rdbuf();
    return content.str();
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
TEST_CASE("b2_store_authenticate") {
    Fixture fixture;
    REQUIRE(!fixture.store.isAuthenticated());

    SECTION("restricted key") {
        fixture.authenticate();
        REQUIRE(fixture.store.isAuthenticated());
        REQUIRE(fixture.client.count("b2_list_buckets") == 0);
        REQUIRE(fixture.client.calls[0].header("Authorization") == "Basic " + utils::base64Encode(reinterpret_cast<const uint8_t*>("key-id:secret"), 13));
    }
    SECTION("bucket lookup") {
        fixture.client.script("b2_authorize_account", authorization("token-1", false));
        fixture.client.script("b2_list_buckets", Reply::json(200, "{\"buckets\":[{\"bucketId\":\"bucket-id\",\"bucketName\":\"bucket\"}]}"));
        fixture.store.authenticate();
        REQUIRE(fixture.store.isAuthenticated());
        REQUIRE(fixture.client.calls[1].header("Authorization") == "token-1");
    }
    SECTION("missing bucket") {
        fixture.client.script("b2_authorize_account", authorization("token-1", false));
        fixture.client.script("b2_list_buckets", Reply::json(200, "{\"buckets\":[]}"));
        REQUIRE_THROWS_AS(fixture.store.authenticate(), AuthError);
        REQUIRE(!fixture.store.isAuthenticated());
    }
    SECTION("rejected credentials") {
        fixture.client.script("b2_authorize_account", Reply::error(401, "unauthorized"));
        REQUIRE_THROWS_AS(fixture.store.authenticate(), AuthError);
        REQUIRE(fixture.client.calls.size() == 1);
    }
    SECTION("unreachable endpoint") {
        fixture.client.script("b2_authorize_account", Reply::transportError());
        REQUIRE_THROWS_AS(fixture.store.authenticate(), AuthError);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("b2_store_not_authenticated") {
    Fixture fixture;
    auto path = createFile("b2_store_unauthenticated", 4);
    REQUIRE_THROWS_AS(fixture.store.listObjects(), NotAuthenticatedError);
    REQUIRE_THROWS_AS(fixture.store.findObject("a"), NotAuthenticatedError);
    REQUIRE_THROWS_AS(fixture.store.uploadObject(path, "a"), NotAuthenticatedError);
    REQUIRE_THROWS_AS(fixture.store.downloadObject("a", path), NotAuthenticatedError);
    REQUIRE(fixture.client.calls.empty());
    REQUIRE_THROWS_AS(fixture.store.setSession(AuthSession()), AuthError);
    filesystem::remove(path);
}
//---------------------------------------------------------------------------
TEST_CASE("b2_store_list") {
    Fixture fixture;
    fixture.authenticate();

    SECTION("pagination") {
        fixture.client.script("b2_list_file_names", Reply::json(200, "{\"files\":[{\"fileName\":\"a/1\"},{\"fileName\":\"a/2\"}],\"nextFileName\":\"b/1\"}"));
        fixture.client.script("b2_list_file_names", Reply::json(200, "{\"files\":[{\"fileName\":\"b/1\"}],\"nextFileName\":null}"));
        auto objects = fixture.store.listObjects();
        REQUIRE(objects.size() == 3);
        REQUIRE(objects[2].fileName == "b/1");
        auto calls = fixture.client.callsOf("b2_list_file_names");
        REQUIRE(calls.size() == 2);
        REQUIRE(calls[0].body.data == "{\"bucketId\":\"bucket-id\",\"maxFileCount\":1000}");
        REQUIRE(calls[1].body.data == "{\"bucketId\":\"bucket-id\",\"maxFileCount\":1000,\"startFileName\":\"b/1\"}");
        REQUIRE(calls[1].header("Authorization") == "token-1");
    }
    SECTION("empty bucket") {
        fixture.client.script("b2_list_file_names", Reply::json(200, emptyPage));
        REQUIRE(fixture.store.listObjects().empty());
    }
    SECTION("failure on a later page") {
        fixture.client.script("b2_list_file_names", Reply::json(200, "{\"files\":[{\"fileName\":\"a/1\"}],\"nextFileName\":\"b/1\"}"));
        fixture.client.script("b2_list_file_names", Reply::error(400, "bad_request"));
        REQUIRE_THROWS_AS(fixture.store.listObjects(), ListError);
        REQUIRE(fixture.sleeper.delays.empty());
    }
    SECTION("malformed page") {
        fixture.client.script("b2_list_file_names", Reply::json(200, "{\"files\":42}"));
        REQUIRE_THROWS_AS(fixture.store.listObjects(), ListError);
        REQUIRE(fixture.client.count("b2_list_file_names") == 1);
    }
    SECTION("find by exact name") {
        fixture.client.script("b2_list_file_names", Reply::json(200, "{\"files\":[{\"fileName\":\"a/10\"}],\"nextFileName\":\"a/11\"}"));
        REQUIRE(!fixture.store.findObject("a/1"));
        REQUIRE(fixture.client.calls.back().body.data == "{\"bucketId\":\"bucket-id\",\"maxFileCount\":1,\"prefix\":\"a/1\",\"startFileName\":\"a/1\"}");
        fixture.client.script("b2_list_file_names", Reply::json(200, "{\"files\":[{\"fileName\":\"a/1\",\"contentSha1\":\"abc\"}]}"));
        auto object = fixture.store.findObject("a/1");
        REQUIRE(object);
        REQUIRE(object->contentSha1 == "abc");
    }
}
//---------------------------------------------------------------------------
TEST_CASE("b2_store_retry") {
    SECTION("transient failures are retried") {
        Fixture fixture;
        fixture.authenticate();
        fixture.client.script("b2_list_file_names", Reply::error(503, "service_unavailable"));
        fixture.client.script("b2_list_file_names", Reply::transportError());
        fixture.client.script("b2_list_file_names", Reply::error(500, "internal_error"));
        fixture.client.script("b2_list_file_names", Reply::json(200, emptyPage));
        REQUIRE(fixture.store.listObjects().empty());
        REQUIRE(fixture.client.count("b2_list_file_names") == 4);
        REQUIRE(fixture.sleeper.delays.size() == 3);
        // base 10 ms doubled per attempt with jitter in [0.5, 1.5)
        REQUIRE(fixture.sleeper.delays[0] >= chrono::milliseconds(5));
        REQUIRE(fixture.sleeper.delays[0] < chrono::milliseconds(15));
        REQUIRE(fixture.sleeper.delays[2] >= chrono::milliseconds(20));
        REQUIRE(fixture.sleeper.delays[2] < chrono::milliseconds(60));
    }
    SECTION("attempts are exhausted") {
        Fixture fixture(3);
        fixture.authenticate();
        fixture.client.script("b2_list_file_names", Reply::error(503, "service_unavailable"), 3);
        try {
            static_cast<void>(fixture.store.listObjects());
            FAIL("listing succeeded");
        } catch (const ListError& error) {
            REQUIRE(string(error.what()).find("after 3 attempts") != string::npos);
            REQUIRE(error.cause().find("503") != string::npos);
        }
        REQUIRE(fixture.client.count("b2_list_file_names") == 3);
        REQUIRE(fixture.sleeper.delays.size() == 2);
    }
    SECTION("bad requests abort immediately") {
        Fixture fixture;
        fixture.authenticate();
        fixture.client.script("b2_list_file_names", Reply::error(400, "bad_request"));
        REQUIRE_THROWS_AS(fixture.store.listObjects(), ListError);
        REQUIRE(fixture.client.count("b2_list_file_names") == 1);
        REQUIRE(fixture.sleeper.delays.empty());
    }
    SECTION("retry after raises the delay up to the ceiling") {
        Fixture fixture;
        fixture.authenticate();
        fixture.client.script("b2_list_file_names", Reply::error(429, "too_many_requests", {{"Retry-After", "3"}}));
        fixture.client.script("b2_list_file_names", Reply::json(200, emptyPage));
        REQUIRE(fixture.store.listObjects().empty());
        REQUIRE(fixture.sleeper.delays.size() == 1);
        REQUIRE(fixture.sleeper.delays[0] == chrono::milliseconds(1000));
    }
    SECTION("huge retry after stays at the ceiling") {
        Fixture fixture;
        fixture.authenticate();
        fixture.client.script("b2_list_file_names", Reply::error(503, "service_unavailable", {{"Retry-After", "18446744073709551615"}}));
        fixture.client.script("b2_list_file_names", Reply::json(200, emptyPage));
        REQUIRE(fixture.store.listObjects().empty());
        REQUIRE(fixture.sleeper.delays.size() == 1);
        REQUIRE(fixture.sleeper.delays[0] == chrono::milliseconds(1000));
    }
    SECTION("expired token triggers one re-authentication") {
        Fixture fixture;
        fixture.authenticate();
        fixture.client.script("b2_list_file_names", Reply::error(401, "expired_auth_token"));
        fixture.client.script("b2_authorize_account", authorization("token-2"));
        fixture.client.script("b2_list_file_names", Reply::json(200, emptyPage));
        REQUIRE(fixture.store.listObjects().empty());
        REQUIRE(fixture.client.count("b2_authorize_account") == 2);
        REQUIRE(fixture.client.calls.back().header("Authorization") == "token-2");
        REQUIRE(fixture.sleeper.delays.empty());
    }
    SECTION("re-authentication does not use up an attempt") {
        Fixture fixture(1);
        fixture.authenticate();
        fixture.client.script("b2_list_file_names", Reply::error(401, "expired_auth_token"));
        fixture.client.script("b2_authorize_account", authorization("token-2"));
        fixture.client.script("b2_list_file_names", Reply::json(200, emptyPage));
        REQUIRE(fixture.store.listObjects().empty());
    }
    SECTION("a second expiry is fatal") {
        Fixture fixture;
        fixture.authenticate();
        fixture.client.script("b2_list_file_names", Reply::error(401, "expired_auth_token"));
        fixture.client.script("b2_authorize_account", authorization("token-2"));
        fixture.client.script("b2_list_file_names", Reply::error(401, "expired_auth_token"));
        REQUIRE_THROWS_AS(fixture.store.listObjects(), ListError);
        REQUIRE(fixture.client.count("b2_authorize_account") == 2);
        REQUIRE(fixture.client.exhausted());
    }
    SECTION("failed re-authentication") {
        Fixture fixture;
        fixture.authenticate();
        fixture.client.script("b2_list_file_names", Reply::error(401, "bad_auth_token"));
        fixture.client.script("b2_authorize_account", Reply::error(401, "unauthorized"));
        REQUIRE_THROWS_AS(fixture.store.listObjects(), AuthError);
        REQUIRE(!fixture.store.isAuthenticated());
    }
}
//---------------------------------------------------------------------------
TEST_CASE("b2_store_upload_single") {
    Fixture fixture;
    fixture.authenticate();
    auto path = createFile("b2_store_single", 10);
    auto sha1 = utils::fileSha1(path);

    SECTION("new object") {
        fixture.client.script("b2_list_file_names", Reply::json(200, emptyPage));
        fixture.client.script("b2_get_upload_url", Reply::json(200, uploadUrl));
        fixture.client.script("upload", fileInfo("users/users.jsonl.part1", 10, sha1));
        auto object = fixture.store.uploadObject(path, "users/users.jsonl.part1");
        REQUIRE(object.fileName == "users/users.jsonl.part1");
        REQUIRE(object.contentSha1 == sha1);
        auto upload = fixture.client.callsOf("upload").front();
        REQUIRE(upload.header("Authorization") == "upload-token");
        REQUIRE(upload.header("X-Bz-File-Name") == "users/users.jsonl.part1");
        REQUIRE(upload.header("X-Bz-Content-Sha1") == sha1);
        REQUIRE(upload.body.filePath == path);
        REQUIRE(upload.body.size() == 10);
    }
    SECTION("existing object is skipped") {
        fixture.client.script("b2_list_file_names", Reply::json(200, "{\"files\":[{\"fileName\":\"users/users.jsonl.part1\",\"contentSha1\":\"" + sha1 + "\"}]}"));
        auto object = fixture.store.uploadObject(path, "users/users.jsonl.part1");
        REQUIRE(object.contentSha1 == sha1);
        REQUIRE(fixture.client.count("upload") == 0);
    }
    SECTION("transient failures use a fresh upload url") {
        fixture.client.script("b2_list_file_names", Reply::json(200, emptyPage));
        fixture.client.script("b2_get_upload_url", Reply::json(200, uploadUrl), 3);
        fixture.client.script("upload", Reply::error(503, "service_unavailable"));
        fixture.client.script("upload", Reply::transportError());
        fixture.client.script("upload", fileInfo("a", 10, sha1));
        static_cast<void>(fixture.store.uploadObject(path, "a"));
        REQUIRE(fixture.client.count("upload") == 3);
        REQUIRE(fixture.client.count("b2_get_upload_url") == 3);
        REQUIRE(fixture.sleeper.delays.size() == 2);
    }
    SECTION("failure carries the cause") {
        fixture.client.script("b2_list_file_names", Reply::json(200, emptyPage));
        fixture.client.script("b2_get_upload_url", Reply::json(200, uploadUrl));
        fixture.client.script("upload", Reply::error(400, "bad_request"));
        try {
            static_cast<void>(fixture.store.uploadObject(path, "a"));
            FAIL("upload succeeded");
        } catch (const UploadError& error) {
            REQUIRE(error.cause().find("bad_request") != string::npos);
        }
        REQUIRE(fixture.client.count("upload") == 1);
    }
    SECTION("failing existence check") {
        fixture.client.script("b2_list_file_names", Reply::error(403, "access_denied"));
        REQUIRE_THROWS_AS(fixture.store.uploadObject(path, "a"), UploadError);
    }
    SECTION("missing file") {
        REQUIRE_THROWS_AS(fixture.store.uploadObject(path + ".missing", "a"), UploadError);
        REQUIRE(fixture.client.calls.size() == 1);
    }
    filesystem::remove(path);
}
//---------------------------------------------------------------------------
TEST_CASE("b2_store_upload_large") {
    B2Store::Settings settings;
    settings.singleShotThreshold = 100;
    settings.partSize = 100;
    settings.skipExisting = false;
    Fixture fixture(5, settings);
    fixture.authenticate();
    auto path = createFile("b2_store_large", 250);

    SECTION("parts in order") {
        fixture.client.script("b2_start_large_file", Reply::json(200, "{\"fileId\":\"file-id\",\"fileName\":\"big\"}"));
        fixture.client.script("b2_get_upload_part_url", Reply::json(200, uploadPartUrl), 3);
        fixture.client.script("upload_part", Reply::json(200, "{}"), 3);
        fixture.client.script("b2_finish_large_file", fileInfo("big", 250, "none"));
        auto object = fixture.store.uploadObject(path, "big");
        REQUIRE(object.contentLength == 250);

        auto parts = fixture.client.callsOf("upload_part");
        REQUIRE(parts.size() == 3);
        vector<pair<uint64_t, uint64_t>> ranges = {{0, 100}, {100, 100}, {200, 50}};
        string expectedShas;
        for (unsigned i = 0; i < 3; i++) {
            REQUIRE(parts[i].header("X-Bz-Part-Number") == to_string(i + 1));
            REQUIRE(parts[i].header("Authorization") == "part-token");
            REQUIRE(parts[i].body.offset == ranges[i].first);
            REQUIRE(parts[i].body.length == ranges[i].second);
            auto sha1 = utils::fileSha1(path, ranges[i].first, ranges[i].second);
            REQUIRE(parts[i].header("X-Bz-Content-Sha1") == sha1);
            expectedShas += (i ? ",\"" : "\"") + sha1 + "\"";
        }
        auto finish = fixture.client.callsOf("b2_finish_large_file").front();
        REQUIRE(finish.body.data == "{\"fileId\":\"file-id\",\"partSha1Array\":[" + expectedShas + "]}");
        REQUIRE(fixture.client.count("b2_cancel_large_file") == 0);
    }
    SECTION("part retried") {
        fixture.client.script("b2_start_large_file", Reply::json(200, "{\"fileId\":\"file-id\"}"));
        fixture.client.script("b2_get_upload_part_url", Reply::json(200, uploadPartUrl), 4);
        fixture.client.script("upload_part", Reply::json(200, "{}"));
        fixture.client.script("upload_part", Reply::error(503, "service_unavailable"));
        fixture.client.script("upload_part", Reply::json(200, "{}"), 2);
        fixture.client.script("b2_finish_large_file", fileInfo("big", 250, "none"));
        static_cast<void>(fixture.store.uploadObject(path, "big"));
        auto parts = fixture.client.callsOf("upload_part");
        REQUIRE(parts.size() == 4);
        REQUIRE(parts[1].header("X-Bz-Part-Number") == "2");
        REQUIRE(parts[2].header("X-Bz-Part-Number") == "2");
        REQUIRE(parts[3].header("X-Bz-Part-Number") == "3");
    }
    SECTION("failed part cancels the large file") {
        fixture.client.script("b2_start_large_file", Reply::json(200, "{\"fileId\":\"file-id\"}"));
        fixture.client.script("b2_get_upload_part_url", Reply::json(200, uploadPartUrl), 2);
        fixture.client.script("upload_part", Reply::json(200, "{}"));
        fixture.client.script("upload_part", Reply::error(400, "bad_request"));
        fixture.client.script("b2_cancel_large_file", Reply::json(200, "{}"));
        REQUIRE_THROWS_AS(fixture.store.uploadObject(path, "big"), UploadError);
        REQUIRE(fixture.client.count("b2_finish_large_file") == 0);
        auto cancel = fixture.client.callsOf("b2_cancel_large_file");
        REQUIRE(cancel.size() == 1);
        REQUIRE(cancel[0].body.data == "{\"fileId\":\"file-id\"}");
    }
    SECTION("failed cancel keeps the upload error") {
        fixture.client.script("b2_start_large_file", Reply::json(200, "{\"fileId\":\"file-id\"}"));
        fixture.client.script("b2_get_upload_part_url", Reply::error(400, "bad_request"));
        fixture.client.script("b2_cancel_large_file", Reply::error(400, "bad_request"));
        REQUIRE_THROWS_AS(fixture.store.uploadObject(path, "big"), UploadError);
    }
    filesystem::remove(path);
}
//---------------------------------------------------------------------------
TEST_CASE("b2_store_download") {
    Fixture fixture(2);
    fixture.authenticate();
    auto target = (filesystem::temp_directory_path() / "dumpsync_b2_store_download").string();
    string content = "{\"i\":1}\n";
    auto sha1 = utils::sha1Encode(reinterpret_cast<const uint8_t*>(content.data()), content.size());

    SECTION("verified content") {
        fixture.client.script("download", Reply::json(200, content, {{"X-Bz-Content-Sha1", sha1}}));
        fixture.store.downloadObject("users/users.jsonl.part1", target);
        REQUIRE(readFile(target) == content);
        REQUIRE(fixture.client.calls.back().request.path == "/file/bucket/users/users.jsonl.part1");
    }
    SECTION("checksum mismatch") {
        fixture.client.script("download", Reply::json(200, content, {{"X-Bz-Content-Sha1", string(40, '0')}}), 2);
        REQUIRE_THROWS_AS(fixture.store.downloadObject("a", target), DownloadError);
        REQUIRE(fixture.client.count("download") == 2);
    }
    SECTION("missing object") {
        fixture.client.script("download", Reply::error(404, "not_found"));
        REQUIRE_THROWS_AS(fixture.store.downloadObject("a", target), DownloadError);
    }
    filesystem::remove(target);
}
//---------------------------------------------------------------------------
} // namespace dumpsync::cloud::test
