#include "utils/utils.hpp"
#include <catch2/catch.hpp>
#include <string>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace dumpsync::utils::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("utils_encoding") {
    string plain = "DumpSync";
    auto* data = reinterpret_cast<const uint8_t*>(plain.data());
    REQUIRE(base64Encode(data, plain.size()) == "RHVtcFN5bmM=");
    REQUIRE(hexEncode(data, 4) == "44756d70");
    REQUIRE(hexEncode(data, 4, true) == "44756D70");
    REQUIRE(sha1Encode(reinterpret_cast<const uint8_t*>("abc"), 3) == "a9993e364706816aba3e25717850c26c9cd0d89d");
}
//---------------------------------------------------------------------------
TEST_CASE("utils_url") {
    REQUIRE(encodeUrlPath("users/users.jsonl.part1") == "users/users.jsonl.part1");
    REQUIRE(encodeUrlPath("a b/c~d") == "a%20b/c~d");
}
//---------------------------------------------------------------------------
TEST_CASE("utils_mask_credentials") {
    REQUIRE(maskCredentials("mongodb://admin:secret@db:27017/?authSource=admin") == "mongodb://admin:***@db:27017/?authSource=admin");
    REQUIRE(maskCredentials("mongodb://db:27017") == "mongodb://db:27017");
    REQUIRE(maskCredentials("mongodb://admin@db:27017") == "mongodb://admin@db:27017");
}
//---------------------------------------------------------------------------
} // namespace dumpsync::utils::test
