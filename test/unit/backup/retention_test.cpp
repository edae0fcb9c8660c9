#include "backup/retention.hpp"
#include <catch2/catch.hpp>
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
namespace dumpsync::backup::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("retention_keep_latest") {
    vector<string> runs = {"/b/2025-03-01T00-00-00-000Z", "/b/2025-01-01T00-00-00-000Z", "/b/2025-02-01T12-00-00-000Z"};

    REQUIRE(KeepLatestRuns(0).expired(runs).empty());
    REQUIRE(KeepLatestRuns(3).expired(runs).empty());
    REQUIRE(KeepLatestRuns(5).expired(runs).empty());
    REQUIRE(KeepLatestRuns(1).expired(runs) == vector<string>{"/b/2025-01-01T00-00-00-000Z", "/b/2025-02-01T12-00-00-000Z"});
    REQUIRE(KeepLatestRuns(2).expired(runs) == vector<string>{"/b/2025-01-01T00-00-00-000Z"});
    REQUIRE(KeepLatestRuns(1).expired({}).empty());
}
//---------------------------------------------------------------------------
TEST_CASE("retention_ignores_foreign_directories") {
    vector<string> directories = {"/b/2025-01-01T00-00-00-000Z", "/b/2025-01-02T00-00-00-000Z", "/b/logs", "/b/0-manual-export"};

    REQUIRE(KeepLatestRuns(2).expired(directories).empty());
    REQUIRE(KeepLatestRuns(1).expired(directories) == vector<string>{"/b/2025-01-01T00-00-00-000Z"});
    REQUIRE(KeepLatestRuns(1).expired({"/b/logs", "/b/0-manual-export", "/b/2025-01-01T00-00-00-000Z"}).empty());
}
//---------------------------------------------------------------------------
TEST_CASE("retention_run_names") {
    REQUIRE(RetentionPolicy::isRunName("2025-01-02T03-04-05-678Z"));
    REQUIRE(RetentionPolicy::isRunName("1970-01-01T00-00-00-000Z"));
    REQUIRE(!RetentionPolicy::isRunName(""));
    REQUIRE(!RetentionPolicy::isRunName("logs"));
    REQUIRE(!RetentionPolicy::isRunName("2025-01-02T03-04-05-678"));
    REQUIRE(!RetentionPolicy::isRunName("2025-01-02T03:04:05.678Z"));
    REQUIRE(!RetentionPolicy::isRunName("2025-01-02T03-04-05-678Z.old"));
    REQUIRE(!RetentionPolicy::isRunName("2025-0a-02T03-04-05-678Z"));
}
//---------------------------------------------------------------------------
} // namespace dumpsync::backup::test
