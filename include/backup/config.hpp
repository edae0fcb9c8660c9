#pragma once
#include "backup/diff_engine.hpp"
#include "backup/dump_source.hpp"
#include "cloud/b2.hpp"
#include "utils/backoff.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace dumpsync::backup {
//---------------------------------------------------------------------------
// The service configuration
struct Config {
    /// Looks up a variable, nullopt if unset
    using Lookup = std::function<std::optional<std::string>(const std::string& name)>;

    /// The store credentials and bucket
    cloud::B2::Settings b2;
    /// The dump tool
    MongoDump::Settings mongo;
    /// The local root of all runs
    std::string backupPath = "./backups";
    /// The time between runs
    std::chrono::hours interval{12};
    /// The chunk threshold in bytes
    uint64_t chunkSize = 10ull << 20;
    /// The retry schedule
    utils::BackoffPolicy::Settings backoff;
    /// The timeout of one http call
    std::chrono::seconds httpTimeout{300};
    /// The diff policy
    DiffPolicy diffPolicy = DiffPolicy::FolderPresence;
    /// The number of local runs to keep, 0 keeps all
    uint64_t retentionRuns = 0;
    /// The log level
    std::string logLevel = "info";
    /// The log file, empty logs to stderr only
    std::string logFile;

    /// Load from the lookup, throws ConfigError
    [[nodiscard]] static Config load(const Lookup& lookup);
    /// Load from the process environment, throws ConfigError
    [[nodiscard]] static Config fromEnvironment();
};
//---------------------------------------------------------------------------
} // namespace dumpsync::backup
