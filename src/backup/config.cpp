#include "backup/config.hpp"
#include "utils/errors.hpp"
#include <charconv>
#include <cstdlib>
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
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
string required(const Config::Lookup& lookup, const string& name)
// A variable that has to be set
{
    auto value = lookup(name);
    if (!value || value->empty())
        throw ConfigError("Missing required environment variable " + name + "!");
    return *value;
}
//---------------------------------------------------------------------------
string optionalValue(const Config::Lookup& lookup, const string& name, const string& fallback)
// A variable with a default
{
    auto value = lookup(name);
    return value && !value->empty() ? *value : fallback;
}
//---------------------------------------------------------------------------
uint64_t number(const Config::Lookup& lookup, const string& name, uint64_t fallback, uint64_t minimum = 0)
// An unsigned number with a default
{
    auto value = lookup(name);
    if (!value || value->empty())
        return fallback;
    uint64_t result = 0;
    auto* end = value->data() + value->size();
    auto [ptr, ec] = from_chars(value->data(), end, result);
    if (ec != errc() || ptr != end)
        throw ConfigError("Invalid number in " + name + ": " + *value);
    if (result < minimum)
        throw ConfigError(name + " must be at least " + to_string(minimum) + "!");
    return result;
}
//---------------------------------------------------------------------------
/// The largest chunk threshold
constexpr uint64_t maxChunkMegabytes = 100 * 1024;
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
Config Config::load(const Lookup& lookup)
// Read all variables
{
    Config config;
    config.b2.keyId = required(lookup, "B2_KEY_ID");
    config.b2.key = required(lookup, "B2_KEY");
    config.b2.bucketName = required(lookup, "B2_BUCKET_NAME");
    config.b2.authUrl = optionalValue(lookup, "B2_AUTH_URL", config.b2.authUrl);

    config.mongo.uri = optionalValue(lookup, "MONGO_URI", config.mongo.uri);
    config.mongo.containerName = optionalValue(lookup, "MONGO_CONTAINER_NAME", "");

    config.backupPath = optionalValue(lookup, "BACKUP_PATH", config.backupPath);
    config.interval = chrono::hours(number(lookup, "BACKUP_INTERVAL_HOURS", 12, 1));
    auto chunkMegabytes = number(lookup, "CHUNK_SIZE_MB", 10, 1);
    if (chunkMegabytes > maxChunkMegabytes)
        throw ConfigError("CHUNK_SIZE_MB must not exceed " + to_string(maxChunkMegabytes) + "!");
    config.chunkSize = chunkMegabytes << 20;

    config.backoff.maxRetries = static_cast<unsigned>(number(lookup, "MAX_RETRIES", 5, 1));
    config.backoff.baseDelay = chrono::milliseconds(number(lookup, "RETRY_BASE_DELAY_MS", 1000));
    config.backoff.maxDelay = chrono::milliseconds(number(lookup, "RETRY_MAX_DELAY_MS", 60000));
    if (config.backoff.maxDelay < config.backoff.baseDelay)
        throw ConfigError("RETRY_MAX_DELAY_MS must not be smaller than RETRY_BASE_DELAY_MS!");
    config.httpTimeout = chrono::seconds(number(lookup, "HTTP_TIMEOUT_SECONDS", 300, 1));

    auto policy = optionalValue(lookup, "DIFF_POLICY", "folder");
    if (policy == "folder")
        config.diffPolicy = DiffPolicy::FolderPresence;
    else if (policy == "digest")
        config.diffPolicy = DiffPolicy::ContentDigest;
    else
        throw ConfigError("Unknown DIFF_POLICY " + policy + ", expected folder or digest!");

    config.retentionRuns = number(lookup, "RETENTION_RUNS", 0);
    config.logLevel = optionalValue(lookup, "LOG_LEVEL", config.logLevel);
    config.logFile = optionalValue(lookup, "LOG_FILE", "");
    return config;
}
//---------------------------------------------------------------------------
Config Config::fromEnvironment()
// Read the process environment
{
    return load([](const string& name) -> optional<string> {
        if (auto* value = getenv(name.c_str()))
            return string(value);
        return nullopt;
    });
}
//---------------------------------------------------------------------------
} // namespace dumpsync::backup
