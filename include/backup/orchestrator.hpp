#pragma once
#include "backup/diff_engine.hpp"
#include "backup/dump_source.hpp"
#include "backup/retention.hpp"
#include "cloud/remote_store.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
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
namespace dumpsync::backup {
//---------------------------------------------------------------------------
// Runs one backup: dump, transcode, diff, upload and cleanup
class Orchestrator {
    public:
    /// The settings
    struct Settings {
        /// The local root of all runs
        std::string backupPath = "./backups";
        /// The chunk threshold in bytes
        uint64_t chunkSize = 10ull << 20;
        /// The diff policy
        DiffPolicy diffPolicy = DiffPolicy::FolderPresence;
    };
    /// The outcome of a successful run
    struct Report {
        /// The run directory
        std::string runDirectory;
        /// The converted source files
        uint64_t sources = 0;
        /// The produced chunks
        uint64_t chunks = 0;
        /// The uploaded chunks
        uint64_t uploaded = 0;
        /// The chunks that were already present remotely
        uint64_t skipped = 0;
    };

    private:
    /// The remote store
    cloud::RemoteStore& _store;
    /// The dump source
    DumpSource& _source;
    /// The retention policy, may be null
    const RetentionPolicy* _retention;
    /// The settings
    Settings _settings;
    /// The stop flag
    const std::atomic<bool>& _stop;

    /// Throws CancelledError if a stop was requested
    void checkStop() const;
    /// Delete the chunks and expired runs, failures are logged
    void cleanup(const std::string& chunkDirectory) const;

    public:
    /// The constructor
    Orchestrator(cloud::RemoteStore& store, DumpSource& source, const RetentionPolicy* retention, Settings settings, const std::atomic<bool>& stop);

    /// Perform one run, throws on the first fatal error
    Report run();
    /// Perform one run in the given directory
    Report run(const std::string& runDirectory);

    /// The run directory name of a point in time, e.g. 2025-01-02T03-04-05-678Z
    [[nodiscard]] static std::string runName(std::chrono::system_clock::time_point time);
    /// All .bson files below the directory in sorted order
    [[nodiscard]] static std::vector<std::string> findSources(const std::string& dumpDirectory);
};
//---------------------------------------------------------------------------
} // namespace dumpsync::backup
