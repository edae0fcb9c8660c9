#pragma once
#include <string>
#include <utility>
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
// Produces a directory of BSON collection files
class DumpSource {
    public:
    /// The destructor
    virtual ~DumpSource() = default;
    /// Dump into the run directory and return the dump directory, throws DumpError
    virtual std::string produce(const std::string& runDirectory) = 0;
};
//---------------------------------------------------------------------------
// Runs mongodump locally or inside a docker container
class MongoDump : public DumpSource {
    public:
    /// The settings
    struct Settings {
        /// The connection string
        std::string uri = "mongodb://localhost:27017";
        /// The container, empty runs mongodump on the host
        std::string containerName;
        /// The dump directory inside the container
        std::string containerDumpPath = "/dump";
    };

    private:
    /// The settings
    Settings _settings;

    public:
    /// The constructor
    explicit MongoDump(Settings settings) : _settings(std::move(settings)) {}

    /// Dump into {runDirectory}/dump
    std::string produce(const std::string& runDirectory) override;
    /// The argument lists of the commands a dump runs, the last one is best-effort
    [[nodiscard]] std::vector<std::vector<std::string>> commands(const std::string& dumpDirectory) const;
    /// Run a command and return its exit status, throws DumpError if it cannot be started
    static int run(const std::vector<std::string>& arguments);
};
//---------------------------------------------------------------------------
} // namespace dumpsync::backup
