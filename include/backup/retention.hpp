#pragma once
#include <cstdint>
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
namespace dumpsync::backup {
//---------------------------------------------------------------------------
// Selects local run directories to delete
class RetentionPolicy {
    public:
    /// The destructor
    virtual ~RetentionPolicy() = default;
    /// The directories to delete
    [[nodiscard]] virtual std::vector<std::string> expired(const std::vector<std::string>& runDirectories) const = 0;

    /// Is the directory name a run timestamp, e.g. 2025-01-02T03-04-05-678Z
    [[nodiscard]] static bool isRunName(std::string_view name);
};
//---------------------------------------------------------------------------
// Keeps the newest runs, run directories are named by their UTC timestamp
class KeepLatestRuns : public RetentionPolicy {
    /// The number of runs to keep, 0 keeps all
    uint64_t _keep;

    public:
    /// The constructor
    explicit KeepLatestRuns(uint64_t keep) : _keep(keep) {}
    /// All but the newest runs, directories not named like a run are never selected
    [[nodiscard]] std::vector<std::string> expired(const std::vector<std::string>& runDirectories) const override;
};
//---------------------------------------------------------------------------
} // namespace dumpsync::backup
