#pragma once
#include "cloud/remote_store.hpp"
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
/// The chunks produced for one source file
struct ChunkSet {
    /// The source base name
    std::string baseName;
    /// The local chunk paths in order
    std::vector<std::string> chunks;
};
//---------------------------------------------------------------------------
/// One pending upload
struct UploadItem {
    /// The local chunk path
    std::string localPath;
    /// The remote object name
    std::string remoteName;

    bool operator==(const UploadItem&) const = default;
};
//---------------------------------------------------------------------------
/// How chunks are compared with the remote listing
enum class DiffPolicy : uint8_t {
    /// Skip a source if its folder exists remotely, otherwise skip chunks by exact name
    FolderPresence,
    /// Upload chunks that are missing remotely or whose sha1 differs
    ContentDigest
};
//---------------------------------------------------------------------------
// Decides which local chunks have to be uploaded
class DiffEngine {
    /// The policy
    DiffPolicy _policy;

    public:
    /// The constructor
    explicit DiffEngine(DiffPolicy policy = DiffPolicy::FolderPresence) : _policy(policy) {}

    /// The remote name of a chunk, {baseName}/{chunk file name}
    [[nodiscard]] static std::string remoteName(const std::string& baseName, const std::string& localPath);
    /// Compute the ordered worklist, throws IOError if a digest cannot be computed
    [[nodiscard]] std::vector<UploadItem> computeWorklist(const std::vector<ChunkSet>& chunkSets, const std::vector<cloud::RemoteObject>& remoteObjects) const;
    /// The policy
    [[nodiscard]] DiffPolicy policy() const { return _policy; }
};
//---------------------------------------------------------------------------
} // namespace dumpsync::backup
