#include "backup/diff_engine.hpp"
#include "utils/checksum.hpp"
#include <filesystem>
#include <unordered_map>
#include <unordered_set>
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
string DiffEngine::remoteName(const string& baseName, const string& localPath)
// {baseName}/{file name}
{
    return baseName + "/" + filesystem::path(localPath).filename().string();
}
//---------------------------------------------------------------------------
vector<UploadItem> DiffEngine::computeWorklist(const vector<ChunkSet>& chunkSets, const vector<cloud::RemoteObject>& remoteObjects) const
// Filter the local chunks against the listing
{
    unordered_map<string, const cloud::RemoteObject*> byName;
    unordered_set<string> folders;
    for (auto& object : remoteObjects) {
        byName.emplace(object.fileName, &object);
        // Every prefix ending in '/' names a folder
        for (auto pos = object.fileName.find('/'); pos != string::npos; pos = object.fileName.find('/', pos + 1))
            folders.insert(object.fileName.substr(0, pos));
    }

    vector<UploadItem> worklist;
    for (auto& set : chunkSets) {
        if (_policy == DiffPolicy::FolderPresence && folders.count(set.baseName))
            continue;
        for (auto& chunk : set.chunks) {
            auto name = remoteName(set.baseName, chunk);
            auto it = byName.find(name);
            if (it != byName.end()) {
                if (_policy == DiffPolicy::FolderPresence)
                    continue;
                if (it->second->contentSha1 == utils::fileSha1(chunk))
                    continue;
            }
            worklist.push_back({chunk, move(name)});
        }
    }
    return worklist;
}
//---------------------------------------------------------------------------
} // namespace dumpsync::backup
