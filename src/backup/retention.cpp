#include "backup/retention.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
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
bool RetentionPolicy::isRunName(string_view name)
// YYYY-MM-DDTHH-MM-SS-mmmZ
{
    static constexpr string_view pattern = "0000-00-00T00-00-00-000Z";
    if (name.size() != pattern.size())
        return false;
    for (size_t i = 0; i < pattern.size(); i++) {
        if (pattern[i] == '0' ? !isdigit(static_cast<unsigned char>(name[i])) : name[i] != pattern[i])
            return false;
    }
    return true;
}
//---------------------------------------------------------------------------
vector<string> KeepLatestRuns::expired(const vector<string>& runDirectories) const
// Sort by name and drop the newest
{
    if (!_keep)
        return {};
    vector<string> sorted;
    copy_if(runDirectories.begin(), runDirectories.end(), back_inserter(sorted), [](const string& directory) {
        return isRunName(filesystem::path(directory).filename().string());
    });
    if (sorted.size() <= _keep)
        return {};
    sort(sorted.begin(), sorted.end(), [](const string& a, const string& b) {
        return filesystem::path(a).filename() < filesystem::path(b).filename();
    });
    sorted.resize(sorted.size() - _keep);
    return sorted;
}
//---------------------------------------------------------------------------
} // namespace dumpsync::backup
