#include "backup/orchestrator.hpp"
#include "format/dump_converter.hpp"
#include "utils/errors.hpp"
#include <algorithm>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <unordered_set>
#include <spdlog/spdlog.h>
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
Orchestrator::Orchestrator(cloud::RemoteStore& store, DumpSource& source, const RetentionPolicy* retention, Settings settings, const atomic<bool>& stop)
    : _store(store), _source(source), _retention(retention), _settings(move(settings)), _stop(stop)
// The constructor
{
}
//---------------------------------------------------------------------------
string Orchestrator::runName(chrono::system_clock::time_point time)
// ISO 8601 in UTC with file system safe separators
{
    auto ms = chrono::duration_cast<chrono::milliseconds>(time.time_since_epoch()).count();
    auto seconds = static_cast<time_t>(ms / 1000);
    auto millis = ms % 1000;
    if (millis < 0) {
        millis += 1000;
        seconds--;
    }
    tm utc{};
    gmtime_r(&seconds, &utc);
    char buffer[32];
    auto length = strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H-%M-%S", &utc);
    char suffix[8];
    snprintf(suffix, sizeof(suffix), "-%03dZ", static_cast<int>(millis));
    return string(buffer, length) + suffix;
}
//---------------------------------------------------------------------------
vector<string> Orchestrator::findSources(const string& dumpDirectory)
// Recursive scan
{
    vector<string> sources;
    error_code ec;
    filesystem::recursive_directory_iterator it(dumpDirectory, ec), end;
    if (ec)
        throw DumpError("Cannot scan " + dumpDirectory + ": " + ec.message());
    for (; it != end; it.increment(ec)) {
        if (ec)
            throw DumpError("Cannot scan " + dumpDirectory + ": " + ec.message());
        error_code typeError;
        if (it->is_regular_file(typeError) && it->path().extension() == ".bson")
            sources.push_back(it->path().string());
    }
    if (ec)
        throw DumpError("Cannot scan " + dumpDirectory + ": " + ec.message());
    sort(sources.begin(), sources.end());
    return sources;
}
//---------------------------------------------------------------------------
void Orchestrator::checkStop() const
// Cancellation point
{
    if (_stop.load())
        throw CancelledError();
}
//---------------------------------------------------------------------------
Orchestrator::Report Orchestrator::run()
// A fresh run directory
{
    return run((filesystem::path(_settings.backupPath) / runName(chrono::system_clock::now())).string());
}
//---------------------------------------------------------------------------
Orchestrator::Report Orchestrator::run(const string& runDirectory)
// The pipeline
{
    Report report;
    report.runDirectory = runDirectory;
    spdlog::info("Starting backup run {}", runDirectory);

    _store.authenticate();
    checkStop();

    auto dumpDirectory = _source.produce(runDirectory);
    checkStop();

    auto chunkDirectory = (filesystem::path(runDirectory) / "chunks").string();
    vector<ChunkSet> chunkSets;
    unordered_set<string> baseNames;
    for (auto& source : findSources(dumpDirectory)) {
        checkStop();
        auto baseName = format::DumpConverter::baseName(source);
        if (!baseNames.insert(baseName).second)
            throw DumpError("Two dump files share the name " + baseName + ": " + source);
        auto converted = format::DumpConverter::convert(source, (filesystem::path(chunkDirectory) / baseName).string(), _settings.chunkSize);
        report.chunks += converted.chunks.size();
        chunkSets.push_back({move(converted.baseName), move(converted.chunks)});
    }
    report.sources = chunkSets.size();
    checkStop();

    auto remoteObjects = _store.listObjects();
    auto worklist = DiffEngine(_settings.diffPolicy).computeWorklist(chunkSets, remoteObjects);
    report.skipped = report.chunks - worklist.size();
    spdlog::info("{} of {} chunks need to be uploaded, {} remote objects listed", worklist.size(), report.chunks, remoteObjects.size());

    for (auto& item : worklist) {
        checkStop();
        _store.uploadObject(item.localPath, item.remoteName);
        report.uploaded++;
        spdlog::info("Uploaded {} ({}/{})", item.remoteName, report.uploaded, worklist.size());
    }

    cleanup(chunkDirectory);
    spdlog::info("Finished backup run {}: {} sources, {} chunks, {} uploaded, {} skipped", runDirectory, report.sources, report.chunks, report.uploaded, report.skipped);
    return report;
}
//---------------------------------------------------------------------------
void Orchestrator::cleanup(const string& chunkDirectory) const
// Best-effort
{
    error_code ec;
    filesystem::remove_all(chunkDirectory, ec);
    if (ec)
        spdlog::warn("Cannot remove {}: {}", chunkDirectory, ec.message());

    if (!_retention)
        return;
    vector<string> runs;
    filesystem::directory_iterator it(_settings.backupPath, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        error_code typeError;
        if (it->is_directory(typeError))
            runs.push_back(it->path().string());
    }
    if (ec) {
        spdlog::warn("Cannot scan {}: {}", _settings.backupPath, ec.message());
        return;
    }
    for (auto& run : _retention->expired(runs)) {
        filesystem::remove_all(run, ec);
        if (ec)
            spdlog::warn("Cannot remove expired run {}: {}", run, ec.message());
        else
            spdlog::info("Removed expired run {}", run);
    }
}
//---------------------------------------------------------------------------
} // namespace dumpsync::backup
