#include "backup/dump_source.hpp"
#include "utils/errors.hpp"
#include "utils/utils.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <spawn.h>
#include <sys/wait.h>
#include <spdlog/spdlog.h>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
extern char** environ;
//---------------------------------------------------------------------------
namespace dumpsync::backup {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
string describe(const vector<string>& arguments)
// The command line with masked credentials
{
    string result;
    for (auto& argument : arguments) {
        if (!result.empty())
            result += ' ';
        result += argument.starts_with("--uri=") ? "--uri=" + utils::maskCredentials(string_view(argument).substr(6)) : argument;
    }
    return result;
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
int MongoDump::run(const vector<string>& arguments)
// Spawn and wait
{
    if (arguments.empty())
        throw DumpError("Empty command!");
    vector<char*> argv;
    argv.reserve(arguments.size() + 1);
    for (auto& argument : arguments)
        argv.push_back(const_cast<char*>(argument.c_str()));
    argv.push_back(nullptr);

    pid_t pid;
    auto error = posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
    if (error)
        throw DumpError("Cannot start " + arguments[0] + ": " + strerror(error));

    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw DumpError("Cannot wait for " + arguments[0] + ": " + strerror(errno));
    }
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}
//---------------------------------------------------------------------------
vector<vector<string>> MongoDump::commands(const string& dumpDirectory) const
// Build the command lines
{
    if (_settings.containerName.empty())
        return {{"mongodump", "--uri=" + _settings.uri, "--out=" + dumpDirectory}};

    auto& container = _settings.containerName;
    return {
        {"docker", "exec", container, "mongodump", "--uri=" + _settings.uri, "--out=" + _settings.containerDumpPath, "--authenticationDatabase=admin"},
        {"docker", "cp", container + ":" + _settings.containerDumpPath, dumpDirectory},
        {"docker", "exec", container, "rm", "-rf", _settings.containerDumpPath}};
}
//---------------------------------------------------------------------------
string MongoDump::produce(const string& runDirectory)
// Run the dump commands
{
    auto dumpDirectory = (filesystem::path(runDirectory) / "dump").string();
    error_code ec;
    filesystem::create_directories(runDirectory, ec);
    if (ec)
        throw DumpError("Cannot create " + runDirectory + ": " + ec.message());

    auto steps = commands(dumpDirectory);
    auto required = _settings.containerName.empty() ? steps.size() : steps.size() - 1;
    for (size_t i = 0; i < steps.size(); i++) {
        spdlog::info("Running {}", describe(steps[i]));
        if (i < required) {
            auto status = run(steps[i]);
            if (status)
                throw DumpError(steps[i][0] + " exited with status " + to_string(status) + ": " + describe(steps[i]));
            continue;
        }
        // Container cleanup
        try {
            auto status = run(steps[i]);
            if (status)
                spdlog::warn("Container cleanup exited with status {}", status);
        } catch (const DumpError& e) {
            spdlog::warn("Container cleanup failed: {}", e.what());
        }
    }

    if (!filesystem::is_directory(dumpDirectory, ec))
        throw DumpError("The dump did not produce " + dumpDirectory + "!");
    return dumpDirectory;
}
//---------------------------------------------------------------------------
} // namespace dumpsync::backup
