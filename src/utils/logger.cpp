#include "utils/logger.hpp"
#include "utils/errors.hpp"
#include <memory>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace dumpsync::utils {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
void initLogging(const string& level, const string& file)
// Install the default logger
{
    auto logLevel = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (logLevel == spdlog::level::off && level != "off")
        throw ConfigError("Unknown log level " + level + "!");

    vector<spdlog::sink_ptr> sinks;
    sinks.push_back(make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!file.empty()) {
        try {
            sinks.push_back(make_shared<spdlog::sinks::rotating_file_sink_mt>(file, logFileSize, logFileCount));
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigError("Cannot open log file " + file + ": " + e.what());
        }
    }

    auto logger = make_shared<spdlog::logger>("dumpsync", sinks.begin(), sinks.end());
    logger->set_level(logLevel);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(move(logger));
}
//---------------------------------------------------------------------------
} // namespace dumpsync::utils
