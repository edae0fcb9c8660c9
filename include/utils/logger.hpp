#pragma once
#include <cstddef>
#include <string>
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
/// The size of one log file before it is rotated
static constexpr size_t logFileSize = 5ull << 20;
/// The number of rotated log files
static constexpr size_t logFileCount = 3;
//---------------------------------------------------------------------------
/// Install the default logger with a stderr sink and an optional rotating file sink
void initLogging(const std::string& level, const std::string& file = "");
//---------------------------------------------------------------------------
} // namespace dumpsync::utils
