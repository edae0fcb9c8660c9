#pragma once
#include "format/chunk_writer.hpp"
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
namespace dumpsync::format {
//---------------------------------------------------------------------------
/// The chunks of one converted collection file
struct ConvertedFile {
    /// The collection file name without the .bson extension
    std::string baseName;
    /// The chunk paths in order
    std::vector<std::string> chunks;
    /// The number of records
    uint64_t records = 0;
};
//---------------------------------------------------------------------------
// Streams a .bson collection file through the transcoder into chunks
class DumpConverter {
    public:
    /// The read size
    static constexpr uint64_t readSize = 1ull << 20;

    /// The base name of a collection file
    [[nodiscard]] static std::string baseName(const std::string& inputPath);
    /// Convert the file into chunks inside outputDirectory, which is created if missing
    [[nodiscard]] static ConvertedFile convert(const std::string& inputPath, const std::string& outputDirectory, uint64_t chunkSize = ChunkWriter::defaultChunkSize);
};
//---------------------------------------------------------------------------
} // namespace dumpsync::format
