#pragma once
#include <cstdint>
#include <fstream>
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
namespace dumpsync::format {
//---------------------------------------------------------------------------
// Splits a stream of text units into {baseName}.jsonl.part{N} files.
// A unit is never split. A new file is started only when the current one reached the threshold,
// so every file but the last holds at least threshold bytes.
class ChunkWriter {
    public:
    /// The default threshold
    static constexpr uint64_t defaultChunkSize = 10ull << 20;

    private:
    /// The output directory
    std::string _directory;
    /// The base name
    std::string _baseName;
    /// The threshold
    uint64_t _threshold;
    /// The open chunk
    std::ofstream _stream;
    /// The bytes written to the open chunk
    uint64_t _currentSize;
    /// The produced chunk paths
    std::vector<std::string> _chunks;

    /// Close the open chunk
    void closeChunk();
    /// Open the next chunk
    void openChunk();

    public:
    /// The constructor, the directory has to exist
    ChunkWriter(std::string directory, std::string baseName, uint64_t threshold = defaultChunkSize);

    /// Write one unit, throws ChunkWriteError
    void write(std::string_view unit);
    /// Close the last chunk and return all chunk paths in order
    [[nodiscard]] std::vector<std::string> finish();

    /// The file name of the chunk with the 1-based index
    [[nodiscard]] static std::string chunkName(const std::string& baseName, uint64_t index);
};
//---------------------------------------------------------------------------
} // namespace dumpsync::format
