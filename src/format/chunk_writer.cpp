#include "format/chunk_writer.hpp"
#include "utils/errors.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
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
using namespace std;
//---------------------------------------------------------------------------
ChunkWriter::ChunkWriter(string directory, string baseName, uint64_t threshold) : _directory(move(directory)), _baseName(move(baseName)), _threshold(threshold), _currentSize(0)
// The constructor
{
    if (!_threshold)
        throw runtime_error("The chunk threshold must be positive!");
}
//---------------------------------------------------------------------------
string ChunkWriter::chunkName(const string& baseName, uint64_t index)
// {baseName}.jsonl.part{N}
{
    return baseName + ".jsonl.part" + to_string(index);
}
//---------------------------------------------------------------------------
void ChunkWriter::openChunk()
// Open the next chunk
{
    auto path = (filesystem::path(_directory) / chunkName(_baseName, _chunks.size() + 1)).string();
    _stream.open(path, ios::binary | ios::trunc);
    if (!_stream.is_open())
        throw ChunkWriteError("Cannot create chunk " + path + ": " + strerror(errno));
    _chunks.push_back(move(path));
    _currentSize = 0;
}
//---------------------------------------------------------------------------
void ChunkWriter::closeChunk()
// Flush and close the open chunk
{
    if (!_stream.is_open())
        return;
    _stream.close();
    if (!_stream)
        throw ChunkWriteError("Cannot close chunk " + _chunks.back() + "!");
}
//---------------------------------------------------------------------------
void ChunkWriter::write(string_view unit)
// Write the unit to the current or the next chunk
{
    if (!_stream.is_open() || _currentSize >= _threshold) {
        closeChunk();
        openChunk();
    }
    _stream.write(unit.data(), static_cast<streamsize>(unit.size()));
    if (!_stream)
        throw ChunkWriteError("Cannot write chunk " + _chunks.back() + ": " + strerror(errno));
    _currentSize += unit.size();
}
//---------------------------------------------------------------------------
vector<string> ChunkWriter::finish()
// Close the last chunk
{
    closeChunk();
    return _chunks;
}
//---------------------------------------------------------------------------
} // namespace dumpsync::format
