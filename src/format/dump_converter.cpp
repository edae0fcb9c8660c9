#include "format/dump_converter.hpp"
#include "format/record_transcoder.hpp"
#include "utils/errors.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <spdlog/spdlog.h>
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
string DumpConverter::baseName(const string& inputPath)
// users.bson -> users
{
    auto path = filesystem::path(inputPath);
    if (path.extension() == ".bson")
        return path.stem().string();
    return path.filename().string();
}
//---------------------------------------------------------------------------
ConvertedFile DumpConverter::convert(const string& inputPath, const string& outputDirectory, uint64_t chunkSize)
// Read, transcode and chunk
{
    ConvertedFile result;
    result.baseName = baseName(inputPath);

    error_code ec;
    filesystem::create_directories(outputDirectory, ec);
    if (ec)
        throw ChunkWriteError("Cannot create chunk directory " + outputDirectory + ": " + ec.message());

    ifstream input(inputPath, ios::binary);
    if (!input.is_open())
        throw IOError("Cannot open " + inputPath + ": " + strerror(errno));

    RecordTranscoder transcoder;
    ChunkWriter writer(outputDirectory, result.baseName, chunkSize);
    auto buffer = make_unique<uint8_t[]>(readSize);
    auto consumer = [&writer](string_view line) { writer.write(line); };

    while (true) {
        input.read(reinterpret_cast<char*>(buffer.get()), static_cast<streamsize>(readSize));
        auto count = input.gcount();
        if (count > 0)
            transcoder.absorb(buffer.get(), static_cast<uint64_t>(count), consumer);
        if (input.eof())
            break;
        if (!input)
            throw IOError("Cannot read " + inputPath + ": " + strerror(errno));
    }
    transcoder.finish();

    result.chunks = writer.finish();
    result.records = transcoder.records();
    spdlog::info("Converted {} into {} chunks with {} records", inputPath, result.chunks.size(), result.records);
    return result;
}
//---------------------------------------------------------------------------
} // namespace dumpsync::format
