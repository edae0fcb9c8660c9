#include "format/record_transcoder.hpp"
#include "format/bson.hpp"
#include "utils/errors.hpp"
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
void RecordTranscoder::absorb(const uint8_t* data, uint64_t length, const LineConsumer& consumer)
// Append the read and extract complete records
{
    _buffer.append(data, length);

    uint64_t consumed = 0;
    while (_buffer.size() - consumed >= 4) {
        auto* record = _buffer.cdata() + consumed;
        auto size = static_cast<int32_t>(static_cast<uint32_t>(record[0]) | (static_cast<uint32_t>(record[1]) << 8) | (static_cast<uint32_t>(record[2]) << 16) | (static_cast<uint32_t>(record[3]) << 24));
        if (size < Bson::minDocumentSize || size > Bson::maxDocumentSize)
            throw CorruptStreamError("Invalid BSON document size " + to_string(size) + " at offset " + to_string(_offset + consumed) + "!");
        if (_buffer.size() - consumed < static_cast<uint64_t>(size))
            break;

        _line.clear();
        try {
            Bson::toJson(record, static_cast<uint64_t>(size), _line);
        } catch (const CorruptStreamError& error) {
            throw CorruptStreamError(string(error.what()) + " (record at offset " + to_string(_offset + consumed) + ")");
        }
        _line += '\n';
        consumer(_line);
        consumed += static_cast<uint64_t>(size);
        _records++;
    }

    _buffer.consume(consumed);
    _offset += consumed;
}
//---------------------------------------------------------------------------
void RecordTranscoder::finish() const
// Nothing may remain
{
    if (!_buffer.empty())
        throw TruncatedStreamError("Incomplete BSON document at end of file, " + to_string(_buffer.size()) + " bytes at offset " + to_string(_offset) + " remain!");
}
//---------------------------------------------------------------------------
} // namespace dumpsync::format
