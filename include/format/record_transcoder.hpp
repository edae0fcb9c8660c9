#pragma once
#include "utils/data_vector.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
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
// Turns a stream of length-prefixed BSON records into JSON lines.
// Records may span any number of reads; incomplete records are kept until the next read.
class RecordTranscoder {
    public:
    /// Receives every line including its newline
    using LineConsumer = std::function<void(std::string_view line)>;

    private:
    /// The unconsumed input
    utils::DataVector<uint8_t> _buffer;
    /// The line under construction
    std::string _line;
    /// The number of emitted records
    uint64_t _records;
    /// The stream offset of the buffer start
    uint64_t _offset;

    public:
    /// The constructor
    RecordTranscoder() : _records(0), _offset(0) {}

    /// Absorb one read and emit all complete records, throws CorruptStreamError
    void absorb(const uint8_t* data, uint64_t length, const LineConsumer& consumer);
    /// End of input, throws TruncatedStreamError if a record was cut off
    void finish() const;
    /// The number of emitted records
    [[nodiscard]] uint64_t records() const { return _records; }
    /// The number of buffered bytes
    [[nodiscard]] uint64_t pending() const { return _buffer.size(); }
};
//---------------------------------------------------------------------------
} // namespace dumpsync::format
