#pragma once
#include <cstdint>
#include <string>
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
// Renders BSON documents as MongoDB Relaxed Extended JSON v2.
// The field order of the document is kept, strings are emitted as raw UTF-8.
class Bson {
    public:
    /// The smallest document, the length prefix and the terminator
    static constexpr int32_t minDocumentSize = 5;
    /// The largest document MongoDB stores
    static constexpr int32_t maxDocumentSize = 16 * 1024 * 1024;
    /// The maximum nesting of documents and arrays
    static constexpr unsigned maxDepth = 128;

    /// The element types
    enum class Type : uint8_t {
        Double = 0x01,
        String = 0x02,
        Document = 0x03,
        Array = 0x04,
        Binary = 0x05,
        Undefined = 0x06,
        ObjectId = 0x07,
        Boolean = 0x08,
        DateTime = 0x09,
        Null = 0x0A,
        Regex = 0x0B,
        DBPointer = 0x0C,
        Code = 0x0D,
        Symbol = 0x0E,
        CodeWithScope = 0x0F,
        Int32 = 0x10,
        Timestamp = 0x11,
        Int64 = 0x12,
        Decimal128 = 0x13,
        MinKey = 0xFF,
        MaxKey = 0x7F
    };

    /// Append the json text of one complete document to output, throws CorruptStreamError
    static void toJson(const uint8_t* data, uint64_t length, std::string& output);
    /// Render a decimal128 given as its two little-endian halves
    [[nodiscard]] static std::string decimal128ToString(uint64_t low, uint64_t high);
    /// Append a json string literal, malformed utf-8 is replaced by U+FFFD
    static void appendString(std::string& output, const char* data, uint64_t length);
};
//---------------------------------------------------------------------------
} // namespace dumpsync::format
