#include "format/bson.hpp"
#include "utils/errors.hpp"
#include "utils/utils.hpp"
#include <cmath>
#include <cstring>
#include <ctime>
#include <string_view>
#include <spdlog/fmt/fmt.h>
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
namespace {
//---------------------------------------------------------------------------
__extension__ typedef unsigned __int128 uint128_t;
//---------------------------------------------------------------------------
/// The largest ms timestamp rendered as iso date, 9999-12-31T23:59:59.999Z
static constexpr int64_t maxIsoDate = 253402300799999ll;
//---------------------------------------------------------------------------
/// A bounds checked cursor over one document
class Reader {
    /// The data
    const uint8_t* _data;
    /// The end
    const uint8_t* _end;

    public:
    /// The constructor
    Reader(const uint8_t* data, const uint8_t* end) : _data(data), _end(end) {}

    /// The current position
    [[nodiscard]] const uint8_t* position() const { return _data; }
    /// The remaining bytes
    [[nodiscard]] uint64_t remaining() const { return static_cast<uint64_t>(_end - _data); }
    /// Throw if fewer than count bytes remain
    void require(uint64_t count, const char* what) const {
        if (remaining() < count)
            throw CorruptStreamError(string("Malformed BSON document: ") + what + " exceeds the document!");
    }
    /// Skip bytes
    void skip(uint64_t count) {
        require(count, "field");
        _data += count;
    }
    /// Read a byte
    [[nodiscard]] uint8_t readByte() {
        require(1, "byte");
        return *_data++;
    }
    /// Read a little-endian int32
    [[nodiscard]] int32_t readInt32() {
        require(4, "int32");
        auto value = static_cast<uint32_t>(_data[0]) | (static_cast<uint32_t>(_data[1]) << 8) | (static_cast<uint32_t>(_data[2]) << 16) | (static_cast<uint32_t>(_data[3]) << 24);
        _data += 4;
        return static_cast<int32_t>(value);
    }
    /// Read a little-endian uint64
    [[nodiscard]] uint64_t readUInt64() {
        require(8, "int64");
        uint64_t value = 0;
        for (auto i = 0; i < 8; i++)
            value |= static_cast<uint64_t>(_data[i]) << (8 * i);
        _data += 8;
        return value;
    }
    /// Read a little-endian double
    [[nodiscard]] double readDouble() {
        auto bits = readUInt64();
        double value;
        memcpy(&value, &bits, sizeof(value));
        return value;
    }
    /// Read a null terminated string
    [[nodiscard]] string_view readCString() {
        auto* terminator = static_cast<const uint8_t*>(memchr(_data, 0, remaining()));
        if (!terminator)
            throw CorruptStreamError("Malformed BSON document: Unterminated key or cstring!");
        string_view value(reinterpret_cast<const char*>(_data), static_cast<size_t>(terminator - _data));
        _data = terminator + 1;
        return value;
    }
    /// Read a length prefixed string
    [[nodiscard]] string_view readString() {
        auto length = readInt32();
        if (length < 1)
            throw CorruptStreamError("Malformed BSON document: Invalid string length!");
        require(static_cast<uint64_t>(length), "string");
        if (_data[length - 1] != 0)
            throw CorruptStreamError("Malformed BSON document: String is not null terminated!");
        string_view value(reinterpret_cast<const char*>(_data), static_cast<size_t>(length - 1));
        _data += length;
        return value;
    }
};
//---------------------------------------------------------------------------
/// Writes the relaxed extended json of a document
class JsonWriter {
    /// The output
    string& _out;

    /// Append an escaped string
    void appendString(string_view value) {
        Bson::appendString(_out, value.data(), value.size());
    }
    /// Append an object id
    void appendObjectId(Reader& reader) {
        reader.require(12, "object id");
        _out += "{\"$oid\":\"";
        _out += utils::hexEncode(reader.position(), 12);
        _out += "\"}";
        reader.skip(12);
    }
    /// Append a double, non finite values use the canonical form
    void appendDouble(double value) {
        if (isnan(value)) {
            _out += "{\"$numberDouble\":\"NaN\"}";
        } else if (isinf(value)) {
            _out += value > 0 ? "{\"$numberDouble\":\"Infinity\"}" : "{\"$numberDouble\":\"-Infinity\"}";
        } else {
            auto text = fmt::format("{}", value);
            // Keep integral doubles distinguishable from integers
            if (text.find_first_of(".eE") == string::npos)
                text += ".0";
            _out += text;
        }
    }
    /// Append a UTC datetime
    void appendDateTime(int64_t milliseconds) {
        if (milliseconds < 0 || milliseconds > maxIsoDate) {
            _out += fmt::format("{{\"$date\":{{\"$numberLong\":\"{}\"}}}}", milliseconds);
            return;
        }
        auto seconds = static_cast<time_t>(milliseconds / 1000);
        struct tm utc;
        if (!gmtime_r(&seconds, &utc))
            throw CorruptStreamError("Malformed BSON document: Invalid datetime!");
        _out += fmt::format("{{\"$date\":\"{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z\"}}", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, milliseconds % 1000);
    }
    /// Append binary data
    void appendBinary(Reader& reader) {
        auto length = reader.readInt32();
        if (length < 0)
            throw CorruptStreamError("Malformed BSON document: Invalid binary length!");
        auto subType = reader.readByte();
        reader.require(static_cast<uint64_t>(length), "binary");
        auto* data = reader.position();
        auto size = static_cast<uint64_t>(length);
        // The old binary subtype repeats the length
        if (subType == 0x02) {
            Reader inner(data, data + size);
            auto innerLength = inner.readInt32();
            if (innerLength < 0 || static_cast<uint64_t>(innerLength) != size - 4)
                throw CorruptStreamError("Malformed BSON document: Invalid old binary length!");
            data += 4;
            size -= 4;
        }
        _out += "{\"$binary\":{\"base64\":\"";
        _out += utils::base64Encode(data, size);
        _out += fmt::format("\",\"subType\":\"{:02x}\"}}}}", static_cast<unsigned>(subType));
        reader.skip(static_cast<uint64_t>(length));
    }

    public:
    /// The constructor
    explicit JsonWriter(string& out) : _out(out) {}

    /// Append a document or array, the reader is positioned at its length prefix
    void appendDocument(Reader& reader, bool isArray, unsigned depth) {
        if (depth > Bson::maxDepth)
            throw CorruptStreamError("Malformed BSON document: Nesting too deep!");
        auto* start = reader.position();
        auto size = reader.readInt32();
        if (size < Bson::minDocumentSize)
            throw CorruptStreamError("Malformed BSON document: Invalid embedded document size!");
        reader.require(static_cast<uint64_t>(size) - 4, "embedded document");
        Reader document(reader.position(), start + size);

        _out += isArray ? '[' : '{';
        auto first = true;
        while (true) {
            auto type = document.readByte();
            if (!type) {
                if (document.remaining())
                    throw CorruptStreamError("Malformed BSON document: Data after the terminator!");
                break;
            }
            auto key = document.readCString();
            if (!first)
                _out += ',';
            first = false;
            if (!isArray) {
                appendString(key);
                _out += ':';
            }
            appendValue(document, static_cast<Bson::Type>(type), depth);
        }
        _out += isArray ? ']' : '}';
        reader.skip(static_cast<uint64_t>(size) - 4);
    }

    /// Append a single value
    void appendValue(Reader& reader, Bson::Type type, unsigned depth) {
        switch (type) {
            case Bson::Type::Double: appendDouble(reader.readDouble()); break;
            case Bson::Type::String: appendString(reader.readString()); break;
            case Bson::Type::Document: appendDocument(reader, false, depth + 1); break;
            case Bson::Type::Array: appendDocument(reader, true, depth + 1); break;
            case Bson::Type::Binary: appendBinary(reader); break;
            case Bson::Type::Undefined: _out += "{\"$undefined\":true}"; break;
            case Bson::Type::ObjectId: appendObjectId(reader); break;
            case Bson::Type::Boolean: {
                auto value = reader.readByte();
                if (value > 1)
                    throw CorruptStreamError("Malformed BSON document: Invalid boolean!");
                _out += value ? "true" : "false";
                break;
            }
            case Bson::Type::DateTime: appendDateTime(static_cast<int64_t>(reader.readUInt64())); break;
            case Bson::Type::Null: _out += "null"; break;
            case Bson::Type::Regex: {
                auto pattern = reader.readCString();
                auto options = reader.readCString();
                _out += "{\"$regularExpression\":{\"pattern\":";
                appendString(pattern);
                _out += ",\"options\":";
                appendString(options);
                _out += "}}";
                break;
            }
            case Bson::Type::DBPointer: {
                auto ns = reader.readString();
                _out += "{\"$dbPointer\":{\"$ref\":";
                appendString(ns);
                _out += ",\"$id\":";
                appendObjectId(reader);
                _out += "}}";
                break;
            }
            case Bson::Type::Code:
                _out += "{\"$code\":";
                appendString(reader.readString());
                _out += '}';
                break;
            case Bson::Type::Symbol:
                _out += "{\"$symbol\":";
                appendString(reader.readString());
                _out += '}';
                break;
            case Bson::Type::CodeWithScope: {
                auto* start = reader.position();
                auto size = reader.readInt32();
                // length, code string with its length and at least an empty scope
                if (size < 14)
                    throw CorruptStreamError("Malformed BSON document: Invalid code with scope size!");
                reader.require(static_cast<uint64_t>(size) - 4, "code with scope");
                Reader scoped(reader.position(), start + size);
                _out += "{\"$code\":";
                appendString(scoped.readString());
                _out += ",\"$scope\":";
                appendDocument(scoped, false, depth + 1);
                _out += '}';
                if (scoped.remaining())
                    throw CorruptStreamError("Malformed BSON document: Invalid code with scope size!");
                reader.skip(static_cast<uint64_t>(size) - 4);
                break;
            }
            case Bson::Type::Int32: _out += fmt::format("{}", reader.readInt32()); break;
            case Bson::Type::Timestamp: {
                auto value = reader.readUInt64();
                _out += fmt::format("{{\"$timestamp\":{{\"t\":{},\"i\":{}}}}}", value >> 32, value & 0xFFFFFFFFull);
                break;
            }
            case Bson::Type::Int64: _out += fmt::format("{}", static_cast<int64_t>(reader.readUInt64())); break;
            case Bson::Type::Decimal128: {
                auto low = reader.readUInt64();
                auto high = reader.readUInt64();
                _out += "{\"$numberDecimal\":\"";
                _out += Bson::decimal128ToString(low, high);
                _out += "\"}";
                break;
            }
            case Bson::Type::MinKey: _out += "{\"$minKey\":1}"; break;
            case Bson::Type::MaxKey: _out += "{\"$maxKey\":1}"; break;
            default:
                throw CorruptStreamError(fmt::format("Malformed BSON document: Unknown element type 0x{:02x}!", static_cast<unsigned>(type)));
        }
    }
};
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
static uint64_t utf8SequenceLength(const unsigned char* data, uint64_t remaining)
// The length of the well-formed utf-8 sequence at data, 0 if it is malformed
{
    auto lead = data[0];
    uint64_t length;
    unsigned char low = 0x80, high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        // No overlong forms and no surrogates
        if (lead == 0xE0)
            low = 0xA0;
        else if (lead == 0xED)
            high = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        // No overlong forms and nothing above U+10FFFF
        if (lead == 0xF0)
            low = 0x90;
        else if (lead == 0xF4)
            high = 0x8F;
    } else {
        return 0;
    }
    if (remaining < length || data[1] < low || data[1] > high)
        return 0;
    for (uint64_t i = 2; i < length; i++)
        if (data[i] < 0x80 || data[i] > 0xBF)
            return 0;
    return length;
}
//---------------------------------------------------------------------------
void Bson::appendString(string& output, const char* data, uint64_t length)
// Escape quotes, backslashes and control characters, malformed utf-8 becomes U+FFFD
{
    static constexpr char hex[] = "0123456789abcdef";
    output += '"';
    for (uint64_t i = 0; i < length; i++) {
        auto c = static_cast<unsigned char>(data[i]);
        switch (c) {
            case '"': output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b"; break;
            case '\f': output += "\\f"; break;
            case '\n': output += "\\n"; break;
            case '\r': output += "\\r"; break;
            case '\t': output += "\\t"; break;
            default:
                if (c < 0x20) {
                    output += "\\u00";
                    output += hex[c >> 4];
                    output += hex[c & 15];
                } else if (c < 0x80) {
                    output += static_cast<char>(c);
                } else if (auto sequence = utf8SequenceLength(reinterpret_cast<const unsigned char*>(data + i), length - i)) {
                    output.append(data + i, sequence);
                    i += sequence - 1;
                } else {
                    output += "\\ufffd";
                }
        }
    }
    output += '"';
}
//---------------------------------------------------------------------------
string Bson::decimal128ToString(uint64_t low, uint64_t high)
// IEEE 754-2008 decimal128 in binary integer decimal encoding to its scientific string
{
    static constexpr int32_t exponentBias = 6176;
    auto negative = (high >> 63) != 0;
    auto combination = (high >> 58) & 0x1F;

    if (combination == 31)
        return "NaN";
    string result = negative ? "-" : "";
    if (combination == 30)
        return result + "Infinity";

    int32_t biasedExponent;
    uint128_t coefficient;
    if ((combination >> 3) == 3) {
        // The implicit 100 prefix always exceeds the largest coefficient
        biasedExponent = static_cast<int32_t>((high >> 47) & 0x3FFF);
        coefficient = 0;
    } else {
        biasedExponent = static_cast<int32_t>((high >> 49) & 0x3FFF);
        coefficient = (static_cast<uint128_t>(high & 0x1FFFFFFFFFFFFull) << 64) | low;
        uint128_t maxCoefficient = 1;
        for (auto i = 0; i < 34; i++)
            maxCoefficient *= 10;
        if (coefficient >= maxCoefficient)
            coefficient = 0;
    }
    auto exponent = biasedExponent - exponentBias;

    string digits;
    do {
        digits.insert(digits.begin(), static_cast<char>('0' + static_cast<int>(coefficient % 10)));
        coefficient /= 10;
    } while (coefficient);

    auto digitCount = static_cast<int32_t>(digits.size());
    auto adjustedExponent = exponent + digitCount - 1;
    if (exponent > 0 || adjustedExponent < -6) {
        result += digits[0];
        if (digitCount > 1) {
            result += '.';
            result.append(digits, 1);
        }
        result += 'E';
        if (adjustedExponent >= 0)
            result += '+';
        result += to_string(adjustedExponent);
    } else if (exponent == 0) {
        result += digits;
    } else {
        auto integerDigits = digitCount + exponent;
        if (integerDigits > 0) {
            result.append(digits, 0, static_cast<size_t>(integerDigits));
            result += '.';
            result.append(digits, static_cast<size_t>(integerDigits));
        } else {
            result += "0.";
            result.append(static_cast<size_t>(-integerDigits), '0');
            result += digits;
        }
    }
    return result;
}
//---------------------------------------------------------------------------
void Bson::toJson(const uint8_t* data, uint64_t length, string& output)
// Render one complete document
{
    Reader reader(data, data + length);
    JsonWriter writer(output);
    writer.appendDocument(reader, false, 0);
    if (reader.remaining())
        throw CorruptStreamError("Malformed BSON document: Length prefix does not match the record!");
}
//---------------------------------------------------------------------------
} // namespace dumpsync::format
