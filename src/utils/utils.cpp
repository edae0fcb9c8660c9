#include "utils/utils.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>
#include <utility>
#include <openssl/evp.h>
#include <openssl/sha.h>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace dumpsync {
namespace utils {
//---------------------------------------------------------------------------
string base64Encode(const uint8_t* input, uint64_t length)
// Encodes a string as a base64 string
{
    if (!in_range<int>(length))
        throw runtime_error("Base64 input too large!");
    auto baseLength = 4 * ((length + 2) / 3);
    auto buffer = make_unique<char[]>(baseLength + 1);
    auto encodeLength = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(buffer.get()), input, static_cast<int>(length));
    if (encodeLength < 0 || static_cast<unsigned>(encodeLength) != baseLength)
        throw runtime_error("OpenSSL Error!");
    return string(buffer.get(), static_cast<unsigned>(encodeLength));
}
//---------------------------------------------------------------------------
string hexEncode(const uint8_t* input, uint64_t length, bool upper)
// Encodes a string as a hex string
{
    const char hex[] = "0123456789abcdef";
    string output;
    output.reserve(length << 1);
    for (auto i = 0u; i < length; i++) {
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] >> 4])) : hex[input[i] >> 4]);
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] & 15])) : hex[input[i] & 15]);
    }
    return output;
}
//---------------------------------------------------------------------------
string encodeUrlPath(const string& encode)
// Percent encodes everything except the unreserved characters and the path separators
{
    string result;
    result.reserve(encode.size());
    for (auto c : encode) {
        if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/')
            result += c;
        else {
            result += "%";
            result += hexEncode(reinterpret_cast<uint8_t*>(&c), 1, true);
        }
    }
    return result;
}
//---------------------------------------------------------------------------
string sha1Encode(const uint8_t* data, uint64_t length)
// Encodes the data as sha1 hex string
{
    unsigned char hash[SHA_DIGEST_LENGTH];
    unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!mdctx)
        throw runtime_error("OpenSSL Error!");

    if (EVP_DigestInit_ex(mdctx.get(), EVP_sha1(), nullptr) <= 0)
        throw runtime_error("OpenSSL Error!");

    if (EVP_DigestUpdate(mdctx.get(), data, length) <= 0)
        throw runtime_error("OpenSSL Error!");

    unsigned digestLength = SHA_DIGEST_LENGTH;
    if (EVP_DigestFinal_ex(mdctx.get(), hash, &digestLength) <= 0)
        throw runtime_error("OpenSSL Error!");

    return hexEncode(hash, digestLength);
}
//---------------------------------------------------------------------------
string maskCredentials(string_view uri)
// Replaces the password part of the user info with ***
{
    auto schemeEnd = uri.find("://");
    auto start = schemeEnd == string_view::npos ? 0 : schemeEnd + 3;
    auto at = uri.find('@', start);
    if (at == string_view::npos)
        return string(uri);
    auto colon = uri.find(':', start);
    if (colon == string_view::npos || colon > at)
        return string(uri);
    string result(uri.substr(0, colon + 1));
    result += "***";
    result += uri.substr(at);
    return result;
}
//---------------------------------------------------------------------------
}; // namespace utils
}; // namespace dumpsync
