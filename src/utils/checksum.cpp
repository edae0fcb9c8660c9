#include "utils/checksum.hpp"
#include "utils/errors.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <openssl/sha.h>
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
using namespace std;
//---------------------------------------------------------------------------
Sha1::Sha1() : _ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free), _finalized(false)
// The constructor
{
    if (!_ctx)
        throw runtime_error("OpenSSL Error!");
    if (EVP_DigestInit_ex(_ctx.get(), EVP_sha1(), nullptr) <= 0)
        throw runtime_error("OpenSSL Error!");
}
//---------------------------------------------------------------------------
void Sha1::update(const uint8_t* data, uint64_t length)
// Add data to the digest
{
    if (_finalized)
        throw runtime_error("Digest already finalized!");
    if (length && EVP_DigestUpdate(_ctx.get(), data, length) <= 0)
        throw runtime_error("OpenSSL Error!");
}
//---------------------------------------------------------------------------
string Sha1::finalize()
// Finish the digest
{
    if (_finalized)
        throw runtime_error("Digest already finalized!");
    _finalized = true;
    unsigned char hash[SHA_DIGEST_LENGTH];
    unsigned digestLength = SHA_DIGEST_LENGTH;
    if (EVP_DigestFinal_ex(_ctx.get(), hash, &digestLength) <= 0)
        throw runtime_error("OpenSSL Error!");
    return hexEncode(hash, digestLength);
}
//---------------------------------------------------------------------------
string fileSha1(const string& path, uint64_t offset, uint64_t length)
// Stream a file range through sha1
{
    ifstream file(path, ios::binary);
    if (!file.is_open())
        throw IOError("Cannot open " + path + " for checksum!");
    if (offset) {
        file.seekg(static_cast<streamoff>(offset));
        if (!file)
            throw IOError("Cannot seek to offset " + to_string(offset) + " in " + path + "!");
    }

    auto wholeFile = length == numeric_limits<uint64_t>::max();
    auto buffer = make_unique<char[]>(checksumReadSize);
    Sha1 sha1;
    uint64_t remaining = length;
    while (remaining) {
        auto request = min(remaining, checksumReadSize);
        file.read(buffer.get(), static_cast<streamsize>(request));
        auto got = static_cast<uint64_t>(file.gcount());
        if (file.bad())
            throw IOError("Read error while computing checksum of " + path + "!");
        sha1.update(reinterpret_cast<const uint8_t*>(buffer.get()), got);
        if (!wholeFile)
            remaining -= got;
        if (got < request) {
            if (wholeFile)
                break;
            if (remaining)
                throw IOError("Unexpected end of file while computing checksum of " + path + "!");
        }
    }
    return sha1.finalize();
}
//---------------------------------------------------------------------------
} // namespace dumpsync::utils
