#pragma once
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <openssl/evp.h>
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
/// Incremental SHA-1 digest
class Sha1 {
    /// The openssl digest context
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> _ctx;
    /// Finalized
    bool _finalized;

    public:
    /// The constructor
    Sha1();
    /// Add data to the digest
    void update(const uint8_t* data, uint64_t length);
    /// Finish the digest and return it as lowercase hex, the object cannot be updated afterwards
    [[nodiscard]] std::string finalize();
};
//---------------------------------------------------------------------------
/// The read size when streaming files through the digest
static constexpr uint64_t checksumReadSize = 1ull << 20;
//---------------------------------------------------------------------------
/// Digest the byte range [offset, offset + length) of a file, the default is the whole file
[[nodiscard]] std::string fileSha1(const std::string& path, uint64_t offset = 0, uint64_t length = std::numeric_limits<uint64_t>::max());
//---------------------------------------------------------------------------
} // namespace dumpsync::utils
