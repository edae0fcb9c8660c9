#pragma once
#include <array>
#include <cstdint>
#include <utility>
#include <openssl/ssl.h>
#include <openssl/types.h>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace dumpsync::network {
//---------------------------------------------------------------------------
class Connection;
//---------------------------------------------------------------------------
// The context is owned by one http client and used by one thread,
// which keeps the session cache free of locking.
class TLSContext {
    /// The ssl context
    SSL_CTX* _ctx;
    /// The cache size as power of 2
    static constexpr uint8_t cachePower = 6;
    /// The cache mask
    static constexpr uint64_t cacheMask = (~0ull) >> (64 - cachePower);
    /// The session cache, keyed by the peer ipv4 address
    std::array<std::pair<uint64_t, SSL_SESSION*>, 1ull << cachePower> _sessionCache;

    public:
    /// The constructor, verifyPeer checks the certificate chain against the system store
    explicit TLSContext(bool verifyPeer = true);
    /// The destructor
    ~TLSContext();
    /// No copies
    TLSContext(const TLSContext&) = delete;
    TLSContext& operator=(const TLSContext&) = delete;

    /// Caches the SSL session
    bool cacheSession(int fd, SSL* ssl);
    /// Drops the SSL session
    bool dropSession(int fd);
    /// Reuses a SSL session
    bool reuseSession(int fd, SSL* ssl);

    /// Init the OpenSSL algos and errors and ignore SIGPIPE, called by the constructor
    static void initOpenSSL();

    friend Connection;
};
//---------------------------------------------------------------------------
} // namespace dumpsync::network
