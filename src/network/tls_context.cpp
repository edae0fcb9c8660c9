#include "network/tls_context.hpp"
#include <csignal>
#include <optional>
#include <stdexcept>
#include <netinet/in.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <sys/socket.h>
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
using namespace std;
//---------------------------------------------------------------------------
static optional<uint64_t> peerAddress(int fd)
// The ipv4 address of the peer, used as session cache key
{
    struct sockaddr_in addr;
    socklen_t addrLen = sizeof(struct sockaddr_in);
    if (getpeername(fd, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) || addr.sin_family != AF_INET)
        return nullopt;
    return addr.sin_addr.s_addr;
}
//---------------------------------------------------------------------------
TLSContext::TLSContext(bool verifyPeer) : _sessionCache()
// Construct the TLS Context
{
    initOpenSSL();
    _ctx = SSL_CTX_new(TLS_client_method());
    if (!_ctx)
        throw runtime_error("OpenSSL Error - Context creation failed!");

    SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Responses without length end with a plain tcp close
    SSL_CTX_set_options(_ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    if (verifyPeer) {
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            SSL_CTX_free(_ctx);
            throw runtime_error("OpenSSL Error - Cannot load the system certificates!");
        }
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_PEER, nullptr);
    }

    // Enable session cache
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);
}
//---------------------------------------------------------------------------
TLSContext::~TLSContext()
// The destructor
{
    for (auto& entry : _sessionCache) {
        if (entry.first && entry.second)
            SSL_SESSION_free(entry.second);
    }
    SSL_CTX_free(_ctx);
}
//---------------------------------------------------------------------------
void TLSContext::initOpenSSL()
// Inits the openssl algos
{
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    // SSL_write uses plain write, a closed peer has to surface as EPIPE instead of a signal
    signal(SIGPIPE, SIG_IGN);
}
//---------------------------------------------------------------------------
bool TLSContext::cacheSession(int fd, SSL* ssl)
// Caches the SSL session
{
    if (SSL_session_reused(ssl))
        return false;
    auto addr = peerAddress(fd);
    if (!addr)
        return false;
    auto& entry = _sessionCache[*addr & cacheMask];
    if (entry.first && entry.second)
        SSL_SESSION_free(entry.second);
    entry = {*addr, SSL_get1_session(ssl)};
    return true;
}
//---------------------------------------------------------------------------
bool TLSContext::dropSession(int fd)
// Drop the SSL session from cache
{
    auto addr = peerAddress(fd);
    if (!addr)
        return false;
    auto& entry = _sessionCache[*addr & cacheMask];
    if (entry.first == *addr && entry.second) {
        SSL_SESSION_free(entry.second);
        entry = {0, nullptr};
    }
    return true;
}
//---------------------------------------------------------------------------
bool TLSContext::reuseSession(int fd, SSL* ssl)
// Reuses the SSL session
{
    auto addr = peerAddress(fd);
    if (!addr)
        return false;
    auto& entry = _sessionCache[*addr & cacheMask];
    if (entry.first != *addr || !entry.second)
        return false;
    return SSL_set_session(ssl, entry.second) == 1;
}
//---------------------------------------------------------------------------
} // namespace dumpsync::network
