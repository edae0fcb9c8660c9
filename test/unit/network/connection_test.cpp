#include "network/connection.hpp"
#include "network/http_request.hpp"
#include "network/tls_context.hpp"
#include "utils/errors.hpp"
#include <catch2/catch.hpp>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <thread>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <sys/socket.h>
#include <unistd.h>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace dumpsync::network::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// A loopback peer that accepts one connection, optionally completes a tls handshake and closes again
class ClosingPeer {
    /// The listening socket
    int _listenFd;
    /// The port
    uint32_t _port;
    /// The server context, only with tls
    SSL_CTX* _ctx;
    /// The accepting thread
    thread _thread;

    /// Create a self-signed certificate for the server context
    void setupTls() {
        auto* key = EVP_EC_gen("P-256");
        REQUIRE(key);
        auto* cert = X509_new();
        X509_set_version(cert, 2);
        ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
        X509_gmtime_adj(X509_getm_notBefore(cert), 0);
        X509_gmtime_adj(X509_getm_notAfter(cert), 3600);
        X509_set_pubkey(cert, key);
        auto* name = X509_get_subject_name(cert);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
        X509_set_issuer_name(cert, name);
        REQUIRE(X509_sign(cert, key, EVP_sha256()) > 0);

        _ctx = SSL_CTX_new(TLS_server_method());
        REQUIRE(_ctx);
        REQUIRE(SSL_CTX_use_certificate(_ctx, cert) == 1);
        REQUIRE(SSL_CTX_use_PrivateKey(_ctx, key) == 1);
        X509_free(cert);
        EVP_PKEY_free(key);
    }
    /// Accept, handshake and close
    void serve() {
        auto fd = accept(_listenFd, nullptr, nullptr);
        if (fd < 0)
            return;
        if (_ctx) {
            auto* ssl = SSL_new(_ctx);
            SSL_set_fd(ssl, fd);
            if (SSL_accept(ssl) == 1)
                SSL_shutdown(ssl);
            SSL_free(ssl);
        }
        close(fd);
    }

    public:
    /// The constructor
    explicit ClosingPeer(bool tls) : _listenFd(-1), _port(0), _ctx(nullptr) {
        if (tls)
            setupTls();
        _listenFd = socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(_listenFd >= 0);
        struct sockaddr_in addr = {};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(bind(_listenFd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(listen(_listenFd, 1) == 0);
        socklen_t addrLen = sizeof(addr);
        REQUIRE(getsockname(_listenFd, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) == 0);
        _port = ntohs(addr.sin_port);
        _thread = thread([this] { serve(); });
    }
    /// The destructor
    ~ClosingPeer() {
        waitClosed();
        close(_listenFd);
        if (_ctx)
            SSL_CTX_free(_ctx);
    }
    /// Wait until the peer closed its side
    void waitClosed() {
        if (_thread.joinable())
            _thread.join();
    }
    /// The endpoint of the peer
    Endpoint endpoint() const { return {"127.0.0.1", _port, _ctx != nullptr}; }
};
//---------------------------------------------------------------------------
/// Send until the connection fails
void sendMany(Connection& connection) {
    vector<uint8_t> buffer(1ull << 20, 'x');
    for (int i = 0; i < 64; i++)
        connection.send(buffer.data(), buffer.size());
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
TEST_CASE("connection_sigpipe_ignored") {
    TLSContext context(false);
    struct sigaction action = {};
    REQUIRE(sigaction(SIGPIPE, nullptr, &action) == 0);
    REQUIRE(action.sa_handler == SIG_IGN);
}
//---------------------------------------------------------------------------
TEST_CASE("connection_peer_closes_during_send") {
    auto deadline = Connection::Clock::now() + chrono::seconds(10);
    SECTION("tls") {
        TLSContext context(false);
        ClosingPeer peer(true);
        Connection connection(peer.endpoint(), {}, &context, deadline);
        peer.waitClosed();
        REQUIRE_THROWS_AS(sendMany(connection), TransportError);
    }
    SECTION("tcp") {
        ClosingPeer peer(false);
        Connection connection(peer.endpoint(), {}, nullptr, deadline);
        peer.waitClosed();
        REQUIRE_THROWS_AS(sendMany(connection), TransportError);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("connection_refused") {
    uint32_t port;
    {
        ClosingPeer peer(false);
        port = peer.endpoint().port;
        // Connect once so the peer thread finishes
        Connection connection(peer.endpoint(), {}, nullptr, Connection::Clock::now() + chrono::seconds(10));
    }
    REQUIRE_THROWS_AS(Connection({"127.0.0.1", port, false}, {}, nullptr, Connection::Clock::now() + chrono::seconds(10)), TransportError);
    TLSContext context(false);
    REQUIRE_THROWS_AS(Connection({"127.0.0.1", port, true}, {}, &context, Connection::Clock::now() + chrono::seconds(10)), TransportError);
}
//---------------------------------------------------------------------------
} // namespace dumpsync::network::test
