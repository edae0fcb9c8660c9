#include "network/connection.hpp"
#include "network/tls_context.hpp"
#include "utils/errors.hpp"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <memory>
#include <string>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <openssl/err.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
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
static string opensslError()
// The last openssl error as string
{
    auto code = ERR_get_error();
    if (!code)
        return "unknown tls error";
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    ERR_clear_error();
    return buffer;
}
//---------------------------------------------------------------------------
Connection::Connection(const Endpoint& endpoint, const TCPSettings& settings, TLSContext* context, Clock::time_point deadline) : _fd(-1), _ssl(nullptr), _context(context), _settings(settings), _deadline(deadline), _host(endpoint.host)
// The constructor
{
    if (endpoint.tls && !_context)
        throw runtime_error("A tls connection requires a tls context!");
    try {
        connectSocket(endpoint);
        if (endpoint.tls)
            handshake(endpoint);
    } catch (...) {
        close();
        throw;
    }
}
//---------------------------------------------------------------------------
Connection::~Connection()
// The destructor
{
    close();
}
//---------------------------------------------------------------------------
void Connection::close() noexcept
// Close tls and socket
{
    if (_ssl) {
        // Best-effort close notify, the socket is closed anyway
        if (SSL_shutdown(_ssl) < 0)
            ERR_clear_error();
        SSL_free(_ssl);
        _ssl = nullptr;
    }
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
}
//---------------------------------------------------------------------------
void Connection::connectSocket(const Endpoint& endpoint)
// Resolve the host and connect to the first reachable address
{
    struct addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    struct addrinfo* result = nullptr;
    auto port = to_string(endpoint.port);
    if (auto error = getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &result))
        throw TransportError("Hostname resolution error for " + endpoint.host + "! " + gai_strerror(error));
    unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> addresses(result, freeaddrinfo);

    string lastError = "no address";
    for (auto* addr = addresses.get(); addr; addr = addr->ai_next) {
        _fd = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
        if (_fd == -1) {
            lastError = strerror(errno);
            continue;
        }

        auto setOption = [this](int level, int option, int value, const char* name) {
            if (value > 0 && setsockopt(_fd, level, option, &value, sizeof(value)))
                throw TransportError("Socket creation error! - " + string(name) + " error " + strerror(errno));
        };
        setOption(SOL_SOCKET, SO_KEEPALIVE, _settings.keepAlive, "keep alive");
        if (_settings.keepAlive > 0) {
            setOption(SOL_TCP, TCP_KEEPIDLE, _settings.keepIdle, "keep idle");
            setOption(SOL_TCP, TCP_KEEPINTVL, _settings.keepIntvl, "keep intvl");
            setOption(SOL_TCP, TCP_KEEPCNT, _settings.keepCnt, "keep cnt");
        }
        setOption(SOL_TCP, TCP_NODELAY, _settings.noDelay, "nodelay");

        // Non blocking connect to bound the connection time
        auto flags = fcntl(_fd, F_GETFL, 0);
        if (flags < 0 || fcntl(_fd, F_SETFL, flags | O_NONBLOCK) < 0)
            throw TransportError("Socket creation error! - non blocking error");

        auto connectRes = ::connect(_fd, addr->ai_addr, addr->ai_addrlen);
        auto socketError = connectRes < 0 ? errno : 0;
        if (connectRes < 0 && errno == EINPROGRESS) {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(_deadline - Clock::now()).count();
            auto waitMs = static_cast<int>(max<int64_t>(0, min<int64_t>(remaining, _settings.timeout / 1000)));
            struct pollfd pollEvent = {_fd, POLLOUT, 0};
            auto t = poll(&pollEvent, 1, waitMs);
            if (t == 1) {
                socklen_t socketErrorLen = sizeof(socketError);
                if (getsockopt(_fd, SOL_SOCKET, SO_ERROR, &socketError, &socketErrorLen))
                    socketError = errno;
            } else {
                socketError = ETIMEDOUT;
            }
        }
        if (socketError) {
            lastError = strerror(socketError);
            ::close(_fd);
            _fd = -1;
            continue;
        }

        // Back to blocking mode, timeouts are enforced by the socket options
        if (fcntl(_fd, F_SETFL, flags & ~O_NONBLOCK) < 0)
            throw TransportError("Socket creation error! - blocking error");
        return;
    }
    throw TransportError("Socket creation error for " + endpoint.host + ":" + port + "! " + lastError);
}
//---------------------------------------------------------------------------
void Connection::handshake(const Endpoint& endpoint)
// Perform the tls handshake with sni and host name verification
{
    _ssl = SSL_new(_context->_ctx);
    if (!_ssl)
        throw TransportError("TLS error! " + opensslError());
    if (SSL_set_fd(_ssl, _fd) != 1)
        throw TransportError("TLS error! " + opensslError());
    if (SSL_set_tlsext_host_name(_ssl, endpoint.host.c_str()) != 1)
        throw TransportError("TLS error - SNI! " + opensslError());
    if (SSL_set1_host(_ssl, endpoint.host.c_str()) != 1)
        throw TransportError("TLS error - host verification! " + opensslError());
    _context->reuseSession(_fd, _ssl);

    armTimeout();
    if (SSL_connect(_ssl) != 1) {
        auto verify = SSL_get_verify_result(_ssl);
        string reason = verify != X509_V_OK ? X509_verify_cert_error_string(verify) : opensslError();
        _context->dropSession(_fd);
        throw TransportError("TLS handshake with " + endpoint.host + " failed! " + reason);
    }
    _context->cacheSession(_fd, _ssl);
}
//---------------------------------------------------------------------------
void Connection::armTimeout()
// Set the socket timeouts for the next operation
{
    auto remaining = chrono::duration_cast<chrono::microseconds>(_deadline - Clock::now()).count();
    if (remaining <= 0)
        throw TransportError("Timeout reached for " + _host + "!");
    auto timeout = min<int64_t>(remaining, _settings.timeout);
    struct timeval tv;
    tv.tv_sec = timeout / (1000 * 1000);
    tv.tv_usec = timeout % (1000 * 1000);
    if (setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&tv), sizeof tv))
        throw TransportError("Socket error - recv timeout error!");
    if (setsockopt(_fd, SOL_SOCKET, SO_SNDTIMEO, reinterpret_cast<const char*>(&tv), sizeof tv))
        throw TransportError("Socket error - send timeout error!");
}
//---------------------------------------------------------------------------
void Connection::send(const uint8_t* data, uint64_t length)
// Send all bytes
{
    while (length) {
        armTimeout();
        auto request = static_cast<int>(min<uint64_t>(length, INT_MAX));
        int64_t sent;
        if (_ssl) {
            sent = SSL_write(_ssl, data, request);
            if (sent <= 0) {
                auto error = SSL_get_error(_ssl, static_cast<int>(sent));
                if (error == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))
                    throw TransportError("Timeout reached while sending to " + _host + "!");
                throw TransportError("TLS send error to " + _host + "! " + opensslError());
            }
        } else {
            sent = ::send(_fd, data, static_cast<size_t>(request), MSG_NOSIGNAL);
            if (sent < 0) {
                if (errno == EINTR)
                    continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK)
                    throw TransportError("Timeout reached while sending to " + _host + "!");
                throw TransportError("Send error to " + _host + "! " + strerror(errno));
            }
        }
        data += sent;
        length -= static_cast<uint64_t>(sent);
    }
}
//---------------------------------------------------------------------------
uint64_t Connection::receive(uint8_t* data, uint64_t length)
// Receive up to length bytes
{
    auto request = static_cast<int>(min<uint64_t>(length, INT_MAX));
    while (true) {
        armTimeout();
        if (_ssl) {
            auto received = SSL_read(_ssl, data, request);
            if (received > 0)
                return static_cast<uint64_t>(received);
            auto error = SSL_get_error(_ssl, received);
            if (error == SSL_ERROR_ZERO_RETURN)
                return 0;
            if (error == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))
                throw TransportError("Timeout reached while receiving from " + _host + "!");
            if (error == SSL_ERROR_SYSCALL && !errno && !ERR_peek_error())
                return 0;
            throw TransportError("TLS receive error from " + _host + "! " + opensslError());
        }
        auto received = recv(_fd, data, static_cast<size_t>(request), 0);
        if (received >= 0)
            return static_cast<uint64_t>(received);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            throw TransportError("Timeout reached while receiving from " + _host + "!");
        throw TransportError("Receive error from " + _host + "! " + strerror(errno));
    }
}
//---------------------------------------------------------------------------
} // namespace dumpsync::network
