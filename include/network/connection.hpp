#pragma once
#include "network/http_request.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <openssl/ssl.h>
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
class TLSContext;
//---------------------------------------------------------------------------
// A blocking tcp connection with optional tls.
// Every operation is bounded by the per-operation timeout and the overall deadline,
// failures are reported as TransportError.
class Connection {
    public:
    /// The tcp settings
    struct TCPSettings {
        /// flag for noDelay
        int noDelay = 1;
        /// flag for keepAlive
        int keepAlive = 1;
        /// time for tcp keepIdle
        int keepIdle = 30;
        /// time for tcp keepIntvl
        int keepIntvl = 10;
        /// probe count
        int keepCnt = 3;
        /// The timeout of a single connect, send or receive in usec
        int timeout = 60 * 1000 * 1000;
    };
    /// The clock of the deadline
    using Clock = std::chrono::steady_clock;

    private:
    /// The socket
    int _fd;
    /// The tls state, only with tls
    SSL* _ssl;
    /// The tls context
    TLSContext* _context;
    /// The settings
    TCPSettings _settings;
    /// The overall deadline
    Clock::time_point _deadline;
    /// The host, used in messages
    std::string _host;

    /// Open the tcp connection
    void connectSocket(const Endpoint& endpoint);
    /// Perform the tls handshake
    void handshake(const Endpoint& endpoint);
    /// Set the socket timeouts for the next operation, throws when the deadline passed
    void armTimeout();
    /// Close everything
    void close() noexcept;

    public:
    /// The constructor connects, context is required for tls endpoints
    Connection(const Endpoint& endpoint, const TCPSettings& settings, TLSContext* context, Clock::time_point deadline);
    /// The destructor
    ~Connection();
    /// No copies
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Send all bytes
    void send(const uint8_t* data, uint64_t length);
    /// Receive up to length bytes, returns 0 if the peer closed the connection
    [[nodiscard]] uint64_t receive(uint8_t* data, uint64_t length);
};
//---------------------------------------------------------------------------
} // namespace dumpsync::network
