////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "datagram_channel.hpp"
#include "error.hpp"
#include "exports.hpp"
#include "namespace.hpp"
#include "payload.hpp"
#include "protocol.hpp"
#include "socket4_addr.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

TFTP__NAMESPACE_BEGIN

struct server_options
{
    socket4_addr listen_saddr {inet4_addr{127, 0, 0, 1}, 69};

    // Zero means default (10)
    std::uint8_t retries {kDefaultRetries};

    // Zero means default (6 seconds)
    std::chrono::milliseconds timeout {kDefaultTimeout};
};

/**
 * Read-only TFTP server. Accepts read requests on the listening channel and
 * serves the same payload to every client, one independent session per request.
 */
class server
{
public:
    using channel_factory = std::function<std::unique_ptr<datagram_channel> (socket4_addr const & peer)>;
    using task_launcher = std::function<void (std::function<void ()>)>;

private:
    shared_content _payload;
    server_options _opts;

public:
    /**
     * Creates channel for the new session. Default implementation binds UDP
     * socket to ephemeral port of the listen address and connects it to the peer.
     */
    channel_factory make_channel;

    /**
     * Launches session task. Default implementation runs it in the detached thread.
     */
    task_launcher spawn;

public:
    /**
     * @throw tftp::error with errc::invalid_argument if @a payload is null.
     */
    TFTP__EXPORT server (shared_content payload, server_options const & opts = server_options{});

    server (server const &) = delete;
    server & operator = (server const &) = delete;

public:
    server_options const & options () const noexcept
    {
        return _opts;
    }

    /**
     * Receives and dispatches one datagram from @a listener.
     *
     * @return @c false on listener failure only, malformed requests are discarded.
     */
    TFTP__EXPORT bool serve_once (datagram_listener & listener, error * perr = nullptr);

    /**
     * Dispatches datagrams from @a listener until listener failure.
     */
    TFTP__EXPORT bool serve (datagram_listener & listener, error * perr = nullptr);

    /**
     * Binds UDP listener to the configured address and serves forever.
     *
     * @return @c false on bind or receive failure.
     */
    TFTP__EXPORT bool listen_and_serve (error * perr = nullptr);
};

TFTP__NAMESPACE_END
