////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "error.hpp"
#include "namespace.hpp"
#include "send_result.hpp"
#include "socket4_addr.hpp"
#include <chrono>
#include <cstddef>
#include <ios>

TFTP__NAMESPACE_BEGIN

/**
 * Point-to-point unreliable datagram channel between the session and one peer.
 */
class datagram_channel
{
public:
    virtual ~datagram_channel () {}

    /**
     * Sends one datagram to the peer.
     */
    virtual send_result send (char const * data, std::size_t len, error * perr = nullptr) = 0;

    /**
     * Waits for one datagram from the peer not longer than @a timeout.
     *
     * @return recv_status::good with datagram size, recv_status::timeout if
     *         nothing received until deadline, or recv_status::failure.
     */
    virtual recv_result recv (char * data, std::size_t len, std::chrono::milliseconds timeout
        , error * perr = nullptr) = 0;
};

/**
 * Shared listening channel used by the dispatcher.
 */
class datagram_listener
{
public:
    virtual ~datagram_listener () {}

    /**
     * Blocks until the next datagram is received.
     *
     * @return Datagram size or -1 on failure.
     */
    virtual std::streamsize recv_from (char * data, std::size_t len, socket4_addr * saddr
        , error * perr = nullptr) = 0;

    virtual send_result send_to (socket4_addr const & dest, char const * data, std::size_t len
        , error * perr = nullptr) = 0;
};

TFTP__NAMESPACE_END
