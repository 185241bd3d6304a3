////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2023.01.01 Initial version.
//      2026.10.05 Removed multicast and broadcast support.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include <pfs/tftp/posix/inet_socket.hpp>
#include <chrono>

TFTP__NAMESPACE_BEGIN

namespace posix {

/**
 * POSIX Inet UDP socket (non-blocking).
 */
class udp_socket: public inet_socket
{
public:
    udp_socket (udp_socket const & s) = delete;
    udp_socket & operator = (udp_socket const & s) = delete;

    /**
     * Creates unbound UDP socket.
     *
     * @throw tftp::error on failure.
     */
    TFTP__EXPORT udp_socket ();

    TFTP__EXPORT udp_socket (udp_socket && s) noexcept;
    TFTP__EXPORT udp_socket & operator = (udp_socket && s) noexcept;
    TFTP__EXPORT ~udp_socket ();

    /**
     * Binds socket to @a saddr. Port @c 0 requests an ephemeral port.
     */
    TFTP__EXPORT bool bind (socket4_addr const & saddr, error * perr = nullptr);

    /**
     * Sets the default destination and restricts incoming datagrams to @a saddr.
     */
    TFTP__EXPORT bool connect (socket4_addr const & saddr, error * perr = nullptr);

    /**
     * Waits until the socket becomes readable not longer than @a timeout.
     *
     * @return @c 1 if readable, @c 0 on timeout or @c -1 on error.
     */
    TFTP__EXPORT int wait_readable (std::chrono::milliseconds timeout, error * perr = nullptr);
};

} // namespace posix

TFTP__NAMESPACE_END
