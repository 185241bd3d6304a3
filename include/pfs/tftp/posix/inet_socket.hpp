////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2023.01.01 Initial version.
//      2026.10.05 Reduced to datagram operations, added connect and local address.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include <pfs/tftp/error.hpp>
#include <pfs/tftp/exports.hpp>
#include <pfs/tftp/namespace.hpp>
#include <pfs/tftp/send_result.hpp>
#include <pfs/tftp/socket4_addr.hpp>
#include <ios>

TFTP__NAMESPACE_BEGIN

namespace posix {

/**
 * POSIX inet socket
 */
class inet_socket
{
public:
    using socket_id = int;
    static socket_id constexpr kINVALID_SOCKET = -1;

protected:
    socket_id _socket {kINVALID_SOCKET};

    // Bound address for listener.
    // Peer address for connected socket.
    socket4_addr _saddr;

protected:
    /**
     * Constructs invalid POSIX socket
     */
    inet_socket ();

    inet_socket (inet_socket const &) = delete;
    inet_socket & operator = (inet_socket const &) = delete;

    TFTP__EXPORT inet_socket (inet_socket &&) noexcept;
    TFTP__EXPORT inet_socket & operator = (inet_socket &&) noexcept;

    TFTP__EXPORT ~inet_socket ();

protected:
    static bool bind (socket_id sock, socket4_addr const & saddr, error * perr);
    static bool connect (socket_id sock, socket4_addr const & saddr, error * perr);

public:
    /**
     * Returns the address the socket is bound to (useful when bound to port 0).
     */
    TFTP__EXPORT socket4_addr local_saddr (error * perr = nullptr) const;

    /**
     * Receives one datagram from the connected peer.
     *
     * @return Datagram size, zero if no data available or -1 on error.
     */
    TFTP__EXPORT std::streamsize recv (char * data, std::size_t len, error * perr = nullptr);

    /**
     * Sends one datagram to the connected peer.
     */
    TFTP__EXPORT send_result send (char const * data, std::size_t len, error * perr = nullptr);

    /**
     * See recv description.
     */
    TFTP__EXPORT std::streamsize recv_from (char * data, std::size_t len
        , socket4_addr * saddr = nullptr, error * perr = nullptr);

    /**
     * See send description.
     */
    TFTP__EXPORT send_result send_to (socket4_addr const & dest, char const * data
        , std::size_t len, error * perr = nullptr);
};

} // namespace posix

TFTP__NAMESPACE_END
