////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include <pfs/tftp/datagram_channel.hpp>
#include <pfs/tftp/posix/udp_socket.hpp>

TFTP__NAMESPACE_BEGIN

namespace posix {

/**
 * UDP socket bound to an ephemeral local port and connected to the single peer.
 * Datagrams from other sources are filtered out by the kernel.
 */
class udp_channel: public datagram_channel
{
    udp_socket _socket;

public:
    /**
     * @throw tftp::error on socket failure.
     */
    TFTP__EXPORT udp_channel (inet4_addr const & local_addr, socket4_addr const & peer);

    udp_channel (udp_channel const &) = delete;
    udp_channel & operator = (udp_channel const &) = delete;

public:
    udp_socket const & socket () const noexcept
    {
        return _socket;
    }

    TFTP__EXPORT send_result send (char const * data, std::size_t len, error * perr = nullptr) override;

    TFTP__EXPORT recv_result recv (char * data, std::size_t len, std::chrono::milliseconds timeout
        , error * perr = nullptr) override;
};

} // namespace posix

TFTP__NAMESPACE_END
