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
 * UDP socket bound to the well-known server address. Receives requests from
 * any client.
 */
class udp_listener: public datagram_listener
{
    udp_socket _socket;

public:
    /**
     * @throw tftp::error if bind failure.
     */
    TFTP__EXPORT explicit udp_listener (socket4_addr const & saddr);

    udp_listener (udp_listener const &) = delete;
    udp_listener & operator = (udp_listener const &) = delete;

public:
    udp_socket const & socket () const noexcept
    {
        return _socket;
    }

    TFTP__EXPORT std::streamsize recv_from (char * data, std::size_t len, socket4_addr * saddr
        , error * perr = nullptr) override;

    TFTP__EXPORT send_result send_to (socket4_addr const & dest, char const * data
        , std::size_t len, error * perr = nullptr) override;
};

} // namespace posix

TFTP__NAMESPACE_END
