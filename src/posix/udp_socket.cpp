////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2023.01.01 Initial version.
//      2026.10.05 Removed multicast and broadcast support.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/tftp/posix/udp_socket.hpp"
#include "pfs/tftp/posix/poll_poller.hpp"
#include <pfs/i18n.hpp>
#include <sys/types.h>
#include <sys/socket.h>
#include <errno.h>
#include <unistd.h>

TFTP__NAMESPACE_BEGIN

namespace posix {

udp_socket::udp_socket ()
    : inet_socket()
{
    _socket = ::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK, 0);

    if (_socket < 0) {
        throw error {
              make_error_code(errc::socket_error)
            , tr::_("create UDP socket failure")
            , pfs::system_error_text()
        };
    }

    int optval = 1;
    auto rc = ::setsockopt(_socket, SOL_SOCKET, SO_REUSEADDR, & optval, sizeof(optval));

    if (rc != 0) {
        error err {
              make_error_code(errc::socket_error)
            , tr::_("set socket option failure: SO_REUSEADDR")
            , pfs::system_error_text()
        };

        ::close(_socket);
        _socket = kINVALID_SOCKET;
        throw err;
    }
}

udp_socket::udp_socket (udp_socket && s) noexcept = default;
udp_socket & udp_socket::operator = (udp_socket && s) noexcept = default;
udp_socket::~udp_socket () = default;

bool udp_socket::bind (socket4_addr const & saddr, error * perr)
{
    if (!inet_socket::bind(_socket, saddr, perr))
        return false;

    _saddr = saddr;
    return true;
}

bool udp_socket::connect (socket4_addr const & saddr, error * perr)
{
    if (!inet_socket::connect(_socket, saddr, perr))
        return false;

    _saddr = saddr;
    return true;
}

int udp_socket::wait_readable (std::chrono::milliseconds timeout, error * perr)
{
    poll_poller poller {POLLIN};
    poller.add_socket(_socket);

    auto n = poller.poll(timeout, perr);

    if (n <= 0)
        return n;

    auto revents = poller.revents(_socket);

    if (revents & (POLLERR | POLLNVAL)) {
        pfs::throw_or(perr, error {
              make_error_code(errc::poller_error)
            , tr::_("socket failure while waiting for data")
        });

        return -1;
    }

    return (revents & POLLIN) ? 1 : 0;
}

} // namespace posix

TFTP__NAMESPACE_END
