////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2023.01.01 Initial version.
//      2026.10.05 Reduced to datagram operations, added connect and local address.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/tftp/posix/inet_socket.hpp"
#include <pfs/endian.hpp>
#include <pfs/i18n.hpp>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <errno.h>
#include <string.h>
#include <unistd.h>

TFTP__NAMESPACE_BEGIN

namespace posix {

constexpr inet_socket::socket_id inet_socket::kINVALID_SOCKET;

static sockaddr_in make_sockaddr (socket4_addr const & saddr)
{
    sockaddr_in addr_in4;

    memset(& addr_in4, 0, sizeof(addr_in4));

    addr_in4.sin_family      = AF_INET;
    addr_in4.sin_port        = pfs::to_network_order(static_cast<std::uint16_t>(saddr.port));
    addr_in4.sin_addr.s_addr = pfs::to_network_order(static_cast<std::uint32_t>(saddr.addr));

    return addr_in4;
}

static socket4_addr from_sockaddr (sockaddr_in const & addr_in4)
{
    return socket4_addr {
          inet4_addr{pfs::to_native_order(static_cast<std::uint32_t>(addr_in4.sin_addr.s_addr))}
        , pfs::to_native_order(static_cast<std::uint16_t>(addr_in4.sin_port))
    };
}

inet_socket::inet_socket () = default;

inet_socket::inet_socket (inet_socket && other) noexcept
{
    this->operator = (std::move(other));
}

inet_socket & inet_socket::operator = (inet_socket && other) noexcept
{
    if (this != & other) {
        this->~inet_socket();
        _socket = other._socket;
        _saddr  = other._saddr;
        other._socket = kINVALID_SOCKET;
    }

    return *this;
}

inet_socket::~inet_socket ()
{
    if (_socket >= 0) {
        ::close(_socket);
        _socket = kINVALID_SOCKET;
    }
}

socket4_addr inet_socket::local_saddr (error * perr) const
{
    sockaddr_in addr_in4;
    memset(& addr_in4, 0, sizeof(addr_in4));
    socklen_t addr_in4_len = sizeof(addr_in4);

    auto rc = ::getsockname(_socket, reinterpret_cast<sockaddr *>(& addr_in4), & addr_in4_len);

    if (rc != 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::_("get socket name failure")
            , pfs::system_error_text()
        });

        return socket4_addr{};
    }

    return from_sockaddr(addr_in4);
}

bool inet_socket::bind (socket_id sock, socket4_addr const & saddr, error * perr)
{
    auto addr_in4 = make_sockaddr(saddr);

    auto rc = ::bind(sock
        , reinterpret_cast<sockaddr *>(& addr_in4)
        , sizeof(addr_in4));

    if (rc != 0) {
        error err {
              make_error_code(errc::socket_error)
            , tr::f_("bind name to socket failure: {}", to_string(saddr))
            , pfs::system_error_text()
        };

        if (perr) {
            *perr = std::move(err);
            return false;
        } else {
            throw err;
        }
    }

    return true;
}

bool inet_socket::connect (socket_id sock, socket4_addr const & saddr, error * perr)
{
    auto addr_in4 = make_sockaddr(saddr);

    // For datagram socket connect only sets the default destination and
    // filters incoming datagrams by the source address.
    auto rc = ::connect(sock
        , reinterpret_cast<sockaddr *>(& addr_in4)
        , sizeof(addr_in4));

    if (rc != 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::f_("connect to peer failure: {}", to_string(saddr))
            , pfs::system_error_text()
        });

        return false;
    }

    return true;
}

std::streamsize inet_socket::recv (char * data, std::size_t len, error * perr)
{
    auto n = ::recv(_socket, data, len, MSG_DONTWAIT);

    if (n < 0) {
        if (errno == EAGAIN || (EAGAIN != EWOULDBLOCK && errno == EWOULDBLOCK)) {
            n = 0;
        } else {
            error err {
                  make_error_code(errc::socket_error)
                , tr::_("receive data failure")
                , pfs::system_error_text()
            };

            if (perr) {
                *perr = std::move(err);
                return -1;
            } else {
                throw err;
            }
        }
    }

    return static_cast<std::streamsize>(n);
}

std::streamsize inet_socket::recv_from (char * data, std::size_t len
    , socket4_addr * saddr, error * perr)
{
    sockaddr_in addr_in4;
    memset(& addr_in4, 0, sizeof(addr_in4));
    socklen_t addr_in4_len = sizeof(addr_in4);

    auto n = ::recvfrom(_socket, data, len, MSG_DONTWAIT
        , reinterpret_cast<sockaddr *>(& addr_in4), & addr_in4_len);

    if (n < 0) {
        if (errno == EAGAIN || (EAGAIN != EWOULDBLOCK && errno == EWOULDBLOCK)) {
            n = 0;
        } else {
            error err {
                  make_error_code(errc::socket_error)
                , tr::_("receive data failure")
                , pfs::system_error_text()
            };

            if (perr) {
                *perr = std::move(err);
                return -1;
            } else {
                throw err;
            }
        }
    }

    if (saddr && n > 0)
        *saddr = from_sockaddr(addr_in4);

    return static_cast<std::streamsize>(n);
}

send_result inet_socket::send (char const * data, std::size_t len, error * perr)
{
    // MSG_NOSIGNAL flag means:
    // requests not to send SIGPIPE on errors on stream oriented sockets
    // when the other end breaks the connection.
    auto n = ::send(_socket, data, len, MSG_NOSIGNAL | MSG_DONTWAIT);

    if (n < 0) {
        // man send:
        // The output queue for a network interface was full. This generally
        // indicates that the interface has stopped sending, but may be
        // caused by transient congestion.
        if (errno == ENOBUFS)
            return send_result{send_status::overflow, n};

        if (errno == EAGAIN || (EAGAIN != EWOULDBLOCK && errno == EWOULDBLOCK))
            return send_result{send_status::again, n};

        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::f_("send failure: {}", to_string(_saddr))
            , pfs::system_error_text()
        });

        return send_result{send_status::failure, n};
    }

    return send_result{send_status::good, n};
}

// See inet_socket::send
send_result inet_socket::send_to (socket4_addr const & saddr
    , char const * data, std::size_t len, error * perr)
{
    auto addr_in4 = make_sockaddr(saddr);

    auto n = ::sendto(_socket, data, len, MSG_NOSIGNAL | MSG_DONTWAIT
        , reinterpret_cast<sockaddr *>(& addr_in4), sizeof(addr_in4));

    if (n < 0) {
        if (errno == ENOBUFS)
            return send_result{send_status::overflow, n};

        if (errno == EAGAIN || (EAGAIN != EWOULDBLOCK && errno == EWOULDBLOCK))
            return send_result{send_status::again, n};

        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::f_("send to socket failure: {}", to_string(saddr))
            , pfs::system_error_text()
        });

        return send_result{send_status::failure, n};
    }

    return send_result{send_status::good, n};
}

} // namespace posix

TFTP__NAMESPACE_END
