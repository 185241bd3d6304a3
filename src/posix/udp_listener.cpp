////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/tftp/posix/udp_listener.hpp"

TFTP__NAMESPACE_BEGIN

namespace posix {

namespace {
std::chrono::milliseconds const kPollTick {1000};
}

udp_listener::udp_listener (socket4_addr const & saddr)
{
    _socket.bind(saddr);
}

std::streamsize udp_listener::recv_from (char * data, std::size_t len, socket4_addr * saddr
    , error * perr)
{
    for (;;) {
        auto rc = _socket.wait_readable(kPollTick, perr);

        if (rc < 0)
            return -1;

        if (rc == 0)
            continue;

        auto n = _socket.recv_from(data, len, saddr, perr);

        if (n < 0)
            return -1;

        // Spurious wakeup or zero-length datagram
        if (n == 0)
            continue;

        return n;
    }
}

send_result udp_listener::send_to (socket4_addr const & dest, char const * data
    , std::size_t len, error * perr)
{
    return _socket.send_to(dest, data, len, perr);
}

} // namespace posix

TFTP__NAMESPACE_END
