////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/tftp/posix/udp_channel.hpp"

TFTP__NAMESPACE_BEGIN

namespace posix {

udp_channel::udp_channel (inet4_addr const & local_addr, socket4_addr const & peer)
{
    _socket.bind(socket4_addr{local_addr, 0});
    _socket.connect(peer);
}

send_result udp_channel::send (char const * data, std::size_t len, error * perr)
{
    return _socket.send(data, len, perr);
}

recv_result udp_channel::recv (char * data, std::size_t len, std::chrono::milliseconds timeout
    , error * perr)
{
    using clock_type = std::chrono::steady_clock;

    auto deadline = clock_type::now() + timeout;

    for (;;) {
        auto remain = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_type::now());

        if (remain <= std::chrono::milliseconds{0})
            return recv_result{recv_status::timeout, 0};

        auto rc = _socket.wait_readable(remain, perr);

        if (rc < 0)
            return recv_result{recv_status::failure, -1};

        if (rc == 0)
            continue;

        auto n = _socket.recv(data, len, perr);

        if (n < 0)
            return recv_result{recv_status::failure, -1};

        if (n == 0)
            continue;

        return recv_result{recv_status::good, n};
    }
}

} // namespace posix

TFTP__NAMESPACE_END
