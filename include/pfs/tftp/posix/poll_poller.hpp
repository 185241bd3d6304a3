////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2023.01.06 Initial version.
//      2026.10.05 Added access to returned events.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include <pfs/tftp/error.hpp>
#include <pfs/tftp/exports.hpp>
#include <pfs/tftp/namespace.hpp>
#include <chrono>
#include <vector>
#include <poll.h>

TFTP__NAMESPACE_BEGIN

namespace posix {

class poll_poller
{
public:
    using socket_id = int;

private:
    std::vector<pollfd> _events;
    short int _oevents; // Observable events

public:
    TFTP__EXPORT poll_poller (short int observable_events);

    TFTP__EXPORT void add_socket (socket_id sock);

    /**
     * Returns events occurred on @a sock during the last poll.
     */
    TFTP__EXPORT short int revents (socket_id sock) const noexcept;

    /**
     * @return Number of sockets with events, zero on timeout or interrupt, -1 on error.
     */
    TFTP__EXPORT int poll (std::chrono::milliseconds millis, error * perr = nullptr);
};

} // namespace posix

TFTP__NAMESPACE_END
