////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2023.01.06 Initial version.
//      2026.10.05 Added access to returned events.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/tftp/posix/poll_poller.hpp"
#include <pfs/i18n.hpp>
#include <algorithm>
#include <errno.h>

TFTP__NAMESPACE_BEGIN

namespace posix {

poll_poller::poll_poller (short int observable_events)
    : _oevents(observable_events)
{}

void poll_poller::add_socket (socket_id sock)
{
    auto pos = std::find_if(_events.begin(), _events.end()
        , [& sock] (pollfd const & p) { return sock == p.fd;});

    // Already exists
    if (pos != _events.end())
        return;

    pollfd ev;
    ev.fd = sock;
    ev.events = _oevents;
    ev.revents = 0;
    _events.push_back(ev);
}

short int poll_poller::revents (socket_id sock) const noexcept
{
    auto pos = std::find_if(_events.begin(), _events.end()
        , [& sock] (pollfd const & p) { return sock == p.fd;});

    return pos != _events.end() ? pos->revents : 0;
}

int poll_poller::poll (std::chrono::milliseconds millis, error * perr)
{
    if (millis < std::chrono::milliseconds{0})
        millis = std::chrono::milliseconds{0};

    for (auto & ev: _events)
        ev.revents = 0;

    auto n = ::poll(_events.data(), _events.size(), static_cast<int>(millis.count()));

    if (n < 0) {
        // Is not a critical error, caller checks its deadline and polls again
        if (errno == EINTR)
            return 0;

        pfs::throw_or(perr, error {
              make_error_code(errc::poller_error)
            , tr::_("poll failure")
            , pfs::system_error_text()
        });

        return n;
    }

    return n;
}

} // namespace posix

TFTP__NAMESPACE_END
